// cppcheck-suppress-file missingIncludeSystem
#include "endpoint.hpp"

#include <chrono>
#include <string>

namespace capkern {

Endpoint::Endpoint(const ObjectId& id, EndpointConfig config) : id_(id), config_(std::move(config)), drop_(config_.drop)
{
}

bool Endpoint::wait_locked(std::unique_lock<std::mutex>& lock, std::condition_variable& cv,
                           const std::function<bool()>& ready, const InterruptCheck& interrupted, Error& failure)
{
    const bool bounded = config_.block_timeout_ms != 0;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.block_timeout_ms);
    while (true) {
        if (closed_) {
            failure = Error(ErrorCode::EndpointClosed, "Endpoint closed", config_.name);
            return false;
        }
        if (interrupted) {
            auto check = interrupted();
            if (!check) {
                failure = check.error();
                return false;
            }
        }
        if (ready()) {
            return true;
        }
        if (!bounded) {
            cv.wait(lock);
            continue;
        }
        if (cv.wait_until(lock, deadline) == std::cv_status::timeout) {
            if (closed_) {
                continue;
            }
            if (ready()) {
                return true;
            }
            failure = Error(ErrorCode::WouldBlock, "Timed out waiting on endpoint", config_.name);
            return false;
        }
    }
}

Result<std::optional<DroppedMessage>> Endpoint::push(CapsuleId producer, Message message, bool blocking,
                                                     bool allow_drop, const InterruptCheck& interrupted)
{
    std::unique_lock<std::mutex> lock(mu_);
    if (closed_) {
        return Error(ErrorCode::EndpointClosed, "Endpoint closed", config_.name);
    }
    if (size_ < config_.capacity) {
        enqueue_locked(producer, std::move(message));
        return std::optional<DroppedMessage>{};
    }
    if (allow_drop && drop_ == DropPolicy::DropLowerPriority) {
        auto victim = evict_lower_locked(message.priority());
        if (victim) {
            enqueue_locked(producer, std::move(message));
            return victim;
        }
    }
    if (!blocking) {
        return Error(ErrorCode::WouldBlock, "Endpoint queue full", config_.name);
    }

    Error failure(ErrorCode::Unknown, "");
    if (!wait_locked(lock, not_full_, [&] { return size_ < config_.capacity; }, interrupted, failure)) {
        return failure;
    }
    enqueue_locked(producer, std::move(message));
    return std::optional<DroppedMessage>{};
}

Result<QueuedMessage> Endpoint::pop(bool blocking, const InterruptCheck& interrupted)
{
    std::unique_lock<std::mutex> lock(mu_);
    if (closed_) {
        return Error(ErrorCode::EndpointClosed, "Endpoint closed", config_.name);
    }
    if (size_ == 0) {
        if (!blocking) {
            return Error(ErrorCode::WouldBlock, "Endpoint queue empty", config_.name);
        }
        Error failure(ErrorCode::Unknown, "");
        if (!wait_locked(lock, not_empty_, [&] { return size_ != 0; }, interrupted, failure)) {
            return failure;
        }
    }
    return take_locked();
}

void Endpoint::enqueue_locked(CapsuleId producer, Message message)
{
    QueuedMessage queued;
    queued.message = std::move(message);
    queued.producer = producer;
    queued.seq = ++next_seq_[producer];
    queued.arrival = next_arrival_++;
    producers_[producer].push_back(std::move(queued));
    ++size_;
    not_empty_.notify_one();
}

std::optional<DroppedMessage> Endpoint::evict_lower_locked(uint8_t priority)
{
    std::deque<QueuedMessage>* victim_queue = nullptr;
    std::deque<QueuedMessage>::iterator victim;
    CapsuleId victim_producer = 0;
    for (auto& [producer, queue] : producers_) {
        for (auto it = queue.begin(); it != queue.end(); ++it) {
            const uint8_t p = it->message.priority();
            if (p >= priority) {
                continue;
            }
            if (!victim_queue || p < victim->message.priority() ||
                (p == victim->message.priority() && it->arrival < victim->arrival)) {
                victim_queue = &queue;
                victim = it;
                victim_producer = producer;
            }
        }
    }
    if (!victim_queue) {
        return std::nullopt;
    }

    DroppedMessage dropped;
    dropped.producer = victim->producer;
    dropped.label = victim->message.header.label;
    dropped.priority = victim->message.priority();
    victim_queue->erase(victim);
    if (victim_queue->empty()) {
        producers_.erase(victim_producer);
    }
    --size_;
    return dropped;
}

Result<QueuedMessage> Endpoint::take_locked()
{
    auto pick = producers_.end();
    if (config_.ordering == OrderingMode::Fifo) {
        for (auto it = producers_.begin(); it != producers_.end(); ++it) {
            if (pick == producers_.end() || it->second.front().arrival < pick->second.front().arrival) {
                pick = it;
            }
        }
    } else {
        pick = have_cursor_ ? producers_.upper_bound(rr_cursor_) : producers_.begin();
        if (pick == producers_.end()) {
            pick = producers_.begin();
        }
    }
    if (pick == producers_.end()) {
        return Error(ErrorCode::Internal, "Endpoint size out of sync with its queues", config_.name);
    }

    const CapsuleId producer = pick->first;
    QueuedMessage out = std::move(pick->second.front());
    pick->second.pop_front();
    if (pick->second.empty()) {
        producers_.erase(pick);
    }
    --size_;
    rr_cursor_ = producer;
    have_cursor_ = true;
    not_full_.notify_one();

    uint64_t& last = delivered_seq_[producer];
    if (out.seq <= last) {
        return Error(ErrorCode::Internal, "Per-producer ordering violated",
                     config_.name + " producer=" + std::to_string(producer) + " seq=" + std::to_string(out.seq) +
                         " last=" + std::to_string(last));
    }
    last = out.seq;
    return out;
}

void Endpoint::wake()
{
    std::lock_guard<std::mutex> lock(mu_);
    not_full_.notify_all();
    not_empty_.notify_all();
}

void Endpoint::close()
{
    {
        std::lock_guard<std::mutex> lock(mu_);
        closed_ = true;
        producers_.clear();
        size_ = 0;
    }
    not_full_.notify_all();
    not_empty_.notify_all();
}

bool Endpoint::closed() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return closed_;
}

size_t Endpoint::size() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return size_;
}

void Endpoint::set_drop_policy(DropPolicy policy)
{
    std::lock_guard<std::mutex> lock(mu_);
    drop_ = policy;
}

DropPolicy Endpoint::drop_policy() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return drop_;
}

} // namespace capkern
