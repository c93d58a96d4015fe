// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>

#include "result.hpp"
#include "types.hpp"

namespace capkern {

struct QueuedMessage {
    Message message;
    CapsuleId producer = 0;
    uint64_t seq = 0;     // per producer
    uint64_t arrival = 0; // per endpoint
};

struct DroppedMessage {
    CapsuleId producer = 0;
    uint64_t label = 0;
    uint8_t priority = 0;
};

// Re-evaluated on every wakeup of a blocked operation; an error aborts the wait.
using InterruptCheck = std::function<Result<void>()>;

/**
 * Bounded message queue with one sub-queue per producer.
 *
 * Length never exceeds the configured capacity. Messages from one producer
 * leave in the order they arrived; across producers the ordering mode picks
 * the next sub-queue.
 */
class Endpoint {
  public:
    Endpoint(const ObjectId& id, EndpointConfig config);

    Endpoint(const Endpoint&) = delete;
    Endpoint& operator=(const Endpoint&) = delete;

    [[nodiscard]] const ObjectId& id() const { return id_; }
    [[nodiscard]] const EndpointConfig& config() const { return config_; }

    // On success returns the message evicted to make room, if any.
    Result<std::optional<DroppedMessage>> push(CapsuleId producer, Message message, bool blocking, bool allow_drop,
                                               const InterruptCheck& interrupted);
    Result<QueuedMessage> pop(bool blocking, const InterruptCheck& interrupted);

    // Wake blocked callers so they re-check their interrupt condition.
    void wake();
    // Fail every pending and future operation with EndpointClosed.
    void close();

    [[nodiscard]] bool closed() const;
    [[nodiscard]] size_t size() const;

    void set_drop_policy(DropPolicy policy);
    [[nodiscard]] DropPolicy drop_policy() const;

  private:
    bool wait_locked(std::unique_lock<std::mutex>& lock, std::condition_variable& cv,
                     const std::function<bool()>& ready, const InterruptCheck& interrupted, Error& failure);
    std::optional<DroppedMessage> evict_lower_locked(uint8_t priority);
    void enqueue_locked(CapsuleId producer, Message message);
    Result<QueuedMessage> take_locked();

    const ObjectId id_;
    const EndpointConfig config_;

    mutable std::mutex mu_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
    std::map<CapsuleId, std::deque<QueuedMessage>> producers_;
    std::map<CapsuleId, uint64_t> next_seq_;
    std::map<CapsuleId, uint64_t> delivered_seq_;
    size_t size_ = 0;
    uint64_t next_arrival_ = 1;
    bool have_cursor_ = false;
    CapsuleId rr_cursor_ = 0;
    DropPolicy drop_;
    bool closed_ = false;
};

} // namespace capkern
