// cppcheck-suppress-file missingIncludeSystem
#include "policy_hooks.hpp"

#include <algorithm>
#include <exception>
#include <vector>

#include "logging.hpp"

namespace capkern {

namespace {

constexpr const char* kHookNames[kHookTypeCount] = {
    "issuance_precheck", "delegation_check", "operation_check", "runtime_violation", "quota_enforcement",
};

} // namespace

const char* hook_type_name(HookType hook)
{
    const auto idx = static_cast<size_t>(hook);
    return idx < kHookTypeCount ? kHookNames[idx] : "unknown";
}

bool parse_hook_type(const std::string& value, HookType& hook)
{
    for (size_t i = 0; i < kHookTypeCount; ++i) {
        if (value == kHookNames[i]) {
            hook = static_cast<HookType>(i);
            return true;
        }
    }
    return false;
}

const char* policy_verdict_name(PolicyVerdict verdict)
{
    switch (verdict) {
        case PolicyVerdict::Allow:
            return "allow";
        case PolicyVerdict::Deny:
            return "deny";
        case PolicyVerdict::Throttle:
            return "throttle";
    }
    return "deny";
}

PolicyChannel::PolicyChannel(CapsuleId capsule, std::shared_ptr<PolicyHandler> handler)
    : capsule_(capsule), state_(std::make_shared<State>())
{
    state_->capsule = capsule;
    state_->handler = std::move(handler);
    worker_ = std::thread(&PolicyChannel::worker_loop, state_);
}

PolicyChannel::~PolicyChannel()
{
    bool busy = false;
    {
        std::lock_guard<std::mutex> lock(state_->mu);
        state_->stopping = true;
        busy = state_->busy;
        state_->queue.clear();
    }
    state_->cv.notify_all();
    if (!worker_.joinable()) {
        return;
    }
    if (busy) {
        // The handler may never return. The worker holds its own reference
        // to the state and exits after the call.
        logger().log(SLOG_WARN("Policy handler still running at retirement; detaching worker")
                         .field("policy_capsule", static_cast<int64_t>(capsule_)));
        worker_.detach();
    } else {
        worker_.join();
    }
}

void PolicyChannel::prune_abandoned(State& state)
{
    auto& queue = state.queue;
    queue.erase(std::remove_if(queue.begin(), queue.end(),
                               [](const Request& req) {
                                   std::lock_guard<std::mutex> lock(req.reply->mu);
                                   return req.reply->abandoned;
                               }),
                queue.end());
}

PolicyReply PolicyChannel::round_trip(const PolicyQuery& query, std::chrono::milliseconds timeout)
{
    auto reply = std::make_shared<PendingReply>();
    {
        std::lock_guard<std::mutex> lock(state_->mu);
        if (state_->stopping) {
            return PolicyReply{ReplyStatus::Closed, {}};
        }
        if (state_->queue.size() >= kMaxPending) {
            prune_abandoned(*state_);
        }
        if (state_->queue.size() >= kMaxPending) {
            return PolicyReply{ReplyStatus::Saturated, {}};
        }
        state_->queue.push_back(Request{query, reply});
    }
    state_->cv.notify_one();

    std::unique_lock<std::mutex> lock(reply->mu);
    if (!reply->cv.wait_for(lock, timeout, [&] { return reply->done; })) {
        reply->abandoned = true;
        return PolicyReply{ReplyStatus::TimedOut, {}};
    }
    return PolicyReply{ReplyStatus::Answered, reply->decision};
}

void PolicyChannel::worker_loop(const std::shared_ptr<State>& state)
{
    std::unique_lock<std::mutex> lock(state->mu);
    while (true) {
        state->busy = false;
        state->cv.wait(lock, [&] { return state->stopping || !state->queue.empty(); });
        if (state->stopping) {
            return;
        }
        Request req = std::move(state->queue.front());
        state->queue.pop_front();
        state->busy = true;
        lock.unlock();

        bool abandoned = false;
        {
            std::lock_guard<std::mutex> reply_lock(req.reply->mu);
            abandoned = req.reply->abandoned;
        }
        if (!abandoned) {
            PolicyDecision decision;
            try {
                decision = state->handler->decide(req.query);
            } catch (const std::exception& e) {
                logger().log(SLOG_ERROR("Policy handler threw; denying")
                                 .field("policy_capsule", static_cast<int64_t>(state->capsule))
                                 .field("hook", hook_type_name(req.query.hook))
                                 .field("error", e.what()));
                decision = PolicyDecision::deny(std::string("policy handler error: ") + e.what());
            }

            {
                std::lock_guard<std::mutex> reply_lock(req.reply->mu);
                req.reply->decision = std::move(decision);
                req.reply->done = true;
            }
            req.reply->cv.notify_all();
        }
        lock.lock();
    }
}

Result<void> PolicyHookTable::designate(HookType hook, CapsuleId policy_capsule,
                                        std::shared_ptr<PolicyHandler> handler, std::chrono::milliseconds timeout,
                                        PolicyDecision default_decision)
{
    const auto idx = static_cast<size_t>(hook);
    if (idx >= kHookTypeCount) {
        return Error::invalid_argument("hook type");
    }
    if (!handler) {
        return Error::invalid_argument("policy handler is null");
    }
    if (timeout.count() <= 0) {
        return Error::invalid_argument("policy timeout must be positive");
    }

    std::unique_lock<std::shared_mutex> lock(mu_);
    if (bindings_[idx].has_value()) {
        return Error(ErrorCode::AlreadyExists, "Hook already has a designated policy capsule", hook_type_name(hook));
    }
    Binding binding;
    binding.channel = std::make_shared<PolicyChannel>(policy_capsule, std::move(handler));
    binding.timeout = timeout;
    binding.default_decision = std::move(default_decision);
    bindings_[idx] = std::move(binding);

    logger().log(SLOG_INFO("Policy hook designated")
                     .field("hook", hook_type_name(hook))
                     .field("policy_capsule", static_cast<int64_t>(policy_capsule))
                     .field("timeout_ms", static_cast<int64_t>(timeout.count())));
    return {};
}

PolicyOutcome PolicyHookTable::consult(const PolicyQuery& query)
{
    std::shared_ptr<PolicyChannel> channel;
    std::chrono::milliseconds timeout{0};
    PolicyDecision fallback;
    {
        std::shared_lock<std::shared_mutex> lock(mu_);
        const auto& binding = bindings_[static_cast<size_t>(query.hook)];
        if (!binding.has_value()) {
            return PolicyOutcome{PolicyDecision::allow(), false, false, 0};
        }
        channel = binding->channel;
        timeout = binding->timeout;
        fallback = binding->default_decision;
    }

    PolicyOutcome outcome;
    outcome.designated = true;
    outcome.policy_capsule = channel->capsule();
    PolicyReply reply = channel->round_trip(query, timeout);
    if (reply.status == ReplyStatus::Answered) {
        outcome.decision = std::move(reply.decision);
        return outcome;
    }
    outcome.timed_out = true;
    outcome.saturated = reply.status == ReplyStatus::Saturated;
    outcome.decision = fallback;
    logger().log(SLOG_WARN(outcome.saturated ? "Policy hook queue full; applying default decision"
                                             : "Policy hook timed out; applying default decision")
                     .field("hook", hook_type_name(query.hook))
                     .field("policy_capsule", static_cast<int64_t>(outcome.policy_capsule))
                     .field("timeout_ms", static_cast<int64_t>(timeout.count()))
                     .field("default", policy_verdict_name(fallback.verdict)));
    return outcome;
}

bool PolicyHookTable::is_policy_capsule(CapsuleId capsule) const
{
    std::shared_lock<std::shared_mutex> lock(mu_);
    for (const auto& binding : bindings_) {
        if (binding.has_value() && binding->channel->capsule() == capsule) {
            return true;
        }
    }
    return false;
}

bool PolicyHookTable::designated(HookType hook) const
{
    std::shared_lock<std::shared_mutex> lock(mu_);
    return bindings_[static_cast<size_t>(hook)].has_value();
}

size_t PolicyHookTable::retire(CapsuleId capsule)
{
    std::vector<std::shared_ptr<PolicyChannel>> dropped;
    {
        std::unique_lock<std::shared_mutex> lock(mu_);
        for (auto& binding : bindings_) {
            if (binding.has_value() && binding->channel->capsule() == capsule) {
                dropped.push_back(std::move(binding->channel));
                binding.reset();
            }
        }
    }
    // Channels stop their workers outside the table lock.
    return dropped.size();
}

} // namespace capkern
