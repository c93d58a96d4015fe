// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <array>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>

#include "result.hpp"
#include "types.hpp"

namespace capkern {

enum class HookType : uint8_t {
    IssuancePreCheck = 0,
    DelegationCheck = 1,
    OperationCheck = 2,
    RuntimeViolation = 3,
    QuotaEnforcement = 4,
};

inline constexpr size_t kHookTypeCount = 5;

const char* hook_type_name(HookType hook);
bool parse_hook_type(const std::string& value, HookType& hook);

enum class PolicyVerdict { Allow, Deny, Throttle };

const char* policy_verdict_name(PolicyVerdict verdict);

struct PolicyDecision {
    PolicyVerdict verdict = PolicyVerdict::Allow;
    std::string reason;

    static PolicyDecision allow(std::string reason = {}) { return {PolicyVerdict::Allow, std::move(reason)}; }
    static PolicyDecision deny(std::string reason = {}) { return {PolicyVerdict::Deny, std::move(reason)}; }
    static PolicyDecision throttle(std::string reason = {}) { return {PolicyVerdict::Throttle, std::move(reason)}; }
};

/**
 * What the kernel sends to a policy capsule. Tokens never cross this
 * boundary; only their fingerprint does.
 */
struct PolicyQuery {
    HookType hook = HookType::OperationCheck;
    CapsuleId subject = 0;
    CapsuleId target = 0;
    ObjectId object;
    ObjectKind kind = ObjectKind::Control;
    Op op = Op::Send;
    OpSet ops;
    std::string token_fingerprint;
    Labels labels;
    std::string detail;
};

/**
 * The decision logic running inside a designated policy capsule. The
 * kernel never calls it directly; calls are marshalled onto the capsule's
 * own execution context by a PolicyChannel.
 */
class PolicyHandler {
  public:
    virtual ~PolicyHandler() = default;
    virtual PolicyDecision decide(const PolicyQuery& query) = 0;
};

struct PolicyOutcome {
    PolicyDecision decision;
    bool designated = false;
    bool timed_out = false;
    bool saturated = false; // refused without dispatch; the request queue was full
    CapsuleId policy_capsule = 0;
};

enum class ReplyStatus { Answered, TimedOut, Saturated, Closed };

struct PolicyReply {
    ReplyStatus status = ReplyStatus::Closed;
    PolicyDecision decision;
};

/**
 * Request/reply channel to one policy capsule's execution context.
 *
 * The worker thread stands in for the policy capsule; round_trip() posts a
 * request and waits at most `timeout` for the reply. The worker owns the
 * handler and the queue through a shared state block, so destroying the
 * channel never waits on a handler that does not return: a busy worker is
 * detached and exits once the handler comes back.
 */
class PolicyChannel {
  public:
    // Requests waiting for the worker beyond this many fail at once.
    static constexpr size_t kMaxPending = 64;

    PolicyChannel(CapsuleId capsule, std::shared_ptr<PolicyHandler> handler);
    ~PolicyChannel();

    PolicyChannel(const PolicyChannel&) = delete;
    PolicyChannel& operator=(const PolicyChannel&) = delete;

    PolicyReply round_trip(const PolicyQuery& query, std::chrono::milliseconds timeout);

    [[nodiscard]] CapsuleId capsule() const { return capsule_; }

  private:
    struct PendingReply {
        std::mutex mu;
        std::condition_variable cv;
        bool done = false;
        bool abandoned = false;
        PolicyDecision decision;
    };

    struct Request {
        PolicyQuery query;
        std::shared_ptr<PendingReply> reply;
    };

    // Lock order: State::mu before PendingReply::mu.
    struct State {
        CapsuleId capsule = 0;
        std::shared_ptr<PolicyHandler> handler;
        std::mutex mu;
        std::condition_variable cv;
        std::deque<Request> queue;
        bool stopping = false;
        bool busy = false;
    };

    static void worker_loop(const std::shared_ptr<State>& state);
    static void prune_abandoned(State& state);

    CapsuleId capsule_;
    std::shared_ptr<State> state_;
    std::thread worker_;
};

/**
 * One designated policy capsule per hook type. A hook with no designation
 * allows; a designated hook that misses its deadline yields the
 * designation's default decision.
 */
class PolicyHookTable {
  public:
    PolicyHookTable() = default;

    PolicyHookTable(const PolicyHookTable&) = delete;
    PolicyHookTable& operator=(const PolicyHookTable&) = delete;

    Result<void> designate(HookType hook, CapsuleId policy_capsule, std::shared_ptr<PolicyHandler> handler,
                           std::chrono::milliseconds timeout,
                           PolicyDecision default_decision = PolicyDecision::deny("policy timeout"));

    PolicyOutcome consult(const PolicyQuery& query);

    [[nodiscard]] bool is_policy_capsule(CapsuleId capsule) const;
    [[nodiscard]] bool designated(HookType hook) const;

    // Drop every designation held by `capsule`. Returns how many were dropped.
    size_t retire(CapsuleId capsule);

  private:
    struct Binding {
        std::shared_ptr<PolicyChannel> channel;
        std::chrono::milliseconds timeout{0};
        PolicyDecision default_decision;
    };

    mutable std::shared_mutex mu_;
    std::array<std::optional<Binding>, kHookTypeCount> bindings_;
};

} // namespace capkern
