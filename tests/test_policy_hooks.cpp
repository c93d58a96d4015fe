// cppcheck-suppress-file missingIncludeSystem
// cppcheck-suppress-file missingInclude
// cppcheck-suppress-file syntaxError
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include "policy_hooks.hpp"
#include "test_support.hpp"

namespace capkern {
namespace {

using testing_support::FakeClock;
using testing_support::history_has;
using testing_support::make_kernel;
using testing_support::policy_fn;

using std::chrono::milliseconds;

PolicyQuery query_for(HookType hook, CapsuleId subject = 5)
{
    PolicyQuery q;
    q.hook = hook;
    q.subject = subject;
    q.op = Op::Send;
    return q;
}

std::shared_ptr<PolicyHandler> always(PolicyDecision decision)
{
    return policy_fn([decision](const PolicyQuery&) { return decision; });
}

// Each call blocks until `release` is set or three seconds pass.
std::shared_ptr<PolicyHandler> stalled_until(std::shared_ptr<std::atomic<bool>> release)
{
    return policy_fn([release](const PolicyQuery&) {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
        while (!release->load() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(milliseconds(5));
        }
        return PolicyDecision::allow();
    });
}

int64_t elapsed_ms(std::chrono::steady_clock::time_point start)
{
    return std::chrono::duration_cast<milliseconds>(std::chrono::steady_clock::now() - start).count();
}

TEST(PolicyHookTableTest, UndesignatedHookAllows)
{
    PolicyHookTable hooks;
    const PolicyOutcome outcome = hooks.consult(query_for(HookType::OperationCheck));
    EXPECT_EQ(outcome.decision.verdict, PolicyVerdict::Allow);
    EXPECT_FALSE(outcome.designated);
    EXPECT_FALSE(outcome.timed_out);
    EXPECT_FALSE(hooks.designated(HookType::OperationCheck));
}

TEST(PolicyHookTableTest, DesignatedHandlerDecides)
{
    PolicyHookTable hooks;
    ASSERT_TRUE(hooks.designate(HookType::OperationCheck, 7, policy_fn([](const PolicyQuery& q) {
                                    return q.subject == 5 ? PolicyDecision::deny("no 5") : PolicyDecision::allow();
                                }),
                                milliseconds(500)));
    EXPECT_TRUE(hooks.designated(HookType::OperationCheck));
    EXPECT_TRUE(hooks.is_policy_capsule(7));
    EXPECT_FALSE(hooks.is_policy_capsule(5));

    const PolicyOutcome denied = hooks.consult(query_for(HookType::OperationCheck, 5));
    EXPECT_TRUE(denied.designated);
    EXPECT_EQ(denied.decision.verdict, PolicyVerdict::Deny);
    EXPECT_EQ(denied.decision.reason, "no 5");
    EXPECT_EQ(denied.policy_capsule, 7u);

    EXPECT_EQ(hooks.consult(query_for(HookType::OperationCheck, 6)).decision.verdict, PolicyVerdict::Allow);
    // Other hook types are unaffected.
    EXPECT_FALSE(hooks.consult(query_for(HookType::DelegationCheck, 5)).designated);
}

TEST(PolicyHookTableTest, SecondDesignationIsRejected)
{
    PolicyHookTable hooks;
    ASSERT_TRUE(hooks.designate(HookType::RuntimeViolation, 7, always(PolicyDecision::allow()), milliseconds(50)));
    auto again = hooks.designate(HookType::RuntimeViolation, 8, always(PolicyDecision::deny()), milliseconds(50));
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().code(), ErrorCode::AlreadyExists);
}

TEST(PolicyHookTableTest, InvalidDesignationsAreRejected)
{
    PolicyHookTable hooks;
    EXPECT_EQ(hooks.designate(HookType::OperationCheck, 7, nullptr, milliseconds(50)).error().code(),
              ErrorCode::InvalidArgument);
    EXPECT_EQ(hooks.designate(HookType::OperationCheck, 7, always(PolicyDecision::allow()), milliseconds(0))
                  .error()
                  .code(),
              ErrorCode::InvalidArgument);
}

TEST(PolicyHookTableTest, TimeoutAppliesDefaultDecision)
{
    PolicyHookTable hooks;
    ASSERT_TRUE(hooks.designate(HookType::QuotaEnforcement, 7, policy_fn([](const PolicyQuery&) {
                                    std::this_thread::sleep_for(milliseconds(200));
                                    return PolicyDecision::allow();
                                }),
                                milliseconds(20)));
    const auto start = std::chrono::steady_clock::now();
    const PolicyOutcome outcome = hooks.consult(query_for(HookType::QuotaEnforcement));
    const auto waited = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(outcome.timed_out);
    EXPECT_EQ(outcome.decision.verdict, PolicyVerdict::Deny);
    EXPECT_LT(std::chrono::duration_cast<milliseconds>(waited).count(), 150);
}

TEST(PolicyHookTableTest, TimeoutDefaultCanBeConfigured)
{
    PolicyHookTable hooks;
    ASSERT_TRUE(hooks.designate(HookType::QuotaEnforcement, 7, policy_fn([](const PolicyQuery&) {
                                    std::this_thread::sleep_for(milliseconds(100));
                                    return PolicyDecision::deny();
                                }),
                                milliseconds(10), PolicyDecision::throttle("slow policy")));
    const PolicyOutcome outcome = hooks.consult(query_for(HookType::QuotaEnforcement));
    EXPECT_TRUE(outcome.timed_out);
    EXPECT_EQ(outcome.decision.verdict, PolicyVerdict::Throttle);
}

TEST(PolicyHookTableTest, ThrowingHandlerDenies)
{
    PolicyHookTable hooks;
    ASSERT_TRUE(hooks.designate(HookType::OperationCheck, 7, policy_fn([](const PolicyQuery&) -> PolicyDecision {
                                    throw std::runtime_error("boom");
                                }),
                                milliseconds(500)));
    const PolicyOutcome outcome = hooks.consult(query_for(HookType::OperationCheck));
    EXPECT_FALSE(outcome.timed_out);
    EXPECT_EQ(outcome.decision.verdict, PolicyVerdict::Deny);
    EXPECT_NE(outcome.decision.reason.find("boom"), std::string::npos);
}

TEST(PolicyHookTableTest, RetireDropsEveryHookOfCapsule)
{
    PolicyHookTable hooks;
    ASSERT_TRUE(hooks.designate(HookType::OperationCheck, 7, always(PolicyDecision::deny()), milliseconds(50)));
    ASSERT_TRUE(hooks.designate(HookType::DelegationCheck, 7, always(PolicyDecision::deny()), milliseconds(50)));
    ASSERT_TRUE(hooks.designate(HookType::RuntimeViolation, 8, always(PolicyDecision::deny()), milliseconds(50)));

    EXPECT_EQ(hooks.retire(7), 2u);
    EXPECT_FALSE(hooks.is_policy_capsule(7));
    EXPECT_TRUE(hooks.is_policy_capsule(8));
    EXPECT_EQ(hooks.consult(query_for(HookType::OperationCheck)).decision.verdict, PolicyVerdict::Allow);
    EXPECT_TRUE(hooks.designate(HookType::OperationCheck, 9, always(PolicyDecision::allow()), milliseconds(50)));
}

TEST(PolicyHookTableTest, RetireDoesNotWaitForStuckHandler)
{
    auto release = std::make_shared<std::atomic<bool>>(false);
    PolicyHookTable hooks;
    ASSERT_TRUE(hooks.designate(HookType::RuntimeViolation, 7, stalled_until(release), milliseconds(20)));
    EXPECT_TRUE(hooks.consult(query_for(HookType::RuntimeViolation)).timed_out);

    const auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(hooks.retire(7), 1u);
    EXPECT_LT(elapsed_ms(start), 500);
    release->store(true);
}

TEST(PolicyChannelTest, FullQueueFailsFast)
{
    auto release = std::make_shared<std::atomic<bool>>(false);
    PolicyChannel channel(7, stalled_until(release));

    // One request occupies the worker; the rest fill the queue while their callers wait.
    std::vector<std::future<PolicyReply>> waiting;
    for (size_t i = 0; i < PolicyChannel::kMaxPending + 1; ++i) {
        waiting.push_back(std::async(std::launch::async, [&channel] {
            return channel.round_trip(query_for(HookType::OperationCheck), milliseconds(5000));
        }));
    }
    std::this_thread::sleep_for(milliseconds(300));

    const auto start = std::chrono::steady_clock::now();
    const PolicyReply refused = channel.round_trip(query_for(HookType::OperationCheck), milliseconds(5000));
    EXPECT_EQ(refused.status, ReplyStatus::Saturated);
    EXPECT_LT(elapsed_ms(start), 100);

    release->store(true);
    for (auto& pending : waiting) {
        ASSERT_EQ(pending.wait_for(std::chrono::seconds(5)), std::future_status::ready);
        EXPECT_EQ(pending.get().status, ReplyStatus::Answered);
    }
}

TEST(PolicyChannelTest, AbandonedRequestsDoNotFillQueue)
{
    auto release = std::make_shared<std::atomic<bool>>(false);
    PolicyChannel channel(7, stalled_until(release));
    for (size_t i = 0; i < PolicyChannel::kMaxPending * 2; ++i) {
        EXPECT_EQ(channel.round_trip(query_for(HookType::OperationCheck), milliseconds(1)).status,
                  ReplyStatus::TimedOut);
    }
    release->store(true);
}

TEST(PolicyHookTableTest, SaturatedHookAppliesDefault)
{
    auto release = std::make_shared<std::atomic<bool>>(false);
    PolicyHookTable hooks;
    ASSERT_TRUE(hooks.designate(HookType::OperationCheck, 7, stalled_until(release), milliseconds(5000),
                                PolicyDecision::throttle("busy")));
    std::vector<std::future<PolicyOutcome>> waiting;
    for (size_t i = 0; i < PolicyChannel::kMaxPending + 1; ++i) {
        waiting.push_back(std::async(std::launch::async, [&hooks] {
            return hooks.consult(query_for(HookType::OperationCheck));
        }));
    }
    std::this_thread::sleep_for(milliseconds(300));

    const PolicyOutcome outcome = hooks.consult(query_for(HookType::OperationCheck));
    EXPECT_TRUE(outcome.saturated);
    EXPECT_TRUE(outcome.timed_out);
    EXPECT_EQ(outcome.decision.verdict, PolicyVerdict::Throttle);

    release->store(true);
    for (auto& pending : waiting) {
        ASSERT_EQ(pending.wait_for(std::chrono::seconds(5)), std::future_status::ready);
        EXPECT_FALSE(pending.get().saturated);
    }
}

TEST(PolicyHookNamesTest, RoundTrip)
{
    for (size_t i = 0; i < kHookTypeCount; ++i) {
        const auto hook = static_cast<HookType>(i);
        HookType parsed = HookType::OperationCheck;
        ASSERT_TRUE(parse_hook_type(hook_type_name(hook), parsed));
        EXPECT_EQ(parsed, hook);
    }
    HookType unused = HookType::OperationCheck;
    EXPECT_FALSE(parse_hook_type("bogus", unused));
}

TEST(KernelPolicyTest, DesignationNeedsControlCapability)
{
    FakeClock clock;
    auto kernel = make_kernel(clock);
    ASSERT_NE(kernel, nullptr);
    auto storage = kernel->create_object(3, ObjectKind::Storage);
    ASSERT_TRUE(storage);

    auto denied = kernel->designate_policy_hook(3, storage->token, HookType::OperationCheck, 9,
                                                always(PolicyDecision::allow()));
    ASSERT_FALSE(denied);
    EXPECT_EQ(denied.error().code(), ErrorCode::Unauthorized);

    auto root = kernel->bootstrap_root_capability();
    ASSERT_TRUE(root);
    ASSERT_TRUE(kernel->designate_policy_hook(kernel->config().root_capsule, root->token, HookType::OperationCheck,
                                              9, always(PolicyDecision::allow())));
    EXPECT_TRUE(history_has(kernel->audit_sink(), AuditKind::PolicyDesignated));

    auto reserved = kernel->designate_policy_hook(kernel->config().root_capsule, root->token,
                                                  HookType::DelegationCheck, kKernelCapsule,
                                                  always(PolicyDecision::allow()));
    ASSERT_FALSE(reserved);
    EXPECT_EQ(reserved.error().code(), ErrorCode::InvalidArgument);
}

TEST(KernelPolicyTest, PolicyTimeoutIsAuditedAndDenies)
{
    FakeClock clock;
    KernelConfig config;
    config.policy_timeout_ms = 10;
    auto kernel = make_kernel(clock, "version=1\n", config);
    ASSERT_NE(kernel, nullptr);
    auto root = kernel->bootstrap_root_capability();
    ASSERT_TRUE(root);
    ASSERT_TRUE(kernel->designate_policy_hook(kernel->config().root_capsule, root->token,
                                              HookType::RuntimeViolation, 9, policy_fn([](const PolicyQuery&) {
                                                  std::this_thread::sleep_for(milliseconds(100));
                                                  return PolicyDecision::allow();
                                              })));
    auto storage = kernel->create_object(3, ObjectKind::Storage);
    ASSERT_TRUE(storage);
    auto vetoed = kernel->validate(3, storage->token, Op::StorageRead);
    ASSERT_FALSE(vetoed);
    EXPECT_EQ(vetoed.error().code(), ErrorCode::PolicyDenied);
    EXPECT_TRUE(history_has(kernel->audit_sink(), AuditKind::PolicyTimeout));
}

TEST(KernelPolicyTest, TeardownOfStuckPolicyCapsuleReturnsPromptly)
{
    FakeClock clock;
    auto kernel = make_kernel(clock);
    ASSERT_NE(kernel, nullptr);
    auto root = kernel->bootstrap_root_capability();
    ASSERT_TRUE(root);
    auto release = std::make_shared<std::atomic<bool>>(false);
    ASSERT_TRUE(kernel->designate_policy_hook(kernel->config().root_capsule, root->token,
                                              HookType::RuntimeViolation, 9, stalled_until(release),
                                              milliseconds(20)));
    auto storage = kernel->create_object(3, ObjectKind::Storage);
    ASSERT_TRUE(storage);
    EXPECT_EQ(kernel->validate(3, storage->token, Op::StorageRead).error().code(), ErrorCode::PolicyDenied);

    const auto start = std::chrono::steady_clock::now();
    ASSERT_TRUE(kernel->teardown_notify(9));
    EXPECT_LT(elapsed_ms(start), 500);

    // The hook is gone, so validation no longer waits on the stuck capsule.
    EXPECT_TRUE(kernel->validate(3, storage->token, Op::StorageRead));
    release->store(true);
}

TEST(KernelPolicyTest, PolicyOnlyOperationsRequireDesignation)
{
    FakeClock clock;
    auto kernel = make_kernel(clock);
    ASSERT_NE(kernel, nullptr);
    EXPECT_EQ(kernel->set_backpressure_auditing(9, true).error().code(), ErrorCode::Unauthorized);
    EXPECT_EQ(kernel->quarantine_capsule(9, 3, "nope").error().code(), ErrorCode::Unauthorized);

    auto root = kernel->bootstrap_root_capability();
    ASSERT_TRUE(root);
    ASSERT_TRUE(kernel->designate_policy_hook(kernel->config().root_capsule, root->token,
                                              HookType::QuotaEnforcement, 9, always(PolicyDecision::allow())));
    ASSERT_TRUE(kernel->set_backpressure_auditing(9, true));
    EXPECT_TRUE(kernel->audit_sink().backpressure_auditing());
    EXPECT_EQ(kernel->quarantine_capsule(9, kKernelCapsule, "x").error().code(), ErrorCode::InvalidArgument);
}

} // namespace
} // namespace capkern
