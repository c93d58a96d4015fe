// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "audit.hpp"
#include "capability_engine.hpp"
#include "capsule_state.hpp"
#include "config.hpp"
#include "object_registry.hpp"
#include "platform.hpp"
#include "policy_hooks.hpp"
#include "result.hpp"
#include "router.hpp"
#include "topology.hpp"
#include "types.hpp"

namespace capkern {

/**
 * The mediation core: one object wiring the registry, capability engine,
 * policy hooks, router and audit sink together.
 *
 * Capsule-facing calls take the calling capsule id as their first argument;
 * the caller (the scheduler's syscall path) is trusted to supply it.
 */
class Kernel {
  public:
    static Result<std::unique_ptr<Kernel>> create(KernelConfig config, Topology topology,
                                                  const PlatformDeps& deps = {});
    ~Kernel();

    Kernel(const Kernel&) = delete;
    Kernel& operator=(const Kernel&) = delete;

    // Boot
    Result<Capability> bootstrap_root_capability();

    // Capsule API
    Result<Capability> issue(const IssueRequest& request, const RequestContext& context);
    Result<ResolvedObject> validate(CapsuleId caller, const CapToken& token, Op op);
    Result<Capability> delegate(CapsuleId caller, const CapToken& parent, const DelegateRequest& request);
    Result<void> revoke(CapsuleId caller, const CapToken& token);
    Result<Capability> inspect(CapsuleId caller, const CapToken& token) const;

    Result<void> send(CapsuleId caller, const ObjectId& endpoint, const CapToken& token, Message message);
    Result<Message> recv(CapsuleId caller, const ObjectId& endpoint, const CapToken& token);

    Result<std::shared_ptr<AuditSubscription>> subscribe_audit(CapsuleId caller, const CapToken& token);
    Result<std::vector<AuditRecord>> replay_audit(CapsuleId caller, const CapToken& token, uint64_t from_seq);

    Result<Capability> create_endpoint(CapsuleId caller, const std::string& name);
    Result<Capability> create_object(CapsuleId caller, ObjectKind kind);

    // External collaborator API
    Result<void> deliver(const ObjectId& endpoint, Message message);
    void on_context_switch(CapsuleId capsule);
    void freeze_capsule(CapsuleId capsule);
    void thaw_capsule(CapsuleId capsule);
    void stop_capsule(CapsuleId capsule);
    Result<void> teardown_notify(CapsuleId capsule);

    // Policy API
    Result<void> designate_policy_hook(CapsuleId caller, const CapToken& control, HookType hook,
                                       CapsuleId policy_capsule, std::shared_ptr<PolicyHandler> handler,
                                       std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    Result<void> set_drop_policy(CapsuleId caller, const ObjectId& endpoint, DropPolicy policy);
    Result<void> set_backpressure_auditing(CapsuleId caller, bool enabled);
    Result<void> quarantine_capsule(CapsuleId caller, CapsuleId target, const std::string& reason);

    // Introspection for boot code, the scheduler and tests
    [[nodiscard]] const ObjectId& control_object() const { return control_object_; }
    [[nodiscard]] const ObjectId& audit_log_object() const { return audit_log_object_; }
    [[nodiscard]] const KernelConfig& config() const { return config_; }
    [[nodiscard]] CapsuleRunState capsule_state(CapsuleId capsule) const { return states_.state(capsule); }
    Result<size_t> pending_messages(const ObjectId& endpoint) const;
    [[nodiscard]] size_t live_capabilities(CapsuleId capsule) const { return engine_->live_count(capsule); }
    void flush_audit();
    [[nodiscard]] AuditSink& audit_sink() { return audit_; }

  private:
    Kernel(KernelConfig config, Topology topology, const PlatformDeps& deps);
    Result<void> init();
    Result<void> require_policy_capsule(CapsuleId caller, const char* action);
    void audit(AuditKind kind, AuditOutcome outcome, CapsuleId subject, const ObjectId& object, std::string reason);

    const KernelConfig config_;
    const Topology topology_;
    Platform platform_;
    AuditSink audit_;
    PolicyHookTable hooks_;
    ObjectRegistry registry_;
    CapsuleStates states_;
    ObjectId control_object_;
    ObjectId audit_log_object_;
    std::unique_ptr<CapabilityEngine> engine_;
    std::unique_ptr<Router> router_;
    std::atomic<bool> bootstrapped_{false};
};

} // namespace capkern
