// cppcheck-suppress-file missingIncludeSystem
#include "kernel.hpp"

#include "logging.hpp"

namespace capkern {

namespace {

AuditSinkConfig audit_config_for(const KernelConfig& config)
{
    AuditSinkConfig out;
    out.log_path = config.audit_log_path;
    out.history_limit = config.audit_history_limit;
    out.mirror = config.audit_mirror;
    out.audit_backpressure = config.audit_backpressure;
    out.audit_allowed = config.audit_allowed;
    return out;
}

} // namespace

Kernel::Kernel(KernelConfig config, Topology topology, const PlatformDeps& deps)
    : config_(std::move(config)), topology_(std::move(topology)), platform_(deps), audit_(audit_config_for(config_)),
      registry_(platform_)
{
}

Kernel::~Kernel()
{
    // Router and engine go first so no new audit events race the sink's shutdown.
    router_.reset();
    engine_.reset();
    audit_.flush();
}

Result<std::unique_ptr<Kernel>> Kernel::create(KernelConfig config, Topology topology, const PlatformDeps& deps)
{
    if (config.root_capsule == kKernelCapsule) {
        return Error::invalid_argument("root capsule id 0 is reserved for the kernel");
    }
    std::unique_ptr<Kernel> kernel(new Kernel(std::move(config), std::move(topology), deps));
    TRY(kernel->init());
    return Result<std::unique_ptr<Kernel>>(std::move(kernel));
}

Result<void> Kernel::init()
{
    auto control = registry_.create(ObjectKind::Control, kKernelCapsule);
    if (!control) {
        return control.error();
    }
    control_object_ = *control;

    auto audit_log = registry_.create(ObjectKind::AuditLog, kKernelCapsule);
    if (!audit_log) {
        return audit_log.error();
    }
    audit_log_object_ = *audit_log;

    engine_ = std::make_unique<CapabilityEngine>(platform_, registry_, hooks_, audit_, control_object_);

    RouterLimits limits;
    limits.max_message_bytes = config_.max_message_bytes;
    limits.endpoint_delegation_depth = config_.default_delegation_depth;
    router_ = std::make_unique<Router>(platform_, limits, topology_, registry_, *engine_, hooks_, audit_, states_);

    logger().log(SLOG_INFO("Kernel initialized")
                     .field("root_capsule", static_cast<int64_t>(config_.root_capsule))
                     .field("endpoints", static_cast<int64_t>(topology_.endpoints.size()))
                     .field("routes", static_cast<int64_t>(topology_.routes.size()))
                     .field("max_message_bytes", static_cast<int64_t>(config_.max_message_bytes))
                     .field("policy_timeout_ms", static_cast<int64_t>(config_.policy_timeout_ms)));
    return {};
}

void Kernel::audit(AuditKind kind, AuditOutcome outcome, CapsuleId subject, const ObjectId& object,
                   std::string reason)
{
    AuditEvent event;
    event.kind = kind;
    event.subject = subject;
    event.object = object;
    event.timestamp_ms = platform_.now_ms();
    event.outcome = outcome;
    event.reason = std::move(reason);
    audit_.emit(std::move(event));
}

Result<Capability> Kernel::bootstrap_root_capability()
{
    if (bootstrapped_.exchange(true)) {
        return Error(ErrorCode::AlreadyExists, "Root capability already bootstrapped");
    }

    IssueRequest request;
    request.object = control_object_;
    request.ops = OpSet{Op::Control};
    request.delegation_depth = config_.root_delegation_depth;
    request.recipient = config_.root_capsule;
    auto cap = engine_->issue_privileged(request, kKernelCapsule, AuditKind::RootBootstrap,
                                         "root capsule " + std::to_string(config_.root_capsule));
    if (!cap) {
        bootstrapped_.store(false);
        logger().log(SLOG_ERROR("Root bootstrap failed").field("error", cap.error().to_string()));
        return cap.error();
    }
    logger().log(SLOG_INFO("Root capability bootstrapped")
                     .field("root_capsule", static_cast<int64_t>(config_.root_capsule))
                     .field("token", token_fingerprint(cap->token)));
    return cap;
}

Result<Capability> Kernel::issue(const IssueRequest& request, const RequestContext& context)
{
    TRY(states_.check_runnable(context.caller));
    return engine_->issue(request, context);
}

Result<ResolvedObject> Kernel::validate(CapsuleId caller, const CapToken& token, Op op)
{
    TRY(states_.check_runnable(caller));
    return engine_->validate(caller, token, op);
}

Result<Capability> Kernel::delegate(CapsuleId caller, const CapToken& parent, const DelegateRequest& request)
{
    TRY(states_.check_runnable(caller));
    return engine_->delegate(caller, parent, request);
}

Result<void> Kernel::revoke(CapsuleId caller, const CapToken& token)
{
    TRY(states_.check_runnable(caller));
    return engine_->revoke(caller, token);
}

Result<Capability> Kernel::inspect(CapsuleId caller, const CapToken& token) const
{
    TRY(states_.check_runnable(caller));
    return engine_->inspect(caller, token);
}

Result<void> Kernel::send(CapsuleId caller, const ObjectId& endpoint, const CapToken& token, Message message)
{
    return router_->send(caller, endpoint, token, std::move(message));
}

Result<Message> Kernel::recv(CapsuleId caller, const ObjectId& endpoint, const CapToken& token)
{
    return router_->recv(caller, endpoint, token);
}

Result<std::shared_ptr<AuditSubscription>> Kernel::subscribe_audit(CapsuleId caller, const CapToken& token)
{
    TRY(states_.check_runnable(caller));
    auto resolved = engine_->validate_for(caller, token, Op::AuditRead, audit_log_object_);
    if (!resolved) {
        return resolved.error();
    }
    auto sub = audit_.subscribe();
    audit(AuditKind::AuditSubscribed, AuditOutcome::Success, caller, audit_log_object_, "live subscription");
    return sub;
}

Result<std::vector<AuditRecord>> Kernel::replay_audit(CapsuleId caller, const CapToken& token, uint64_t from_seq)
{
    TRY(states_.check_runnable(caller));
    auto resolved = engine_->validate_for(caller, token, Op::AuditReplay, audit_log_object_);
    if (!resolved) {
        return resolved.error();
    }
    std::vector<AuditRecord> records = audit_.history(from_seq);
    audit(AuditKind::AuditReplayed, AuditOutcome::Success, caller, audit_log_object_,
          "from_seq=" + std::to_string(from_seq) + " records=" + std::to_string(records.size()));
    return records;
}

Result<Capability> Kernel::create_endpoint(CapsuleId caller, const std::string& name)
{
    return router_->create_endpoint(caller, name);
}

Result<Capability> Kernel::create_object(CapsuleId caller, ObjectKind kind)
{
    TRY(states_.check_runnable(caller));

    OpSet ops;
    switch (kind) {
        case ObjectKind::Timer:
            ops = OpSet{Op::TimerArm};
            break;
        case ObjectKind::Storage:
            ops = OpSet{Op::StorageRead, Op::StorageWrite};
            break;
        case ObjectKind::Endpoint:
            return Error::invalid_argument("endpoints are created from the topology with create_endpoint");
        case ObjectKind::Control:
        case ObjectKind::AuditLog:
            return Error::invalid_argument(std::string(object_kind_name(kind)) + " objects are kernel-owned");
    }

    auto id = registry_.create(kind, caller);
    if (!id) {
        return id.error();
    }

    IssueRequest request;
    request.object = *id;
    request.ops = ops;
    request.delegation_depth = config_.default_delegation_depth;
    request.recipient = caller;
    auto cap = engine_->issue_privileged(request, caller, AuditKind::CapabilityIssued,
                                         std::string("new ") + object_kind_name(kind));
    if (!cap) {
        auto destroyed = registry_.destroy(*id);
        if (!destroyed) {
            logger().log(SLOG_WARN("Failed to release object after issue failure")
                             .field("error", destroyed.error().to_string()));
        }
        return cap.error();
    }
    audit(AuditKind::ObjectCreated, AuditOutcome::Success, caller, *id, object_kind_name(kind));
    return cap;
}

Result<void> Kernel::deliver(const ObjectId& endpoint, Message message)
{
    return router_->deliver(endpoint, std::move(message));
}

void Kernel::on_context_switch(CapsuleId capsule)
{
    logger().log(SLOG_DEBUG("Context switch").field("capsule", static_cast<int64_t>(capsule)));
    router_->wake_all();
}

void Kernel::freeze_capsule(CapsuleId capsule)
{
    states_.set(capsule, CapsuleRunState::Frozen);
    logger().log(SLOG_INFO("Capsule frozen").field("capsule", static_cast<int64_t>(capsule)));
    router_->wake_all();
}

void Kernel::thaw_capsule(CapsuleId capsule)
{
    states_.set(capsule, CapsuleRunState::Running);
    logger().log(SLOG_INFO("Capsule thawed").field("capsule", static_cast<int64_t>(capsule)));
    router_->wake_all();
}

void Kernel::stop_capsule(CapsuleId capsule)
{
    states_.set(capsule, CapsuleRunState::Stopped);
    logger().log(SLOG_INFO("Capsule stopped").field("capsule", static_cast<int64_t>(capsule)));
    router_->wake_all();
}

Result<void> Kernel::teardown_notify(CapsuleId capsule)
{
    if (capsule == kKernelCapsule) {
        return Error::invalid_argument("cannot tear down the kernel");
    }

    // Blocked callers of this capsule observe Stopped before their endpoints vanish.
    states_.set(capsule, CapsuleRunState::Stopped);
    router_->wake_all();

    const size_t caps = engine_->purge_capsule(capsule);
    const size_t endpoints = router_->close_owned(capsule);
    const std::vector<ObjectId> objects = registry_.release_owned(capsule);
    const size_t hooks = hooks_.retire(capsule);
    engine_->reopen_capsule(capsule);
    states_.forget(capsule);

    audit(AuditKind::CapsuleTeardown, AuditOutcome::Success, capsule, ObjectId{},
          "capabilities=" + std::to_string(caps) + " endpoints=" + std::to_string(endpoints) +
              " objects=" + std::to_string(objects.size()) + " hooks=" + std::to_string(hooks));
    logger().log(SLOG_INFO("Capsule torn down")
                     .field("capsule", static_cast<int64_t>(capsule))
                     .field("capabilities", static_cast<int64_t>(caps))
                     .field("endpoints", static_cast<int64_t>(endpoints))
                     .field("objects", static_cast<int64_t>(objects.size()))
                     .field("hooks", static_cast<int64_t>(hooks)));
    return {};
}

Result<void> Kernel::designate_policy_hook(CapsuleId caller, const CapToken& control, HookType hook,
                                           CapsuleId policy_capsule, std::shared_ptr<PolicyHandler> handler,
                                           std::optional<std::chrono::milliseconds> timeout)
{
    TRY(states_.check_runnable(caller));
    if (policy_capsule == kKernelCapsule) {
        return Error::invalid_argument("policy capsule id 0 is reserved for the kernel");
    }
    auto resolved = engine_->validate_for(caller, control, Op::Control, control_object_);
    if (!resolved) {
        return resolved.error();
    }
    const std::chrono::milliseconds effective = timeout.value_or(std::chrono::milliseconds(config_.policy_timeout_ms));
    TRY(hooks_.designate(hook, policy_capsule, std::move(handler), effective));
    audit(AuditKind::PolicyDesignated, AuditOutcome::Success, caller, control_object_,
          std::string("hook=") + hook_type_name(hook) + " policy_capsule=" + std::to_string(policy_capsule) +
              " timeout_ms=" + std::to_string(effective.count()));
    return {};
}

Result<void> Kernel::require_policy_capsule(CapsuleId caller, const char* action)
{
    TRY(states_.check_runnable(caller));
    if (hooks_.is_policy_capsule(caller)) {
        return {};
    }
    audit(AuditKind::AccessDenied, AuditOutcome::Failure, caller, control_object_,
          std::string("Unauthorized: ") + action + " requires a designated policy capsule");
    return Error(ErrorCode::Unauthorized, "Caller is not a designated policy capsule", action);
}

Result<void> Kernel::set_drop_policy(CapsuleId caller, const ObjectId& endpoint, DropPolicy policy)
{
    TRY(require_policy_capsule(caller, "set_drop_policy"));
    TRY(router_->set_drop_policy(endpoint, policy));
    audit(AuditKind::ConfigChanged, AuditOutcome::Success, caller, endpoint,
          std::string("drop_policy=") + drop_policy_name(policy));
    return {};
}

Result<void> Kernel::set_backpressure_auditing(CapsuleId caller, bool enabled)
{
    TRY(require_policy_capsule(caller, "set_backpressure_auditing"));
    audit_.set_backpressure_auditing(enabled);
    audit(AuditKind::ConfigChanged, AuditOutcome::Success, caller, audit_log_object_,
          std::string("audit_backpressure=") + (enabled ? "true" : "false"));
    return {};
}

Result<void> Kernel::quarantine_capsule(CapsuleId caller, CapsuleId target, const std::string& reason)
{
    TRY(require_policy_capsule(caller, "quarantine"));
    if (target == kKernelCapsule) {
        return Error::invalid_argument("cannot quarantine the kernel");
    }
    router_->quarantine(target, "requested by policy capsule " + std::to_string(caller) + ": " + reason);
    return {};
}

Result<size_t> Kernel::pending_messages(const ObjectId& endpoint) const
{
    return router_->pending(endpoint);
}

void Kernel::flush_audit()
{
    audit_.flush();
}

} // namespace capkern
