// cppcheck-suppress-file missingIncludeSystem
#include "capability_engine.hpp"

#include <algorithm>

#include "logging.hpp"

namespace capkern {

namespace {

Result<void> check_limits(const CapLimits& limits)
{
    if (limits.quota != 0 && limits.quota_window_ms == 0) {
        return Error::invalid_argument("quota_window_ms must be positive when quota is set");
    }
    if (limits.rate_per_sec == 0 && limits.rate_burst != 0) {
        return Error::invalid_argument("rate_burst requires rate_per_sec");
    }
    return {};
}

// Empty when `child` is at least as tight as every limit on `parent`.
std::string limit_relaxation(const CapabilityRecord& parent, const CapLimits& child, uint64_t now)
{
    if (parent.expires_at_ms != 0) {
        if (child.ttl_ms == 0) {
            return "unbounded ttl under an expiring parent";
        }
        if (now + child.ttl_ms > parent.expires_at_ms) {
            return "ttl outlives parent";
        }
    }
    if (parent.limits.quota != 0) {
        if (child.quota == 0 || child.quota > parent.limits.quota) {
            return "quota exceeds parent";
        }
        if (child.quota_window_ms < parent.limits.quota_window_ms) {
            return "quota window shorter than parent";
        }
    }
    if (parent.limits.rate_per_sec != 0) {
        if (child.rate_per_sec == 0 || child.rate_per_sec > parent.limits.rate_per_sec) {
            return "rate exceeds parent";
        }
        if (child.effective_burst() > parent.limits.effective_burst()) {
            return "burst exceeds parent";
        }
    }
    if (parent.limits.max_uses != 0) {
        if (child.max_uses == 0 || child.max_uses > parent.uses_remaining) {
            return "max_uses exceeds parent's remaining uses";
        }
    }
    return {};
}

void arm_counters(CapabilityRecord& record, uint64_t now)
{
    record.issued_at_ms = now;
    record.expires_at_ms = record.limits.ttl_ms != 0 ? now + record.limits.ttl_ms : 0;
    record.uses_remaining = record.limits.max_uses;
    record.uses_total = 0;
    record.bucket = TokenBucket(record.limits.rate_per_sec, record.limits.effective_burst(), now);
    record.quota = FixedWindowQuota(record.limits.quota, record.limits.quota_window_ms, now);
}

bool is_expired(const CapabilityRecord& record, uint64_t now)
{
    return record.expires_at_ms != 0 && now > record.expires_at_ms;
}

bool counters_admit(const CapabilityRecord& record, uint64_t now)
{
    return record.quota.can_take(now) && record.bucket.can_take(now);
}

} // namespace

CapabilityEngine::CapabilityEngine(const Platform& platform, ObjectRegistry& registry, PolicyHookTable& hooks,
                                   AuditSink& audit, const ObjectId& control_object)
    : platform_(platform), registry_(registry), hooks_(hooks), audit_(audit), control_object_(control_object)
{
}

void CapabilityEngine::audit(AuditKind kind, AuditOutcome outcome, CapsuleId subject, const ObjectId& object,
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

Error CapabilityEngine::deny(ErrorCode code, AuditKind kind, CapsuleId subject, const ObjectId& object,
                             const std::string& message, const std::string& reason)
{
    const bool opt_in_only = code == ErrorCode::RateLimited || code == ErrorCode::WouldBlock;
    if (!opt_in_only || audit_.backpressure_auditing()) {
        audit(kind, AuditOutcome::Failure, subject, object,
              reason.empty() ? std::string(error_code_name(code)) : std::string(error_code_name(code)) + ": " + reason);
    }
    logger().log(SLOG_DEBUG("Capability check failed")
                     .field("code", error_code_name(code))
                     .field("capsule", static_cast<int64_t>(subject))
                     .field("reason", reason));
    return Error(code, message);
}

Error CapabilityEngine::deny_missing(const CapabilityTable& table, CapsuleId caller, const CapToken& token,
                                     const ObjectId& object, const std::string& reason)
{
    if (table.was_exhausted(token)) {
        return deny(ErrorCode::Exhausted, AuditKind::AccessDenied, caller, object, "Capability use count exhausted",
                    reason);
    }
    return deny(ErrorCode::Unauthorized, AuditKind::AccessDenied, caller, object, "No matching capability", reason);
}

PolicyOutcome CapabilityEngine::consult(const PolicyQuery& query, CapsuleId subject)
{
    PolicyOutcome outcome = hooks_.consult(query);
    if (outcome.timed_out) {
        audit(AuditKind::PolicyTimeout, AuditOutcome::Failure, subject, query.object,
              std::string("hook=") + hook_type_name(query.hook) +
                  " policy_capsule=" + std::to_string(outcome.policy_capsule) +
                  " default=" + policy_verdict_name(outcome.decision.verdict) +
                  (outcome.saturated ? " queue_full" : ""));
    }
    return outcome;
}

Result<CapabilityEngine::StagedCapability> CapabilityEngine::stage_new(CapsuleId holder, CapabilityRecord record)
{
    auto table = space_.table_or_create(holder);
    if (!table) {
        return Error(ErrorCode::CapsuleSuspended, "Recipient capsule is being torn down",
                     "capsule=" + std::to_string(holder));
    }
    constexpr int kTokenAttempts = 4;
    for (int attempt = 0; attempt < kTokenAttempts; ++attempt) {
        auto token = platform_.make_token();
        if (!token) {
            return token.error();
        }
        if (!space_.claim_token(*token)) {
            continue;
        }
        record.token = *token;
        auto pending = table->reserve(record);
        if (!pending) {
            space_.release_token(*token);
            return pending.error();
        }
        return StagedCapability{capability_view(record, holder, pending->handle()), table, *pending};
    }
    return Error(ErrorCode::Internal, "Token generation kept colliding");
}

void CapabilityEngine::discard(const StagedCapability& staged)
{
    staged.table->abandon(staged.slot, staged.view.token);
    space_.release_token(staged.view.token);
}

Result<Capability> CapabilityEngine::insert_new(CapsuleId holder, CapabilityRecord record)
{
    auto staged = stage_new(holder, std::move(record));
    if (!staged) {
        return staged.error();
    }
    if (!staged->slot.activate()) {
        discard(*staged);
        return Error(ErrorCode::CapsuleSuspended, "Recipient capsule is being torn down",
                     "capsule=" + std::to_string(holder));
    }
    return staged->view;
}

Result<Capability> CapabilityEngine::issue(const IssueRequest& request, const RequestContext& context)
{
    auto info = registry_.resolve(request.object);
    if (!info) {
        return deny(ErrorCode::Unauthorized, AuditKind::AccessDenied, context.caller, request.object,
                    "Not authorized to issue on this object", "unknown object");
    }

    bool authorized = info->owner == context.caller;
    if (!authorized && context.authority.has_value()) {
        auto root = validate_for(context.caller, *context.authority, Op::Control, control_object_);
        if (!root) {
            return root.error();
        }
        authorized = true;
    }
    if (!authorized) {
        return deny(ErrorCode::Unauthorized, AuditKind::AccessDenied, context.caller, request.object,
                    "Not authorized to issue on this object", "caller neither owns the object nor holds authority");
    }
    return issue_privileged(request, context.caller, AuditKind::CapabilityIssued, context.reason);
}

Result<Capability> CapabilityEngine::issue_privileged(const IssueRequest& request, CapsuleId subject, AuditKind kind,
                                                      const std::string& reason)
{
    if (request.ops.empty()) {
        return Error::invalid_argument("ops must not be empty");
    }
    if (request.delegation_depth > kMaxDelegationDepth) {
        return Error::invalid_argument("delegation_depth above " + std::to_string(kMaxDelegationDepth));
    }
    if (request.recipient == kKernelCapsule) {
        return Error::invalid_argument("capabilities cannot be issued to the kernel");
    }
    TRY(check_limits(request.limits));

    auto info = registry_.resolve(request.object);
    if (!info) {
        return deny(ErrorCode::Unauthorized, AuditKind::AccessDenied, subject, request.object,
                    "Not authorized to issue on this object", "unknown object");
    }

    PolicyQuery query;
    query.hook = HookType::IssuancePreCheck;
    query.subject = subject;
    query.target = request.recipient;
    query.object = request.object;
    query.kind = info->kind;
    query.ops = request.ops;
    query.labels = request.labels;
    query.detail = reason;
    const PolicyOutcome outcome = consult(query, subject);
    if (outcome.decision.verdict != PolicyVerdict::Allow) {
        return deny(ErrorCode::PolicyDenied, AuditKind::PolicyDenied, subject, request.object, "Issuance denied by policy",
                    outcome.decision.reason);
    }

    CapabilityRecord record;
    record.object = request.object;
    record.kind = info->kind;
    record.ops = request.ops;
    record.limits = request.limits;
    record.delegation_depth = request.delegation_depth;
    record.labels = request.labels;
    arm_counters(record, platform_.now_ms());

    auto cap = insert_new(request.recipient, std::move(record));
    if (!cap) {
        logger().log(SLOG_ERROR("Capability insert failed")
                         .field("recipient", static_cast<int64_t>(request.recipient))
                         .field("error", cap.error().to_string()));
        return cap.error();
    }

    std::string detail = "recipient=" + std::to_string(request.recipient) + " ops=" + request.ops.to_string() +
                         " token=" + token_fingerprint(cap->token);
    if (!reason.empty()) {
        detail += " reason=" + reason;
    }
    audit(kind, AuditOutcome::Success, subject, request.object, std::move(detail));
    return cap;
}

Result<ResolvedObject> CapabilityEngine::validate(CapsuleId caller, const CapToken& token, Op op)
{
    return validate_impl(caller, token, op, nullptr);
}

Result<ResolvedObject> CapabilityEngine::validate_for(CapsuleId caller, const CapToken& token, Op op,
                                                      const ObjectId& expected)
{
    return validate_impl(caller, token, op, &expected);
}

Result<ResolvedObject> CapabilityEngine::validate_impl(CapsuleId caller, const CapToken& token, Op op,
                                                       const ObjectId* expected)
{
    const ObjectId audit_object = expected ? *expected : ObjectId{};
    const std::string fp = "token=" + token_fingerprint(token);

    auto table = space_.table(caller);
    if (!table) {
        return deny(ErrorCode::Unauthorized, AuditKind::AccessDenied, caller, audit_object, "No matching capability",
                    fp);
    }
    auto handle = table->find(token);
    if (!handle) {
        return deny_missing(*table, caller, token, audit_object, fp);
    }

    const uint64_t now = platform_.now_ms();
    ResolvedObject resolved;
    PolicyQuery query;
    std::optional<CapabilityRecord> retired;

    // Phase 1: checks in fixed order under the slot lock.
    {
        auto guard = table->lock(*handle);
        if (!guard) {
            return deny_missing(*table, caller, token, audit_object, fp + " stale");
        }
        CapabilityRecord& rec = guard->record();
        auto info = registry_.resolve(rec.object);
        if (!info) {
            return deny(ErrorCode::Unauthorized, AuditKind::AccessDenied, caller, rec.object, "No matching capability",
                        fp + " object gone");
        }
        if (!rec.ops.contains(op)) {
            return deny(ErrorCode::Unauthorized, AuditKind::AccessDenied, caller, rec.object, "No matching capability",
                        fp + " op=" + op_name(op) + " not granted");
        }
        if (expected && rec.object != *expected) {
            return deny(ErrorCode::Unauthorized, AuditKind::AccessDenied, caller, *expected, "No matching capability",
                        fp + " object mismatch");
        }
        if (is_expired(rec, now)) {
            retired = guard->retire();
        } else if (!counters_admit(rec, now)) {
            return deny(ErrorCode::RateLimited, AuditKind::RateLimited, caller, rec.object, "Capability rate limited",
                        fp);
        } else {
            resolved.id = rec.object;
            resolved.kind = rec.kind;
            resolved.owner = info->owner;
            resolved.labels = rec.labels;

            query.subject = caller;
            query.target = info->owner;
            query.object = rec.object;
            query.kind = rec.kind;
            query.op = op;
            query.ops = rec.ops;
            query.token_fingerprint = token_fingerprint(token);
            query.labels = rec.labels;
        }
    }
    if (retired) {
        const ObjectId object = retired->object;
        finish_retire(table, caller, *handle, std::move(*retired), AuditKind::CapabilityExpired, "ttl elapsed");
        return Error(ErrorCode::Expired, "Capability expired", object_id_to_string(object));
    }

    // Policy callouts run unlocked.
    query.hook = HookType::QuotaEnforcement;
    const PolicyOutcome quota = consult(query, caller);
    if (quota.decision.verdict == PolicyVerdict::Throttle) {
        return deny(ErrorCode::RateLimited, AuditKind::RateLimited, caller, resolved.id, "Throttled by policy",
                    quota.decision.reason);
    }
    if (quota.decision.verdict == PolicyVerdict::Deny) {
        return deny(ErrorCode::PolicyDenied, AuditKind::PolicyDenied, caller, resolved.id, "Denied by quota policy",
                    quota.decision.reason);
    }
    query.hook = HookType::RuntimeViolation;
    const PolicyOutcome veto = consult(query, caller);
    if (veto.decision.verdict != PolicyVerdict::Allow) {
        return deny(ErrorCode::PolicyDenied, AuditKind::PolicyDenied, caller, resolved.id, "Vetoed by runtime policy",
                    veto.decision.reason);
    }

    // Phase 2: commit. A revoke between the phases bumps the generation and
    // lock() fails. Consuming the last use retires the record here, so no
    // live record ever has zero uses left.
    {
        auto guard = table->lock(*handle);
        if (!guard) {
            return deny_missing(*table, caller, token, resolved.id, fp + " revoked during validation");
        }
        CapabilityRecord& rec = guard->record();
        if (!counters_admit(rec, now)) {
            return deny(ErrorCode::RateLimited, AuditKind::RateLimited, caller, rec.object, "Capability rate limited",
                        fp);
        }
        rec.quota.take(now);
        rec.bucket.take(now);
        ++rec.uses_total;
        if (rec.limits.max_uses != 0 && --rec.uses_remaining == 0) {
            retired = guard->retire();
        }
    }
    if (retired) {
        table->remember_exhausted(token);
        finish_retire(table, caller, *handle, std::move(*retired), AuditKind::CapabilityExhausted, "max_uses consumed");
    }

    if (audit_.allowed_auditing()) {
        audit(AuditKind::OperationAllowed, AuditOutcome::Success, caller, resolved.id,
              std::string("op=") + op_name(op) + " " + fp);
    }
    return resolved;
}

Result<Capability> CapabilityEngine::delegate(CapsuleId caller, const CapToken& parent, const DelegateRequest& request)
{
    if (request.ops.empty()) {
        return Error::invalid_argument("ops must not be empty");
    }
    if (request.target == kKernelCapsule) {
        return Error::invalid_argument("capabilities cannot be delegated to the kernel");
    }
    TRY(check_limits(request.limits));

    const std::string fp = "token=" + token_fingerprint(parent);
    auto table = space_.table(caller);
    if (!table) {
        return deny(ErrorCode::Unauthorized, AuditKind::AccessDenied, caller, ObjectId{}, "No matching capability", fp);
    }
    auto handle = table->find(parent);
    if (!handle) {
        return deny(ErrorCode::Unauthorized, AuditKind::AccessDenied, caller, ObjectId{}, "No matching capability", fp);
    }

    const uint64_t now = platform_.now_ms();
    CapabilityRecord child;
    PolicyQuery query;
    std::optional<CapabilityRecord> retired;
    {
        auto guard = table->lock(*handle);
        if (!guard) {
            return deny(ErrorCode::Unauthorized, AuditKind::AccessDenied, caller, ObjectId{}, "No matching capability",
                        fp + " stale");
        }
        const CapabilityRecord& rec = guard->record();
        if (!registry_.exists(rec.object)) {
            return deny(ErrorCode::Unauthorized, AuditKind::AccessDenied, caller, rec.object, "No matching capability",
                        fp + " object gone");
        }
        if (is_expired(rec, now)) {
            retired = guard->retire();
        } else {
            if (rec.delegation_depth == 0) {
                return deny(ErrorCode::DelegationDepthExceeded, AuditKind::DelegationDenied, caller, rec.object,
                            "Capability cannot be delegated further", fp);
            }
            if (!request.ops.is_subset_of(rec.ops)) {
                return deny(ErrorCode::DelegationRightsExceeded, AuditKind::DelegationDenied, caller, rec.object,
                            "Delegated ops exceed parent", fp + " ops=" + request.ops.to_string());
            }
            const std::string relaxed = limit_relaxation(rec, request.limits, now);
            if (!relaxed.empty()) {
                return deny(ErrorCode::DelegationRightsExceeded, AuditKind::DelegationDenied, caller, rec.object,
                            "Delegated limits relax parent", fp + " " + relaxed);
            }

            child.object = rec.object;
            child.kind = rec.kind;
            child.ops = request.ops;
            child.limits = request.limits;
            child.delegation_depth = static_cast<uint8_t>(rec.delegation_depth - 1);
            child.labels = rec.labels;
            for (const auto& [key, value] : request.labels) {
                child.labels.emplace(key, value);
            }

            query.hook = HookType::DelegationCheck;
            query.subject = caller;
            query.target = request.target;
            query.object = rec.object;
            query.kind = rec.kind;
            query.ops = request.ops;
            query.token_fingerprint = token_fingerprint(parent);
            query.labels = child.labels;
        }
    }
    if (retired) {
        const ObjectId object = retired->object;
        finish_retire(table, caller, *handle, std::move(*retired), AuditKind::CapabilityExpired, "ttl elapsed");
        return Error(ErrorCode::Expired, "Capability expired", object_id_to_string(object));
    }

    const PolicyOutcome outcome = consult(query, caller);
    if (outcome.decision.verdict != PolicyVerdict::Allow) {
        return deny(ErrorCode::PolicyDenied, AuditKind::PolicyDenied, caller, child.object,
                    "Delegation denied by policy", outcome.decision.reason);
    }

    arm_counters(child, now);
    child.has_parent = true;
    child.parent = CapRef{caller, *handle};
    auto staged = stage_new(request.target, std::move(child));
    if (!staged) {
        return staged.error();
    }

    // The child goes live under the parent's slot lock, in the same critical
    // section that links it. A revoke of the parent either runs first, and
    // the child never becomes usable, or sees the link and cascades to it.
    bool parent_live = false;
    bool linked = false;
    {
        auto guard = table->lock(*handle);
        if (guard) {
            parent_live = true;
            if (staged->slot.activate()) {
                guard->record().children.push_back(CapRef{request.target, staged->slot.handle()});
                linked = true;
            }
        }
    }
    if (!linked) {
        const ObjectId object = staged->view.object;
        discard(*staged);
        if (!parent_live) {
            return deny(ErrorCode::Unauthorized, AuditKind::AccessDenied, caller, object, "No matching capability",
                        fp + " revoked during delegation");
        }
        return Error(ErrorCode::CapsuleSuspended, "Recipient capsule is being torn down",
                     "capsule=" + std::to_string(request.target));
    }
    const Capability& cap = staged->view;

    audit(AuditKind::CapabilityDelegated, AuditOutcome::Success, caller, cap.object,
          "target=" + std::to_string(request.target) + " ops=" + request.ops.to_string() +
              " depth=" + std::to_string(cap.delegation_depth) + " token=" + token_fingerprint(cap.token));
    return cap;
}

Result<void> CapabilityEngine::revoke(CapsuleId caller, const CapToken& token)
{
    const std::string fp = "token=" + token_fingerprint(token);
    auto table = space_.table(caller);
    if (!table) {
        return deny(ErrorCode::Unauthorized, AuditKind::AccessDenied, caller, ObjectId{}, "No matching capability", fp);
    }
    auto handle = table->find(token);
    if (!handle) {
        return deny(ErrorCode::Unauthorized, AuditKind::AccessDenied, caller, ObjectId{}, "No matching capability", fp);
    }

    CapabilityRecord record;
    {
        auto guard = table->lock(*handle);
        if (!guard) {
            return deny(ErrorCode::Unauthorized, AuditKind::AccessDenied, caller, ObjectId{}, "No matching capability",
                        fp + " stale");
        }
        record = guard->retire();
    }
    finish_retire(table, caller, *handle, std::move(record), AuditKind::CapabilityRevoked, "revoked by holder");
    return {};
}

Result<Capability> CapabilityEngine::inspect(CapsuleId caller, const CapToken& token) const
{
    auto table = space_.table(caller);
    if (!table) {
        return Error(ErrorCode::Unauthorized, "No matching capability");
    }
    auto handle = table->find(token);
    if (!handle) {
        return handle.error();
    }
    auto guard = table->lock(*handle);
    if (!guard) {
        return guard.error();
    }
    return capability_view(guard->record(), caller, *handle);
}

size_t CapabilityEngine::live_count(CapsuleId capsule) const
{
    auto table = space_.table(capsule);
    return table ? table->live_count() : 0;
}

void CapabilityEngine::finish_retire(const std::shared_ptr<CapabilityTable>& table, CapsuleId holder,
                                     CapHandle handle, CapabilityRecord record, AuditKind kind,
                                     const std::string& reason)
{
    table->release(handle, record.token);
    space_.release_token(record.token);
    unlink_from_parent(record, holder, handle);

    const AuditOutcome outcome = kind == AuditKind::CapabilityRevoked ? AuditOutcome::Success : AuditOutcome::Failure;
    audit(kind, outcome, holder, record.object, reason + " token=" + token_fingerprint(record.token));

    const size_t cascaded = cascade(std::move(record.children));
    if (cascaded > 0) {
        logger().log(SLOG_DEBUG("Revocation cascaded")
                         .field("capsule", static_cast<int64_t>(holder))
                         .field("descendants", static_cast<int64_t>(cascaded)));
    }
}

bool CapabilityEngine::retire_ref(const CapRef& ref, AuditKind kind, const std::string& reason)
{
    auto table = space_.table(ref.holder);
    if (!table) {
        return false;
    }
    CapabilityRecord record;
    {
        auto guard = table->lock(ref.handle);
        if (!guard) {
            return false;
        }
        record = guard->retire();
    }
    finish_retire(table, ref.holder, ref.handle, std::move(record), kind, reason);
    return true;
}

void CapabilityEngine::unlink_from_parent(const CapabilityRecord& record, CapsuleId holder, CapHandle handle)
{
    if (!record.has_parent) {
        return;
    }
    auto table = space_.table(record.parent.holder);
    if (!table) {
        return;
    }
    auto guard = table->lock(record.parent.handle);
    if (!guard) {
        return;
    }
    auto& children = guard->record().children;
    children.erase(std::remove_if(children.begin(), children.end(),
                                  [&](const CapRef& ref) { return ref.holder == holder && ref.handle == handle; }),
                   children.end());
}

size_t CapabilityEngine::cascade(std::vector<CapRef> children)
{
    size_t count = 0;
    for (const auto& child : children) {
        if (retire_ref(child, AuditKind::CapabilityRevoked, "ancestor revoked")) {
            ++count;
        }
    }
    return count;
}

void CapabilityEngine::reopen_capsule(CapsuleId capsule)
{
    space_.reopen(capsule);
}

size_t CapabilityEngine::purge_capsule(CapsuleId capsule)
{
    auto table = space_.detach(capsule);
    if (!table) {
        return 0;
    }
    std::vector<CapabilityRecord> records = table->close();
    const size_t count = records.size();
    for (auto& record : records) {
        space_.release_token(record.token);
        if (record.has_parent && record.parent.holder != capsule) {
            auto parent_table = space_.table(record.parent.holder);
            if (parent_table) {
                auto guard = parent_table->lock(record.parent.handle);
                if (guard) {
                    auto& children = guard->record().children;
                    children.erase(std::remove_if(children.begin(), children.end(),
                                                  [&](const CapRef& ref) { return ref.holder == capsule; }),
                                   children.end());
                }
            }
        }
        cascade(std::move(record.children));
    }
    return count;
}

} // namespace capkern
