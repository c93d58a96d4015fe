// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>

#include "audit.hpp"
#include "capability_store.hpp"
#include "object_registry.hpp"
#include "platform.hpp"
#include "policy_hooks.hpp"
#include "result.hpp"
#include "types.hpp"

namespace capkern {

struct IssueRequest {
    ObjectId object;
    OpSet ops;
    CapLimits limits;
    uint8_t delegation_depth = 0;
    Labels labels;
    CapsuleId recipient = 0;
};

struct RequestContext {
    CapsuleId caller = 0;
    std::optional<CapToken> authority; // Control on the kernel control object
    std::string reason;
};

struct DelegateRequest {
    OpSet ops;
    CapLimits limits;
    CapsuleId target = 0;
    Labels labels; // added to the inherited labels; cannot override them
};

/**
 * Capability Store + Validator.
 *
 * Lock discipline: a thread holds at most one slot lock at a time and never
 * calls into a CapabilityTable's index (insert, release, close) or the
 * policy hooks while holding one. The one nesting is delegate(), which
 * activates the reserved child slot under the parent's slot lock; a reserved
 * slot is never locked by anyone else for longer than a liveness check.
 */
class CapabilityEngine {
  public:
    CapabilityEngine(const Platform& platform, ObjectRegistry& registry, PolicyHookTable& hooks, AuditSink& audit,
                     const ObjectId& control_object);

    CapabilityEngine(const CapabilityEngine&) = delete;
    CapabilityEngine& operator=(const CapabilityEngine&) = delete;

    Result<Capability> issue(const IssueRequest& request, const RequestContext& context);

    // Issue without the ownership/authority check. Boot and endpoint setup
    // only; the issuance pre-check hook is still consulted.
    Result<Capability> issue_privileged(const IssueRequest& request, CapsuleId subject, AuditKind kind,
                                        const std::string& reason);

    Result<ResolvedObject> validate(CapsuleId caller, const CapToken& token, Op op);
    Result<ResolvedObject> validate_for(CapsuleId caller, const CapToken& token, Op op, const ObjectId& expected);

    Result<Capability> delegate(CapsuleId caller, const CapToken& parent, const DelegateRequest& request);
    Result<void> revoke(CapsuleId caller, const CapToken& token);

    // Read-only copy of a capability the caller holds.
    Result<Capability> inspect(CapsuleId caller, const CapToken& token) const;

    // Teardown: retire the capsule's whole table and cascade to every
    // capability delegated from it. Returns the number of records retired.
    size_t purge_capsule(CapsuleId capsule);

    // End of teardown: the capsule id may receive capabilities again.
    void reopen_capsule(CapsuleId capsule);

    [[nodiscard]] const ObjectId& control_object() const { return control_object_; }
    [[nodiscard]] size_t live_count(CapsuleId capsule) const;

  private:
    Result<ResolvedObject> validate_impl(CapsuleId caller, const CapToken& token, Op op, const ObjectId* expected);
    struct StagedCapability {
        Capability view;
        std::shared_ptr<CapabilityTable> table;
        PendingSlot slot;
    };

    // Reserve a slot with a fresh token in the holder's table. Not live yet.
    Result<StagedCapability> stage_new(CapsuleId holder, CapabilityRecord record);
    void discard(const StagedCapability& staged);
    Result<Capability> insert_new(CapsuleId holder, CapabilityRecord record);

    // Post-retire bookkeeping: index, ledger, parent link, cascade, audit.
    void finish_retire(const std::shared_ptr<CapabilityTable>& table, CapsuleId holder, CapHandle handle,
                       CapabilityRecord record, AuditKind kind, const std::string& reason);
    bool retire_ref(const CapRef& ref, AuditKind kind, const std::string& reason);
    void unlink_from_parent(const CapabilityRecord& record, CapsuleId holder, CapHandle handle);
    size_t cascade(std::vector<CapRef> children);

    PolicyOutcome consult(const PolicyQuery& query, CapsuleId subject);
    // Unauthorized, or Exhausted when the token's last use was consumed.
    Error deny_missing(const CapabilityTable& table, CapsuleId caller, const CapToken& token, const ObjectId& object,
                       const std::string& reason);
    Error deny(ErrorCode code, AuditKind kind, CapsuleId subject, const ObjectId& object, const std::string& message,
               const std::string& reason = {});
    void audit(AuditKind kind, AuditOutcome outcome, CapsuleId subject, const ObjectId& object, std::string reason);

    const Platform& platform_;
    ObjectRegistry& registry_;
    PolicyHookTable& hooks_;
    AuditSink& audit_;
    const ObjectId control_object_;
    CapabilitySpace space_;
};

} // namespace capkern
