// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "audit.hpp"
#include "capability_engine.hpp"
#include "capsule_state.hpp"
#include "endpoint.hpp"
#include "object_registry.hpp"
#include "platform.hpp"
#include "policy_hooks.hpp"
#include "result.hpp"
#include "topology.hpp"
#include "types.hpp"

namespace capkern {

struct RouterLimits {
    uint32_t max_message_bytes = kDefaultMaxMessageBytes;
    uint8_t endpoint_delegation_depth = 4; // depth of the owner's Send+Recv capability
};

/**
 * Endpoint & Message Router.
 *
 * Owns every live endpoint. Send and recv are authorized through the
 * capability engine, vetted by the operation hook and the static topology,
 * then applied to the endpoint queue.
 */
class Router {
  public:
    Router(const Platform& platform, RouterLimits limits, const Topology& topology, ObjectRegistry& registry,
           CapabilityEngine& engine, PolicyHookTable& hooks, AuditSink& audit, CapsuleStates& states);

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    // Create the topology endpoint `name`; the caller must be its configured owner.
    Result<Capability> create_endpoint(CapsuleId caller, const std::string& name);

    Result<void> send(CapsuleId caller, const ObjectId& endpoint, const CapToken& token, Message message);
    Result<Message> recv(CapsuleId caller, const ObjectId& endpoint, const CapToken& token);

    // Kernel-originated delivery (timers). No capability check.
    Result<void> deliver(const ObjectId& endpoint, Message message);

    Result<void> set_drop_policy(const ObjectId& endpoint, DropPolicy policy);
    Result<size_t> pending(const ObjectId& endpoint) const;

    // Wake blocked operations so they re-check the caller's run state.
    void wake_all();

    // Close and destroy every endpoint owned by `owner`. Returns how many.
    size_t close_owned(CapsuleId owner);

    // Mark `capsule` quarantined after an invariant violation and audit it.
    void quarantine(CapsuleId capsule, const std::string& reason);

  private:
    std::shared_ptr<Endpoint> find(const ObjectId& id) const;
    std::shared_ptr<Endpoint> find_by_name(const std::string& name) const;
    Result<void> enqueue(CapsuleId producer, const std::shared_ptr<Endpoint>& endpoint, Message message,
                         bool blocking, bool allow_drop);
    void notify_drop(const std::shared_ptr<Endpoint>& endpoint, const DroppedMessage& dropped);
    Error reject(ErrorCode code, AuditKind kind, CapsuleId subject, const ObjectId& object, const Error& cause);
    void audit(AuditKind kind, AuditOutcome outcome, CapsuleId subject, const ObjectId& object, std::string reason);
    InterruptCheck interrupt_for(CapsuleId capsule) const;

    const Platform& platform_;
    const RouterLimits limits_;
    const Topology& topology_;
    ObjectRegistry& registry_;
    CapabilityEngine& engine_;
    PolicyHookTable& hooks_;
    AuditSink& audit_;
    CapsuleStates& states_;

    mutable std::shared_mutex mu_;
    std::unordered_map<ObjectId, std::shared_ptr<Endpoint>, ObjectIdHash> endpoints_;
    std::unordered_map<std::string, ObjectId> by_name_;
};

} // namespace capkern
