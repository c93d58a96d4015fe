// cppcheck-suppress-file missingIncludeSystem
#include "router.hpp"

#include <algorithm>
#include <mutex>

#include "logging.hpp"
#include "message.hpp"

namespace capkern {

namespace {

bool wants_blocking(const EndpointConfig& config, const Labels& labels)
{
    if (config.blocking) {
        return true;
    }
    auto it = labels.find(kBlockingLabel);
    return it != labels.end() && it->second == "true";
}

} // namespace

Router::Router(const Platform& platform, RouterLimits limits, const Topology& topology, ObjectRegistry& registry,
               CapabilityEngine& engine, PolicyHookTable& hooks, AuditSink& audit, CapsuleStates& states)
    : platform_(platform), limits_(limits), topology_(topology), registry_(registry), engine_(engine), hooks_(hooks),
      audit_(audit), states_(states)
{
}

void Router::audit(AuditKind kind, AuditOutcome outcome, CapsuleId subject, const ObjectId& object,
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

Error Router::reject(ErrorCode code, AuditKind kind, CapsuleId subject, const ObjectId& object, const Error& cause)
{
    const bool opt_in_only = code == ErrorCode::RateLimited || code == ErrorCode::WouldBlock;
    if (!opt_in_only || audit_.backpressure_auditing()) {
        audit(kind, AuditOutcome::Failure, subject, object, cause.to_string());
    }
    return Error(code, cause.message(), cause.context());
}

InterruptCheck Router::interrupt_for(CapsuleId capsule) const
{
    return [this, capsule]() { return states_.check_runnable(capsule); };
}

std::shared_ptr<Endpoint> Router::find(const ObjectId& id) const
{
    std::shared_lock<std::shared_mutex> lock(mu_);
    auto it = endpoints_.find(id);
    return it == endpoints_.end() ? nullptr : it->second;
}

std::shared_ptr<Endpoint> Router::find_by_name(const std::string& name) const
{
    std::shared_lock<std::shared_mutex> lock(mu_);
    auto it = by_name_.find(name);
    if (it == by_name_.end()) {
        return nullptr;
    }
    auto ep = endpoints_.find(it->second);
    return ep == endpoints_.end() ? nullptr : ep->second;
}

Result<Capability> Router::create_endpoint(CapsuleId caller, const std::string& name)
{
    TRY(states_.check_runnable(caller));

    const EndpointConfig* declared = topology_.find_endpoint(name);
    if (!declared) {
        return Error::not_found("endpoint '" + name + "' is not in the topology");
    }
    if (declared->owner != caller) {
        return reject(ErrorCode::Unauthorized, AuditKind::AccessDenied, caller, ObjectId{},
                      Error(ErrorCode::Unauthorized, "Not the endpoint's configured owner", name));
    }

    EndpointConfig config = *declared;
    config.max_message_bytes = std::min(config.max_message_bytes, limits_.max_message_bytes);

    ObjectId id;
    {
        std::unique_lock<std::shared_mutex> lock(mu_);
        if (by_name_.find(name) != by_name_.end()) {
            return Error(ErrorCode::AlreadyExists, "Endpoint already created", name);
        }
        auto created = registry_.create(ObjectKind::Endpoint, caller);
        if (!created) {
            return created.error();
        }
        id = *created;
        endpoints_.emplace(id, std::make_shared<Endpoint>(id, config));
        by_name_.emplace(name, id);
    }

    IssueRequest request;
    request.object = id;
    request.ops = OpSet{Op::Send, Op::Recv};
    request.delegation_depth = limits_.endpoint_delegation_depth;
    request.recipient = caller;
    auto cap = engine_.issue_privileged(request, caller, AuditKind::CapabilityIssued, "endpoint " + name);
    if (!cap) {
        {
            std::unique_lock<std::shared_mutex> lock(mu_);
            endpoints_.erase(id);
            by_name_.erase(name);
        }
        auto destroyed = registry_.destroy(id);
        if (!destroyed) {
            logger().log(SLOG_WARN("Failed to release endpoint object after issue failure")
                             .field("endpoint", name)
                             .field("error", destroyed.error().to_string()));
        }
        return cap.error();
    }

    audit(AuditKind::EndpointCreated, AuditOutcome::Success, caller, id,
          "name=" + name + " capacity=" + std::to_string(config.capacity) +
              " ordering=" + ordering_mode_name(config.ordering) + " drop=" + drop_policy_name(config.drop));
    logger().log(SLOG_INFO("Endpoint created")
                     .field("endpoint", name)
                     .field("owner", static_cast<int64_t>(caller))
                     .field("capacity", static_cast<int64_t>(config.capacity)));
    return cap;
}

Result<void> Router::send(CapsuleId caller, const ObjectId& endpoint_id, const CapToken& token, Message message)
{
    TRY(states_.check_runnable(caller));

    auto valid = validate_message(message, limits_.max_message_bytes);
    if (!valid) {
        return reject(valid.error().code(), AuditKind::MessageRejected, caller, endpoint_id, valid.error());
    }
    auto endpoint = find(endpoint_id);
    if (endpoint) {
        auto fits = validate_message(message, endpoint->config().max_message_bytes);
        if (!fits) {
            return reject(fits.error().code(), AuditKind::MessageRejected, caller, endpoint_id, fits.error());
        }
    }

    auto resolved = engine_.validate_for(caller, token, Op::Send, endpoint_id);
    if (!resolved) {
        return resolved.error();
    }
    if (!endpoint) {
        return Error(ErrorCode::EndpointClosed, "Endpoint closed", object_id_to_string(endpoint_id));
    }

    PolicyQuery query;
    query.hook = HookType::OperationCheck;
    query.subject = caller;
    query.target = resolved->owner;
    query.object = endpoint_id;
    query.kind = ObjectKind::Endpoint;
    query.op = Op::Send;
    query.token_fingerprint = token_fingerprint(token);
    query.labels = resolved->labels;
    query.detail = "label=" + std::to_string(message.header.label) + " len=" + std::to_string(message.header.len);
    const PolicyOutcome outcome = hooks_.consult(query);
    if (outcome.timed_out) {
        audit(AuditKind::PolicyTimeout, AuditOutcome::Failure, caller, endpoint_id,
              std::string("hook=") + hook_type_name(query.hook) + " default=" +
                  policy_verdict_name(outcome.decision.verdict));
    }
    if (outcome.decision.verdict == PolicyVerdict::Throttle) {
        return reject(ErrorCode::RateLimited, AuditKind::RateLimited, caller, endpoint_id,
                      Error(ErrorCode::RateLimited, "Send throttled by policy", outcome.decision.reason));
    }
    if (outcome.decision.verdict == PolicyVerdict::Deny) {
        return reject(ErrorCode::PolicyDenied, AuditKind::PolicyDenied, caller, endpoint_id,
                      Error(ErrorCode::PolicyDenied, "Send denied by policy", outcome.decision.reason));
    }

    if (!topology_.can_send(caller, endpoint->config().name)) {
        return reject(ErrorCode::GraphViolation, AuditKind::GraphViolation, caller, endpoint_id,
                      Error(ErrorCode::GraphViolation, "Endpoint not reachable from caller",
                            std::to_string(caller) + " -> " + endpoint->config().name));
    }

    return enqueue(caller, endpoint, std::move(message), wants_blocking(endpoint->config(), resolved->labels), true);
}

Result<Message> Router::recv(CapsuleId caller, const ObjectId& endpoint_id, const CapToken& token)
{
    TRY(states_.check_runnable(caller));

    auto resolved = engine_.validate_for(caller, token, Op::Recv, endpoint_id);
    if (!resolved) {
        return resolved.error();
    }
    auto endpoint = find(endpoint_id);
    if (!endpoint) {
        return Error(ErrorCode::EndpointClosed, "Endpoint closed", object_id_to_string(endpoint_id));
    }

    PolicyQuery query;
    query.hook = HookType::OperationCheck;
    query.subject = caller;
    query.target = resolved->owner;
    query.object = endpoint_id;
    query.kind = ObjectKind::Endpoint;
    query.op = Op::Recv;
    query.token_fingerprint = token_fingerprint(token);
    query.labels = resolved->labels;
    const PolicyOutcome outcome = hooks_.consult(query);
    if (outcome.timed_out) {
        audit(AuditKind::PolicyTimeout, AuditOutcome::Failure, caller, endpoint_id,
              std::string("hook=") + hook_type_name(query.hook) + " default=" +
                  policy_verdict_name(outcome.decision.verdict));
    }
    if (outcome.decision.verdict == PolicyVerdict::Throttle) {
        return reject(ErrorCode::RateLimited, AuditKind::RateLimited, caller, endpoint_id,
                      Error(ErrorCode::RateLimited, "Recv throttled by policy", outcome.decision.reason));
    }
    if (outcome.decision.verdict == PolicyVerdict::Deny) {
        return reject(ErrorCode::PolicyDenied, AuditKind::PolicyDenied, caller, endpoint_id,
                      Error(ErrorCode::PolicyDenied, "Recv denied by policy", outcome.decision.reason));
    }

    const bool blocking = wants_blocking(endpoint->config(), resolved->labels);
    auto popped = endpoint->pop(blocking, blocking ? interrupt_for(caller) : InterruptCheck{});
    if (!popped) {
        const Error& err = popped.error();
        if (err.code() == ErrorCode::Internal) {
            quarantine(caller, err.to_string());
        } else if (err.code() == ErrorCode::WouldBlock && audit_.backpressure_auditing()) {
            audit(AuditKind::Backpressure, AuditOutcome::Failure, caller, endpoint_id, err.to_string());
        }
        return err;
    }
    return std::move(popped->message);
}

Result<void> Router::deliver(const ObjectId& endpoint_id, Message message)
{
    auto valid = validate_message(message, limits_.max_message_bytes);
    if (!valid) {
        return reject(valid.error().code(), AuditKind::MessageRejected, kKernelCapsule, endpoint_id, valid.error());
    }
    auto endpoint = find(endpoint_id);
    if (!endpoint) {
        return Error::not_found("endpoint " + object_id_to_string(endpoint_id));
    }
    auto fits = validate_message(message, endpoint->config().max_message_bytes);
    if (!fits) {
        return reject(fits.error().code(), AuditKind::MessageRejected, kKernelCapsule, endpoint_id, fits.error());
    }
    return enqueue(kKernelCapsule, endpoint, std::move(message), false, true);
}

Result<void> Router::enqueue(CapsuleId producer, const std::shared_ptr<Endpoint>& endpoint, Message message,
                             bool blocking, bool allow_drop)
{
    const uint64_t label = message.header.label;
    auto pushed = endpoint->push(producer, std::move(message), blocking, allow_drop,
                                 blocking ? interrupt_for(producer) : InterruptCheck{});
    if (!pushed) {
        const Error& err = pushed.error();
        if (err.code() == ErrorCode::WouldBlock && audit_.backpressure_auditing()) {
            audit(AuditKind::Backpressure, AuditOutcome::Failure, producer, endpoint->id(),
                  "label=" + std::to_string(label) + " " + err.to_string());
        }
        return err;
    }
    if (pushed->has_value()) {
        const DroppedMessage& dropped = **pushed;
        audit(AuditKind::MessageDropped, AuditOutcome::Failure, dropped.producer, endpoint->id(),
              "label=" + std::to_string(dropped.label) + " priority=" + std::to_string(dropped.priority) +
                  " displaced_by=" + std::to_string(producer));
        notify_drop(endpoint, dropped);
    }
    return {};
}

void Router::notify_drop(const std::shared_ptr<Endpoint>& endpoint, const DroppedMessage& dropped)
{
    if (dropped.producer == kKernelCapsule) {
        return;
    }
    const std::string* name = topology_.notify_endpoint(dropped.producer);
    if (!name) {
        audit(AuditKind::NotificationLost, AuditOutcome::Failure, dropped.producer, endpoint->id(),
              "no notify endpoint configured");
        return;
    }
    auto target = find_by_name(*name);
    if (!target) {
        audit(AuditKind::NotificationLost, AuditOutcome::Failure, dropped.producer, endpoint->id(),
              "notify endpoint '" + *name + "' not created");
        return;
    }
    auto pushed = target->push(kKernelCapsule, make_drop_notification(endpoint->id(), dropped.label, dropped.priority),
                               false, false, InterruptCheck{});
    if (!pushed) {
        audit(AuditKind::NotificationLost, AuditOutcome::Failure, dropped.producer, target->id(),
              pushed.error().to_string());
    }
}

Result<void> Router::set_drop_policy(const ObjectId& endpoint_id, DropPolicy policy)
{
    auto endpoint = find(endpoint_id);
    if (!endpoint) {
        return Error::not_found("endpoint " + object_id_to_string(endpoint_id));
    }
    endpoint->set_drop_policy(policy);
    return {};
}

Result<size_t> Router::pending(const ObjectId& endpoint_id) const
{
    auto endpoint = find(endpoint_id);
    if (!endpoint) {
        return Error::not_found("endpoint " + object_id_to_string(endpoint_id));
    }
    return endpoint->size();
}

void Router::wake_all()
{
    std::shared_lock<std::shared_mutex> lock(mu_);
    for (auto& entry : endpoints_) {
        entry.second->wake();
    }
}

size_t Router::close_owned(CapsuleId owner)
{
    std::vector<std::shared_ptr<Endpoint>> closing;
    {
        std::unique_lock<std::shared_mutex> lock(mu_);
        for (auto it = endpoints_.begin(); it != endpoints_.end();) {
            if (it->second->config().owner == owner) {
                by_name_.erase(it->second->config().name);
                closing.push_back(std::move(it->second));
                it = endpoints_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (const auto& endpoint : closing) {
        endpoint->close();
        audit(AuditKind::EndpointClosed, AuditOutcome::Success, owner, endpoint->id(),
              "name=" + endpoint->config().name);
    }
    return closing.size();
}

void Router::quarantine(CapsuleId capsule, const std::string& reason)
{
    states_.set(capsule, CapsuleRunState::Quarantined);
    audit(AuditKind::CapsuleQuarantined, AuditOutcome::Failure, capsule, ObjectId{}, reason);
    logger().log(SLOG_ERROR("Capsule quarantined").field("capsule", static_cast<int64_t>(capsule)).field("reason", reason));
    wake_all();
}

} // namespace capkern
