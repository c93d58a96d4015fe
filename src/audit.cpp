// cppcheck-suppress-file missingIncludeSystem
#include "audit.hpp"

#include <fstream>

#include "events.hpp"
#include "logging.hpp"
#include "sha256.hpp"
#include "utils.hpp"

namespace capkern {

namespace {

struct AuditKindName {
    AuditKind kind;
    const char* name;
};

constexpr AuditKindName kAuditKindNames[] = {
    {AuditKind::RootBootstrap, "root_bootstrap"},
    {AuditKind::CapabilityIssued, "capability_issued"},
    {AuditKind::CapabilityDelegated, "capability_delegated"},
    {AuditKind::CapabilityRevoked, "capability_revoked"},
    {AuditKind::CapabilityExpired, "capability_expired"},
    {AuditKind::CapabilityExhausted, "capability_exhausted"},
    {AuditKind::OperationAllowed, "operation_allowed"},
    {AuditKind::AccessDenied, "access_denied"},
    {AuditKind::DelegationDenied, "delegation_denied"},
    {AuditKind::PolicyDenied, "policy_denied"},
    {AuditKind::PolicyTimeout, "policy_timeout"},
    {AuditKind::PolicyDesignated, "policy_designated"},
    {AuditKind::RateLimited, "rate_limited"},
    {AuditKind::Backpressure, "backpressure"},
    {AuditKind::MessageRejected, "message_rejected"},
    {AuditKind::MessageDropped, "message_dropped"},
    {AuditKind::NotificationLost, "notification_lost"},
    {AuditKind::GraphViolation, "graph_violation"},
    {AuditKind::EndpointCreated, "endpoint_created"},
    {AuditKind::EndpointClosed, "endpoint_closed"},
    {AuditKind::ObjectCreated, "object_created"},
    {AuditKind::CapsuleTeardown, "capsule_teardown"},
    {AuditKind::CapsuleQuarantined, "capsule_quarantined"},
    {AuditKind::AuditSubscribed, "audit_subscribed"},
    {AuditKind::AuditReplayed, "audit_replayed"},
    {AuditKind::ConfigChanged, "config_changed"},
};

} // namespace

const char* audit_kind_name(AuditKind kind)
{
    for (const auto& entry : kAuditKindNames) {
        if (entry.kind == kind) {
            return entry.name;
        }
    }
    return "unknown";
}

bool parse_audit_kind(const std::string& value, AuditKind& kind)
{
    for (const auto& entry : kAuditKindNames) {
        if (value == entry.name) {
            kind = entry.kind;
            return true;
        }
    }
    return false;
}

const char* audit_outcome_name(AuditOutcome outcome)
{
    return outcome == AuditOutcome::Success ? "success" : "failure";
}

std::string audit_canonical_bytes(uint64_t seq, const AuditEvent& event)
{
    std::string out;
    out.reserve(128 + event.reason.size());
    out += "seq=" + std::to_string(seq);
    out += ";kind=";
    out += audit_kind_name(event.kind);
    out += ";subject=" + std::to_string(event.subject);
    out += ";object=" + object_id_to_string(event.object);
    out += ";ts=" + std::to_string(event.timestamp_ms);
    out += ";outcome=";
    out += audit_outcome_name(event.outcome);
    out += ";reason=" + json_escape(event.reason);
    return out;
}

std::string audit_chain_hash(const std::string& prev_hash, uint64_t seq, const AuditEvent& event)
{
    Sha256 h;
    h.update(prev_hash);
    h.update(audit_canonical_bytes(seq, event));
    return Sha256::to_hex(h.finish());
}

Result<void> verify_audit_chain(const std::vector<AuditRecord>& records, const std::string& anchor)
{
    std::string prev = anchor;
    uint64_t expected_seq = records.empty() ? 0 : records.front().seq;
    for (const auto& record : records) {
        if (record.seq != expected_seq) {
            return Error(ErrorCode::AuditChainBroken, "Audit sequence gap",
                         "expected " + std::to_string(expected_seq) + ", got " + std::to_string(record.seq));
        }
        if (record.prev_hash != prev) {
            return Error(ErrorCode::AuditChainBroken, "Audit record does not link to its predecessor",
                         "seq " + std::to_string(record.seq));
        }
        if (audit_chain_hash(prev, record.seq, record.event) != record.hash) {
            return Error(ErrorCode::AuditChainBroken, "Audit record hash mismatch",
                         "seq " + std::to_string(record.seq));
        }
        prev = record.hash;
        ++expected_seq;
    }
    return {};
}

std::string audit_record_to_json(const AuditRecord& record)
{
    std::string out = "{";
    out += "\"seq\":" + std::to_string(record.seq);
    out += ",\"kind\":\"";
    out += audit_kind_name(record.event.kind);
    out += "\",\"subject\":" + std::to_string(record.event.subject);
    out += ",\"object\":\"" + object_id_to_string(record.event.object) + "\"";
    out += ",\"timestamp_ms\":" + std::to_string(record.event.timestamp_ms);
    out += ",\"outcome\":\"";
    out += audit_outcome_name(record.event.outcome);
    out += "\",\"reason\":\"" + json_escape(record.event.reason) + "\"";
    out += ",\"prev_hash\":\"" + record.prev_hash + "\"";
    out += ",\"hash\":\"" + record.hash + "\"";
    out += "}";
    return out;
}

Result<AuditRecord> parse_audit_record_json(const std::string& line)
{
    AuditRecord record;
    std::string kind;
    std::string object;
    std::string outcome;
    uint64_t subject = 0;
    if (!extract_json_uint64_simple(line, "seq", record.seq) || !extract_json_string_simple(line, "kind", kind) ||
        !extract_json_uint64_simple(line, "subject", subject) || !extract_json_string_simple(line, "object", object) ||
        !extract_json_uint64_simple(line, "timestamp_ms", record.event.timestamp_ms) ||
        !extract_json_string_simple(line, "outcome", outcome) ||
        !extract_json_string_simple(line, "reason", record.event.reason) ||
        !extract_json_string_simple(line, "prev_hash", record.prev_hash) ||
        !extract_json_string_simple(line, "hash", record.hash)) {
        return Error(ErrorCode::AuditChainBroken, "Audit record is missing a field");
    }
    if (!parse_audit_kind(kind, record.event.kind)) {
        return Error(ErrorCode::AuditChainBroken, "Unknown audit kind", kind);
    }
    if (subject > UINT32_MAX) {
        return Error(ErrorCode::AuditChainBroken, "Audit subject out of range");
    }
    record.event.subject = static_cast<CapsuleId>(subject);
    if (!parse_object_id(object, record.event.object)) {
        return Error(ErrorCode::AuditChainBroken, "Invalid audit object id", object);
    }
    if (outcome == "success") {
        record.event.outcome = AuditOutcome::Success;
    } else if (outcome == "failure") {
        record.event.outcome = AuditOutcome::Failure;
    } else {
        return Error(ErrorCode::AuditChainBroken, "Invalid audit outcome", outcome);
    }
    return record;
}

Result<std::vector<AuditRecord>> read_audit_log_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in.is_open()) {
        return Error(ErrorCode::IoError, "Failed to open audit log", path);
    }
    std::vector<AuditRecord> records;
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (trim(line).empty()) {
            continue;
        }
        auto parsed = parse_audit_record_json(line);
        if (!parsed) {
            return Error(parsed.error().code(), parsed.error().message(),
                         path + ":" + std::to_string(line_no));
        }
        records.push_back(std::move(*parsed));
    }
    if (in.bad()) {
        return Error(ErrorCode::IoError, "Failed to read audit log", path);
    }
    return records;
}

Result<uint64_t> verify_audit_log_file(const std::string& path)
{
    auto records = read_audit_log_file(path);
    if (!records) {
        return records.error();
    }
    if (!records->empty() && records->front().seq != 1) {
        return Error(ErrorCode::AuditChainBroken, "Audit log does not start at the genesis record", path);
    }
    TRY(verify_audit_chain(*records));
    return static_cast<uint64_t>(records->size());
}

Result<AuditRecord> AuditSubscription::next(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mu_);
    if (!cv_.wait_for(lock, timeout, [&] { return closed_ || !queue_.empty(); })) {
        return Error(ErrorCode::WouldBlock, "No audit record within timeout");
    }
    if (queue_.empty()) {
        return Error(ErrorCode::EndpointClosed, "Audit subscription cancelled");
    }
    AuditRecord record = std::move(queue_.front());
    queue_.pop_front();
    return record;
}

std::optional<AuditRecord> AuditSubscription::try_next()
{
    std::lock_guard<std::mutex> lock(mu_);
    if (queue_.empty()) {
        return std::nullopt;
    }
    AuditRecord record = std::move(queue_.front());
    queue_.pop_front();
    return record;
}

void AuditSubscription::cancel()
{
    {
        std::lock_guard<std::mutex> lock(mu_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool AuditSubscription::cancelled() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return closed_;
}

size_t AuditSubscription::pending() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return queue_.size();
}

void AuditSubscription::push(const AuditRecord& record)
{
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (closed_) {
            return;
        }
        queue_.push_back(record);
    }
    cv_.notify_one();
}

AuditSink::AuditSink(AuditSinkConfig config)
    : config_(std::move(config)), audit_backpressure_(config_.audit_backpressure),
      audit_allowed_(config_.audit_allowed)
{
    if (config_.history_limit == 0) {
        config_.history_limit = 1;
    }
    writer_ = std::thread(&AuditSink::writer_loop, this);
}

AuditSink::~AuditSink()
{
    {
        std::lock_guard<std::mutex> lock(queue_mu_);
        stopping_ = true;
    }
    queue_cv_.notify_all();
    if (writer_.joinable()) {
        writer_.join();
    }
}

void AuditSink::emit(AuditEvent event)
{
    {
        std::lock_guard<std::mutex> lock(queue_mu_);
        queue_.push_back(std::move(event));
        ++enqueued_;
    }
    queue_cv_.notify_one();
}

void AuditSink::flush()
{
    std::unique_lock<std::mutex> lock(queue_mu_);
    const uint64_t target = enqueued_;
    drained_cv_.wait(lock, [&] { return processed_ >= target; });
}

std::shared_ptr<AuditSubscription> AuditSink::subscribe()
{
    auto sub = std::make_shared<AuditSubscription>();
    std::lock_guard<std::mutex> lock(chain_mu_);
    subscribers_.push_back(sub);
    return sub;
}

std::vector<AuditRecord> AuditSink::history(uint64_t from_seq) const
{
    std::lock_guard<std::mutex> lock(chain_mu_);
    std::vector<AuditRecord> out;
    for (const auto& record : history_) {
        if (record.seq >= from_seq) {
            out.push_back(record);
        }
    }
    return out;
}

std::string AuditSink::head_hash() const
{
    std::lock_guard<std::mutex> lock(chain_mu_);
    return head_hash_;
}

uint64_t AuditSink::appended() const
{
    std::lock_guard<std::mutex> lock(chain_mu_);
    return next_seq_ - 1;
}

void AuditSink::writer_loop()
{
    while (true) {
        std::deque<AuditEvent> batch;
        {
            std::unique_lock<std::mutex> lock(queue_mu_);
            queue_cv_.wait(lock, [&] { return stopping_ || !queue_.empty(); });
            if (queue_.empty() && stopping_) {
                return;
            }
            batch.swap(queue_);
        }
        const uint64_t count = batch.size();
        for (auto& event : batch) {
            append(std::move(event));
        }
        {
            std::lock_guard<std::mutex> lock(queue_mu_);
            processed_ += count;
        }
        drained_cv_.notify_all();
    }
}

void AuditSink::append(AuditEvent event)
{
    AuditRecord record;
    std::vector<std::shared_ptr<AuditSubscription>> live;
    {
        std::lock_guard<std::mutex> lock(chain_mu_);
        record.seq = next_seq_++;
        record.event = std::move(event);
        record.prev_hash = head_hash_;
        record.hash = audit_chain_hash(record.prev_hash, record.seq, record.event);
        head_hash_ = record.hash;

        history_.push_back(record);
        while (history_.size() > config_.history_limit) {
            history_.pop_front();
        }

        auto it = subscribers_.begin();
        while (it != subscribers_.end()) {
            auto sub = it->lock();
            if (!sub || sub->cancelled()) {
                it = subscribers_.erase(it);
                continue;
            }
            live.push_back(std::move(sub));
            ++it;
        }
    }

    for (const auto& sub : live) {
        sub->push(record);
    }

    const bool need_json = !config_.log_path.empty() || config_.mirror != EventLogSink::None;
    if (!need_json) {
        return;
    }
    const std::string json = audit_record_to_json(record);
    if (!config_.log_path.empty()) {
        auto result = append_jsonl_line(config_.log_path, json);
        if (!result) {
            write_failures_.fetch_add(1);
            logger().log(SLOG_ERROR("Failed to persist audit record")
                             .field("seq", static_cast<int64_t>(record.seq))
                             .field("path", config_.log_path)
                             .field("error", result.error().to_string()));
        }
    }
    mirror_audit_record(config_.mirror, record, json);
}

} // namespace capkern
