// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "result.hpp"
#include "types.hpp"

namespace capkern {

enum class AuditKind : uint8_t {
    RootBootstrap,
    CapabilityIssued,
    CapabilityDelegated,
    CapabilityRevoked,
    CapabilityExpired,
    CapabilityExhausted,
    OperationAllowed,
    AccessDenied,
    DelegationDenied,
    PolicyDenied,
    PolicyTimeout,
    PolicyDesignated,
    RateLimited,
    Backpressure,
    MessageRejected,
    MessageDropped,
    NotificationLost,
    GraphViolation,
    EndpointCreated,
    EndpointClosed,
    ObjectCreated,
    CapsuleTeardown,
    CapsuleQuarantined,
    AuditSubscribed,
    AuditReplayed,
    ConfigChanged,
};

const char* audit_kind_name(AuditKind kind);
bool parse_audit_kind(const std::string& value, AuditKind& kind);

enum class AuditOutcome : uint8_t { Success, Failure };

const char* audit_outcome_name(AuditOutcome outcome);

struct AuditEvent {
    AuditKind kind = AuditKind::AccessDenied;
    CapsuleId subject = 0;
    ObjectId object;
    uint64_t timestamp_ms = 0;
    AuditOutcome outcome = AuditOutcome::Failure;
    std::string reason;
};

struct AuditRecord {
    uint64_t seq = 0;
    AuditEvent event;
    std::string prev_hash;
    std::string hash;
};

// prev_hash of the first record in a chain.
inline const std::string kAuditGenesisHash(64, '0');

std::string audit_canonical_bytes(uint64_t seq, const AuditEvent& event);
std::string audit_chain_hash(const std::string& prev_hash, uint64_t seq, const AuditEvent& event);

/**
 * Recompute the chain over `records`. The first record must link to
 * `anchor`; pass the previous record's hash to verify a suffix.
 */
Result<void> verify_audit_chain(const std::vector<AuditRecord>& records,
                                const std::string& anchor = kAuditGenesisHash);

std::string audit_record_to_json(const AuditRecord& record);
Result<AuditRecord> parse_audit_record_json(const std::string& line);

Result<std::vector<AuditRecord>> read_audit_log_file(const std::string& path);
// Returns the number of verified records.
Result<uint64_t> verify_audit_log_file(const std::string& path);

struct AuditSinkConfig {
    std::string log_path;
    size_t history_limit = 4096;
    EventLogSink mirror = EventLogSink::None;
    bool audit_backpressure = false;
    bool audit_allowed = false;
};

/**
 * A live, append-only stream of chained records starting at subscription
 * time. The queue is unbounded; a slow reader never slows the sink.
 */
class AuditSubscription {
  public:
    AuditSubscription() = default;

    AuditSubscription(const AuditSubscription&) = delete;
    AuditSubscription& operator=(const AuditSubscription&) = delete;

    // WouldBlock on timeout, EndpointClosed once cancelled and drained.
    Result<AuditRecord> next(std::chrono::milliseconds timeout);
    std::optional<AuditRecord> try_next();

    void cancel();
    [[nodiscard]] bool cancelled() const;
    [[nodiscard]] size_t pending() const;

  private:
    friend class AuditSink;
    void push(const AuditRecord& record);

    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::deque<AuditRecord> queue_;
    bool closed_ = false;
};

/**
 * Hash-chained audit log with an asynchronous writer.
 *
 * emit() enqueues and returns; the writer thread assigns the sequence
 * number, extends the chain, persists, mirrors and fans out to
 * subscribers in emit order.
 */
class AuditSink {
  public:
    explicit AuditSink(AuditSinkConfig config);
    ~AuditSink();

    AuditSink(const AuditSink&) = delete;
    AuditSink& operator=(const AuditSink&) = delete;

    void emit(AuditEvent event);

    // Block until every event emitted before the call is chained.
    void flush();

    std::shared_ptr<AuditSubscription> subscribe();

    // Bounded in-memory history with seq >= from_seq, oldest first.
    [[nodiscard]] std::vector<AuditRecord> history(uint64_t from_seq = 0) const;

    [[nodiscard]] std::string head_hash() const;
    [[nodiscard]] uint64_t appended() const;
    [[nodiscard]] uint64_t write_failures() const { return write_failures_.load(); }

    void set_backpressure_auditing(bool enabled) { audit_backpressure_.store(enabled); }
    [[nodiscard]] bool backpressure_auditing() const { return audit_backpressure_.load(); }
    [[nodiscard]] bool allowed_auditing() const { return audit_allowed_; }

  private:
    void writer_loop();
    void append(AuditEvent event);

    AuditSinkConfig config_;
    std::atomic<bool> audit_backpressure_;
    const bool audit_allowed_;
    std::atomic<uint64_t> write_failures_{0};

    std::mutex queue_mu_;
    std::condition_variable queue_cv_;
    std::condition_variable drained_cv_;
    std::deque<AuditEvent> queue_;
    uint64_t enqueued_ = 0;
    uint64_t processed_ = 0;
    bool stopping_ = false;

    mutable std::mutex chain_mu_;
    uint64_t next_seq_ = 1;
    std::string head_hash_ = kAuditGenesisHash;
    std::deque<AuditRecord> history_;
    std::vector<std::weak_ptr<AuditSubscription>> subscribers_;

    std::thread writer_;
};

} // namespace capkern
