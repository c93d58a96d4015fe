// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <array>
#include <deque>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "rate_limit.hpp"
#include "result.hpp"
#include "types.hpp"

namespace capkern {

// Global reference to one slot: which capsule's table, and which slot in it.
struct CapRef {
    CapsuleId holder = 0;
    CapHandle handle;
};

/**
 * Canonical capability record. Only the Capability Store holds these;
 * capsules see a Capability copy.
 */
struct CapabilityRecord {
    CapToken token;
    ObjectId object;
    ObjectKind kind = ObjectKind::Control;
    OpSet ops;
    CapLimits limits;
    uint8_t delegation_depth = 0;
    Labels labels;

    uint64_t issued_at_ms = 0;
    uint64_t expires_at_ms = 0; // 0: never
    uint32_t uses_remaining = 0;
    uint64_t uses_total = 0;
    TokenBucket bucket;
    FixedWindowQuota quota;

    bool has_parent = false;
    CapRef parent;
    std::vector<CapRef> children;
};

class CapabilityTable;

struct CapabilitySlot {
    std::mutex mu;
    uint32_t generation = 1;
    bool live = false;
    CapabilityRecord record;
};

/**
 * Exclusive access to one live slot. Holding the guard is the only way to
 * read or change a record, so no reader can observe a half-applied update.
 */
class SlotGuard {
  public:
    SlotGuard(SlotGuard&&) noexcept = default;
    SlotGuard& operator=(SlotGuard&&) noexcept = default;
    SlotGuard(const SlotGuard&) = delete;
    SlotGuard& operator=(const SlotGuard&) = delete;

    CapabilityRecord& record();
    [[nodiscard]] CapHandle handle() const { return handle_; }

    // Mark the slot dead and bump its generation. The record is moved out so
    // the caller can cascade to children and release the token index entry.
    CapabilityRecord retire();

  private:
    friend class CapabilityTable;
    SlotGuard(std::unique_lock<std::mutex> lock, CapabilitySlot* slot, CapHandle handle)
        : lock_(std::move(lock)), slot_(slot), handle_(handle)
    {
    }

    std::unique_lock<std::mutex> lock_;
    CapabilitySlot* slot_ = nullptr;
    CapHandle handle_;
};

/**
 * A slot reserved by CapabilityTable::reserve(). Its token is indexed but the
 * slot is not live, so lock() fails until activate() succeeds.
 */
class PendingSlot {
  public:
    [[nodiscard]] CapHandle handle() const { return handle_; }

    // Make the slot live. Takes only this slot's mutex, so it may run while
    // the caller holds another slot's lock. Fails once the table was closed.
    bool activate();

  private:
    friend class CapabilityTable;
    PendingSlot(CapabilitySlot* slot, CapHandle handle) : slot_(slot), handle_(handle) {}

    CapabilitySlot* slot_ = nullptr;
    CapHandle handle_;
};

/**
 * One capsule's private capability table: an arena of slots indexed by
 * generation-tagged handles plus a token index. There is no iteration API;
 * a capsule can only reach records through tokens it was handed.
 */
class CapabilityTable {
  public:
    explicit CapabilityTable(CapsuleId owner);

    CapabilityTable(const CapabilityTable&) = delete;
    CapabilityTable& operator=(const CapabilityTable&) = delete;

    [[nodiscard]] CapsuleId owner() const { return owner_; }

    Result<CapHandle> insert(CapabilityRecord record);
    Result<PendingSlot> reserve(CapabilityRecord record);
    Result<CapHandle> find(const CapToken& token) const;
    Result<SlotGuard> lock(CapHandle handle);

    // Drop the token index entry and recycle the slot after SlotGuard::retire().
    void release(CapHandle handle, const CapToken& token);

    // Undo a reserve() that was never activated.
    void abandon(const PendingSlot& pending, const CapToken& token);

    // Tokens whose last use was consumed answer Exhausted rather than
    // Unauthorized. Only the most recent kExhaustedMemory are remembered.
    void remember_exhausted(const CapToken& token);
    [[nodiscard]] bool was_exhausted(const CapToken& token) const;

    // Retire every live record and refuse further inserts. Used at capsule teardown.
    std::vector<CapabilityRecord> close();

    [[nodiscard]] size_t live_count() const;

    static constexpr size_t kExhaustedMemory = 256;

  private:
    Result<CapabilitySlot*> place(CapabilityRecord record, bool live, CapHandle& handle);

    CapsuleId owner_;
    mutable std::shared_mutex mu_;
    bool closed_ = false;
    std::deque<CapabilitySlot> slots_;
    std::vector<uint32_t> free_;
    std::unordered_map<CapToken, CapHandle, CapTokenHash> by_token_;
    std::unordered_set<CapToken, CapTokenHash> exhausted_;
    std::deque<CapToken> exhausted_order_;
};

/**
 * All capability tables, keyed by capsule, plus the live-token ledger that
 * keeps tokens unique across capsules.
 */
class CapabilitySpace {
  public:
    CapabilitySpace() = default;

    CapabilitySpace(const CapabilitySpace&) = delete;
    CapabilitySpace& operator=(const CapabilitySpace&) = delete;

    std::shared_ptr<CapabilityTable> table(CapsuleId capsule) const;

    // Null while the capsule is being torn down (between detach and reopen).
    std::shared_ptr<CapabilityTable> table_or_create(CapsuleId capsule);

    // Remove the capsule's table and refuse new ones until reopen().
    std::shared_ptr<CapabilityTable> detach(CapsuleId capsule);
    void reopen(CapsuleId capsule);

    bool claim_token(const CapToken& token);
    void release_token(const CapToken& token);

  private:
    static constexpr size_t kLedgerShards = 16;

    struct LedgerShard {
        std::mutex mu;
        std::unordered_set<CapToken, CapTokenHash> tokens;
    };

    LedgerShard& ledger_for(const CapToken& token) { return ledger_[token.bytes[31] % kLedgerShards]; }

    mutable std::shared_mutex mu_;
    std::unordered_map<CapsuleId, std::shared_ptr<CapabilityTable>> tables_;
    std::unordered_set<CapsuleId> closing_;
    std::array<LedgerShard, kLedgerShards> ledger_;
};

Capability capability_view(const CapabilityRecord& record, CapsuleId holder, CapHandle handle);

} // namespace capkern
