// cppcheck-suppress-file missingIncludeSystem
#include "capability_store.hpp"

namespace capkern {

CapabilityRecord& SlotGuard::record()
{
    return slot_->record;
}

CapabilityRecord SlotGuard::retire()
{
    CapabilityRecord out = std::move(slot_->record);
    slot_->record = CapabilityRecord{};
    slot_->live = false;
    ++slot_->generation;
    if (slot_->generation == 0) {
        slot_->generation = 1;
    }
    return out;
}

CapabilityTable::CapabilityTable(CapsuleId owner) : owner_(owner) {}

Result<CapabilitySlot*> CapabilityTable::place(CapabilityRecord record, bool live, CapHandle& handle)
{
    if (closed_) {
        return Error(ErrorCode::Unauthorized, "Capability table is closed", "capsule=" + std::to_string(owner_));
    }
    if (by_token_.find(record.token) != by_token_.end()) {
        return Error(ErrorCode::AlreadyExists, "Token already present in table");
    }

    uint32_t index = 0;
    if (!free_.empty()) {
        index = free_.back();
        free_.pop_back();
    } else {
        if (slots_.size() >= UINT32_MAX) {
            return Error(ErrorCode::Internal, "Capability table is full");
        }
        index = static_cast<uint32_t>(slots_.size());
        slots_.emplace_back();
    }

    CapabilitySlot& slot = slots_[index];
    std::lock_guard<std::mutex> slot_lock(slot.mu);
    const CapToken token = record.token;
    slot.record = std::move(record);
    slot.live = live;
    handle = CapHandle{index, slot.generation};
    by_token_.emplace(token, handle);
    exhausted_.erase(token);
    return &slot;
}

Result<CapHandle> CapabilityTable::insert(CapabilityRecord record)
{
    std::unique_lock<std::shared_mutex> lock(mu_);
    CapHandle handle;
    auto slot = place(std::move(record), true, handle);
    if (!slot) {
        return slot.error();
    }
    return handle;
}

Result<PendingSlot> CapabilityTable::reserve(CapabilityRecord record)
{
    std::unique_lock<std::shared_mutex> lock(mu_);
    CapHandle handle;
    auto slot = place(std::move(record), false, handle);
    if (!slot) {
        return slot.error();
    }
    return PendingSlot(*slot, handle);
}

bool PendingSlot::activate()
{
    std::lock_guard<std::mutex> lock(slot_->mu);
    if (slot_->live || slot_->generation != handle_.generation) {
        return false;
    }
    slot_->live = true;
    return true;
}

void CapabilityTable::abandon(const PendingSlot& pending, const CapToken& token)
{
    {
        std::lock_guard<std::mutex> slot_lock(pending.slot_->mu);
        if (!pending.slot_->live && pending.slot_->generation == pending.handle_.generation) {
            pending.slot_->record = CapabilityRecord{};
            ++pending.slot_->generation;
            if (pending.slot_->generation == 0) {
                pending.slot_->generation = 1;
            }
        }
    }
    release(pending.handle_, token);
}

Result<CapHandle> CapabilityTable::find(const CapToken& token) const
{
    std::shared_lock<std::shared_mutex> lock(mu_);
    auto it = by_token_.find(token);
    if (it == by_token_.end()) {
        return Error(ErrorCode::Unauthorized, "Unknown capability token");
    }
    return it->second;
}

Result<SlotGuard> CapabilityTable::lock(CapHandle handle)
{
    CapabilitySlot* slot = nullptr;
    {
        std::shared_lock<std::shared_mutex> lock(mu_);
        if (handle.index >= slots_.size()) {
            return Error(ErrorCode::Unauthorized, "Stale capability handle");
        }
        slot = &slots_[handle.index];
    }

    std::unique_lock<std::mutex> slot_lock(slot->mu);
    if (!slot->live || slot->generation != handle.generation) {
        return Error(ErrorCode::Unauthorized, "Stale capability handle");
    }
    return SlotGuard(std::move(slot_lock), slot, handle);
}

void CapabilityTable::release(CapHandle handle, const CapToken& token)
{
    std::unique_lock<std::shared_mutex> lock(mu_);
    auto it = by_token_.find(token);
    if (it != by_token_.end() && it->second == handle) {
        by_token_.erase(it);
    }
    if (!closed_ && handle.index < slots_.size()) {
        free_.push_back(handle.index);
    }
}

std::vector<CapabilityRecord> CapabilityTable::close()
{
    std::unique_lock<std::shared_mutex> lock(mu_);
    closed_ = true;
    std::vector<CapabilityRecord> retired;
    for (auto& slot : slots_) {
        std::lock_guard<std::mutex> slot_lock(slot.mu);
        // Reserved slots are bumped too, so a late activate() fails.
        ++slot.generation;
        if (slot.generation == 0) {
            slot.generation = 1;
        }
        if (!slot.live) {
            continue;
        }
        retired.push_back(std::move(slot.record));
        slot.record = CapabilityRecord{};
        slot.live = false;
    }
    by_token_.clear();
    free_.clear();
    exhausted_.clear();
    exhausted_order_.clear();
    return retired;
}

void CapabilityTable::remember_exhausted(const CapToken& token)
{
    std::unique_lock<std::shared_mutex> lock(mu_);
    if (closed_ || !exhausted_.insert(token).second) {
        return;
    }
    exhausted_order_.push_back(token);
    if (exhausted_order_.size() > kExhaustedMemory) {
        exhausted_.erase(exhausted_order_.front());
        exhausted_order_.pop_front();
    }
}

bool CapabilityTable::was_exhausted(const CapToken& token) const
{
    std::shared_lock<std::shared_mutex> lock(mu_);
    return exhausted_.count(token) > 0;
}

size_t CapabilityTable::live_count() const
{
    std::shared_lock<std::shared_mutex> lock(mu_);
    return by_token_.size();
}

std::shared_ptr<CapabilityTable> CapabilitySpace::table(CapsuleId capsule) const
{
    std::shared_lock<std::shared_mutex> lock(mu_);
    auto it = tables_.find(capsule);
    if (it == tables_.end()) {
        return nullptr;
    }
    return it->second;
}

std::shared_ptr<CapabilityTable> CapabilitySpace::table_or_create(CapsuleId capsule)
{
    {
        std::shared_lock<std::shared_mutex> lock(mu_);
        auto it = tables_.find(capsule);
        if (it != tables_.end()) {
            return it->second;
        }
    }
    std::unique_lock<std::shared_mutex> lock(mu_);
    if (closing_.count(capsule) > 0) {
        return nullptr;
    }
    auto& slot = tables_[capsule];
    if (!slot) {
        slot = std::make_shared<CapabilityTable>(capsule);
    }
    return slot;
}

std::shared_ptr<CapabilityTable> CapabilitySpace::detach(CapsuleId capsule)
{
    std::unique_lock<std::shared_mutex> lock(mu_);
    closing_.insert(capsule);
    auto it = tables_.find(capsule);
    if (it == tables_.end()) {
        return nullptr;
    }
    auto table = std::move(it->second);
    tables_.erase(it);
    return table;
}

void CapabilitySpace::reopen(CapsuleId capsule)
{
    std::unique_lock<std::shared_mutex> lock(mu_);
    closing_.erase(capsule);
}

bool CapabilitySpace::claim_token(const CapToken& token)
{
    LedgerShard& shard = ledger_for(token);
    std::lock_guard<std::mutex> lock(shard.mu);
    return shard.tokens.insert(token).second;
}

void CapabilitySpace::release_token(const CapToken& token)
{
    LedgerShard& shard = ledger_for(token);
    std::lock_guard<std::mutex> lock(shard.mu);
    shard.tokens.erase(token);
}

Capability capability_view(const CapabilityRecord& record, CapsuleId holder, CapHandle handle)
{
    Capability cap;
    cap.token = record.token;
    cap.handle = handle;
    cap.holder = holder;
    cap.object = record.object;
    cap.kind = record.kind;
    cap.ops = record.ops;
    cap.limits = record.limits;
    cap.delegation_depth = record.delegation_depth;
    cap.labels = record.labels;
    return cap;
}

} // namespace capkern
