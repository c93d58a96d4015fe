// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <array>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "platform.hpp"
#include "result.hpp"
#include "types.hpp"

namespace capkern {

struct ObjectInfo {
    ObjectKind kind = ObjectKind::Control;
    CapsuleId owner = 0;
    uint64_t created_at_ms = 0;
};

/**
 * Registry of kernel-managed objects keyed by random 128-bit ids.
 *
 * Lookups are by exact id only; no iteration API is reachable from a
 * capsule-facing path. The per-owner index is used only by capsule
 * teardown to release owned objects.
 */
class ObjectRegistry {
  public:
    explicit ObjectRegistry(const Platform& platform);

    ObjectRegistry(const ObjectRegistry&) = delete;
    ObjectRegistry& operator=(const ObjectRegistry&) = delete;

    Result<ObjectId> create(ObjectKind kind, CapsuleId owner);
    Result<ObjectInfo> resolve(const ObjectId& id) const;
    [[nodiscard]] bool exists(const ObjectId& id) const;
    Result<void> destroy(const ObjectId& id);

    // Removes every object owned by `owner` and returns the released ids.
    std::vector<ObjectId> release_owned(CapsuleId owner);

  private:
    static constexpr size_t kShardCount = 16;

    struct Shard {
        mutable std::shared_mutex mu;
        std::unordered_map<ObjectId, ObjectInfo, ObjectIdHash> objects;
    };

    Shard& shard_for(const ObjectId& id) { return shards_[id.lo % kShardCount]; }
    const Shard& shard_for(const ObjectId& id) const { return shards_[id.lo % kShardCount]; }

    const Platform& platform_;
    std::array<Shard, kShardCount> shards_;

    // Lock order: owners_mu_ before any shard mutex.
    std::mutex owners_mu_;
    std::unordered_map<CapsuleId, std::unordered_set<ObjectId, ObjectIdHash>> owned_;
};

} // namespace capkern
