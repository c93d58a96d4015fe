// cppcheck-suppress-file missingIncludeSystem
#include "object_registry.hpp"

#include "logging.hpp"

namespace capkern {

ObjectRegistry::ObjectRegistry(const Platform& platform) : platform_(platform) {}

Result<ObjectId> ObjectRegistry::create(ObjectKind kind, CapsuleId owner)
{
    // A collision among 128-bit random ids is not expected; retry a bounded number of times anyway.
    for (int attempt = 0; attempt < 4; ++attempt) {
        auto id = platform_.make_object_id();
        if (!id) {
            return id.error();
        }
        Shard& shard = shard_for(*id);
        {
            // Both indexes change under owners_mu_ so release_owned() sees
            // either none or all of a concurrent create.
            std::lock_guard<std::mutex> owners_lock(owners_mu_);
            std::unique_lock<std::shared_mutex> lock(shard.mu);
            if (!shard.objects.emplace(*id, ObjectInfo{kind, owner, platform_.now_ms()}).second) {
                continue;
            }
            owned_[owner].insert(*id);
        }
        logger().log(SLOG_DEBUG("Object created")
                         .field("object", object_id_to_string(*id))
                         .field("kind", object_kind_name(kind))
                         .field("owner", static_cast<int64_t>(owner)));
        return *id;
    }
    return Error(ErrorCode::Internal, "Object id generation kept colliding");
}

Result<ObjectInfo> ObjectRegistry::resolve(const ObjectId& id) const
{
    const Shard& shard = shard_for(id);
    std::shared_lock<std::shared_mutex> lock(shard.mu);
    auto it = shard.objects.find(id);
    if (it == shard.objects.end()) {
        return Error::not_found("object");
    }
    return it->second;
}

bool ObjectRegistry::exists(const ObjectId& id) const
{
    const Shard& shard = shard_for(id);
    std::shared_lock<std::shared_mutex> lock(shard.mu);
    return shard.objects.find(id) != shard.objects.end();
}

Result<void> ObjectRegistry::destroy(const ObjectId& id)
{
    CapsuleId owner = 0;
    {
        Shard& shard = shard_for(id);
        std::unique_lock<std::shared_mutex> lock(shard.mu);
        auto it = shard.objects.find(id);
        if (it == shard.objects.end()) {
            return Error::not_found("object");
        }
        owner = it->second.owner;
        shard.objects.erase(it);
    }
    std::lock_guard<std::mutex> lock(owners_mu_);
    auto it = owned_.find(owner);
    if (it != owned_.end()) {
        it->second.erase(id);
        if (it->second.empty()) {
            owned_.erase(it);
        }
    }
    return {};
}

std::vector<ObjectId> ObjectRegistry::release_owned(CapsuleId owner)
{
    std::lock_guard<std::mutex> owners_lock(owners_mu_);
    auto it = owned_.find(owner);
    if (it == owned_.end()) {
        return {};
    }
    const std::unordered_set<ObjectId, ObjectIdHash> ids = std::move(it->second);
    owned_.erase(it);

    std::vector<ObjectId> released;
    released.reserve(ids.size());
    for (const auto& id : ids) {
        Shard& shard = shard_for(id);
        std::unique_lock<std::shared_mutex> lock(shard.mu);
        if (shard.objects.erase(id) > 0) {
            released.push_back(id);
        }
    }
    return released;
}

} // namespace capkern
