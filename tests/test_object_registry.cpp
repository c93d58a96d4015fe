// cppcheck-suppress-file missingIncludeSystem
// cppcheck-suppress-file missingInclude
// cppcheck-suppress-file syntaxError
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <unordered_set>
#include <vector>

#include "object_registry.hpp"

namespace capkern {
namespace {

constexpr CapsuleId kOwner = 50;

TEST(ObjectRegistryTest, ReleaseOwnedOnlyTouchesThatOwner)
{
    Platform platform;
    ObjectRegistry registry(platform);
    auto mine = registry.create(ObjectKind::Storage, kOwner);
    auto theirs = registry.create(ObjectKind::Timer, kOwner + 1);
    ASSERT_TRUE(mine);
    ASSERT_TRUE(theirs);

    const std::vector<ObjectId> released = registry.release_owned(kOwner);
    ASSERT_EQ(released.size(), 1u);
    EXPECT_EQ(released[0], *mine);
    EXPECT_FALSE(registry.exists(*mine));
    EXPECT_TRUE(registry.exists(*theirs));
    EXPECT_TRUE(registry.release_owned(kOwner).empty());
}

TEST(ObjectRegistryTest, DestroyKeepsOwnerIndexInStep)
{
    Platform platform;
    ObjectRegistry registry(platform);
    auto id = registry.create(ObjectKind::Storage, kOwner);
    ASSERT_TRUE(id);
    ASSERT_TRUE(registry.destroy(*id));
    EXPECT_EQ(registry.destroy(*id).error().code(), ErrorCode::ResourceNotFound);
    EXPECT_TRUE(registry.release_owned(kOwner).empty());
}

// Every object created while releases run is released exactly once and
// none survives the final release.
TEST(ObjectRegistryTest, ConcurrentCreateAndReleaseLoseNothing)
{
    Platform platform;
    ObjectRegistry registry(platform);

    std::atomic<bool> stop{false};
    std::mutex mu;
    std::vector<ObjectId> created;
    std::vector<ObjectId> released;

    std::thread creator([&] {
        while (!stop.load()) {
            auto id = registry.create(ObjectKind::Storage, kOwner);
            ASSERT_TRUE(id);
            std::lock_guard<std::mutex> lock(mu);
            created.push_back(*id);
        }
    });
    std::thread releaser([&] {
        while (!stop.load()) {
            std::vector<ObjectId> batch = registry.release_owned(kOwner);
            for (const auto& id : batch) {
                EXPECT_FALSE(registry.exists(id));
            }
            std::lock_guard<std::mutex> lock(mu);
            released.insert(released.end(), batch.begin(), batch.end());
        }
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    stop.store(true);
    creator.join();
    releaser.join();

    const std::vector<ObjectId> rest = registry.release_owned(kOwner);
    released.insert(released.end(), rest.begin(), rest.end());

    std::unordered_set<ObjectId, ObjectIdHash> seen;
    for (const auto& id : released) {
        EXPECT_TRUE(seen.insert(id).second) << "released twice";
    }
    EXPECT_EQ(seen.size(), created.size());
    for (const auto& id : created) {
        EXPECT_FALSE(registry.exists(id));
        EXPECT_EQ(seen.count(id), 1u);
    }
}

} // namespace
} // namespace capkern
