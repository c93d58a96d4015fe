// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstddef>
#include <cstdint>

#include "result.hpp"
#include "types.hpp"

namespace capkern {

using MonotonicClockFn = uint64_t (*)(void* user_ctx);
using RandomBytesFn = Result<void> (*)(void* user_ctx, uint8_t* out, size_t len);

/**
 * Overridable platform dependencies.
 *
 * Null fields fall back to the production implementations
 * (CLOCK_MONOTONIC and getrandom(2)). Tests override the clock to drive
 * TTL, quota and rate decisions deterministically.
 */
struct PlatformDeps {
    MonotonicClockFn now_ms = nullptr;
    RandomBytesFn random_bytes = nullptr;
    void* user_ctx = nullptr;
};

/**
 * The only process-wide facilities the core uses: a monotonic millisecond
 * clock and a cryptographic randomness source. One instance is constructed
 * by the caller and threaded through every component.
 */
class Platform {
  public:
    Platform();
    explicit Platform(const PlatformDeps& deps);

    [[nodiscard]] uint64_t now_ms() const;
    Result<void> random_bytes(uint8_t* out, size_t len) const;

    Result<CapToken> make_token() const;
    Result<ObjectId> make_object_id() const;

  private:
    PlatformDeps deps_;
};

uint64_t system_monotonic_ms(void* user_ctx);
Result<void> system_random_bytes(void* user_ctx, uint8_t* out, size_t len);

} // namespace capkern
