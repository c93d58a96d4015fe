// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstdint>

namespace capkern {

/**
 * Token bucket with integer milli-token accounting.
 *
 * Refills at rate_per_sec tokens per second up to `burst` tokens. A
 * disabled bucket (rate 0) always admits.
 */
class TokenBucket {
  public:
    TokenBucket() = default;
    TokenBucket(uint32_t rate_per_sec, uint32_t burst, uint64_t now_ms);

    [[nodiscard]] bool enabled() const { return rate_per_sec_ != 0; }
    [[nodiscard]] bool can_take(uint64_t now_ms) const;
    bool take(uint64_t now_ms);

  private:
    [[nodiscard]] uint64_t available_milli(uint64_t now_ms) const;

    uint32_t rate_per_sec_ = 0;
    uint64_t capacity_milli_ = 0;
    uint64_t tokens_milli_ = 0;
    uint64_t last_ms_ = 0;
};

/**
 * Fixed-window counter anchored at the capability's issue time.
 */
class FixedWindowQuota {
  public:
    FixedWindowQuota() = default;
    FixedWindowQuota(uint32_t limit, uint32_t window_ms, uint64_t now_ms);

    [[nodiscard]] bool enabled() const { return limit_ != 0; }
    [[nodiscard]] bool can_take(uint64_t now_ms) const;
    bool take(uint64_t now_ms);
    [[nodiscard]] uint32_t used() const { return count_; }

  private:
    [[nodiscard]] uint64_t window_start_for(uint64_t now_ms) const;

    uint32_t limit_ = 0;
    uint32_t window_ms_ = 1000;
    uint64_t window_start_ = 0;
    uint32_t count_ = 0;
};

} // namespace capkern
