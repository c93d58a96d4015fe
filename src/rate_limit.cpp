// cppcheck-suppress-file missingIncludeSystem
#include "rate_limit.hpp"

#include <algorithm>

namespace capkern {

namespace {
constexpr uint64_t kMilli = 1000;
} // namespace

TokenBucket::TokenBucket(uint32_t rate_per_sec, uint32_t burst, uint64_t now_ms)
    : rate_per_sec_(rate_per_sec), capacity_milli_(static_cast<uint64_t>(std::max<uint32_t>(burst, 1)) * kMilli),
      tokens_milli_(capacity_milli_), last_ms_(now_ms)
{
}

uint64_t TokenBucket::available_milli(uint64_t now_ms) const
{
    if (now_ms <= last_ms_ || rate_per_sec_ == 0) {
        return tokens_milli_;
    }
    // rate tokens/s == rate milli-tokens/ms. Past a full refill the gap no
    // longer matters, so clamp it before multiplying.
    const uint64_t full_refill_ms = capacity_milli_ / rate_per_sec_ + 1;
    const uint64_t elapsed = std::min(now_ms - last_ms_, full_refill_ms);
    const uint64_t refill = elapsed * rate_per_sec_;
    return std::min(capacity_milli_, tokens_milli_ + refill);
}

bool TokenBucket::can_take(uint64_t now_ms) const
{
    if (!enabled()) {
        return true;
    }
    return available_milli(now_ms) >= kMilli;
}

bool TokenBucket::take(uint64_t now_ms)
{
    if (!enabled()) {
        return true;
    }
    tokens_milli_ = available_milli(now_ms);
    last_ms_ = std::max(last_ms_, now_ms);
    if (tokens_milli_ < kMilli) {
        return false;
    }
    tokens_milli_ -= kMilli;
    return true;
}

FixedWindowQuota::FixedWindowQuota(uint32_t limit, uint32_t window_ms, uint64_t now_ms)
    : limit_(limit), window_ms_(window_ms == 0 ? 1 : window_ms), window_start_(now_ms)
{
}

uint64_t FixedWindowQuota::window_start_for(uint64_t now_ms) const
{
    if (now_ms < window_start_ + window_ms_) {
        return window_start_;
    }
    const uint64_t windows = (now_ms - window_start_) / window_ms_;
    return window_start_ + windows * window_ms_;
}

bool FixedWindowQuota::can_take(uint64_t now_ms) const
{
    if (!enabled()) {
        return true;
    }
    if (window_start_for(now_ms) != window_start_) {
        return true;
    }
    return count_ < limit_;
}

bool FixedWindowQuota::take(uint64_t now_ms)
{
    if (!enabled()) {
        return true;
    }
    const uint64_t start = window_start_for(now_ms);
    if (start != window_start_) {
        window_start_ = start;
        count_ = 0;
    }
    if (count_ >= limit_) {
        return false;
    }
    ++count_;
    return true;
}

} // namespace capkern
