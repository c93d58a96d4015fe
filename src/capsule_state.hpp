// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <shared_mutex>
#include <unordered_map>

#include "result.hpp"
#include "types.hpp"

namespace capkern {

enum class CapsuleRunState { Running, Frozen, Stopped, Quarantined };

const char* capsule_run_state_name(CapsuleRunState state);

/**
 * Run state of each capsule as reported by the scheduler. Capsules never
 * seen are Running.
 */
class CapsuleStates {
  public:
    CapsuleStates() = default;

    CapsuleStates(const CapsuleStates&) = delete;
    CapsuleStates& operator=(const CapsuleStates&) = delete;

    [[nodiscard]] CapsuleRunState state(CapsuleId capsule) const;
    void set(CapsuleId capsule, CapsuleRunState state);
    void forget(CapsuleId capsule);

    // CapsuleSuspended while frozen or stopped, Internal once quarantined.
    Result<void> check_runnable(CapsuleId capsule) const;

  private:
    mutable std::shared_mutex mu_;
    std::unordered_map<CapsuleId, CapsuleRunState> states_;
};

} // namespace capkern
