// cppcheck-suppress-file missingIncludeSystem
#include "capsule_state.hpp"

#include <mutex>
#include <string>

namespace capkern {

const char* capsule_run_state_name(CapsuleRunState state)
{
    switch (state) {
        case CapsuleRunState::Running:
            return "running";
        case CapsuleRunState::Frozen:
            return "frozen";
        case CapsuleRunState::Stopped:
            return "stopped";
        case CapsuleRunState::Quarantined:
            return "quarantined";
    }
    return "unknown";
}

CapsuleRunState CapsuleStates::state(CapsuleId capsule) const
{
    std::shared_lock<std::shared_mutex> lock(mu_);
    auto it = states_.find(capsule);
    return it == states_.end() ? CapsuleRunState::Running : it->second;
}

void CapsuleStates::set(CapsuleId capsule, CapsuleRunState state)
{
    std::unique_lock<std::shared_mutex> lock(mu_);
    auto& current = states_[capsule];
    // Quarantine is sticky until teardown.
    if (current == CapsuleRunState::Quarantined) {
        return;
    }
    current = state;
}

void CapsuleStates::forget(CapsuleId capsule)
{
    std::unique_lock<std::shared_mutex> lock(mu_);
    states_.erase(capsule);
}

Result<void> CapsuleStates::check_runnable(CapsuleId capsule) const
{
    switch (state(capsule)) {
        case CapsuleRunState::Running:
            return {};
        case CapsuleRunState::Frozen:
            return Error(ErrorCode::CapsuleSuspended, "Capsule is frozen", "capsule=" + std::to_string(capsule));
        case CapsuleRunState::Stopped:
            return Error(ErrorCode::CapsuleSuspended, "Capsule is stopped", "capsule=" + std::to_string(capsule));
        case CapsuleRunState::Quarantined:
            return Error(ErrorCode::Internal, "Capsule is quarantined", "capsule=" + std::to_string(capsule));
    }
    return Error(ErrorCode::Internal, "Unknown capsule state");
}

} // namespace capkern
