// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstdint>
#include <string>

#include "logging.hpp"
#include "types.hpp"

namespace capkern {

struct KernelConfig {
    CapsuleId root_capsule = 1;
    uint8_t root_delegation_depth = 8;
    uint8_t default_delegation_depth = 4;
    uint32_t max_message_bytes = kDefaultMaxMessageBytes;
    uint32_t policy_timeout_ms = 50;

    bool audit_backpressure = false;
    bool audit_allowed = false;
    uint32_t audit_history_limit = 4096;
    std::string audit_log_path;
    EventLogSink audit_mirror = EventLogSink::None;

    LogLevel log_level = LogLevel::Info;
    bool log_json = false;
};

// Defaults overridden by CAPKERN_* environment variables. Invalid values are
// logged and ignored.
KernelConfig kernel_config_from_env();

// Apply the logging part of `config` to the process logger.
void apply_logging_config(const KernelConfig& config);

} // namespace capkern
