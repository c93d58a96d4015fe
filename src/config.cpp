// cppcheck-suppress-file missingIncludeSystem
#include "config.hpp"

#include "events.hpp"
#include "utils.hpp"

namespace capkern {

namespace {

void load_depth(const char* key, uint8_t& out)
{
    uint32_t v = 0;
    if (!parse_u32_env(key, v)) {
        return;
    }
    if (v > kMaxDelegationDepth) {
        logger().log(SLOG_WARN("Delegation depth above maximum; using default")
                         .field("key", key)
                         .field("value", static_cast<int64_t>(v))
                         .field("max", static_cast<int64_t>(kMaxDelegationDepth)));
        return;
    }
    out = static_cast<uint8_t>(v);
}

} // namespace

KernelConfig kernel_config_from_env()
{
    KernelConfig cfg;

    uint32_t root = 0;
    if (parse_u32_env("CAPKERN_ROOT_CAPSULE", root)) {
        if (root == kKernelCapsule) {
            logger().log(SLOG_WARN("Root capsule id 0 is reserved for the kernel; using default")
                             .field("key", "CAPKERN_ROOT_CAPSULE"));
        } else {
            cfg.root_capsule = root;
        }
    }
    load_depth("CAPKERN_ROOT_DELEGATION_DEPTH", cfg.root_delegation_depth);
    load_depth("CAPKERN_DEFAULT_DELEGATION_DEPTH", cfg.default_delegation_depth);

    uint32_t max_message = 0;
    if (parse_u32_env("CAPKERN_MAX_MESSAGE_BYTES", max_message)) {
        if (max_message == 0) {
            logger().log(SLOG_WARN("Max message size must be positive; using default")
                             .field("key", "CAPKERN_MAX_MESSAGE_BYTES"));
        } else {
            cfg.max_message_bytes = max_message;
        }
    }

    uint32_t timeout = 0;
    if (parse_u32_env("CAPKERN_POLICY_TIMEOUT_MS", timeout)) {
        if (timeout == 0) {
            logger().log(SLOG_WARN("Policy timeout must be positive; using default")
                             .field("key", "CAPKERN_POLICY_TIMEOUT_MS"));
        } else {
            cfg.policy_timeout_ms = timeout;
        }
    }

    parse_bool_env("CAPKERN_AUDIT_BACKPRESSURE", cfg.audit_backpressure);
    parse_bool_env("CAPKERN_AUDIT_ALLOWED", cfg.audit_allowed);

    uint32_t history = 0;
    if (parse_u32_env("CAPKERN_AUDIT_HISTORY_LIMIT", history)) {
        if (history == 0) {
            logger().log(SLOG_WARN("Audit history limit must be positive; using default")
                             .field("key", "CAPKERN_AUDIT_HISTORY_LIMIT"));
        } else {
            cfg.audit_history_limit = history;
        }
    }

    cfg.audit_log_path = env_or_default("CAPKERN_AUDIT_LOG_PATH", "");

    const std::string mirror = env_or_default("CAPKERN_AUDIT_MIRROR", "");
    if (!mirror.empty() && !parse_event_log_sink(mirror, cfg.audit_mirror)) {
        logger().log(SLOG_WARN("Invalid env value; using default").field("key", "CAPKERN_AUDIT_MIRROR").field("value", mirror));
    }

    const std::string level = env_or_default("CAPKERN_LOG_LEVEL", "");
    if (!level.empty() && !parse_log_level(level, cfg.log_level)) {
        logger().log(SLOG_WARN("Invalid env value; using default").field("key", "CAPKERN_LOG_LEVEL").field("value", level));
    }

    const std::string format = env_or_default("CAPKERN_LOG_FORMAT", "");
    if (format == "json") {
        cfg.log_json = true;
    } else if (!format.empty() && format != "text") {
        logger().log(SLOG_WARN("Invalid env value; using default").field("key", "CAPKERN_LOG_FORMAT").field("value", format));
    }

    return cfg;
}

void apply_logging_config(const KernelConfig& config)
{
    logger().set_level(config.log_level);
    logger().set_json_format(config.log_json);
}

} // namespace capkern
