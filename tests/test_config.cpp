// cppcheck-suppress-file missingIncludeSystem
// cppcheck-suppress-file missingInclude
// cppcheck-suppress-file syntaxError
#include <gtest/gtest.h>

#include "config.hpp"
#include "test_support.hpp"
#include "utils.hpp"

namespace capkern {
namespace {

using testing_support::ScopedEnvVar;

TEST(KernelConfigTest, DefaultsWithoutEnvironment)
{
    const KernelConfig cfg = kernel_config_from_env();
    EXPECT_EQ(cfg.root_capsule, 1u);
    EXPECT_EQ(cfg.root_delegation_depth, 8);
    EXPECT_EQ(cfg.default_delegation_depth, 4);
    EXPECT_EQ(cfg.max_message_bytes, kDefaultMaxMessageBytes);
    EXPECT_EQ(cfg.policy_timeout_ms, 50u);
    EXPECT_FALSE(cfg.audit_backpressure);
    EXPECT_FALSE(cfg.audit_allowed);
    EXPECT_TRUE(cfg.audit_log_path.empty());
    EXPECT_EQ(cfg.audit_mirror, EventLogSink::None);
}

TEST(KernelConfigTest, EnvironmentOverrides)
{
    ScopedEnvVar root("CAPKERN_ROOT_CAPSULE", "42");
    ScopedEnvVar depth("CAPKERN_DEFAULT_DELEGATION_DEPTH", "2");
    ScopedEnvVar max_msg("CAPKERN_MAX_MESSAGE_BYTES", "512");
    ScopedEnvVar timeout("CAPKERN_POLICY_TIMEOUT_MS", "250");
    ScopedEnvVar backpressure("CAPKERN_AUDIT_BACKPRESSURE", "true");
    ScopedEnvVar allowed("CAPKERN_AUDIT_ALLOWED", "1");
    ScopedEnvVar log_path("CAPKERN_AUDIT_LOG_PATH", "/tmp/capkern-audit.jsonl");
    ScopedEnvVar mirror("CAPKERN_AUDIT_MIRROR", "stdout");
    ScopedEnvVar level("CAPKERN_LOG_LEVEL", "debug");
    ScopedEnvVar format("CAPKERN_LOG_FORMAT", "json");

    const KernelConfig cfg = kernel_config_from_env();
    EXPECT_EQ(cfg.root_capsule, 42u);
    EXPECT_EQ(cfg.default_delegation_depth, 2);
    EXPECT_EQ(cfg.max_message_bytes, 512u);
    EXPECT_EQ(cfg.policy_timeout_ms, 250u);
    EXPECT_TRUE(cfg.audit_backpressure);
    EXPECT_TRUE(cfg.audit_allowed);
    EXPECT_EQ(cfg.audit_log_path, "/tmp/capkern-audit.jsonl");
    EXPECT_EQ(cfg.audit_mirror, EventLogSink::Stdout);
    EXPECT_EQ(cfg.log_level, LogLevel::Debug);
    EXPECT_TRUE(cfg.log_json);
}

TEST(KernelConfigTest, InvalidValuesFallBackToDefaults)
{
    ScopedEnvVar root("CAPKERN_ROOT_CAPSULE", "0");
    ScopedEnvVar depth("CAPKERN_ROOT_DELEGATION_DEPTH", "99");
    ScopedEnvVar max_msg("CAPKERN_MAX_MESSAGE_BYTES", "lots");
    ScopedEnvVar timeout("CAPKERN_POLICY_TIMEOUT_MS", "0");
    ScopedEnvVar backpressure("CAPKERN_AUDIT_BACKPRESSURE", "maybe");
    ScopedEnvVar mirror("CAPKERN_AUDIT_MIRROR", "syslog");
    ScopedEnvVar format("CAPKERN_LOG_FORMAT", "xml");

    const KernelConfig cfg = kernel_config_from_env();
    EXPECT_EQ(cfg.root_capsule, 1u);
    EXPECT_EQ(cfg.root_delegation_depth, 8);
    EXPECT_EQ(cfg.max_message_bytes, kDefaultMaxMessageBytes);
    EXPECT_EQ(cfg.policy_timeout_ms, 50u);
    EXPECT_FALSE(cfg.audit_backpressure);
    EXPECT_EQ(cfg.audit_mirror, EventLogSink::None);
    EXPECT_FALSE(cfg.log_json);
}

TEST(UtilsTest, ParsingHelpers)
{
    uint64_t v = 0;
    EXPECT_TRUE(parse_uint64("18446744073709551615", v));
    EXPECT_EQ(v, UINT64_MAX);
    EXPECT_FALSE(parse_uint64("18446744073709551616", v));
    EXPECT_FALSE(parse_uint64("-1", v));
    EXPECT_FALSE(parse_uint64("", v));

    bool b = false;
    EXPECT_TRUE(parse_bool("on", b));
    EXPECT_TRUE(b);
    EXPECT_FALSE(parse_bool("perhaps", b));

    std::string key;
    std::string value;
    EXPECT_TRUE(parse_key_value("  capacity = 8 ", key, value));
    EXPECT_EQ(key, "capacity");
    EXPECT_EQ(value, "8");
    EXPECT_FALSE(parse_key_value("=8", key, value));
}

TEST(UtilsTest, JsonEscapeRoundTrip)
{
    const std::string raw = std::string("a\"b\\c\nd\te") + '\x01';
    const std::string json = "{\"reason\":\"" + json_escape(raw) + "\"}";
    std::string out;
    ASSERT_TRUE(extract_json_string_simple(json, "reason", out));
    EXPECT_EQ(out, raw);
}

TEST(UtilsTest, ObjectIdHexRoundTrip)
{
    const ObjectId id{0x0123456789abcdefULL, 0xfedcba9876543210ULL};
    const std::string hex = object_id_to_string(id);
    EXPECT_EQ(hex, "0123456789abcdeffedcba9876543210");
    ObjectId parsed;
    ASSERT_TRUE(parse_object_id(hex, parsed));
    EXPECT_EQ(parsed, id);
    EXPECT_FALSE(parse_object_id("0123", parsed));
    EXPECT_FALSE(parse_object_id("0123456789abcdeffedcba987654321g", parsed));
}

} // namespace
} // namespace capkern
