// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "result.hpp"

namespace capkern {

std::string trim(const std::string& s);
std::vector<std::string> split_whitespace(const std::string& s);
bool parse_key_value(const std::string& line, std::string& key, std::string& value);
bool parse_uint64(const std::string& s, uint64_t& out);
bool parse_bool(const std::string& s, bool& out);

std::string json_escape(const std::string& s);
std::string hex_encode(const uint8_t* data, size_t len);

// Environment overrides. Invalid values are logged and the caller's default is kept.
std::string env_or_default(const char* key, const std::string& fallback);
bool parse_u64_env(const char* key, uint64_t& out);
bool parse_u32_env(const char* key, uint32_t& out);
bool parse_bool_env(const char* key, bool& out);

// Minimal flat-object JSON readers for the line formats this project writes itself.
bool extract_json_string_simple(const std::string& json, const std::string& key, std::string& out);
bool extract_json_uint64_simple(const std::string& json, const std::string& key, uint64_t& out);

// Append a single jsonl line (caller provides ordering). Flush + fsync to persist.
Result<void> append_jsonl_line(const std::string& path, const std::string& line);

} // namespace capkern
