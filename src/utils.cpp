// cppcheck-suppress-file missingIncludeSystem
#include "utils.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <sstream>

#include "logging.hpp"

namespace capkern {

namespace {

bool find_json_value_pos(const std::string& json, const std::string& key, size_t& pos_out)
{
    const std::string needle = "\"" + key + "\"";
    size_t pos = json.find(needle);
    if (pos == std::string::npos) {
        return false;
    }
    pos = json.find(':', pos + needle.size());
    if (pos == std::string::npos) {
        return false;
    }
    ++pos;
    while (pos < json.size() && std::isspace(static_cast<unsigned char>(json[pos]))) {
        ++pos;
    }
    pos_out = pos;
    return true;
}

int hex_value(char h)
{
    if (h >= '0' && h <= '9') {
        return h - '0';
    }
    if (h >= 'a' && h <= 'f') {
        return 10 + (h - 'a');
    }
    if (h >= 'A' && h <= 'F') {
        return 10 + (h - 'A');
    }
    return -1;
}

} // namespace

std::string trim(const std::string& s)
{
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        ++start;
    }
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(start, end - start);
}

std::vector<std::string> split_whitespace(const std::string& s)
{
    std::vector<std::string> parts;
    std::istringstream iss(s);
    std::string token;
    while (iss >> token) {
        parts.push_back(token);
    }
    return parts;
}

bool parse_key_value(const std::string& line, std::string& key, std::string& value)
{
    size_t eq = line.find('=');
    if (eq == std::string::npos) {
        return false;
    }
    key = trim(line.substr(0, eq));
    value = trim(line.substr(eq + 1));
    return !key.empty();
}

bool parse_uint64(const std::string& s, uint64_t& out)
{
    if (s.empty()) {
        return false;
    }
    uint64_t v = 0;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        const uint64_t digit = static_cast<uint64_t>(c - '0');
        if (v > (UINT64_MAX - digit) / 10) {
            return false;
        }
        v = v * 10 + digit;
    }
    out = v;
    return true;
}

bool parse_bool(const std::string& s, bool& out)
{
    if (s == "true" || s == "1" || s == "yes" || s == "on") {
        out = true;
        return true;
    }
    if (s == "false" || s == "0" || s == "no" || s == "off") {
        out = false;
        return true;
    }
    return false;
}

std::string json_escape(const std::string& s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (unsigned char c : s) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (c < 0x20) {
                    static const char* kHex = "0123456789abcdef";
                    out += "\\u00";
                    out.push_back(kHex[(c >> 4) & 0xf]);
                    out.push_back(kHex[c & 0xf]);
                } else {
                    out.push_back(static_cast<char>(c));
                }
        }
    }
    return out;
}

std::string hex_encode(const uint8_t* data, size_t len)
{
    static const char* kHex = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(kHex[(data[i] >> 4) & 0xf]);
        out.push_back(kHex[data[i] & 0xf]);
    }
    return out;
}

std::string env_or_default(const char* key, const std::string& fallback)
{
    const char* env = std::getenv(key);
    if (env && *env) {
        return std::string(env);
    }
    return fallback;
}

bool parse_u64_env(const char* key, uint64_t& out)
{
    const char* env = std::getenv(key);
    if (!env || !*env) {
        return false;
    }
    uint64_t v = 0;
    if (!parse_uint64(env, v)) {
        logger().log(SLOG_WARN("Invalid env value; using default").field("key", key).field("value", env));
        return false;
    }
    out = v;
    return true;
}

bool parse_u32_env(const char* key, uint32_t& out)
{
    uint64_t v = 0;
    if (!parse_u64_env(key, v)) {
        return false;
    }
    if (v > UINT32_MAX) {
        logger().log(
            SLOG_WARN("Env value out of range; using default").field("key", key).field("value", static_cast<int64_t>(v)));
        return false;
    }
    out = static_cast<uint32_t>(v);
    return true;
}

bool parse_bool_env(const char* key, bool& out)
{
    const char* env = std::getenv(key);
    if (!env || !*env) {
        return false;
    }
    bool v = false;
    if (!parse_bool(env, v)) {
        logger().log(SLOG_WARN("Invalid env value; using default").field("key", key).field("value", env));
        return false;
    }
    out = v;
    return true;
}

bool extract_json_string_simple(const std::string& json, const std::string& key, std::string& out)
{
    size_t pos = 0;
    if (!find_json_value_pos(json, key, pos)) {
        return false;
    }
    if (pos >= json.size() || json[pos] != '"') {
        return false;
    }
    ++pos;
    std::string s;
    while (pos < json.size()) {
        char c = json[pos++];
        if (c == '"') {
            out = s;
            return true;
        }
        if (c != '\\') {
            s.push_back(c);
            continue;
        }
        if (pos >= json.size()) {
            return false;
        }
        char esc = json[pos++];
        switch (esc) {
            case '"':
            case '\\':
            case '/':
                s.push_back(esc);
                break;
            case 'n':
                s.push_back('\n');
                break;
            case 'r':
                s.push_back('\r');
                break;
            case 't':
                s.push_back('\t');
                break;
            case 'u': {
                // json_escape() only emits \u00XX for control bytes.
                if (pos + 4 > json.size()) {
                    return false;
                }
                unsigned int code = 0;
                for (int i = 0; i < 4; ++i) {
                    int h = hex_value(json[pos++]);
                    if (h < 0) {
                        return false;
                    }
                    code = (code << 4) | static_cast<unsigned int>(h);
                }
                if (code > 0xff) {
                    return false;
                }
                s.push_back(static_cast<char>(code));
                break;
            }
            default:
                return false;
        }
    }
    return false;
}

bool extract_json_uint64_simple(const std::string& json, const std::string& key, uint64_t& out)
{
    size_t pos = 0;
    if (!find_json_value_pos(json, key, pos)) {
        return false;
    }
    if (pos >= json.size() || !std::isdigit(static_cast<unsigned char>(json[pos]))) {
        return false;
    }
    uint64_t v = 0;
    while (pos < json.size() && std::isdigit(static_cast<unsigned char>(json[pos]))) {
        int digit = json[pos++] - '0';
        if (v > (UINT64_MAX - static_cast<uint64_t>(digit)) / 10) {
            return false;
        }
        v = v * 10 + static_cast<uint64_t>(digit);
    }
    out = v;
    return true;
}

Result<void> append_jsonl_line(const std::string& path, const std::string& line)
{
    if (line.find('\n') != std::string::npos || line.find('\r') != std::string::npos) {
        return Error::invalid_argument("jsonl line contains newline characters");
    }

    std::error_code ec;
    const std::filesystem::path p(path);
    const std::filesystem::path parent = p.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return Error(ErrorCode::IoError, "Failed to create log directory", ec.message());
        }
    }

    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0600);
    if (fd < 0) {
        return Error::system(errno, "Failed to open log for append");
    }

    const std::string payload = line + "\n";
    size_t off = 0;
    while (off < payload.size()) {
        ssize_t wrote = ::write(fd, payload.data() + off, payload.size() - off);
        if (wrote < 0) {
            if (errno == EINTR) {
                continue;
            }
            int saved = errno;
            ::close(fd);
            return Error::system(saved, "Failed to append log line");
        }
        off += static_cast<size_t>(wrote);
    }

    if (::fsync(fd) != 0) {
        int saved = errno;
        ::close(fd);
        return Error::system(saved, "Failed to fsync log");
    }
    ::close(fd);
    return {};
}

} // namespace capkern
