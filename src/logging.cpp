// cppcheck-suppress-file missingIncludeSystem
#include "logging.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "utils.hpp"

namespace capkern {

namespace {

std::string timestamp_utc()
{
    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm {};
    gmtime_r(&secs, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << "." << std::setw(3) << std::setfill('0') << millis << "Z";
    return oss.str();
}

const char* basename_of(const char* path)
{
    const char* base = path;
    for (const char* p = path; p && *p; ++p) {
        if (*p == '/') {
            base = p + 1;
        }
    }
    return base;
}

} // namespace

bool parse_log_level(const std::string& value, LogLevel& level)
{
    if (value == "debug") {
        level = LogLevel::Debug;
    } else if (value == "info") {
        level = LogLevel::Info;
    } else if (value == "warn" || value == "warning") {
        level = LogLevel::Warn;
    } else if (value == "error") {
        level = LogLevel::Error;
    } else {
        return false;
    }
    return true;
}

const char* log_level_name(LogLevel level)
{
    switch (level) {
        case LogLevel::Debug:
            return "debug";
        case LogLevel::Info:
            return "info";
        case LogLevel::Warn:
            return "warn";
        case LogLevel::Error:
            return "error";
    }
    return "info";
}

LogEntry& LogEntry::field(const std::string& key, const std::string& value)
{
    fields_.push_back(Field{key, value, true});
    return *this;
}

LogEntry& LogEntry::field(const std::string& key, const char* value)
{
    fields_.push_back(Field{key, value ? std::string(value) : std::string(), true});
    return *this;
}

LogEntry& LogEntry::field(const std::string& key, int64_t value)
{
    fields_.push_back(Field{key, std::to_string(value), false});
    return *this;
}

LogEntry& LogEntry::field(const std::string& key, double value)
{
    std::ostringstream oss;
    oss << value;
    fields_.push_back(Field{key, oss.str(), false});
    return *this;
}

LogEntry& LogEntry::field(const std::string& key, bool value)
{
    fields_.push_back(Field{key, value ? "true" : "false", false});
    return *this;
}

std::string LogEntry::render_text() const
{
    std::ostringstream oss;
    oss << timestamp_utc() << " " << log_level_name(level_) << " " << message_;
    for (const auto& f : fields_) {
        oss << " " << f.key << "=";
        if (f.quoted && f.value.find(' ') != std::string::npos) {
            oss << "\"" << f.value << "\"";
        } else {
            oss << f.value;
        }
    }
    oss << " (" << basename_of(file_) << ":" << line_ << ")";
    return oss.str();
}

std::string LogEntry::render_json() const
{
    std::ostringstream oss;
    oss << "{\"ts\":\"" << timestamp_utc() << "\",\"level\":\"" << log_level_name(level_) << "\",\"message\":\""
        << json_escape(message_) << "\"";
    for (const auto& f : fields_) {
        oss << ",\"" << json_escape(f.key) << "\":";
        if (f.quoted) {
            oss << "\"" << json_escape(f.value) << "\"";
        } else {
            oss << f.value;
        }
    }
    oss << ",\"src\":\"" << basename_of(file_) << ":" << line_ << "\"}";
    return oss.str();
}

Logger::Logger() : out_(&std::cerr) {}

void Logger::log(const LogEntry& entry)
{
    std::lock_guard<std::mutex> lock(mu_);
    if (static_cast<int>(entry.level()) < static_cast<int>(level_) || out_ == nullptr) {
        return;
    }
    *out_ << (json_ ? entry.render_json() : entry.render_text()) << "\n";
    out_->flush();
}

void Logger::set_output(std::ostream* out)
{
    std::lock_guard<std::mutex> lock(mu_);
    out_ = out;
}

void Logger::set_json_format(bool json)
{
    std::lock_guard<std::mutex> lock(mu_);
    json_ = json;
}

void Logger::set_level(LogLevel level)
{
    std::lock_guard<std::mutex> lock(mu_);
    level_ = level;
}

LogLevel Logger::level() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return level_;
}

bool Logger::enabled(LogLevel level) const
{
    std::lock_guard<std::mutex> lock(mu_);
    return static_cast<int>(level) >= static_cast<int>(level_);
}

Logger& logger()
{
    static Logger instance;
    return instance;
}

} // namespace capkern
