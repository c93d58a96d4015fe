// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace capkern {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

bool parse_log_level(const std::string& value, LogLevel& level);
const char* log_level_name(LogLevel level);

/**
 * One structured log line under construction.
 *
 * Values are rendered at field() time so that entries can be moved across
 * threads without holding references to caller state.
 */
class LogEntry {
  public:
    LogEntry(LogLevel level, std::string message, const char* file, int line)
        : level_(level), message_(std::move(message)), file_(file), line_(line)
    {
    }

    LogEntry& field(const std::string& key, const std::string& value);
    LogEntry& field(const std::string& key, const char* value);
    LogEntry& field(const std::string& key, int64_t value);
    LogEntry& field(const std::string& key, double value);
    LogEntry& field(const std::string& key, bool value);

    [[nodiscard]] LogLevel level() const { return level_; }
    [[nodiscard]] const std::string& message() const { return message_; }

    [[nodiscard]] std::string render_text() const;
    [[nodiscard]] std::string render_json() const;

  private:
    struct Field {
        std::string key;
        std::string value;
        bool quoted;
    };

    LogLevel level_;
    std::string message_;
    const char* file_;
    int line_;
    std::vector<Field> fields_;
};

class Logger {
  public:
    Logger();

    void log(const LogEntry& entry);

    void set_output(std::ostream* out);
    void set_json_format(bool json);
    void set_level(LogLevel level);
    [[nodiscard]] LogLevel level() const;
    [[nodiscard]] bool enabled(LogLevel level) const;

  private:
    mutable std::mutex mu_;
    std::ostream* out_;
    bool json_ = false;
    LogLevel level_ = LogLevel::Info;
};

Logger& logger();

} // namespace capkern

#define SLOG_DEBUG(msg) ::capkern::LogEntry(::capkern::LogLevel::Debug, (msg), __FILE__, __LINE__)
#define SLOG_INFO(msg) ::capkern::LogEntry(::capkern::LogLevel::Info, (msg), __FILE__, __LINE__)
#define SLOG_WARN(msg) ::capkern::LogEntry(::capkern::LogLevel::Warn, (msg), __FILE__, __LINE__)
#define SLOG_ERROR(msg) ::capkern::LogEntry(::capkern::LogLevel::Error, (msg), __FILE__, __LINE__)
