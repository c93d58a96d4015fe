// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstring>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace capkern {

enum class ErrorCode {
    // Mediation outcomes
    Unauthorized,
    Expired,
    RateLimited,
    Exhausted,
    PolicyDenied,
    WouldBlock,
    GraphViolation,
    Internal,

    // Delegation
    DelegationDepthExceeded,
    DelegationRightsExceeded,

    // Messaging
    MessageMalformed,
    MessageTooLarge,
    EndpointClosed,
    CapsuleSuspended,

    // Generic
    AlreadyExists,
    ResourceNotFound,
    InvalidArgument,
    ConfigParseFailed,
    AuditChainBroken,
    IoError,
    Unknown,
};

const char* error_code_name(ErrorCode code);

class Error {
  public:
    Error(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}
    Error(ErrorCode code, std::string message, std::string context)
        : code_(code), message_(std::move(message)), context_(std::move(context))
    {
    }

    static Error system(int errnum, const std::string& message)
    {
        return Error(ErrorCode::IoError, message, std::strerror(errnum));
    }

    static Error not_found(const std::string& what) { return Error(ErrorCode::ResourceNotFound, "Not found", what); }

    static Error invalid_argument(const std::string& what)
    {
        return Error(ErrorCode::InvalidArgument, "Invalid argument", what);
    }

    [[nodiscard]] ErrorCode code() const { return code_; }
    [[nodiscard]] const std::string& message() const { return message_; }
    [[nodiscard]] const std::string& context() const { return context_; }

    [[nodiscard]] std::string to_string() const
    {
        std::string out = "[";
        out += error_code_name(code_);
        out += "] ";
        out += message_;
        if (!context_.empty()) {
            out += ": ";
            out += context_;
        }
        return out;
    }

  private:
    ErrorCode code_;
    std::string message_;
    std::string context_;
};

/**
 * Value-or-error return type.
 *
 * Every public operation of the core returns a Result; nothing on the
 * capsule-facing API throws.
 */
template <typename T>
class [[nodiscard]] Result {
  public:
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}
    Result(Error error) : data_(std::in_place_index<1>, std::move(error)) {}

    [[nodiscard]] bool ok() const { return data_.index() == 0; }
    explicit operator bool() const { return ok(); }

    T& value() & { return std::get<0>(data_); }
    const T& value() const& { return std::get<0>(data_); }
    T&& value() && { return std::get<0>(std::move(data_)); }

    const Error& error() const { return std::get<1>(data_); }

    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }
    T* operator->() { return &std::get<0>(data_); }
    const T* operator->() const { return &std::get<0>(data_); }

    T value_or(T fallback) const { return ok() ? std::get<0>(data_) : std::move(fallback); }

  private:
    std::variant<T, Error> data_;
};

template <>
class [[nodiscard]] Result<void> {
  public:
    Result() = default;
    Result(Error error) : error_(std::move(error)), has_error_(true) {}

    [[nodiscard]] bool ok() const { return !has_error_; }
    explicit operator bool() const { return ok(); }

    const Error& error() const { return error_; }

  private:
    Error error_{ErrorCode::Unknown, ""};
    bool has_error_ = false;
};

} // namespace capkern

// Propagate the error of a Result<void> expression to the caller.
#define CAPKERN_CONCAT_INNER(a, b) a##b
#define CAPKERN_CONCAT(a, b) CAPKERN_CONCAT_INNER(a, b)
#define TRY(expr)                                                                                                      \
    do {                                                                                                               \
        auto CAPKERN_CONCAT(_capkern_try_, __LINE__) = (expr);                                                         \
        if (!CAPKERN_CONCAT(_capkern_try_, __LINE__)) {                                                                \
            return CAPKERN_CONCAT(_capkern_try_, __LINE__).error();                                                    \
        }                                                                                                              \
    } while (0)
