#ifndef SECURITYERROR_HPP
#define SECURITYERROR_HPP

#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <variant>
#include <stdexcept>

namespace Kalkan::Core {

/**
 * @brief Stable, machine-readable category of a security violation
 */
enum class ErrorKind {
    NoError,
    InvalidInput,
    PathTraversal,
    ResourceExceeded,
    DangerousContent,
    ParseFailure,
    Timeout
};

inline const char* errorKindName(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::NoError:
        return "NoError";
    case ErrorKind::InvalidInput:
        return "InvalidInput";
    case ErrorKind::PathTraversal:
        return "PathTraversal";
    case ErrorKind::ResourceExceeded:
        return "ResourceExceeded";
    case ErrorKind::DangerousContent:
        return "DangerousContent";
    case ErrorKind::ParseFailure:
        return "ParseFailure";
    case ErrorKind::Timeout:
        return "Timeout";
    }
    return "Unknown";
}

/**
 * @brief Everything a caller needs to render an actionable message
 *
 * `code` is finer grained than `kind` (e.g. NULL_BYTE, FILE_TOO_LARGE).
 * `context` names the offending field or path. `limit` and `observed`
 * are set for ceiling breaches.
 */
struct SecurityError {
    ErrorKind kind = ErrorKind::NoError;
    std::string code;
    std::string message;
    std::string context;
    std::optional<std::int64_t> limit;
    std::optional<std::int64_t> observed;

    SecurityError() = default;
    SecurityError(ErrorKind k, std::string c, std::string msg, std::string ctx = std::string())
        : kind(k), code(std::move(c)), message(std::move(msg)), context(std::move(ctx)) {}

    SecurityError& withLimit(std::int64_t configured, std::int64_t actual)
    {
        limit = configured;
        observed = actual;
        return *this;
    }

    std::string describe() const
    {
        std::string result = std::string(errorKindName(kind)) + " [" + code + "]: " + message;
        if (!context.empty()) {
            result += " (" + context + ")";
        }
        if (limit && observed) {
            result += " limit=" + std::to_string(*limit) + " observed=" + std::to_string(*observed);
        }
        return result;
    }
};

/**
 * @brief Exception carrying a SecurityError
 */
class SecurityException : public std::runtime_error {
private:
    SecurityError error_;

public:
    explicit SecurityException(SecurityError error)
        : std::runtime_error(error.describe())
        , error_(std::move(error)) {}

    SecurityException(ErrorKind kind, const std::string& code, const std::string& message,
                      const std::string& context = std::string())
        : SecurityException(SecurityError(kind, code, message, context)) {}

    const SecurityError& error() const { return error_; }
    ErrorKind kind() const { return error_.kind; }
    const std::string& code() const { return error_.code; }
    const std::string& context() const { return error_.context; }
    std::optional<std::int64_t> limit() const { return error_.limit; }
    std::optional<std::int64_t> observed() const { return error_.observed; }
};

/**
 * @brief Error raised by the sandboxed parser
 *
 * Keeps the kind of the wrapped cause, so a ceiling breach found while
 * validating a parsed tree still reports ResourceExceeded.
 */
class ParserException : public SecurityException {
private:
    std::string filePath_;
    std::optional<SecurityError> cause_;

public:
    ParserException(SecurityError error, std::string filePath, std::optional<SecurityError> cause = std::nullopt)
        : SecurityException(std::move(error))
        , filePath_(std::move(filePath))
        , cause_(std::move(cause)) {}

    const std::string& filePath() const { return filePath_; }
    const std::optional<SecurityError>& cause() const { return cause_; }
};

/**
 * @brief Result type for validators that can fail
 */
template<typename T>
class Result {
private:
    std::variant<T, SecurityError> value_;

public:
    Result(T value) : value_(std::move(value)) {}
    Result(SecurityError error) : value_(std::move(error)) {}
    Result(ErrorKind kind, const std::string& code, const std::string& message,
           const std::string& context = std::string())
        : value_(SecurityError(kind, code, message, context)) {}

    bool isSuccess() const { return std::holds_alternative<T>(value_); }
    bool isError() const { return std::holds_alternative<SecurityError>(value_); }

    const T& value() const
    {
        if (isError()) {
            throw SecurityException(std::get<SecurityError>(value_));
        }
        return std::get<T>(value_);
    }

    T& value()
    {
        if (isError()) {
            throw SecurityException(std::get<SecurityError>(value_));
        }
        return std::get<T>(value_);
    }

    const SecurityError& error() const
    {
        static const SecurityError none;
        if (isSuccess()) {
            return none;
        }
        return std::get<SecurityError>(value_);
    }

    ErrorKind kind() const { return error().kind; }
    const std::string& code() const { return error().code; }

    // Convenience methods
    explicit operator bool() const { return isSuccess(); }
    const T& operator*() const { return value(); }
    const T* operator->() const { return &value(); }
};

} // namespace Kalkan::Core

#endif // SECURITYERROR_HPP
