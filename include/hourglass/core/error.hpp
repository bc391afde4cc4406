#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace hourglass {

enum class ErrorCode {
    Unknown = 1,
    InvalidConfig,
    InvalidArgument,
    InvalidSchedule,
    JobNotFound,
    StoreCorrupt,
    ExecutionFailed,
    Timeout,
    IoError,
    SerializationError,
    InternalError,
};

class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, std::string detail)
        : code_(code), message_(std::move(message)), detail_(std::move(detail)) {}

    [[nodiscard]] auto code() const noexcept -> ErrorCode { return code_; }
    [[nodiscard]] auto message() const noexcept -> std::string_view { return message_; }
    [[nodiscard]] auto detail() const noexcept -> std::string_view { return detail_; }

    [[nodiscard]] auto what() const -> std::string {
        if (detail_.empty()) return message_;
        return message_ + ": " + detail_;
    }

    auto operator==(const Error&) const -> bool = default;

private:
    ErrorCode code_;
    std::string message_;
    std::string detail_;
};

template <typename T>
using Result = std::expected<T, Error>;

using VoidResult = std::expected<void, Error>;

inline auto make_error(ErrorCode code, std::string message) -> Error {
    return Error(code, std::move(message));
}

inline auto make_error(ErrorCode code, std::string message, std::string detail) -> Error {
    return Error(code, std::move(message), std::move(detail));
}

/// Convert ErrorCode to its SCREAMING_SNAKE string form (logs, CLI output).
inline auto error_code_to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::Unknown: return "UNKNOWN";
        case ErrorCode::InvalidConfig: return "INVALID_CONFIG";
        case ErrorCode::InvalidArgument: return "INVALID_ARGUMENT";
        case ErrorCode::InvalidSchedule: return "INVALID_SCHEDULE";
        case ErrorCode::JobNotFound: return "JOB_NOT_FOUND";
        case ErrorCode::StoreCorrupt: return "STORE_CORRUPT";
        case ErrorCode::ExecutionFailed: return "EXECUTION_FAILED";
        case ErrorCode::Timeout: return "TIMEOUT";
        case ErrorCode::IoError: return "IO_ERROR";
        case ErrorCode::SerializationError: return "SERIALIZATION_ERROR";
        case ErrorCode::InternalError: return "INTERNAL_ERROR";
        default: return "UNKNOWN";
    }
}

// Coroutines return errors through Fail: GCC 14 hits an internal compiler
// error on `co_return std::unexpected(...)` inside a coroutine frame
// (https://gcc.gnu.org/bugzilla/show_bug.cgi?id=112341). The conversion to
// Result<T> happens in Fail's conversion operator instead.
struct Fail {
    Error error;

    explicit Fail(Error e) : error(std::move(e)) {}

    template <typename T>
    operator Result<T>() && { return std::unexpected(std::move(error)); }
};

/// `co_return make_fail(err);` in coroutines returning Result<T>.
inline auto make_fail(Error e) -> Fail { return Fail(std::move(e)); }

/// `co_return ok_result();` in coroutines returning VoidResult.
inline auto ok_result() -> Result<void> { return {}; }

} // namespace hourglass
