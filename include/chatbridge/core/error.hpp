#pragma once

#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace chatbridge {

enum class ErrorCode {
    // Upstream API taxonomy, keyed by HTTP status.
    BadRequest = 1,
    Authentication,
    PermissionDenied,
    NotFound,
    Conflict,
    UnprocessableEntity,
    RateLimit,
    InternalServer,
    Generic,
    // Library-internal failures.
    InvalidArgument,
    ProtocolError,
    ConnectionFailed,
    ConnectionClosed,
    Timeout,
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

    /// HTTP status the error originated from, 0 when it did not come from
    /// an HTTP response.
    [[nodiscard]] auto status() const noexcept -> int { return status_; }

    /// Raw upstream response body, when one was available.
    [[nodiscard]] auto response() const noexcept -> const std::optional<std::string>& {
        return response_;
    }

    auto with_status(int status) && -> Error {
        status_ = status;
        return std::move(*this);
    }

    auto with_response(std::optional<std::string> body) && -> Error {
        response_ = std::move(body);
        return std::move(*this);
    }

    [[nodiscard]] auto what() const -> std::string {
        if (detail_.empty()) return message_;
        return message_ + ": " + detail_;
    }

private:
    ErrorCode code_;
    std::string message_;
    std::string detail_;
    int status_ = 0;
    std::optional<std::string> response_;
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

/// Maps an upstream HTTP status to its error kind.
/// 400/401/403/404/409/422/429 have dedicated kinds, any status >= 500 is
/// InternalServer, everything else is Generic.
auto error_code_for_status(int status) noexcept -> ErrorCode;

/// Builds the error for a non-2xx upstream response.
///
/// The human message is taken from `{"error": {"message": ...}}`, then
/// `{"error": "..."}`, then `{"message": ...}`, falling back to
/// "Unknown error" when the body is absent or carries none of these.
auto error_from_status(int status,
                       const std::optional<nlohmann::json>& body,
                       std::optional<std::string> raw_body = std::nullopt) -> Error;

/// Transport failures (connect, timeout, cancellation) surface as
/// InternalServer carrying the underlying failure's message.
auto error_from_transport(const Error& cause) -> Error;

/// Convert ErrorCode to an upper-case identifier for logs.
inline auto error_code_to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::BadRequest: return "BAD_REQUEST";
        case ErrorCode::Authentication: return "AUTHENTICATION";
        case ErrorCode::PermissionDenied: return "PERMISSION_DENIED";
        case ErrorCode::NotFound: return "NOT_FOUND";
        case ErrorCode::Conflict: return "CONFLICT";
        case ErrorCode::UnprocessableEntity: return "UNPROCESSABLE_ENTITY";
        case ErrorCode::RateLimit: return "RATE_LIMIT";
        case ErrorCode::InternalServer: return "INTERNAL_SERVER";
        case ErrorCode::Generic: return "API_ERROR";
        case ErrorCode::InvalidArgument: return "INVALID_ARGUMENT";
        case ErrorCode::ProtocolError: return "PROTOCOL_ERROR";
        case ErrorCode::ConnectionFailed: return "CONNECTION_FAILED";
        case ErrorCode::ConnectionClosed: return "CONNECTION_CLOSED";
        case ErrorCode::Timeout: return "TIMEOUT";
        default: return "UNKNOWN";
    }
}

// GCC 14 ICE workaround for co_return std::unexpected(...) in coroutines.
// The wrapper defers the std::unexpected -> std::expected conversion to a
// user-defined conversion operator outside the coroutine frame.
// See: https://gcc.gnu.org/bugzilla/show_bug.cgi?id=112341
struct Fail {
    Error error;

    explicit Fail(Error e) : error(std::move(e)) {}

    template <typename T>
    operator Result<T>() && { return std::unexpected(std::move(error)); }
};

/// Use co_return make_fail(err) instead of co_return std::unexpected(err).
inline auto make_fail(Error e) -> Fail { return Fail(std::move(e)); }

} // namespace chatbridge
