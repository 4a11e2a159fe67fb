#include "chatbridge/core/error.hpp"

namespace chatbridge {

namespace {

constexpr auto kUnknownError = "Unknown error";

auto extract_message(const std::optional<nlohmann::json>& body) -> std::string {
    if (!body || !body->is_object()) return kUnknownError;

    if (body->contains("error")) {
        const auto& err = (*body)["error"];
        if (err.is_object()) {
            auto it = err.find("message");
            if (it != err.end() && it->is_string()) return it->get<std::string>();
            return kUnknownError;
        }
        if (err.is_string()) return err.get<std::string>();
        return err.dump();
    }

    auto it = body->find("message");
    if (it != body->end()) {
        return it->is_string() ? it->get<std::string>() : it->dump();
    }
    return kUnknownError;
}

} // anonymous namespace

auto error_code_for_status(int status) noexcept -> ErrorCode {
    switch (status) {
        case 400: return ErrorCode::BadRequest;
        case 401: return ErrorCode::Authentication;
        case 403: return ErrorCode::PermissionDenied;
        case 404: return ErrorCode::NotFound;
        case 409: return ErrorCode::Conflict;
        case 422: return ErrorCode::UnprocessableEntity;
        case 429: return ErrorCode::RateLimit;
        default: break;
    }
    return status >= 500 ? ErrorCode::InternalServer : ErrorCode::Generic;
}

auto error_from_status(int status,
                       const std::optional<nlohmann::json>& body,
                       std::optional<std::string> raw_body) -> Error {
    return make_error(error_code_for_status(status), extract_message(body))
        .with_status(status)
        .with_response(std::move(raw_body));
}

auto error_from_transport(const Error& cause) -> Error {
    return make_error(ErrorCode::InternalServer, cause.what()).with_status(500);
}

} // namespace chatbridge
