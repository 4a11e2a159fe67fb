#include "chatbridge/client/messages.hpp"

#include "chatbridge/core/utils.hpp"
#include "chatbridge/transform/response.hpp"

namespace chatbridge::client {

namespace {

auto parse_body(const std::string& body) -> std::optional<json> {
    auto parsed = json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded()) return std::nullopt;
    return parsed;
}

auto status_error(int status, const std::string& body, const LoggerPtr& logger) -> Error {
    auto err = error_from_status(status, parse_body(body), body);
    logger->warn("Upstream returned {} ({}): {}", status,
                 error_code_to_string(err.code()), err.message());
    return err;
}

auto transport_failure(const Error& cause, const LoggerPtr& logger) -> Error {
    logger->error("Upstream request failed: {}", cause.what());
    return error_from_transport(cause);
}

} // anonymous namespace

auto build_request_body(const transform::MessageCreateParams& params, bool stream,
                        const LoggerPtr& logger) -> json {
    auto body = transform::map_request(params, logger);
    body["stream"] = stream;
    return body;
}

auto message_from_response(const infra::HttpResponse& response, const LoggerPtr& logger)
    -> Result<Message> {
    if (!response.is_success()) {
        return std::unexpected(status_error(response.status, response.body, logger));
    }

    auto parsed = parse_body(response.body);
    if (!parsed) {
        return std::unexpected(
            make_error(ErrorCode::ProtocolError, "Upstream response is not valid JSON")
                .with_status(response.status)
                .with_response(response.body));
    }

    logger->debug("Upstream response: {}", utils::sanitize_for_logging(*parsed).dump());
    return transform::map_response(*parsed, logger);
}

Messages::Messages(std::shared_ptr<infra::HttpClient> http, LoggerPtr logger)
    : http_(std::move(http)), logger_(std::move(logger)) {}

auto Messages::create(const transform::MessageCreateParams& params) -> Result<Message> {
    auto body = build_request_body(params, false, logger_);
    auto response = http_->post(kChatCompletionsPath, body.dump());
    if (!response) {
        return std::unexpected(transport_failure(response.error(), logger_));
    }
    return message_from_response(*response, logger_);
}

auto Messages::stream(const transform::MessageCreateParams& params)
    -> Result<streaming::EventStream> {
    auto body = build_request_body(params, true, logger_);
    auto opened = http_->open_stream(kChatCompletionsPath, body.dump());
    if (!opened) {
        return std::unexpected(transport_failure(opened.error(), logger_));
    }
    if (!opened->head.is_success()) {
        return std::unexpected(status_error(opened->head.status, opened->head.error_body, logger_));
    }
    return streaming::EventStream(std::move(opened->body), logger_);
}

auto Messages::async_create(const transform::MessageCreateParams& params)
    -> boost::asio::awaitable<Result<Message>> {
    auto body = build_request_body(params, false, logger_);
    auto response = co_await http_->async_post(kChatCompletionsPath, body.dump());
    if (!response) {
        co_return make_fail(transport_failure(response.error(), logger_));
    }
    co_return message_from_response(*response, logger_);
}

auto Messages::async_stream(const transform::MessageCreateParams& params)
    -> boost::asio::awaitable<Result<streaming::AsyncEventStream>> {
    auto body = build_request_body(params, true, logger_);
    auto opened = co_await http_->async_open_stream(kChatCompletionsPath, body.dump());
    if (!opened) {
        co_return make_fail(transport_failure(opened.error(), logger_));
    }
    if (!opened->head.is_success()) {
        co_return make_fail(status_error(opened->head.status, opened->head.error_body, logger_));
    }
    co_return streaming::AsyncEventStream(std::move(opened->body), logger_);
}

} // namespace chatbridge::client
