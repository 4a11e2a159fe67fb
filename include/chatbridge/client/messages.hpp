#pragma once

#include <memory>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include "chatbridge/core/error.hpp"
#include "chatbridge/core/logger.hpp"
#include "chatbridge/core/types.hpp"
#include "chatbridge/infra/http_client.hpp"
#include "chatbridge/streaming/event_stream.hpp"
#include "chatbridge/transform/request.hpp"

namespace chatbridge::client {

using json = nlohmann::json;

/// Endpoint the mapped request is posted to, relative to the base URL.
inline constexpr std::string_view kChatCompletionsPath = "/chat/completions";

/// Builds the upstream request body, forcing the `stream` flag.
auto build_request_body(const transform::MessageCreateParams& params, bool stream,
                        const LoggerPtr& logger = Logger::get()) -> json;

/// Turns a completed upstream response into a Message, or into the API
/// error for its status.
auto message_from_response(const infra::HttpResponse& response,
                           const LoggerPtr& logger = Logger::get()) -> Result<Message>;

/// Source-protocol messages endpoint served by a ChatCompletion upstream.
/// Blocking and coroutine variants share the mappers and the event
/// pipeline.
class Messages {
public:
    Messages(std::shared_ptr<infra::HttpClient> http, LoggerPtr logger = Logger::get());

    auto create(const transform::MessageCreateParams& params) -> Result<Message>;

    /// Opens a streaming request. Fails only if the upstream could not be
    /// reached or answered with a non-2xx status; later failures surface
    /// through the returned stream.
    auto stream(const transform::MessageCreateParams& params) -> Result<streaming::EventStream>;

    auto async_create(const transform::MessageCreateParams& params)
        -> boost::asio::awaitable<Result<Message>>;

    auto async_stream(const transform::MessageCreateParams& params)
        -> boost::asio::awaitable<Result<streaming::AsyncEventStream>>;

private:
    std::shared_ptr<infra::HttpClient> http_;
    LoggerPtr logger_;
};

} // namespace chatbridge::client
