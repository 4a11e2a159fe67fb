#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include "chatbridge/core/error.hpp"
#include "chatbridge/core/logger.hpp"
#include "chatbridge/infra/chunk_channel.hpp"
#include "chatbridge/streaming/chunk_source.hpp"

namespace chatbridge::infra {

using Headers = std::map<std::string, std::string>;

/// HTTP response from the client.
struct HttpResponse {
    int status = 0;
    Headers headers;
    std::string body;

    /// Returns true if the status code indicates success (2xx).
    [[nodiscard]] auto is_success() const noexcept -> bool {
        return status >= 200 && status < 300;
    }
};

/// Configuration for the HTTP client.
struct HttpClientConfig {
    /// Scheme, host and optional path prefix, e.g. "https://api.openai.com/v1".
    std::string base_url;
    int timeout_seconds = 60;
    /// Extra attempts after a connection failure or timeout. Applies to
    /// non-streaming requests only.
    int max_retries = 0;
    std::chrono::milliseconds retry_delay{500};
    bool verify_ssl = true;
    Headers default_headers;
};

/// Splits a base URL into its "scheme://host[:port]" part and its path
/// prefix without a trailing slash.
auto split_base_url(std::string_view url) -> std::pair<std::string, std::string>;

/// Response body of a streaming request, read fragment by fragment from the
/// background transfer.
class HttpBodySource final : public streaming::ChunkSource,
                             public streaming::AsyncChunkSource {
public:
    explicit HttpBodySource(std::shared_ptr<ChunkChannel> channel)
        : channel_(std::move(channel)) {}
    ~HttpBodySource() override { channel_->close(); }

    HttpBodySource(const HttpBodySource&) = delete;
    HttpBodySource& operator=(const HttpBodySource&) = delete;

    auto read() -> streaming::ChunkResult override;
    auto async_read() -> boost::asio::awaitable<streaming::ChunkResult> override;
    void close() override { channel_->close(); }

private:
    std::shared_ptr<ChunkChannel> channel_;
};

/// An opened streaming response. `body` is set only for 2xx responses;
/// otherwise `head.error_body` carries the buffered error payload.
struct HttpStream {
    StreamHead head;
    std::unique_ptr<HttpBodySource> body;
};

/// HTTP client wrapping cpp-httplib, with blocking calls and awaitable
/// variants for boost::asio coroutines. Awaitable variants run the transfer
/// on a background thread and suspend the calling coroutine until it
/// produces something.
class HttpClient {
public:
    explicit HttpClient(HttpClientConfig config, LoggerPtr logger = Logger::get());
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;
    HttpClient(HttpClient&&) noexcept;
    HttpClient& operator=(HttpClient&&) noexcept;

    /// Performs a blocking HTTP POST request. Connection failures and
    /// timeouts are retried up to max_retries times.
    auto post(std::string_view path,
              std::string_view body,
              std::string_view content_type = "application/json",
              const Headers& headers = {}) -> Result<HttpResponse>;

    auto async_post(std::string_view path,
                    std::string_view body,
                    std::string_view content_type = "application/json",
                    const Headers& headers = {})
        -> boost::asio::awaitable<Result<HttpResponse>>;

    /// Starts a streaming POST request and blocks until the response status
    /// is known. The body keeps arriving in the background; at most one
    /// unread fragment is buffered.
    auto open_stream(std::string_view path,
                     std::string_view body,
                     std::string_view content_type = "application/json",
                     const Headers& headers = {}) -> Result<HttpStream>;

    auto async_open_stream(std::string_view path,
                           std::string_view body,
                           std::string_view content_type = "application/json",
                           const Headers& headers = {})
        -> boost::asio::awaitable<Result<HttpStream>>;

    /// Sets a default header that will be sent with every request.
    void set_default_header(std::string key, std::string value);

    [[nodiscard]] auto base_url() const -> const std::string&;

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace chatbridge::infra
