#include "chatbridge/infra/http_client.hpp"

#include <httplib.h>

#include <functional>
#include <mutex>
#include <optional>
#include <thread>

#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace chatbridge::infra {

namespace {

struct Target {
    std::string host;
    std::string prefix;
    int timeout_seconds = 60;
    bool verify_ssl = true;
    Headers default_headers;
};

auto transport_error(httplib::Error err, std::string_view what) -> Error {
    std::string detail;
    switch (err) {
        case httplib::Error::Connection:
            detail = "Connection failed";
            break;
        case httplib::Error::BindIPAddress:
            detail = "Bind IP address failed";
            break;
        case httplib::Error::Read:
            detail = "Read error";
            break;
        case httplib::Error::Write:
            detail = "Write error";
            break;
        case httplib::Error::ExceedRedirectCount:
            detail = "Exceeded redirect count";
            break;
        case httplib::Error::Canceled:
            detail = "Request canceled";
            break;
        case httplib::Error::SSLConnection:
            detail = "SSL connection error";
            break;
        case httplib::Error::SSLLoadingCerts:
            detail = "SSL certificate loading error";
            break;
        case httplib::Error::SSLServerVerification:
            detail = "SSL server verification failed";
            break;
        case httplib::Error::ConnectionTimeout:
            return make_error(ErrorCode::Timeout, std::string(what) + " timed out",
                              "Connection timeout");
        default:
            detail = "httplib error code " + std::to_string(static_cast<int>(err));
            break;
    }
    return make_error(ErrorCode::ConnectionFailed, std::string(what) + " failed", detail);
}

auto to_httplib_headers(const Headers& headers) -> httplib::Headers {
    httplib::Headers out;
    for (const auto& [k, v] : headers) {
        out.emplace(k, v);
    }
    return out;
}

auto make_client(const Target& target) -> std::unique_ptr<httplib::Client> {
    auto client = std::make_unique<httplib::Client>(target.host);
    client->set_connection_timeout(target.timeout_seconds);
    client->set_read_timeout(target.timeout_seconds);
    client->set_write_timeout(target.timeout_seconds);
    if (!target.verify_ssl) {
        client->enable_server_certificate_verification(false);
    }
    client->set_default_headers(to_httplib_headers(target.default_headers));
    return client;
}

/// Suspends the calling coroutine until `poll` yields a value. `poll`
/// receives a notifier to invoke from any thread once it may succeed.
template <typename T>
auto await_ready(std::function<std::optional<T>(ChunkChannel::Notify)> poll)
    -> boost::asio::awaitable<T> {
    auto executor = co_await boost::asio::this_coro::executor;
    while (true) {
        auto timer = std::make_shared<boost::asio::steady_timer>(
            executor, boost::asio::steady_timer::time_point::max());

        // The notifier may fire after this frame is gone (a channel closed
        // from a destructor); it only reaches the timer while we hold it.
        auto ready = poll([weak = std::weak_ptr(timer)] {
            auto timer = weak.lock();
            if (!timer) return;
            // Expiring rather than cancelling also covers a notification
            // that lands before async_wait starts.
            boost::asio::post(timer->get_executor(), [timer] {
                timer->expires_at(boost::asio::steady_timer::time_point::min());
            });
        });
        if (ready) co_return std::move(*ready);

        boost::system::error_code ec;
        co_await timer->async_wait(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }
}

/// Runs one streaming transfer to completion, feeding `channel`.
void run_stream_transfer(Target target, std::string path, std::string body,
                         std::string content_type, httplib::Headers headers,
                         std::shared_ptr<ChunkChannel> channel, LoggerPtr logger) {
    logger->debug("Stream transfer started: POST {}{}", target.host, path);

    // httplib::Client is not thread-safe; this thread gets its own.
    auto client = make_client(target);

    httplib::Request req;
    req.method = "POST";
    req.path = path;
    req.headers = std::move(headers);
    req.body = std::move(body);
    req.set_header("Content-Type", content_type);
    req.set_header("Accept", "text/event-stream");

    int status = 0;
    std::string error_body;

    req.response_handler = [&status, &channel](const httplib::Response& r) -> bool {
        status = r.status;
        if (status >= 200 && status < 300) {
            channel->set_head(StreamHead{.status = status});
        }
        return !channel->closed();
    };

    req.content_receiver = [&status, &error_body, &channel](
                               const char* data, size_t length,
                               uint64_t /*offset*/, uint64_t /*total_length*/) -> bool {
        if (status >= 200 && status < 300) {
            return channel->push(std::string(data, length));
        }
        error_body.append(data, length);
        return true;
    };

    httplib::Response res;
    httplib::Error error = httplib::Error::Success;
    bool ok = client->send(req, res, error);

    if (!ok) {
        if (channel->closed()) {
            logger->debug("Stream transfer aborted by consumer");
            channel->finish();
        } else {
            auto err = transport_error(error, "HTTP streaming request");
            logger->warn("Stream transfer failed: {}", err.what());
            channel->finish(std::move(err));
        }
        return;
    }

    if (!(res.status >= 200 && res.status < 300)) {
        channel->set_head(StreamHead{.status = res.status, .error_body = std::move(error_body)});
    }
    channel->finish();
    logger->debug("Stream transfer finished, status={}", res.status);
}

} // anonymous namespace

auto split_base_url(std::string_view url) -> std::pair<std::string, std::string> {
    std::size_t authority = 0;
    if (auto scheme = url.find("://"); scheme != std::string_view::npos) {
        authority = scheme + 3;
    }

    auto slash = url.find('/', authority);
    if (slash == std::string_view::npos) {
        return {std::string(url), ""};
    }

    auto prefix = url.substr(slash);
    while (!prefix.empty() && prefix.back() == '/') {
        prefix.remove_suffix(1);
    }
    return {std::string(url.substr(0, slash)), std::string(prefix)};
}

// -- HttpBodySource ----------------------------------------------------------

auto HttpBodySource::read() -> streaming::ChunkResult {
    return channel_->pop();
}

auto HttpBodySource::async_read() -> boost::asio::awaitable<streaming::ChunkResult> {
    auto channel = channel_;
    co_return co_await await_ready<streaming::ChunkResult>(
        [channel](ChunkChannel::Notify notify) { return channel->poll(std::move(notify)); });
}

// -- HttpClient --------------------------------------------------------------

struct HttpClient::Impl {
    HttpClientConfig config;
    LoggerPtr logger;
    Target target;
    std::unique_ptr<httplib::Client> client;
    // Serializes use of `client` by blocking calls from several threads.
    std::mutex client_mtx;

    Impl(HttpClientConfig config_, LoggerPtr logger_)
        : config(std::move(config_)), logger(std::move(logger_)) {
        auto [host, prefix] = split_base_url(config.base_url);
        target = Target{
            .host = std::move(host),
            .prefix = std::move(prefix),
            .timeout_seconds = config.timeout_seconds,
            .verify_ssl = config.verify_ssl,
            .default_headers = config.default_headers,
        };
        client = make_client(target);
        logger->debug("HTTP client created for {}", config.base_url);
    }

    auto full_path(std::string_view path) const -> std::string {
        return target.prefix + std::string(path);
    }

    auto send_post(const std::string& path, const std::string& body,
                   const std::string& content_type, const httplib::Headers& headers)
        -> Result<HttpResponse> {
        Error last = make_error(ErrorCode::ConnectionFailed, "HTTP request failed");
        for (int attempt = 0; attempt <= config.max_retries; ++attempt) {
            if (attempt > 0) {
                auto delay = config.retry_delay * attempt;
                logger->warn("Retrying POST {} (attempt {}/{}) in {}ms: {}", path,
                             attempt, config.max_retries, delay.count(), last.what());
                std::this_thread::sleep_for(delay);
            }

            auto res = [&] {
                std::lock_guard lock(client_mtx);
                logger->debug("POST {}{}", target.host, path);
                return client->Post(path, headers, body, content_type);
            }();

            if (res) {
                HttpResponse response;
                response.status = res->status;
                response.body = res->body;
                for (const auto& [k, v] : res->headers) {
                    response.headers[k] = v;
                }
                return response;
            }

            last = transport_error(res.error(), "HTTP request");
            if (last.code() != ErrorCode::ConnectionFailed && last.code() != ErrorCode::Timeout) {
                break;
            }
        }
        return std::unexpected(std::move(last));
    }

    auto start_stream(std::string_view path, std::string_view body,
                      std::string_view content_type, const Headers& headers)
        -> std::shared_ptr<ChunkChannel> {
        auto channel = std::make_shared<ChunkChannel>(1);
        std::thread(run_stream_transfer, target, full_path(path), std::string(body),
                    std::string(content_type), to_httplib_headers(headers), channel, logger)
            .detach();
        return channel;
    }
};

HttpClient::HttpClient(HttpClientConfig config, LoggerPtr logger)
    : impl_(std::make_shared<Impl>(std::move(config), std::move(logger))) {}

HttpClient::~HttpClient() = default;

HttpClient::HttpClient(HttpClient&&) noexcept = default;
HttpClient& HttpClient::operator=(HttpClient&&) noexcept = default;

auto HttpClient::post(std::string_view path,
                      std::string_view body,
                      std::string_view content_type,
                      const Headers& headers) -> Result<HttpResponse> {
    return impl_->send_post(impl_->full_path(path), std::string(body),
                            std::string(content_type), to_httplib_headers(headers));
}

auto HttpClient::async_post(std::string_view path,
                            std::string_view body,
                            std::string_view content_type,
                            const Headers& headers)
    -> boost::asio::awaitable<Result<HttpResponse>> {
    // The worker keeps impl alive if the client goes away first.
    struct PostState {
        std::mutex mtx;
        std::optional<Result<HttpResponse>> result;
        ChunkChannel::Notify notify;
    };
    auto state = std::make_shared<PostState>();

    std::thread([impl = impl_, state, p = impl_->full_path(path), b = std::string(body),
                 ct = std::string(content_type), hdrs = to_httplib_headers(headers)] {
        auto result = impl->send_post(p, b, ct, hdrs);
        ChunkChannel::Notify notify;
        {
            std::lock_guard lock(state->mtx);
            state->result = std::move(result);
            notify = std::exchange(state->notify, nullptr);
        }
        if (notify) notify();
    }).detach();

    co_return co_await await_ready<Result<HttpResponse>>(
        [state](ChunkChannel::Notify notify) -> std::optional<Result<HttpResponse>> {
            std::lock_guard lock(state->mtx);
            if (state->result) return std::move(*state->result);
            state->notify = std::move(notify);
            return std::nullopt;
        });
}

auto HttpClient::open_stream(std::string_view path,
                             std::string_view body,
                             std::string_view content_type,
                             const Headers& headers) -> Result<HttpStream> {
    auto channel = impl_->start_stream(path, body, content_type, headers);
    auto head = channel->wait_head();
    if (!head) {
        channel->close();
        return std::unexpected(head.error());
    }

    HttpStream stream{.head = std::move(*head)};
    if (stream.head.is_success()) {
        stream.body = std::make_unique<HttpBodySource>(std::move(channel));
    }
    return stream;
}

auto HttpClient::async_open_stream(std::string_view path,
                                   std::string_view body,
                                   std::string_view content_type,
                                   const Headers& headers)
    -> boost::asio::awaitable<Result<HttpStream>> {
    auto channel = impl_->start_stream(path, body, content_type, headers);
    auto head = co_await await_ready<Result<StreamHead>>(
        [channel](ChunkChannel::Notify notify) { return channel->poll_head(std::move(notify)); });
    if (!head) {
        channel->close();
        co_return make_fail(head.error());
    }

    HttpStream stream{.head = std::move(*head)};
    if (stream.head.is_success()) {
        stream.body = std::make_unique<HttpBodySource>(std::move(channel));
    }
    co_return stream;
}

void HttpClient::set_default_header(std::string key, std::string value) {
    std::lock_guard lock(impl_->client_mtx);
    impl_->config.default_headers[key] = value;
    impl_->target.default_headers[std::move(key)] = std::move(value);
    impl_->client->set_default_headers(to_httplib_headers(impl_->target.default_headers));
}

auto HttpClient::base_url() const -> const std::string& {
    return impl_->config.base_url;
}

} // namespace chatbridge::infra
