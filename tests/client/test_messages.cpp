#include <catch2/catch_test_macros.hpp>

#include <httplib.h>

#include <atomic>
#include <mutex>
#include <thread>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>

#include "chatbridge/client/client.hpp"

using namespace chatbridge;
using json = nlohmann::json;

namespace {

template <typename T>
auto run_sync(boost::asio::awaitable<T> coro) -> T {
    boost::asio::io_context ioc;
    std::optional<T> result;
    boost::asio::co_spawn(ioc,
        [&]() -> boost::asio::awaitable<void> {
            result.emplace(co_await std::move(coro));
        },
        boost::asio::detached);
    ioc.run();
    return std::move(*result);
}

auto sample_params() -> transform::MessageCreateParams {
    transform::MessageCreateParams params;
    params.model = "gpt-4o-mini";
    params.max_tokens = 32;
    params.system = "Be terse.";
    params.messages.push_back({.role = "user", .content = "Say hi"});
    return params;
}

const char* kCompletion = R"({
    "id": "chatcmpl-42",
    "model": "gpt-4o-mini",
    "choices": [{"index": 0, "message": {"role": "assistant", "content": "Hi."},
                 "finish_reason": "stop"}],
    "usage": {"prompt_tokens": 11, "completion_tokens": 2}
})";

const std::vector<std::string> kStreamBody = {
    "data: {\"id\":\"chatcmpl-43\",\"model\":\"gpt-4o-mini\",\"choices\":[{\"index\":0,\"delta\":{\"role\":\"assistant\"}}]}\n\n",
    "data: {\"id\":\"chatcmpl-43\",\"choices\":[{\"index\":0,\"delta\":{\"content\":\"Hi\"}}]}\n\n",
    "data: {\"id\":\"chatcmpl-43\",\"choices\":[{\"index\":0,\"delta\":{},\"finish_reason\":\"stop\"}]}\n\n",
    "data: [DONE]\n\n",
};

/// Local stand-in for a ChatCompletion upstream.
class FakeUpstream {
public:
    FakeUpstream() {
        server_.Post("/v1/chat/completions",
            [this](const httplib::Request& req, httplib::Response& res) {
                auto body = json::parse(req.body, nullptr, false);
                {
                    std::lock_guard lock(mtx_);
                    last_body_ = body;
                    last_auth_ = req.get_header_value("Authorization");
                }
                if (fail_status_ != 0) {
                    res.status = fail_status_;
                    res.set_content(R"({"error":{"message":"Incorrect API key provided"}})",
                                    "application/json");
                    return;
                }
                if (body.is_object() && body.value("stream", false)) {
                    res.set_chunked_content_provider("text/event-stream",
                        [](size_t /*offset*/, httplib::DataSink& sink) {
                            for (const auto& part : kStreamBody) {
                                sink.write(part.data(), part.size());
                            }
                            sink.done();
                            return true;
                        });
                    return;
                }
                res.set_content(kCompletion, "application/json");
            });

        port_ = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this] { server_.listen_after_bind(); });
        server_.wait_until_ready();
    }

    ~FakeUpstream() {
        server_.stop();
        thread_.join();
    }

    void fail_with(int status) { fail_status_ = status; }

    [[nodiscard]] auto config() const -> ClientConfig {
        ClientConfig cfg;
        cfg.api_key = "sk-test";
        cfg.base_url = "http://127.0.0.1:" + std::to_string(port_) + "/v1";
        cfg.timeout_seconds = 5;
        cfg.max_retries = 0;
        cfg.log_level = "off";
        return cfg;
    }

    auto last_body() -> json {
        std::lock_guard lock(mtx_);
        return last_body_;
    }

    auto last_auth() -> std::string {
        std::lock_guard lock(mtx_);
        return last_auth_;
    }

private:
    httplib::Server server_;
    std::thread thread_;
    int port_ = 0;
    std::atomic<int> fail_status_{0};
    std::mutex mtx_;
    json last_body_;
    std::string last_auth_;
};

} // namespace

TEST_CASE("build_request_body forces the stream flag", "[client]") {
    auto params = sample_params();
    params.stream = true;

    auto body = client::build_request_body(params, false);
    CHECK(body["stream"] == false);
    CHECK(body["messages"][0]["role"] == "system");

    body = client::build_request_body(params, true);
    CHECK(body["stream"] == true);
}

TEST_CASE("message_from_response maps status and body", "[client]") {
    SECTION("success") {
        auto msg = client::message_from_response(
            infra::HttpResponse{.status = 200, .body = kCompletion});
        REQUIRE(msg);
        CHECK(msg->id == "chatcmpl-42");
        CHECK(msg->usage.input_tokens == 11);
    }

    SECTION("error status") {
        auto msg = client::message_from_response(
            infra::HttpResponse{.status = 429, .body = R"({"error":"Rate limited"})"});
        REQUIRE_FALSE(msg);
        CHECK(msg.error().code() == ErrorCode::RateLimit);
        CHECK(msg.error().message() == "Rate limited");
        CHECK(msg.error().status() == 429);
    }

    SECTION("error status with non-JSON body") {
        auto msg = client::message_from_response(
            infra::HttpResponse{.status = 502, .body = "<html>Bad Gateway</html>"});
        REQUIRE_FALSE(msg);
        CHECK(msg.error().code() == ErrorCode::InternalServer);
        CHECK(msg.error().message() == "Unknown error");
        REQUIRE(msg.error().response().has_value());
        CHECK(*msg.error().response() == "<html>Bad Gateway</html>");
    }

    SECTION("success with unparseable body") {
        auto msg = client::message_from_response(infra::HttpResponse{.status = 200, .body = "{"});
        REQUIRE_FALSE(msg);
        CHECK(msg.error().code() == ErrorCode::ProtocolError);
    }
}

TEST_CASE("make_http_config adds bearer authorization", "[client]") {
    ClientConfig cfg;
    cfg.api_key = "sk-abc";
    cfg.default_headers["X-Org"] = "acme";

    auto http = client::make_http_config(cfg);
    CHECK(http.base_url == "https://api.openai.com/v1");
    CHECK(http.max_retries == 2);
    CHECK(http.default_headers.at("Authorization") == "Bearer sk-abc");
    CHECK(http.default_headers.at("X-Org") == "acme");

    cfg.api_key.clear();
    CHECK_FALSE(client::make_http_config(cfg).default_headers.contains("Authorization"));
}

TEST_CASE("Messages talks to a ChatCompletion upstream", "[client][http]") {
    FakeUpstream upstream;
    client::Client api(upstream.config());

    SECTION("blocking create") {
        auto msg = api.messages().create(sample_params());
        REQUIRE(msg);
        CHECK(msg->id == "chatcmpl-42");
        REQUIRE(msg->content.size() == 1);
        CHECK(std::get<TextBlock>(msg->content[0]).text == "Hi.");
        CHECK(msg->stop_reason == StopReason::EndTurn);

        auto sent = upstream.last_body();
        CHECK(sent["model"] == "gpt-4o-mini");
        CHECK(sent["stream"] == false);
        CHECK(sent["messages"].size() == 2);
        CHECK(upstream.last_auth() == "Bearer sk-test");
    }

    SECTION("blocking stream") {
        auto stream = api.messages().stream(sample_params());
        REQUIRE(stream);

        std::vector<std::string> types;
        for (const auto& event : *stream) {
            types.emplace_back(streaming::event_type(event));
        }
        CHECK(types == std::vector<std::string>{
            "message_start", "content_block_start", "content_block_delta",
            "content_block_stop", "message_delta", "message_stop"});
        CHECK(stream->state() == streaming::StreamState::Completed);
        CHECK(upstream.last_body()["stream"] == true);
    }

    SECTION("async create") {
        auto msg = run_sync(api.messages().async_create(sample_params()));
        REQUIRE(msg);
        CHECK(msg->usage.output_tokens == 2);
    }

    SECTION("async stream") {
        auto outcome = run_sync([&]() -> boost::asio::awaitable<std::vector<std::string>> {
            std::vector<std::string> types;
            auto stream = co_await api.messages().async_stream(sample_params());
            if (!stream) co_return types;
            while (true) {
                auto next = co_await stream->next();
                if (!next || !*next) break;
                types.emplace_back(streaming::event_type(**next));
            }
            co_return types;
        }());
        CHECK(outcome.size() == 6);
        CHECK(outcome.back() == "message_stop");
    }

    SECTION("error status") {
        upstream.fail_with(401);

        auto msg = api.messages().create(sample_params());
        REQUIRE_FALSE(msg);
        CHECK(msg.error().code() == ErrorCode::Authentication);
        CHECK(msg.error().message() == "Incorrect API key provided");

        auto stream = api.messages().stream(sample_params());
        REQUIRE_FALSE(stream);
        CHECK(stream.error().code() == ErrorCode::Authentication);
        CHECK(stream.error().status() == 401);
    }
}

TEST_CASE("Transport failures surface as internal server errors", "[client][http]") {
    ClientConfig cfg;
    cfg.base_url = "http://127.0.0.1:1/v1";
    cfg.timeout_seconds = 2;
    cfg.max_retries = 0;
    cfg.log_level = "off";
    client::Client api(cfg);

    auto msg = api.messages().create(sample_params());
    REQUIRE_FALSE(msg);
    CHECK(msg.error().code() == ErrorCode::InternalServer);
    CHECK(msg.error().status() == 500);
}
