#include <catch2/catch_test_macros.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>

#include "chatbridge/streaming/event_stream.hpp"

using namespace chatbridge::streaming;
using chatbridge::ErrorCode;
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

auto sse(const json& chunk) -> std::string {
    return "data: " + chunk.dump() + "\n\n";
}

auto delta(json d) -> json {
    return {{"id", "chatcmpl-9"}, {"model", "gpt-4o-mini"},
            {"choices", json::array({{{"index", 0}, {"delta", std::move(d)}}})}};
}

auto finish(const std::string& reason) -> json {
    return {{"id", "chatcmpl-9"},
            {"choices", json::array({{{"index", 0}, {"delta", json::object()},
                                      {"finish_reason", reason}}})},
            {"usage", {{"prompt_tokens", 5}, {"completion_tokens", 2}}}};
}

auto hello_body() -> std::string {
    return sse(delta({{"role", "assistant"}})) +
           sse(delta({{"content", "Hel"}})) +
           sse(delta({{"content", "lo"}})) +
           sse(finish("stop")) +
           "data: [DONE]\n\n";
}

auto source_of(std::vector<std::string> chunks) -> std::unique_ptr<VectorChunkSource> {
    return std::make_unique<VectorChunkSource>(std::move(chunks));
}

auto collect(EventStream& stream) -> std::vector<std::string> {
    std::vector<std::string> types;
    for (const auto& event : stream) {
        types.emplace_back(event_type(event));
    }
    return types;
}

const std::vector<std::string> kHelloTypes = {
    "message_start", "content_block_start", "content_block_delta", "content_block_delta",
    "content_block_stop", "message_delta", "message_stop"};

struct AsyncOutcome {
    std::vector<std::string> types;
    StreamState state = StreamState::Open;
    std::optional<chatbridge::Error> error;
};

auto collect_async(std::unique_ptr<AsyncChunkSource> source) -> boost::asio::awaitable<AsyncOutcome> {
    AsyncEventStream stream(std::move(source));
    AsyncOutcome outcome;
    while (true) {
        auto next = co_await stream.next();
        if (!next) {
            outcome.error = next.error();
            break;
        }
        if (!*next) break;
        outcome.types.emplace_back(event_type(**next));
    }
    outcome.state = stream.state();
    co_return outcome;
}

} // namespace

TEST_CASE("EventStream yields lifecycle events from SSE text", "[stream]") {
    EventStream stream(source_of({hello_body()}));

    CHECK(collect(stream) == kHelloTypes);
    CHECK(stream.state() == StreamState::Completed);
    CHECK_FALSE(stream.error().has_value());

    const auto& message = stream.message();
    CHECK(message.id == "chatcmpl-9");
    REQUIRE(message.content.size() == 1);
    CHECK(std::get<chatbridge::TextBlock>(message.content[0]).text == "Hello");
}

TEST_CASE("EventStream is independent of fragment boundaries", "[stream]") {
    auto body = hello_body();

    SECTION("one byte per fragment") {
        std::vector<std::string> chunks;
        for (char c : body) chunks.emplace_back(1, c);
        EventStream stream(source_of(chunks));
        CHECK(collect(stream) == kHelloTypes);
    }

    SECTION("fragments of seven bytes") {
        std::vector<std::string> chunks;
        for (std::size_t i = 0; i < body.size(); i += 7) chunks.push_back(body.substr(i, 7));
        EventStream stream(source_of(chunks));
        CHECK(collect(stream) == kHelloTypes);
    }

    SECTION("CRLF line endings") {
        std::string crlf;
        for (char c : body) {
            if (c == '\n') crlf += '\r';
            crlf += c;
        }
        EventStream stream(source_of({crlf}));
        CHECK(collect(stream) == kHelloTypes);
    }
}

TEST_CASE("EventStream pulls input only on demand", "[stream]") {
    auto raw = std::make_unique<VectorChunkSource>(std::vector<std::string>{
        sse(delta({{"role", "assistant"}})),
        sse(delta({{"content", "a"}})),
        sse(finish("stop")),
    });
    auto* source = raw.get();
    EventStream stream(std::move(raw));

    auto first = stream.next();
    REQUIRE(first);
    REQUIRE(first->has_value());
    CHECK(event_type(**first) == "message_start");
    CHECK(source->reads() == 1);

    auto second = stream.next();
    REQUIRE(second);
    CHECK(event_type(**second) == "content_block_start");
    CHECK(source->reads() == 2);
}

TEST_CASE("EventStream stops at the done sentinel", "[stream]") {
    SECTION("nothing after [DONE] is read") {
        auto raw = std::make_unique<VectorChunkSource>(std::vector<std::string>{
            sse(delta({{"role", "assistant"}})),
            "data: [DONE]\n\n",
            sse(delta({{"content", "never"}})),
        });
        auto* source = raw.get();
        EventStream stream(std::move(raw));

        CHECK(collect(stream) == std::vector<std::string>{"message_start"});
        CHECK(stream.state() == StreamState::Truncated);
        CHECK(source->reads() == 2);
        CHECK(source->closed());
    }

    SECTION("finish then [DONE] completes normally") {
        EventStream stream(source_of({hello_body(), sse(delta({{"content", "extra"}}))}));
        CHECK(collect(stream) == kHelloTypes);
        CHECK(stream.state() == StreamState::Completed);
    }
}

TEST_CASE("EventStream reports truncated input", "[stream]") {
    EventStream stream(source_of({
        sse(delta({{"role", "assistant"}})),
        sse(delta({{"content", "partial"}})),
        "data: {\"choices\":",
    }));

    CHECK(collect(stream) == std::vector<std::string>{
        "message_start", "content_block_start", "content_block_delta"});
    CHECK(stream.state() == StreamState::Truncated);
    CHECK_FALSE(stream.error().has_value());
}

TEST_CASE("EventStream skips records that are not JSON objects", "[stream]") {
    EventStream stream(source_of({
        ": keep-alive\n\n",
        "data: not json\n\n",
        "event: ping\n\n",
        hello_body(),
    }));

    CHECK(collect(stream) == kHelloTypes);
}

TEST_CASE("EventStream surfaces source errors", "[stream]") {
    auto raw = std::make_unique<VectorChunkSource>(std::vector<std::string>{
        sse(delta({{"role", "assistant"}})),
    });
    raw->fail_at_end(chatbridge::make_error(ErrorCode::ConnectionFailed, "HTTP streaming request failed",
                                            "Read error"));
    EventStream stream(std::move(raw));

    auto first = stream.next();
    REQUIRE(first);
    CHECK(event_type(**first) == "message_start");

    auto second = stream.next();
    REQUIRE_FALSE(second);
    CHECK(second.error().code() == ErrorCode::ConnectionFailed);
    CHECK(stream.state() == StreamState::Failed);
    REQUIRE(stream.error().has_value());
    CHECK(stream.error()->detail() == "Read error");

    // The failure is sticky.
    CHECK_FALSE(stream.next());
}

TEST_CASE("EventStream close ends iteration", "[stream]") {
    auto raw = source_of({hello_body()});
    auto* source = raw.get();
    EventStream stream(std::move(raw));

    auto first = stream.next();
    REQUIRE(first);
    stream.close();

    CHECK(source->closed());
    CHECK(stream.state() == StreamState::Truncated);
    auto after = stream.next();
    REQUIRE(after);
    CHECK_FALSE(after->has_value());
}

TEST_CASE("EventStream assembles tool calls", "[stream]") {
    EventStream stream(source_of({
        sse(delta({{"role", "assistant"}})),
        sse(delta({{"tool_calls", json::array({{
            {"index", 0}, {"id", "call_7"},
            {"function", {{"name", "lookup"}, {"arguments", "{\"id\":"}}},
        }})}})),
        sse(delta({{"tool_calls", json::array({{
            {"index", 0}, {"function", {{"arguments", "42}"}}},
        }})}})),
        sse(finish("tool_calls")),
    }));

    collect(stream);
    REQUIRE(stream.state() == StreamState::Completed);

    const auto& message = stream.message();
    CHECK(message.stop_reason == chatbridge::StopReason::ToolUse);
    REQUIRE(message.content.size() == 1);
    const auto& block = std::get<chatbridge::ToolUseBlock>(message.content[0]);
    CHECK(block.id == "call_7");
    CHECK(block.name == "lookup");
    CHECK(block.input == json{{"id", 42}});
}

TEST_CASE("AsyncEventStream yields the same events cooperatively", "[stream]") {
    SECTION("complete stream") {
        auto outcome = run_sync(collect_async(source_of({hello_body()})));
        CHECK(outcome.types == kHelloTypes);
        CHECK(outcome.state == StreamState::Completed);
        CHECK_FALSE(outcome.error.has_value());
    }

    SECTION("fragmented stream") {
        auto body = hello_body();
        std::vector<std::string> chunks;
        for (std::size_t i = 0; i < body.size(); i += 3) chunks.push_back(body.substr(i, 3));
        auto outcome = run_sync(collect_async(source_of(chunks)));
        CHECK(outcome.types == kHelloTypes);
    }

    SECTION("source failure") {
        auto raw = source_of({sse(delta({{"role", "assistant"}}))});
        raw->fail_at_end(chatbridge::make_error(ErrorCode::Timeout, "timed out"));
        auto outcome = run_sync(collect_async(std::move(raw)));
        CHECK(outcome.types == std::vector<std::string>{"message_start"});
        CHECK(outcome.state == StreamState::Failed);
        REQUIRE(outcome.error.has_value());
        CHECK(outcome.error->code() == ErrorCode::Timeout);
    }
}

TEST_CASE("StreamState names", "[stream]") {
    CHECK(to_string(StreamState::Open) == "open");
    CHECK(to_string(StreamState::Completed) == "completed");
    CHECK(to_string(StreamState::Truncated) == "truncated");
    CHECK(to_string(StreamState::Failed) == "failed");
}
