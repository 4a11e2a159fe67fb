#include <catch2/catch_test_macros.hpp>

#include "chatbridge/transform/response.hpp"

using namespace chatbridge::transform;
using chatbridge::StopReason;
using chatbridge::TextBlock;
using chatbridge::ToolUseBlock;
using json = nlohmann::json;

TEST_CASE("Text completion maps to a message", "[response]") {
    auto msg = map_response({
        {"id", "chatcmpl-abc"},
        {"model", "gpt-4o"},
        {"choices", json::array({{
            {"index", 0},
            {"message", {{"role", "assistant"}, {"content", "Hello!"}}},
            {"finish_reason", "stop"},
        }})},
        {"usage", {{"prompt_tokens", 9}, {"completion_tokens", 3}, {"total_tokens", 12}}},
    });

    CHECK(msg.id == "chatcmpl-abc");
    CHECK(msg.model == "gpt-4o");
    CHECK(msg.role == "assistant");
    REQUIRE(msg.content.size() == 1);
    CHECK(std::get<TextBlock>(msg.content[0]).text == "Hello!");
    CHECK(msg.stop_reason == StopReason::EndTurn);
    CHECK(msg.usage.input_tokens == 9);
    CHECK(msg.usage.output_tokens == 3);
}

TEST_CASE("Tool calls map to tool-use blocks", "[response]") {
    auto msg = map_response({
        {"id", "chatcmpl-t"},
        {"model", "gpt-4o"},
        {"choices", json::array({{
            {"message", {
                {"role", "assistant"},
                {"content", nullptr},
                {"tool_calls", json::array({
                    {{"id", "call_1"}, {"type", "function"},
                     {"function", {{"name", "get_weather"}, {"arguments", R"({"city":"Rome"})"}}}},
                    {{"id", "call_2"}, {"type", "function"},
                     {"function", {{"name", "broken"}, {"arguments", "{bad json"}}}},
                    {{"id", "call_3"}, {"type", "function"}},
                })},
            }},
            {"finish_reason", "tool_calls"},
        }})},
    });

    REQUIRE(msg.content.size() == 2);

    const auto& first = std::get<ToolUseBlock>(msg.content[0]);
    CHECK(first.id == "call_1");
    CHECK(first.name == "get_weather");
    CHECK(first.input == json{{"city", "Rome"}});

    const auto& second = std::get<ToolUseBlock>(msg.content[1]);
    CHECK(second.name == "broken");
    CHECK(second.input == json::object());

    CHECK(msg.stop_reason == StopReason::ToolUse);
}

TEST_CASE("Text and tool calls keep text first", "[response]") {
    auto msg = map_response({
        {"id", "x"},
        {"choices", json::array({{
            {"message", {
                {"content", "Looking it up."},
                {"tool_calls", json::array({
                    {{"id", "c"}, {"function", {{"name", "f"}, {"arguments", "{}"}}}},
                })},
            }},
        }})},
    });

    REQUIRE(msg.content.size() == 2);
    CHECK(std::holds_alternative<TextBlock>(msg.content[0]));
    CHECK(std::holds_alternative<ToolUseBlock>(msg.content[1]));
    CHECK_FALSE(msg.stop_reason.has_value());
}

TEST_CASE("Empty content strings produce no block", "[response]") {
    auto msg = map_response({
        {"id", "x"},
        {"choices", json::array({{{"message", {{"content", ""}}}, {"finish_reason", "length"}}})},
    });
    CHECK(msg.content.empty());
    CHECK(msg.stop_reason == StopReason::MaxTokens);
}

TEST_CASE("Degenerate responses still yield a valid message", "[response]") {
    SECTION("empty object") {
        auto msg = map_response(json::object());
        CHECK(msg.id.starts_with("msg_"));
        CHECK(msg.id.size() == 36);
        CHECK(msg.model == "unknown");
        CHECK(msg.role == "assistant");
        CHECK(msg.content.empty());
        CHECK_FALSE(msg.stop_reason.has_value());
        CHECK(msg.usage.input_tokens == 0);
        CHECK(msg.usage.output_tokens == 0);
    }

    SECTION("not an object") {
        auto msg = map_response(json::array({1, 2, 3}));
        CHECK_FALSE(msg.id.empty());
        CHECK(msg.model == "unknown");
    }

    SECTION("empty id is replaced") {
        auto a = map_response({{"id", ""}});
        auto b = map_response({{"id", ""}});
        CHECK(a.id.starts_with("msg_"));
        CHECK(a.id != b.id);
    }

    SECTION("empty choices") {
        auto msg = map_response({{"id", "x"}, {"model", "m"}, {"choices", json::array()}});
        CHECK(msg.id == "x");
        CHECK(msg.content.empty());
    }
}

TEST_CASE("Unknown finish reasons become end_turn", "[response]") {
    auto msg = map_response({
        {"id", "x"},
        {"choices", json::array({{{"message", {{"content", "hi"}}}, {"finish_reason", "weird"}}})},
    });
    CHECK(msg.stop_reason == StopReason::EndTurn);
}

TEST_CASE("parse_tool_arguments", "[response]") {
    CHECK(parse_tool_arguments(R"({"a":[1,2]})") == json{{"a", {1, 2}}});
    CHECK(parse_tool_arguments("{bad json") == json::object());
    CHECK(parse_tool_arguments("") == json::object());
    CHECK(parse_tool_arguments("[1,2]") == json::object());
    CHECK(parse_tool_arguments("\"str\"") == json::object());
}

TEST_CASE("map_usage defaults missing counts to zero", "[response]") {
    CHECK(map_usage(json{{"prompt_tokens", 4}}) == chatbridge::Usage{.input_tokens = 4, .output_tokens = 0});
    CHECK(map_usage(json{{"completion_tokens", -1}}) == chatbridge::Usage{});
    CHECK(map_usage(json{{"prompt_tokens", "7"}}) == chatbridge::Usage{});
    CHECK(map_usage(json(nullptr)) == chatbridge::Usage{});
}
