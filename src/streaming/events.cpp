#include "chatbridge/streaming/events.hpp"

namespace chatbridge::streaming {

namespace {

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

auto delta_to_json(const BlockDelta& delta) -> json {
    return std::visit(overloaded{
        [](const TextDelta& d) {
            return json{{"type", "text_delta"}, {"text", d.text}};
        },
        [](const InputDelta& d) {
            return json{
                {"type", "input_json_delta"},
                {"input", d.input},
                {"partial_json", d.input.dump()},
            };
        },
    }, delta);
}

} // anonymous namespace

auto event_type(const StreamingEvent& event) -> std::string_view {
    return std::visit(overloaded{
        [](const MessageStart&) -> std::string_view { return "message_start"; },
        [](const ContentBlockStart&) -> std::string_view { return "content_block_start"; },
        [](const ContentBlockDelta&) -> std::string_view { return "content_block_delta"; },
        [](const ContentBlockStop&) -> std::string_view { return "content_block_stop"; },
        [](const MessageDelta&) -> std::string_view { return "message_delta"; },
        [](const MessageStop&) -> std::string_view { return "message_stop"; },
    }, event);
}

auto to_json(const StreamingEvent& event) -> json {
    json j = std::visit(overloaded{
        [](const MessageStart& e) {
            return json{{"message", e.message}};
        },
        [](const ContentBlockStart& e) {
            return json{
                {"index", e.index},
                {"content_block", content_block_to_json(e.block)},
            };
        },
        [](const ContentBlockDelta& e) {
            return json{{"index", e.index}, {"delta", delta_to_json(e.delta)}};
        },
        [](const ContentBlockStop& e) {
            return json{{"index", e.index}};
        },
        [](const MessageDelta& e) {
            return json{
                {"delta", {
                    {"stop_reason", e.stop_reason ? json(*e.stop_reason) : json(nullptr)},
                    {"stop_sequence", nullptr},
                }},
                {"usage", e.usage ? json(*e.usage) : json(nullptr)},
            };
        },
        [](const MessageStop&) {
            return json::object();
        },
    }, event);
    j["type"] = std::string(event_type(event));
    return j;
}

} // namespace chatbridge::streaming
