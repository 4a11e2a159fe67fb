#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

#include "chatbridge/core/types.hpp"

namespace chatbridge::streaming {

using json = nlohmann::json;

/// Incremental text appended to a text block.
struct TextDelta {
    std::string text;
};

/// Tool input delivered for a tool-use block.
struct InputDelta {
    json input;
};

using BlockDelta = std::variant<TextDelta, InputDelta>;

struct MessageStart {
    StreamingMessage message;
};

struct ContentBlockStart {
    std::size_t index = 0;
    ContentBlock block;
};

struct ContentBlockDelta {
    std::size_t index = 0;
    BlockDelta delta;
};

struct ContentBlockStop {
    std::size_t index = 0;
};

struct MessageDelta {
    std::optional<StopReason> stop_reason;
    std::optional<Usage> usage;
};

struct MessageStop {};

/// Source-protocol lifecycle event. Events are values: once handed to a
/// consumer they are never touched again by the producer.
using StreamingEvent = std::variant<
    MessageStart,
    ContentBlockStart,
    ContentBlockDelta,
    ContentBlockStop,
    MessageDelta,
    MessageStop>;

/// Wire name of the event ("message_start", "content_block_delta", ...).
auto event_type(const StreamingEvent& event) -> std::string_view;

/// Serializes an event in the source protocol's streaming shape.
auto to_json(const StreamingEvent& event) -> json;

} // namespace chatbridge::streaming
