#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace chatbridge {

using json = nlohmann::json;

/// Why generation ended, in the source protocol's vocabulary.
enum class StopReason {
    EndTurn,
    MaxTokens,
    StopSequence,
    ToolUse,
};

NLOHMANN_JSON_SERIALIZE_ENUM(StopReason, {
    {StopReason::EndTurn, "end_turn"},
    {StopReason::MaxTokens, "max_tokens"},
    {StopReason::StopSequence, "stop_sequence"},
    {StopReason::ToolUse, "tool_use"},
})

/// Why generation ended, in the target protocol's vocabulary.
enum class FinishReason {
    Stop,
    Length,
    ToolCalls,
    FunctionCall,
    ContentFilter,
};

NLOHMANN_JSON_SERIALIZE_ENUM(FinishReason, {
    {FinishReason::Stop, "stop"},
    {FinishReason::Length, "length"},
    {FinishReason::ToolCalls, "tool_calls"},
    {FinishReason::FunctionCall, "function_call"},
    {FinishReason::ContentFilter, "content_filter"},
})

auto to_string(StopReason reason) -> std::string_view;
auto to_string(FinishReason reason) -> std::string_view;

/// Parses a target-protocol finish reason; unknown strings yield nullopt.
auto parse_finish_reason(std::string_view value) -> std::optional<FinishReason>;

/// Fixed finish→stop table. Values outside the target vocabulary map to
/// EndTurn.
auto stop_reason_for(std::string_view finish_reason) -> StopReason;
auto stop_reason_for(FinishReason finish_reason) -> StopReason;

/// Fixed stop→finish table.
auto finish_reason_for(StopReason stop_reason) -> FinishReason;

struct TextBlock {
    std::string text;
};

struct ToolUseBlock {
    std::string id;
    std::string name;
    json input = json::object();
};

/// One addressable unit of message content.
using ContentBlock = std::variant<TextBlock, ToolUseBlock>;

void to_json(json& j, const TextBlock& b);
void to_json(json& j, const ToolUseBlock& b);
auto content_block_to_json(const ContentBlock& block) -> json;

struct Usage {
    uint32_t input_tokens = 0;
    uint32_t output_tokens = 0;

    auto operator==(const Usage&) const -> bool = default;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Usage, input_tokens, output_tokens)

/// A complete, non-streaming assistant message.
struct Message {
    std::string id;
    std::string role = "assistant";
    std::vector<ContentBlock> content;
    std::string model;
    std::optional<StopReason> stop_reason;
    std::optional<std::string> stop_sequence;
    Usage usage;
};

void to_json(json& j, const Message& m);

/// The message being assembled while a stream is in flight. Content only
/// grows; stop_reason and usage are set once, when the stream finishes.
struct StreamingMessage {
    std::string id;
    std::string role = "assistant";
    std::vector<ContentBlock> content;
    std::string model;
    std::optional<StopReason> stop_reason;
    std::optional<std::string> stop_sequence;
    std::optional<Usage> usage;
};

void to_json(json& j, const StreamingMessage& m);

} // namespace chatbridge
