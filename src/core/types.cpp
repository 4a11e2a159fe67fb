#include "chatbridge/core/types.hpp"

namespace chatbridge {

auto to_string(StopReason reason) -> std::string_view {
    switch (reason) {
        case StopReason::EndTurn: return "end_turn";
        case StopReason::MaxTokens: return "max_tokens";
        case StopReason::StopSequence: return "stop_sequence";
        case StopReason::ToolUse: return "tool_use";
    }
    return "end_turn";
}

auto to_string(FinishReason reason) -> std::string_view {
    switch (reason) {
        case FinishReason::Stop: return "stop";
        case FinishReason::Length: return "length";
        case FinishReason::ToolCalls: return "tool_calls";
        case FinishReason::FunctionCall: return "function_call";
        case FinishReason::ContentFilter: return "content_filter";
    }
    return "stop";
}

auto parse_finish_reason(std::string_view value) -> std::optional<FinishReason> {
    if (value == "stop") return FinishReason::Stop;
    if (value == "length") return FinishReason::Length;
    if (value == "tool_calls") return FinishReason::ToolCalls;
    if (value == "function_call") return FinishReason::FunctionCall;
    if (value == "content_filter") return FinishReason::ContentFilter;
    return std::nullopt;
}

auto stop_reason_for(FinishReason finish_reason) -> StopReason {
    switch (finish_reason) {
        case FinishReason::Stop: return StopReason::EndTurn;
        case FinishReason::Length: return StopReason::MaxTokens;
        case FinishReason::ToolCalls: return StopReason::ToolUse;
        case FinishReason::FunctionCall: return StopReason::ToolUse;
        case FinishReason::ContentFilter: return StopReason::EndTurn;
    }
    return StopReason::EndTurn;
}

auto stop_reason_for(std::string_view finish_reason) -> StopReason {
    auto parsed = parse_finish_reason(finish_reason);
    return parsed ? stop_reason_for(*parsed) : StopReason::EndTurn;
}

auto finish_reason_for(StopReason stop_reason) -> FinishReason {
    switch (stop_reason) {
        case StopReason::EndTurn: return FinishReason::Stop;
        case StopReason::MaxTokens: return FinishReason::Length;
        case StopReason::StopSequence: return FinishReason::Stop;
        case StopReason::ToolUse: return FinishReason::ToolCalls;
    }
    return FinishReason::Stop;
}

void to_json(json& j, const TextBlock& b) {
    j = json{{"type", "text"}, {"text", b.text}};
}

void to_json(json& j, const ToolUseBlock& b) {
    j = json{
        {"type", "tool_use"},
        {"id", b.id},
        {"name", b.name},
        {"input", b.input},
    };
}

auto content_block_to_json(const ContentBlock& block) -> json {
    return std::visit([](const auto& b) { return json(b); }, block);
}

namespace {

auto content_to_json(const std::vector<ContentBlock>& content) -> json {
    json arr = json::array();
    for (const auto& block : content) {
        arr.push_back(content_block_to_json(block));
    }
    return arr;
}

auto optional_stop_reason(const std::optional<StopReason>& reason) -> json {
    if (!reason) return nullptr;
    return *reason;
}

} // anonymous namespace

void to_json(json& j, const Message& m) {
    j = json{
        {"id", m.id},
        {"type", "message"},
        {"role", m.role},
        {"content", content_to_json(m.content)},
        {"model", m.model},
        {"stop_reason", optional_stop_reason(m.stop_reason)},
        {"stop_sequence", m.stop_sequence ? json(*m.stop_sequence) : json(nullptr)},
        {"usage", m.usage},
    };
}

void to_json(json& j, const StreamingMessage& m) {
    j = json{
        {"id", m.id},
        {"type", "message"},
        {"role", m.role},
        {"content", content_to_json(m.content)},
        {"model", m.model},
        {"stop_reason", optional_stop_reason(m.stop_reason)},
        {"stop_sequence", m.stop_sequence ? json(*m.stop_sequence) : json(nullptr)},
        {"usage", m.usage ? json(*m.usage) : json(nullptr)},
    };
}

} // namespace chatbridge
