#include "chatbridge/transform/response.hpp"

#include "chatbridge/core/utils.hpp"

namespace chatbridge::transform {

namespace {

constexpr auto kUnknownModel = "unknown";

auto token_count(const json& usage, const char* key) -> uint32_t {
    auto it = usage.find(key);
    if (it == usage.end() || !it->is_number_integer()) return 0;
    auto value = it->get<int64_t>();
    return value > 0 ? static_cast<uint32_t>(value) : 0;
}

auto first_choice(const json& response) -> json {
    auto it = response.find("choices");
    if (it == response.end() || !it->is_array() || it->empty()) {
        return json::object();
    }
    const auto& choice = it->front();
    return choice.is_object() ? choice : json::object();
}

auto string_field(const json& obj, const char* key) -> std::optional<std::string> {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

} // anonymous namespace

auto parse_tool_arguments(std::string_view arguments) -> json {
    auto parsed = json::parse(arguments, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return json::object();
    }
    return parsed;
}

auto map_usage(const json& usage) -> Usage {
    if (!usage.is_object()) return Usage{};
    return Usage{
        .input_tokens = token_count(usage, "prompt_tokens"),
        .output_tokens = token_count(usage, "completion_tokens"),
    };
}

auto map_response(const json& response, const LoggerPtr& logger) -> Message {
    const auto& body = response.is_object() ? response : json::object();
    auto choice = first_choice(body);
    auto message = choice.contains("message") && choice["message"].is_object()
        ? choice["message"]
        : json::object();

    Message result;

    if (auto text = string_field(message, "content"); text && !text->empty()) {
        result.content.emplace_back(TextBlock{.text = std::move(*text)});
    }

    if (message.contains("tool_calls") && message["tool_calls"].is_array()) {
        for (const auto& call : message["tool_calls"]) {
            if (!call.is_object() || !call.contains("function")
                || !call["function"].is_object()) {
                continue;
            }
            const auto& fn = call["function"];

            json input = json::object();
            if (auto args = string_field(fn, "arguments")) {
                input = parse_tool_arguments(*args);
                if (input.empty() && !args->empty() && *args != "{}") {
                    logger->warn("Tool call '{}' has malformed arguments; using empty input",
                                 string_field(fn, "name").value_or(""));
                }
            } else if (fn.contains("arguments") && fn["arguments"].is_object()) {
                input = fn["arguments"];
            }

            result.content.emplace_back(ToolUseBlock{
                .id = string_field(call, "id").value_or(""),
                .name = string_field(fn, "name").value_or(""),
                .input = std::move(input),
            });
        }
    }

    if (auto finish = string_field(choice, "finish_reason")) {
        result.stop_reason = stop_reason_for(*finish);
    }

    if (body.contains("usage")) {
        result.usage = map_usage(body["usage"]);
    }

    auto id = string_field(body, "id");
    result.id = id && !id->empty() ? std::move(*id) : utils::generate_message_id();
    result.model = string_field(body, "model").value_or(kUnknownModel);
    result.role = "assistant";

    logger->debug("Mapped response {} ({} content blocks, stop_reason={})",
                  result.id, result.content.size(),
                  result.stop_reason ? to_string(*result.stop_reason) : "null");
    return result;
}

} // namespace chatbridge::transform
