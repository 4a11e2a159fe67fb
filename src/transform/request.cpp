#include "chatbridge/transform/request.hpp"

#include <array>
#include <string_view>

#include "chatbridge/core/utils.hpp"

namespace chatbridge::transform {

namespace {

constexpr std::array<std::string_view, 10> kKnownKeys = {
    "model", "messages", "max_tokens", "temperature", "top_p",
    "stop_sequences", "stream", "system", "tools", "tool_choice",
};

auto is_known_key(std::string_view key) -> bool {
    for (auto known : kKnownKeys) {
        if (key == known) return true;
    }
    return false;
}

auto string_or_empty(const json& obj, const char* key) -> std::string {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

/// Tool results may carry a string or structured content; the target
/// protocol only accepts a string.
auto stringify_content(const json& block) -> std::string {
    auto it = block.find("content");
    if (it == block.end() || it->is_null()) return "";
    if (it->is_string()) return it->get<std::string>();
    return it->dump();
}

auto to_tool_call(const json& block) -> json {
    auto input = block.contains("input") && !block["input"].is_null()
        ? block["input"]
        : json::object();
    return json{
        {"id", string_or_empty(block, "id")},
        {"type", "function"},
        {"function", {
            {"name", string_or_empty(block, "name")},
            {"arguments", input.dump()},
        }},
    };
}

auto to_tool_message(const json& block) -> json {
    return json{
        {"role", "tool"},
        {"tool_call_id", string_or_empty(block, "tool_use_id")},
        {"content", stringify_content(block)},
    };
}

/// Splits a block list into one combined role message (text and tool
/// calls) followed by one "tool" message per tool result, in source order.
void append_block_messages(const std::string& role, const json& blocks,
                           json& out, const LoggerPtr& logger) {
    std::string text;
    bool has_text = false;
    json tool_calls = json::array();
    json tool_results = json::array();

    for (const auto& block : blocks) {
        if (!block.is_object()) continue;
        auto type = string_or_empty(block, "type");

        if (type == "text" && block.contains("text")) {
            if (has_text) text += '\n';
            text += block["text"].is_string() ? block["text"].get<std::string>()
                                              : block["text"].dump();
            has_text = true;
        } else if (type == "tool_use") {
            tool_calls.push_back(to_tool_call(block));
        } else if (type == "tool_result") {
            tool_results.push_back(to_tool_message(block));
        } else {
            logger->debug("Ignoring unsupported content block type '{}'", type);
        }
    }

    if (!has_text && tool_calls.empty() && tool_results.empty()) {
        logger->debug("Dropping '{}' message with no mappable content blocks", role);
        return;
    }

    if (has_text || !tool_calls.empty()) {
        json main = {{"role", role}, {"content", has_text ? text : std::string()}};
        if (!tool_calls.empty()) {
            main["tool_calls"] = std::move(tool_calls);
        }
        out.push_back(std::move(main));
    }

    for (auto& result : tool_results) {
        out.push_back(std::move(result));
    }
}

} // anonymous namespace

void from_json(const json& j, MessageParam& m) {
    j.at("role").get_to(m.role);
    m.content = j.at("content");
}

void from_json(const json& j, ToolParam& t) {
    j.at("name").get_to(t.name);
    t.description = string_or_empty(j, "description");
    if (j.contains("input_schema") && !j["input_schema"].is_null()) {
        t.input_schema = j["input_schema"];
    }
}

void from_json(const json& j, MessageCreateParams& p) {
    j.at("model").get_to(p.model);
    j.at("messages").get_to(p.messages);
    j.at("max_tokens").get_to(p.max_tokens);

    if (j.contains("temperature") && !j["temperature"].is_null()) {
        p.temperature = j["temperature"].get<double>();
    }
    if (j.contains("top_p") && !j["top_p"].is_null()) {
        p.top_p = j["top_p"].get<double>();
    }
    if (j.contains("stop_sequences") && !j["stop_sequences"].is_null()) {
        p.stop_sequences = j["stop_sequences"].get<std::vector<std::string>>();
    }
    if (j.contains("stream") && !j["stream"].is_null()) {
        p.stream = j["stream"].get<bool>();
    }
    if (j.contains("system") && !j["system"].is_null()) {
        p.system = j["system"].get<std::string>();
    }
    if (j.contains("tools") && j["tools"].is_array()) {
        j["tools"].get_to(p.tools);
    }
    if (j.contains("tool_choice") && !j["tool_choice"].is_null()) {
        p.tool_choice = j["tool_choice"];
    }

    p.extra = json::object();
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!is_known_key(it.key())) {
            p.extra[it.key()] = it.value();
        }
    }
}

auto parse_request(const json& body) -> Result<MessageCreateParams> {
    if (!body.is_object()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                          "Request body must be a JSON object"));
    }
    try {
        return body.get<MessageCreateParams>();
    } catch (const json::exception& e) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                          "Malformed request body", e.what()));
    }
}

auto map_messages(const std::vector<MessageParam>& messages,
                  const std::optional<std::string>& system,
                  const LoggerPtr& logger) -> json {
    json out = json::array();

    if (system.has_value() && !system->empty()) {
        out.push_back({{"role", "system"}, {"content", *system}});
    }

    for (const auto& msg : messages) {
        if (msg.content.is_string()) {
            out.push_back({{"role", msg.role}, {"content", msg.content}});
        } else if (msg.content.is_array()) {
            append_block_messages(msg.role, msg.content, out, logger);
        } else {
            logger->debug("Dropping '{}' message with {} content", msg.role,
                          msg.content.type_name());
        }
    }

    return out;
}

auto map_tools(const std::vector<ToolParam>& tools) -> json {
    json out = json::array();
    for (const auto& tool : tools) {
        out.push_back({
            {"type", "function"},
            {"function", {
                {"name", tool.name},
                {"description", tool.description},
                {"parameters", tool.input_schema},
            }},
        });
    }
    return out;
}

auto map_tool_choice(const json& tool_choice) -> json {
    if (tool_choice.is_string()) {
        auto choice = tool_choice.get<std::string>();
        if (choice == "any" || choice == "required") return "required";
        return "auto";
    }

    if (tool_choice.is_object() && string_or_empty(tool_choice, "type") == "tool") {
        auto it = tool_choice.find("name");
        if (it != tool_choice.end() && it->is_string() && !it->get<std::string>().empty()) {
            return json{
                {"type", "function"},
                {"function", {{"name", *it}}},
            };
        }
    }

    return "auto";
}

auto map_request(const MessageCreateParams& params, const LoggerPtr& logger) -> json {
    json out;
    out["model"] = params.model;
    out["messages"] = map_messages(params.messages, params.system, logger);
    out["max_tokens"] = params.max_tokens;

    if (params.temperature) out["temperature"] = *params.temperature;
    if (params.top_p) out["top_p"] = *params.top_p;
    if (params.stop_sequences) out["stop"] = *params.stop_sequences;
    if (params.stream) out["stream"] = *params.stream;

    if (!params.tools.empty()) {
        out["tools"] = map_tools(params.tools);
    }
    if (params.tool_choice) {
        out["tool_choice"] = map_tool_choice(*params.tool_choice);
    }

    for (auto it = params.extra.begin(); it != params.extra.end(); ++it) {
        out[it.key()] = it.value();
    }

    if (logger->should_log(spdlog::level::debug)) {
        logger->debug("Mapped request: {}", utils::sanitize_for_logging(out).dump());
    }
    return out;
}

} // namespace chatbridge::transform
