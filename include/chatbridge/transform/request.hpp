#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "chatbridge/core/error.hpp"
#include "chatbridge/core/logger.hpp"

namespace chatbridge::transform {

using json = nlohmann::json;

/// One conversation turn in the source protocol. `content` is either a
/// plain string or an array of typed blocks (`text`, `tool_use`,
/// `tool_result`).
struct MessageParam {
    std::string role;
    json content;
};

void from_json(const json& j, MessageParam& m);

/// A tool the model may call, described by a JSON schema.
struct ToolParam {
    std::string name;
    std::string description;
    json input_schema = json::object();
};

void from_json(const json& j, ToolParam& t);

/// Source-protocol request body.
struct MessageCreateParams {
    std::string model;
    std::vector<MessageParam> messages;
    int max_tokens = 0;
    std::optional<double> temperature;
    std::optional<double> top_p;
    std::optional<std::vector<std::string>> stop_sequences;
    std::optional<bool> stream;
    std::optional<std::string> system;
    std::vector<ToolParam> tools;
    std::optional<json> tool_choice;
    /// Extra keys merged into the target request last; they override
    /// anything the mapper computed.
    json extra = json::object();
};

void from_json(const json& j, MessageCreateParams& p);

/// Parses a source-protocol JSON request body. `model`, `messages` and
/// `max_tokens` are required. Unknown top-level keys land in `extra`.
auto parse_request(const json& body) -> Result<MessageCreateParams>;

/// Maps a source-protocol request to the target ChatCompletion request.
auto map_request(const MessageCreateParams& params,
                 const LoggerPtr& logger = Logger::get()) -> json;

/// Maps the message list, prepending the system prompt when present.
auto map_messages(const std::vector<MessageParam>& messages,
                  const std::optional<std::string>& system,
                  const LoggerPtr& logger = Logger::get()) -> json;

auto map_tools(const std::vector<ToolParam>& tools) -> json;
auto map_tool_choice(const json& tool_choice) -> json;

} // namespace chatbridge::transform
