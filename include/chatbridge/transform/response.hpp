#pragma once

#include <string_view>

#include <nlohmann/json.hpp>

#include "chatbridge/core/logger.hpp"
#include "chatbridge/core/types.hpp"

namespace chatbridge::transform {

using json = nlohmann::json;

/// Maps a target ChatCompletion response to a source-protocol Message.
///
/// Only the first choice is read. Malformed tool-call arguments become an
/// empty input object; an absent finish reason leaves stop_reason unset.
/// A response without an id gets a synthesized "msg_" identifier and an
/// absent model becomes "unknown". Never throws for any JSON input.
auto map_response(const json& response,
                  const LoggerPtr& logger = Logger::get()) -> Message;

/// Parses a tool-call argument string; anything that is not valid JSON
/// yields an empty object.
auto parse_tool_arguments(std::string_view arguments) -> json;

/// Reads `{prompt_tokens, completion_tokens}` into Usage, defaulting
/// missing or non-numeric fields to zero.
auto map_usage(const json& usage) -> Usage;

} // namespace chatbridge::transform
