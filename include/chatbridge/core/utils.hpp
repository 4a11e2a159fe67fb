#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace chatbridge::utils {

auto generate_uuid() -> std::string;

/// Identifier for messages the upstream did not name: "msg_" followed by
/// 32 lowercase hex digits.
auto generate_message_id() -> std::string;

auto trim(std::string_view s) -> std::string;
auto split(std::string_view s, char delim) -> std::vector<std::string>;
auto to_lower(std::string_view s) -> std::string;

/// Returns a copy of `data` with the values of credential-like keys
/// replaced by "***". Keys are matched case-insensitively: any key
/// containing api_key, authorization, password or secret, plus "token" and
/// "*_token". Recurses into objects and arrays.
auto sanitize_for_logging(const nlohmann::json& data) -> nlohmann::json;

} // namespace chatbridge::utils
