#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace chatbridge {

using json = nlohmann::json;

/// Connection settings for the upstream ChatCompletion-style service.
struct ClientConfig {
    std::string api_key;
    std::string base_url = "https://api.openai.com/v1";
    int timeout_seconds = 60;
    int max_retries = 2;
    std::map<std::string, std::string> default_headers;
    std::string log_level = "info";
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ClientConfig, api_key, base_url, timeout_seconds,
                                                max_retries, default_headers, log_level)

auto load_config(const std::filesystem::path& path) -> ClientConfig;
auto load_config_from_env() -> ClientConfig;
auto default_config() -> ClientConfig;

/// Resolves `${VAR}` environment variable references in a string.
/// Supports `$${VAR}` escape (literal `${VAR}`).
auto resolve_env_refs(std::string_view input) -> std::string;

} // namespace chatbridge
