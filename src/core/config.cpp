#include "chatbridge/core/config.hpp"
#include "chatbridge/core/logger.hpp"

#include <cstdlib>
#include <fstream>

namespace chatbridge {

namespace {

/// Expands `${VAR}` references in every string value of a parsed config.
void resolve_env_refs_in(json& j) {
    if (j.is_string()) {
        j = resolve_env_refs(j.get<std::string>());
    } else if (j.is_object() || j.is_array()) {
        for (auto& item : j) {
            resolve_env_refs_in(item);
        }
    }
}

auto env_int(const char* name, int fallback) -> int {
    auto* val = std::getenv(name);
    if (!val) return fallback;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        LOG_WARN("Config: ignoring non-numeric {}='{}'", name, val);
        return fallback;
    }
}

} // anonymous namespace

auto load_config(const std::filesystem::path& path) -> ClientConfig {
    if (!std::filesystem::exists(path)) {
        LOG_WARN("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: {}, using defaults", path.string());
        return default_config();
    }

    try {
        json j = json::parse(file);
        resolve_env_refs_in(j);
        return j.get<ClientConfig>();
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config: {}", e.what());
        return default_config();
    }
}

auto load_config_from_env() -> ClientConfig {
    ClientConfig config;

    if (auto* val = std::getenv("CHATBRIDGE_API_KEY")) {
        config.api_key = val;
    } else if (auto* fallback = std::getenv("OPENAI_API_KEY")) {
        config.api_key = fallback;
    }
    if (auto* val = std::getenv("CHATBRIDGE_BASE_URL")) {
        config.base_url = val;
    }
    if (auto* val = std::getenv("CHATBRIDGE_LOG_LEVEL")) {
        config.log_level = val;
    }
    config.timeout_seconds = env_int("CHATBRIDGE_TIMEOUT", config.timeout_seconds);
    config.max_retries = env_int("CHATBRIDGE_MAX_RETRIES", config.max_retries);

    return config;
}

auto default_config() -> ClientConfig {
    return ClientConfig{};
}

auto resolve_env_refs(std::string_view input) -> std::string {
    std::string result;
    result.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        // $${VAR} -> literal ${VAR}
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '$') {
            result += '$';
            i += 2;
            continue;
        }

        if (i + 2 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            auto close = input.find('}', i + 2);
            if (close != std::string_view::npos) {
                std::string var_name(input.substr(i + 2, close - i - 2));

                if (auto* val = std::getenv(var_name.c_str())) {
                    result += val;
                } else {
                    // Preserve unresolved refs
                    result += input.substr(i, close - i + 1);
                    LOG_DEBUG("Config: unresolved env ref ${{{}}}", var_name);
                }
                i = close + 1;
                continue;
            }
        }

        result += input[i];
        ++i;
    }

    return result;
}

} // namespace chatbridge
