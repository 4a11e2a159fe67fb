#include "chatbridge/core/utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <random>

#include <uuid.h>

namespace chatbridge::utils {

auto generate_uuid() -> std::string {
    static thread_local std::mt19937 rng(std::random_device{}());
    auto gen = uuids::uuid_random_generator(rng);
    return uuids::to_string(gen());
}

auto generate_message_id() -> std::string {
    auto uuid = generate_uuid();
    std::erase(uuid, '-');
    return "msg_" + uuid;
}

auto trim(std::string_view s) -> std::string {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(start, end - start + 1));
}

auto split(std::string_view s, char delim) -> std::vector<std::string> {
    std::vector<std::string> parts;
    size_t pos = 0;
    while (pos < s.size()) {
        auto next = s.find(delim, pos);
        if (next == std::string_view::npos) {
            parts.emplace_back(s.substr(pos));
            break;
        }
        parts.emplace_back(s.substr(pos, next - pos));
        pos = next + 1;
    }
    return parts;
}

auto to_lower(std::string_view s) -> std::string {
    std::string result(s);
    std::ranges::transform(result, result.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return result;
}

auto sanitize_for_logging(const nlohmann::json& data) -> nlohmann::json {
    static constexpr std::array<std::string_view, 4> sensitive = {
        "api_key", "authorization", "password", "secret",
    };

    if (data.is_array()) {
        auto out = nlohmann::json::array();
        for (const auto& item : data) {
            out.push_back(sanitize_for_logging(item));
        }
        return out;
    }
    if (!data.is_object()) return data;

    auto out = nlohmann::json::object();
    for (auto it = data.begin(); it != data.end(); ++it) {
        auto key = to_lower(it.key());
        // Token counts ("max_tokens", "prompt_tokens") are not credentials.
        bool is_sensitive = key == "token" || key.ends_with("_token") ||
            std::ranges::any_of(sensitive, [&](std::string_view s) {
                return key.find(s) != std::string::npos;
            });
        if (is_sensitive) {
            out[it.key()] = "***";
        } else {
            out[it.key()] = sanitize_for_logging(it.value());
        }
    }
    return out;
}

} // namespace chatbridge::utils
