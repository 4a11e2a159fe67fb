#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace chatbridge::streaming {

using json = nlohmann::json;

/// Terminal payload that ends a target-protocol stream.
inline constexpr std::string_view kDoneSentinel = "[DONE]";

/// One decoded server-sent event.
struct SseEvent {
    /// Non-data fields (`event`, `id`, `retry`, ...), values trimmed.
    std::map<std::string, std::string> fields;
    /// `data:` lines joined with '\n'. Parsed JSON when the payload is valid
    /// JSON, otherwise the raw string as a JSON string value.
    std::optional<json> data;
    /// True when the payload was the `[DONE]` sentinel. No data is attached
    /// and the reader must stop.
    bool done = false;

    [[nodiscard]] auto event_name() const -> std::optional<std::string> {
        auto it = fields.find("event");
        if (it == fields.end()) return std::nullopt;
        return it->second;
    }
};

/// Decodes one framed record. Comment lines (leading ':') and blank lines
/// are skipped; a line without ':' is a field with an empty value.
/// Returns nullopt when the record has no fields at all.
auto decode_record(std::string_view record) -> std::optional<SseEvent>;

} // namespace chatbridge::streaming
