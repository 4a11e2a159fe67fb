#include "chatbridge/streaming/sse_decoder.hpp"

#include <vector>

#include "chatbridge/core/utils.hpp"

namespace chatbridge::streaming {

auto decode_record(std::string_view record) -> std::optional<SseEvent> {
    SseEvent event;
    std::vector<std::string> data_lines;

    for (const auto& raw : utils::split(record, '\n')) {
        auto line = utils::trim(raw);
        if (line.empty() || line.front() == ':') continue;

        auto colon = line.find(':');
        if (colon == std::string::npos) {
            if (line == "data") {
                data_lines.emplace_back();
            } else {
                event.fields[line] = "";
            }
            continue;
        }

        auto key = utils::trim(std::string_view(line).substr(0, colon));
        auto value = utils::trim(std::string_view(line).substr(colon + 1));
        if (key == "data") {
            data_lines.push_back(std::move(value));
        } else {
            event.fields[key] = std::move(value);
        }
    }

    if (!data_lines.empty()) {
        std::string payload;
        for (std::size_t i = 0; i < data_lines.size(); ++i) {
            if (i > 0) payload += '\n';
            payload += data_lines[i];
        }

        if (payload == kDoneSentinel) {
            event.done = true;
            return event;
        }

        auto parsed = json::parse(payload, nullptr, /*allow_exceptions=*/false);
        event.data = parsed.is_discarded() ? json(payload) : std::move(parsed);
    }

    if (event.fields.empty() && !event.data) {
        return std::nullopt;
    }
    return event;
}

} // namespace chatbridge::streaming
