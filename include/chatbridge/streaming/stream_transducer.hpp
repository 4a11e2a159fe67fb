#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "chatbridge/core/logger.hpp"
#include "chatbridge/core/types.hpp"
#include "chatbridge/streaming/events.hpp"

namespace chatbridge::streaming {

using json = nlohmann::json;

/// Turns target-protocol delta chunks into source-protocol lifecycle events.
///
/// One instance serves exactly one stream and owns its StreamingMessage and
/// open-block table; nothing is shared across instances, so separate streams
/// may run on separate threads without locking. Chunks are fed one at a time
/// in arrival order:
///
///   - a `delta.role` opens the message (MessageStart, once);
///   - `delta.content` text opens a text block on first sight, then emits a
///     text delta per chunk;
///   - `delta.tool_calls` entries open one tool-use block per tool call and
///     emit its parsed input;
///   - a `finish_reason` stops every open block in index order, then emits
///     MessageDelta and MessageStop. Chunks after that are ignored.
///
/// Block indices are dense and assigned in first-seen order, so text that
/// follows a tool call takes the next index rather than 0. A malformed
/// chunk is logged and skipped; it never ends the stream.
class StreamTransducer {
public:
    explicit StreamTransducer(LoggerPtr logger = Logger::get());

    /// Processes one decoded chunk and returns the events it produced.
    auto feed(const json& chunk) -> std::vector<StreamingEvent>;

    /// True once MessageStop has been emitted.
    [[nodiscard]] auto finished() const noexcept -> bool { return finished_; }

    /// True once MessageStart has been emitted.
    [[nodiscard]] auto started() const noexcept -> bool { return started_; }

    /// The message as assembled so far.
    [[nodiscard]] auto message() const noexcept -> const StreamingMessage& { return message_; }

    [[nodiscard]] auto open_block_count() const noexcept -> std::size_t {
        return message_.content.size();
    }

private:
    struct ToolCallState {
        std::size_t index = 0;
        // Accumulated argument text, for upstreams that split arguments
        // across chunks.
        std::string arguments;
    };

    void start_message(const json& chunk, const json& delta,
                       std::vector<StreamingEvent>& out);
    void on_text(const std::string& text, std::vector<StreamingEvent>& out);
    void on_tool_calls(const json& tool_calls, std::vector<StreamingEvent>& out);
    void on_tool_call(std::size_t position, const json& call,
                      std::vector<StreamingEvent>& out);
    void on_finish(const std::string& finish_reason, const json& chunk,
                   std::vector<StreamingEvent>& out);

    /// Key identifying a tool call across chunks: its `index` field, then
    /// its `id`, then its position within the delta array.
    static auto tool_call_key(std::size_t position, const json& call) -> std::string;

    LoggerPtr logger_;
    StreamingMessage message_;
    std::optional<std::size_t> text_index_;
    std::map<std::string, ToolCallState> tool_calls_;
    bool started_ = false;
    bool finished_ = false;
};

} // namespace chatbridge::streaming
