#include "chatbridge/streaming/stream_transducer.hpp"

#include "chatbridge/transform/response.hpp"

namespace chatbridge::streaming {

namespace {

auto non_empty_string(const json& obj, const char* key) -> std::optional<std::string> {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return std::nullopt;
    auto value = it->get<std::string>();
    if (value.empty()) return std::nullopt;
    return value;
}

auto string_or_empty(const json& obj, const char* key) -> std::string {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

auto argument_text(const json& fn) -> std::string {
    auto it = fn.find("arguments");
    if (it == fn.end() || it->is_null()) return "";
    if (it->is_string()) return it->get<std::string>();
    return it->dump();
}

auto is_complete_object(std::string_view text) -> bool {
    auto parsed = json::parse(text, nullptr, /*allow_exceptions=*/false);
    return !parsed.is_discarded() && parsed.is_object();
}

} // anonymous namespace

StreamTransducer::StreamTransducer(LoggerPtr logger)
    : logger_(std::move(logger)) {}

auto StreamTransducer::feed(const json& chunk) -> std::vector<StreamingEvent> {
    std::vector<StreamingEvent> out;
    if (finished_) {
        logger_->debug("Ignoring chunk received after message_stop");
        return out;
    }

    try {
        if (!chunk.is_object()) {
            logger_->debug("Ignoring non-object stream chunk");
            return out;
        }

        auto choices = chunk.find("choices");
        if (choices == chunk.end() || !choices->is_array() || choices->empty()) {
            return out;
        }

        const auto& choice = choices->front();
        if (!choice.is_object()) return out;

        auto delta_it = choice.find("delta");
        const auto delta = delta_it != choice.end() && delta_it->is_object()
            ? *delta_it
            : json::object();

        if (!started_ && non_empty_string(delta, "role")) {
            start_message(chunk, delta, out);
        }

        if (auto text = non_empty_string(delta, "content")) {
            if (!started_) start_message(chunk, delta, out);
            on_text(*text, out);
        }

        if (delta.contains("tool_calls") && delta["tool_calls"].is_array()) {
            if (!started_) start_message(chunk, delta, out);
            on_tool_calls(delta["tool_calls"], out);
        }

        if (auto reason = non_empty_string(choice, "finish_reason")) {
            if (!started_) start_message(chunk, delta, out);
            on_finish(*reason, chunk, out);
        }
    } catch (const json::exception& e) {
        logger_->warn("Skipping malformed stream chunk: {}", e.what());
    }

    return out;
}

void StreamTransducer::start_message(const json& chunk, const json& delta,
                                     std::vector<StreamingEvent>& out) {
    message_.id = string_or_empty(chunk, "id");
    message_.model = string_or_empty(chunk, "model");
    message_.role = non_empty_string(delta, "role").value_or("assistant");
    started_ = true;

    logger_->debug("Stream started: id={} model={}", message_.id, message_.model);
    out.emplace_back(MessageStart{.message = message_});
}

void StreamTransducer::on_text(const std::string& text, std::vector<StreamingEvent>& out) {
    if (!text_index_) {
        text_index_ = message_.content.size();
        message_.content.emplace_back(TextBlock{});
        out.emplace_back(ContentBlockStart{.index = *text_index_, .block = TextBlock{}});
    }

    std::get<TextBlock>(message_.content[*text_index_]).text += text;
    out.emplace_back(ContentBlockDelta{.index = *text_index_, .delta = TextDelta{.text = text}});
}

void StreamTransducer::on_tool_calls(const json& tool_calls, std::vector<StreamingEvent>& out) {
    for (std::size_t i = 0; i < tool_calls.size(); ++i) {
        on_tool_call(i, tool_calls[i], out);
    }
}

void StreamTransducer::on_tool_call(std::size_t position, const json& call,
                                    std::vector<StreamingEvent>& out) {
    if (!call.is_object() || !call.contains("function") || !call["function"].is_object()) {
        logger_->debug("Ignoring tool call delta without a function at position {}", position);
        return;
    }
    const auto& fn = call["function"];
    auto fragment = argument_text(fn);

    auto [it, inserted] = tool_calls_.try_emplace(tool_call_key(position, call));
    auto& state = it->second;

    if (inserted) {
        state.arguments = fragment;
        state.index = message_.content.size();

        ToolUseBlock block{
            .id = string_or_empty(call, "id"),
            .name = string_or_empty(fn, "name"),
            .input = transform::parse_tool_arguments(state.arguments),
        };
        auto input = block.input;
        message_.content.emplace_back(block);
        out.emplace_back(ContentBlockStart{.index = state.index, .block = std::move(block)});
        out.emplace_back(ContentBlockDelta{.index = state.index,
                                           .delta = InputDelta{.input = std::move(input)}});
        return;
    }

    // A complete object only replaces arguments that were already complete;
    // otherwise it is a nested piece of a split object.
    if (is_complete_object(fragment)
        && (state.arguments.empty() || is_complete_object(state.arguments))) {
        state.arguments = fragment;
    } else {
        state.arguments += fragment;
    }

    auto& block = std::get<ToolUseBlock>(message_.content[state.index]);
    if (block.id.empty()) block.id = string_or_empty(call, "id");
    if (block.name.empty()) block.name = string_or_empty(fn, "name");
    block.input = transform::parse_tool_arguments(state.arguments);

    out.emplace_back(ContentBlockDelta{.index = state.index,
                                       .delta = InputDelta{.input = block.input}});
}

void StreamTransducer::on_finish(const std::string& finish_reason, const json& chunk,
                                 std::vector<StreamingEvent>& out) {
    for (std::size_t i = 0; i < message_.content.size(); ++i) {
        out.emplace_back(ContentBlockStop{.index = i});
    }

    message_.stop_reason = stop_reason_for(finish_reason);
    if (chunk.contains("usage") && chunk["usage"].is_object()) {
        message_.usage = transform::map_usage(chunk["usage"]);
    }

    out.emplace_back(MessageDelta{.stop_reason = message_.stop_reason, .usage = message_.usage});
    out.emplace_back(MessageStop{});
    finished_ = true;

    logger_->debug("Stream finished: finish_reason={} stop_reason={} blocks={}",
                   finish_reason, to_string(*message_.stop_reason), message_.content.size());
}

auto StreamTransducer::tool_call_key(std::size_t position, const json& call) -> std::string {
    if (auto it = call.find("index"); it != call.end() && it->is_number_integer()) {
        return "index:" + std::to_string(it->get<int64_t>());
    }
    if (auto id = non_empty_string(call, "id")) {
        return "id:" + *id;
    }
    return "position:" + std::to_string(position);
}

} // namespace chatbridge::streaming
