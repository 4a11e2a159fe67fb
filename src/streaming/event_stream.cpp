#include "chatbridge/streaming/event_stream.hpp"

#include "chatbridge/streaming/sse_decoder.hpp"

namespace chatbridge::streaming {

auto to_string(StreamState state) -> std::string_view {
    switch (state) {
        case StreamState::Open:      return "open";
        case StreamState::Completed: return "completed";
        case StreamState::Truncated: return "truncated";
        case StreamState::Failed:    return "failed";
    }
    return "unknown";
}

// -- EventPipeline -----------------------------------------------------------

EventPipeline::EventPipeline(LoggerPtr logger)
    : logger_(logger), transducer_(std::move(logger)) {}

auto EventPipeline::poll() -> std::optional<StreamingEvent> {
    while (events_.empty()) {
        if (transducer_.finished() || saw_done_ || records_.empty()) {
            return std::nullopt;
        }
        decode_next_record();
    }
    auto event = std::move(events_.front());
    events_.pop_front();
    return event;
}

void EventPipeline::decode_next_record() {
    auto record = std::move(records_.front());
    records_.pop_front();

    auto decoded = decode_record(record);
    if (!decoded) return;

    if (decoded->done) {
        logger_->debug("Received [DONE] sentinel");
        saw_done_ = true;
        records_.clear();
        return;
    }
    if (!decoded->data) return;

    if (!decoded->data->is_object()) {
        logger_->debug("Skipping non-JSON stream record ({} bytes)", record.size());
        return;
    }

    for (auto& event : transducer_.feed(*decoded->data)) {
        events_.push_back(std::move(event));
    }
}

void EventPipeline::push(std::string_view fragment) {
    if (terminated()) return;
    for (auto& record : framer_.feed(fragment)) {
        records_.push_back(std::move(record));
    }
}

void EventPipeline::end_of_input() {
    input_ended_ = true;
    if (auto discarded = framer_.finish(); discarded > 0) {
        logger_->debug("Discarding {} bytes of incomplete stream record", discarded);
    }
}

auto EventPipeline::needs_input() const noexcept -> bool {
    return events_.empty() && records_.empty() && !terminated();
}

auto EventPipeline::terminated() const noexcept -> bool {
    if (!events_.empty()) return false;
    return transducer_.finished() || saw_done_ || (input_ended_ && records_.empty());
}

// -- StreamCore --------------------------------------------------------------

namespace detail {

StreamCore::StreamCore(LoggerPtr logger)
    : logger_(logger), pipeline_(std::move(logger)) {}

auto StreamCore::poll() -> std::optional<StreamingEvent> {
    if (state_ != StreamState::Open) return std::nullopt;
    if (auto event = pipeline_.poll()) return event;
    if (pipeline_.terminated()) settle();
    return std::nullopt;
}

auto StreamCore::accept(ChunkResult chunk) -> VoidResult {
    if (!chunk) {
        state_ = StreamState::Failed;
        error_ = chunk.error();
        logger_->warn("Event stream failed: {}", chunk.error().what());
        return std::unexpected(chunk.error());
    }
    if (!*chunk) {
        pipeline_.end_of_input();
    } else {
        pipeline_.push(**chunk);
    }
    return {};
}

void StreamCore::mark_closed() {
    if (state_ != StreamState::Open) return;
    state_ = StreamState::Truncated;
    logger_->debug("Event stream closed by consumer");
}

void StreamCore::settle() {
    if (pipeline_.completed()) {
        state_ = StreamState::Completed;
        return;
    }
    state_ = StreamState::Truncated;
    logger_->warn("Event stream ended before message_stop ({})",
                  pipeline_.saw_done() ? "[DONE] without finish_reason" : "end of input");
}

} // namespace detail

// -- EventStream -------------------------------------------------------------

EventStream::EventStream(std::unique_ptr<ChunkSource> source, LoggerPtr logger)
    : source_(std::move(source)), core_(std::move(logger)) {}

EventStream::~EventStream() {
    if (source_) source_->close();
}

auto EventStream::next() -> Result<std::optional<StreamingEvent>> {
    while (true) {
        if (core_.state() == StreamState::Failed) {
            return std::unexpected(*core_.error());
        }
        if (auto event = core_.poll()) return event;
        if (core_.state() != StreamState::Open) {
            source_->close();
            return std::optional<StreamingEvent>{};
        }

        auto accepted = core_.accept(source_->read());
        if (!accepted) {
            source_->close();
            return std::unexpected(accepted.error());
        }
    }
}

void EventStream::close() {
    core_.mark_closed();
    if (source_) source_->close();
}

void EventStream::iterator::advance() {
    auto result = stream_->next();
    if (result && *result) {
        current_ = std::move(**result);
    } else {
        current_.reset();
    }
}

// -- AsyncEventStream --------------------------------------------------------

AsyncEventStream::AsyncEventStream(std::unique_ptr<AsyncChunkSource> source, LoggerPtr logger)
    : source_(std::move(source)), core_(std::move(logger)) {}

AsyncEventStream::~AsyncEventStream() {
    if (source_) source_->close();
}

auto AsyncEventStream::next()
    -> boost::asio::awaitable<Result<std::optional<StreamingEvent>>> {
    while (true) {
        if (core_.state() == StreamState::Failed) {
            co_return make_fail(*core_.error());
        }
        if (auto event = core_.poll()) {
            co_return std::move(event);
        }
        if (core_.state() != StreamState::Open) {
            source_->close();
            co_return std::optional<StreamingEvent>{};
        }

        auto chunk = co_await source_->async_read();
        auto accepted = core_.accept(std::move(chunk));
        if (!accepted) {
            source_->close();
            co_return make_fail(accepted.error());
        }
    }
}

void AsyncEventStream::close() {
    core_.mark_closed();
    if (source_) source_->close();
}

} // namespace chatbridge::streaming
