#pragma once

#include <cstddef>
#include <deque>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include "chatbridge/core/error.hpp"
#include "chatbridge/core/logger.hpp"
#include "chatbridge/streaming/chunk_source.hpp"
#include "chatbridge/streaming/events.hpp"
#include "chatbridge/streaming/sse_framer.hpp"
#include "chatbridge/streaming/stream_transducer.hpp"

namespace chatbridge::streaming {

enum class StreamState {
    /// More events may follow.
    Open,
    /// MessageStop was delivered.
    Completed,
    /// Input ended, or the consumer closed the stream, before MessageStop.
    Truncated,
    /// The chunk source reported an error; see error().
    Failed,
};

auto to_string(StreamState state) -> std::string_view;

/// Framer, decoder and transducer chained together, independent of how
/// fragments are obtained. Holds at most the records of one fragment and
/// the events of one chunk; callers push a fragment only when
/// needs_input() says so.
class EventPipeline {
public:
    explicit EventPipeline(LoggerPtr logger = Logger::get());

    /// Next event derivable from what has been pushed so far.
    auto poll() -> std::optional<StreamingEvent>;

    void push(std::string_view fragment);
    void end_of_input();

    [[nodiscard]] auto needs_input() const noexcept -> bool;

    /// No further events will ever be produced.
    [[nodiscard]] auto terminated() const noexcept -> bool;

    /// MessageStop has been produced.
    [[nodiscard]] auto completed() const noexcept -> bool { return transducer_.finished(); }

    /// The `[DONE]` sentinel was read.
    [[nodiscard]] auto saw_done() const noexcept -> bool { return saw_done_; }

    [[nodiscard]] auto transducer() const noexcept -> const StreamTransducer& { return transducer_; }

private:
    void decode_next_record();

    LoggerPtr logger_;
    SseFramer framer_;
    StreamTransducer transducer_;
    std::deque<std::string> records_;
    std::deque<StreamingEvent> events_;
    bool saw_done_ = false;
    bool input_ended_ = false;
};

namespace detail {

/// Bookkeeping shared by the blocking and cooperative streams.
class StreamCore {
public:
    explicit StreamCore(LoggerPtr logger);

    /// Returns the next ready event, or nullopt if the pipeline needs input
    /// or the stream is over (check state()).
    auto poll() -> std::optional<StreamingEvent>;

    /// Hands one read result to the pipeline. Returns the error when the
    /// read failed.
    auto accept(ChunkResult chunk) -> VoidResult;

    void mark_closed();

    [[nodiscard]] auto state() const noexcept -> StreamState { return state_; }
    [[nodiscard]] auto error() const noexcept -> const std::optional<Error>& { return error_; }
    [[nodiscard]] auto pipeline() const noexcept -> const EventPipeline& { return pipeline_; }
    [[nodiscard]] auto logger() const noexcept -> const LoggerPtr& { return logger_; }

private:
    void settle();

    LoggerPtr logger_;
    EventPipeline pipeline_;
    StreamState state_ = StreamState::Open;
    std::optional<Error> error_;
};

} // namespace detail

/// Lazy, single-pass sequence of lifecycle events read from a blocking
/// chunk source. Reads from the source only when no event is ready.
///
///     for (const auto& event : stream) { ... }
///     if (stream.state() == StreamState::Failed) { ... stream.error() ... }
class EventStream {
public:
    explicit EventStream(std::unique_ptr<ChunkSource> source, LoggerPtr logger = Logger::get());
    ~EventStream();

    EventStream(EventStream&&) noexcept = default;
    EventStream& operator=(EventStream&&) noexcept = default;
    EventStream(const EventStream&) = delete;
    EventStream& operator=(const EventStream&) = delete;

    /// Next event; nullopt once the stream is over. A source error is
    /// returned once as the error and afterwards on every call.
    auto next() -> Result<std::optional<StreamingEvent>>;

    /// Closes the source and ends the sequence.
    void close();

    [[nodiscard]] auto state() const noexcept -> StreamState { return core_.state(); }
    [[nodiscard]] auto error() const noexcept -> const std::optional<Error>& { return core_.error(); }
    [[nodiscard]] auto message() const noexcept -> const StreamingMessage& {
        return core_.pipeline().transducer().message();
    }

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = StreamingEvent;
        using difference_type = std::ptrdiff_t;
        using pointer = const StreamingEvent*;
        using reference = const StreamingEvent&;

        iterator() = default;
        explicit iterator(EventStream* stream) : stream_(stream) { advance(); }

        auto operator*() const -> reference { return *current_; }
        auto operator->() const -> pointer { return &*current_; }
        auto operator++() -> iterator& { advance(); return *this; }
        void operator++(int) { advance(); }

        friend auto operator==(const iterator& it, std::default_sentinel_t) -> bool {
            return !it.current_.has_value();
        }

    private:
        void advance();

        EventStream* stream_ = nullptr;
        std::optional<StreamingEvent> current_;
    };

    auto begin() -> iterator { return iterator(this); }
    auto end() -> std::default_sentinel_t { return std::default_sentinel; }

private:
    std::unique_ptr<ChunkSource> source_;
    detail::StreamCore core_;
};

/// Cooperative counterpart of EventStream for boost::asio coroutines.
class AsyncEventStream {
public:
    explicit AsyncEventStream(std::unique_ptr<AsyncChunkSource> source,
                              LoggerPtr logger = Logger::get());
    ~AsyncEventStream();

    AsyncEventStream(AsyncEventStream&&) noexcept = default;
    AsyncEventStream& operator=(AsyncEventStream&&) noexcept = default;
    AsyncEventStream(const AsyncEventStream&) = delete;
    AsyncEventStream& operator=(const AsyncEventStream&) = delete;

    auto next() -> boost::asio::awaitable<Result<std::optional<StreamingEvent>>>;

    void close();

    [[nodiscard]] auto state() const noexcept -> StreamState { return core_.state(); }
    [[nodiscard]] auto error() const noexcept -> const std::optional<Error>& { return core_.error(); }
    [[nodiscard]] auto message() const noexcept -> const StreamingMessage& {
        return core_.pipeline().transducer().message();
    }

private:
    std::unique_ptr<AsyncChunkSource> source_;
    detail::StreamCore core_;
};

} // namespace chatbridge::streaming
