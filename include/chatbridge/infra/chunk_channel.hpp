#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include "chatbridge/core/error.hpp"

namespace chatbridge::infra {

/// Status line of a streaming response. For non-2xx responses the body is
/// buffered in full and handed over here instead of through the channel.
struct StreamHead {
    int status = 0;
    std::string error_body;

    [[nodiscard]] auto is_success() const noexcept -> bool {
        return status >= 200 && status < 300;
    }
};

/// Bounded hand-off between the thread running an HTTP transfer and the
/// consumer of its body. The producer blocks while the channel is full, so
/// the transfer never runs ahead of the consumer by more than `capacity`
/// fragments. Consumers either block (pop, wait_head) or register a one-shot
/// notifier (poll, poll_head) that the producer invokes when something
/// changes.
class ChunkChannel {
public:
    using Notify = std::function<void()>;

    explicit ChunkChannel(std::size_t capacity = 1);

    // -- producer side -------------------------------------------------------

    void set_head(StreamHead head);

    /// Blocks while the channel is full. Returns false once the consumer
    /// closed the channel; the producer should then abort the transfer.
    auto push(std::string chunk) -> bool;

    /// Ends the body, with an error if the transfer failed.
    void finish(std::optional<Error> error = std::nullopt);

    // -- consumer side -------------------------------------------------------

    /// Blocks until the head is known or the transfer failed.
    auto wait_head() -> Result<StreamHead>;

    /// Non-blocking wait_head(). When nothing is ready yet, stores `notify`
    /// and returns nullopt.
    auto poll_head(Notify notify) -> std::optional<Result<StreamHead>>;

    /// Blocks until a fragment, end of body, or a transfer error.
    auto pop() -> Result<std::optional<std::string>>;

    /// Non-blocking pop(). When nothing is ready yet, stores `notify` and
    /// returns nullopt.
    auto poll(Notify notify) -> std::optional<Result<std::optional<std::string>>>;

    /// Abandons the body. Wakes a blocked producer and a pending notifier;
    /// later pops report end of body.
    void close();

    [[nodiscard]] auto closed() const -> bool;

private:
    auto head_ready_locked() -> std::optional<Result<StreamHead>>;
    auto chunk_ready_locked() -> std::optional<Result<std::optional<std::string>>>;
    void wake_locked(std::unique_lock<std::mutex>& lock);

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::size_t capacity_;
    std::deque<std::string> chunks_;
    std::optional<StreamHead> head_;
    std::optional<Error> error_;
    Notify notify_;
    bool finished_ = false;
    bool closed_ = false;
};

} // namespace chatbridge::infra
