#include "chatbridge/infra/chunk_channel.hpp"

#include <utility>

namespace chatbridge::infra {

ChunkChannel::ChunkChannel(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

void ChunkChannel::wake_locked(std::unique_lock<std::mutex>& lock) {
    auto notify = std::exchange(notify_, nullptr);
    lock.unlock();
    cv_.notify_all();
    if (notify) notify();
}

void ChunkChannel::set_head(StreamHead head) {
    std::unique_lock lock(mtx_);
    head_ = std::move(head);
    wake_locked(lock);
}

auto ChunkChannel::push(std::string chunk) -> bool {
    std::unique_lock lock(mtx_);
    cv_.wait(lock, [this] { return closed_ || chunks_.size() < capacity_; });
    if (closed_) return false;
    chunks_.push_back(std::move(chunk));
    wake_locked(lock);
    return true;
}

void ChunkChannel::finish(std::optional<Error> error) {
    std::unique_lock lock(mtx_);
    finished_ = true;
    if (error && !closed_) error_ = std::move(error);
    wake_locked(lock);
}

auto ChunkChannel::head_ready_locked() -> std::optional<Result<StreamHead>> {
    if (head_) return Result<StreamHead>(*head_);
    if (error_) return Result<StreamHead>(std::unexpected(*error_));
    if (finished_ || closed_) {
        return Result<StreamHead>(std::unexpected(make_error(
            ErrorCode::ConnectionClosed, "Stream ended before a response status was received")));
    }
    return std::nullopt;
}

auto ChunkChannel::chunk_ready_locked()
    -> std::optional<Result<std::optional<std::string>>> {
    using R = Result<std::optional<std::string>>;
    if (closed_) return R(std::optional<std::string>{});
    if (!chunks_.empty()) {
        auto chunk = std::move(chunks_.front());
        chunks_.pop_front();
        cv_.notify_all();
        return R(std::optional<std::string>(std::move(chunk)));
    }
    if (error_) return R(std::unexpected(*error_));
    if (finished_) return R(std::optional<std::string>{});
    return std::nullopt;
}

auto ChunkChannel::wait_head() -> Result<StreamHead> {
    std::unique_lock lock(mtx_);
    std::optional<Result<StreamHead>> ready;
    cv_.wait(lock, [&] { return (ready = head_ready_locked()).has_value(); });
    return std::move(*ready);
}

auto ChunkChannel::poll_head(Notify notify) -> std::optional<Result<StreamHead>> {
    std::lock_guard lock(mtx_);
    auto ready = head_ready_locked();
    if (!ready) notify_ = std::move(notify);
    return ready;
}

auto ChunkChannel::pop() -> Result<std::optional<std::string>> {
    std::unique_lock lock(mtx_);
    std::optional<Result<std::optional<std::string>>> ready;
    cv_.wait(lock, [&] { return (ready = chunk_ready_locked()).has_value(); });
    return std::move(*ready);
}

auto ChunkChannel::poll(Notify notify)
    -> std::optional<Result<std::optional<std::string>>> {
    std::lock_guard lock(mtx_);
    auto ready = chunk_ready_locked();
    if (!ready) notify_ = std::move(notify);
    return ready;
}

void ChunkChannel::close() {
    std::unique_lock lock(mtx_);
    if (closed_) return;
    closed_ = true;
    chunks_.clear();
    // A consumer suspended in poll() must observe the end of body.
    wake_locked(lock);
}

auto ChunkChannel::closed() const -> bool {
    std::lock_guard lock(mtx_);
    return closed_;
}

} // namespace chatbridge::infra
