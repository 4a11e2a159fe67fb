#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include "chatbridge/core/error.hpp"

namespace chatbridge::streaming {

/// Result of one read: a text fragment, nullopt at end of input, or the
/// transport error that ended the stream.
using ChunkResult = Result<std::optional<std::string>>;

/// Blocking source of response-body text fragments.
class ChunkSource {
public:
    virtual ~ChunkSource() = default;

    /// Blocks until the next fragment is available.
    virtual auto read() -> ChunkResult = 0;

    /// Abandons the source. Pending and later reads return end of input.
    virtual void close() = 0;
};

/// Cooperative source of response-body text fragments, for use inside
/// boost::asio coroutines.
class AsyncChunkSource {
public:
    virtual ~AsyncChunkSource() = default;

    /// Suspends until the next fragment is available.
    virtual auto async_read() -> boost::asio::awaitable<ChunkResult> = 0;

    virtual void close() = 0;
};

/// Replays a fixed list of fragments. Usable in both modes.
class VectorChunkSource final : public ChunkSource, public AsyncChunkSource {
public:
    explicit VectorChunkSource(std::vector<std::string> chunks)
        : chunks_(std::move(chunks)) {}

    /// Makes the read after the last fragment fail with `error` instead of
    /// reporting end of input.
    void fail_at_end(Error error) { error_ = std::move(error); }

    auto read() -> ChunkResult override;
    auto async_read() -> boost::asio::awaitable<ChunkResult> override;
    void close() override { closed_ = true; }

    [[nodiscard]] auto reads() const noexcept -> std::size_t { return next_; }
    [[nodiscard]] auto closed() const noexcept -> bool { return closed_; }

private:
    std::vector<std::string> chunks_;
    std::optional<Error> error_;
    std::size_t next_ = 0;
    bool closed_ = false;
};

} // namespace chatbridge::streaming
