#include "chatbridge/streaming/chunk_source.hpp"

namespace chatbridge::streaming {

auto VectorChunkSource::read() -> ChunkResult {
    if (closed_) return std::optional<std::string>{};
    if (next_ < chunks_.size()) {
        return std::optional<std::string>(chunks_[next_++]);
    }
    if (error_) {
        return std::unexpected(*error_);
    }
    return std::optional<std::string>{};
}

auto VectorChunkSource::async_read() -> boost::asio::awaitable<ChunkResult> {
    co_return read();
}

} // namespace chatbridge::streaming
