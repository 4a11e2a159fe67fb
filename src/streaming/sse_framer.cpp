#include "chatbridge/streaming/sse_framer.hpp"

namespace chatbridge::streaming {

namespace {
constexpr std::string_view kDelimiter = "\n\n";
}

auto SseFramer::feed(std::string_view fragment) -> std::vector<std::string> {
    buffer_.reserve(buffer_.size() + fragment.size());
    for (char c : fragment) {
        if (c != '\r') buffer_ += c;
    }

    std::vector<std::string> records;
    std::size_t start = 0;

    // A delimiter may straddle the previous tail and this fragment, so the
    // search restarts one byte before the old end of buffer.
    auto pos = buffer_.find(kDelimiter, scan_from_);
    while (pos != std::string::npos) {
        records.emplace_back(buffer_, start, pos - start);
        start = pos + kDelimiter.size();
        pos = buffer_.find(kDelimiter, start);
    }

    if (start > 0) {
        buffer_.erase(0, start);
    }
    scan_from_ = buffer_.empty() ? 0 : buffer_.size() - 1;
    return records;
}

auto SseFramer::finish() -> std::size_t {
    auto discarded = buffer_.size();
    reset();
    return discarded;
}

void SseFramer::reset() {
    buffer_.clear();
    scan_from_ = 0;
}

} // namespace chatbridge::streaming
