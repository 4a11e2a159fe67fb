#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace chatbridge::streaming {

/// Splits an incremental text stream into raw server-sent-event records.
///
/// A record is the text between two blank-line ("\n\n") delimiters.
/// Fragments may be cut anywhere, including inside a delimiter; the partial
/// tail is buffered until the next feed(). Carriage returns are dropped on
/// entry so "\r\n" line endings frame the same way as "\n".
class SseFramer {
public:
    /// Appends a fragment and returns every record it completed, in order.
    auto feed(std::string_view fragment) -> std::vector<std::string>;

    /// Signals end of input. A non-delimited remainder is discarded, never
    /// decoded; returns the number of discarded bytes.
    auto finish() -> std::size_t;

    void reset();

    [[nodiscard]] auto buffered() const noexcept -> std::size_t { return buffer_.size(); }

private:
    std::string buffer_;
    // Offset from which the next delimiter search starts.
    std::size_t scan_from_ = 0;
};

} // namespace chatbridge::streaming
