#pragma once

#include <cstdint>

namespace pipecdn::core {

// Turns a per-part "uploaded so far" counter, which restarts at zero on
// every part boundary, into one monotonic cumulative count.
class ByteAccumulator {
public:
    // Feeds the raw counter and returns the cumulative byte count.
    std::uint64_t Accumulate(std::uint64_t uploaded);

    std::uint64_t cumulative() const { return accumulated_bytes_ + last_seen_bytes_; }
    std::uint64_t accumulated_bytes() const { return accumulated_bytes_; }
    std::uint64_t last_seen_bytes() const { return last_seen_bytes_; }

private:
    std::uint64_t accumulated_bytes_{0}; // sum of finished parts
    std::uint64_t last_seen_bytes_{0};   // raw counter of the current part
};

} // namespace pipecdn::core
