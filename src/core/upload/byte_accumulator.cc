#include <core/upload/byte_accumulator.h>
#include <spdlog/spdlog.h>

namespace pipecdn::core {

std::uint64_t ByteAccumulator::Accumulate(std::uint64_t uploaded) {
    if (uploaded < last_seen_bytes_) {
        spdlog::debug("Part boundary detected: counter dropped from {} to {}",
                      last_seen_bytes_,
                      uploaded);
        accumulated_bytes_ += last_seen_bytes_;
    }
    last_seen_bytes_ = uploaded;
    return cumulative();
}

} // namespace pipecdn::core
