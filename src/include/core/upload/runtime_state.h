#pragma once

#include "byte_accumulator.h"
#include "throughput_estimator.h"
#include <string>
#include <unordered_map>

namespace pipecdn::core {

// Per-task estimator state. Lives exactly as long as the task it belongs to.
struct RuntimeState {
    explicit RuntimeState(ThroughputEstimator::Clock::time_point started)
        : throughput(started) {}

    bool cancelled = false; // set out of band by CancelUpload
    ByteAccumulator bytes;
    ThroughputEstimator throughput;
};

using RuntimeStates = std::unordered_map<std::string, RuntimeState>;

} // namespace pipecdn::core
