#pragma once

#include <cstddef>
#include <cstdint>

namespace pipecdn::core {

namespace upload {

constexpr std::uint64_t kKiB = 1024;
constexpr std::uint64_t kMiB = 1024 * kKiB;
constexpr std::uint64_t kGiB = 1024 * kMiB;

// Throughput smoothing
constexpr double kEmaAlpha = 0.1;
constexpr double kMinSampleIntervalSec = 0.08; // floor for back-to-back events
constexpr double kWindowSpanSec = 10.0;        // rolling window length
constexpr double kMinWindowSpanSec = 0.5;

// Speed/ETA are hidden until both thresholds are reached
constexpr std::size_t kWarmupSamples = 3;
constexpr std::uint64_t kWarmupBytes = 1 * kMiB;

constexpr double kMinBytesPerSec = 1.0 * kKiB;
constexpr double kMaxBytesPerSec = 10.0 * kGiB;

// ETA is pinned to kFrozenEtaSec near the end of a transfer
constexpr std::uint64_t kFreezeRemainingBytes = 2 * kMiB;
constexpr double kFreezeCompletedRatio = 0.995;
constexpr double kFrozenEtaSec = 1.0;

// Idle back-off of the event drain loop
constexpr std::size_t kEventPollIntervalMs = 10;

} // namespace upload

} // namespace pipecdn::core
