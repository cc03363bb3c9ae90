#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>

namespace pipecdn::core {

struct ThroughputEstimate {
    std::optional<double> speed; // bytes/sec, EMA
    std::optional<double> eta;   // seconds
};

/**
 * @brief Speed and ETA from irregular, bursty byte samples.
 *
 * @details Two rates are tracked: an exponential moving average of the
 * sample-to-sample rate, and the average over a rolling 10 second window.
 * The ETA prefers the window rate and falls back to the EMA. The exposed
 * speed is always the EMA. Nothing is exposed until the warm-up thresholds
 * (3 samples and 1 MiB) are reached, and the ETA is pinned to one second
 * once the transfer is within 2 MiB or 99.5% of its total.
 */
class ThroughputEstimator {
public:
    using Clock = std::chrono::steady_clock;

    explicit ThroughputEstimator(Clock::time_point start = Clock::now());

    ThroughputEstimate AddSample(Clock::time_point now,
                                 std::uint64_t cumulative_bytes,
                                 std::uint64_t total_bytes);

    std::optional<double> ema() const { return ema_bytes_per_sec_; }
    std::optional<double> window_rate() const;
    std::size_t sample_count() const { return sample_count_; }
    std::size_t window_size() const { return window_.size(); }

    static double ClampRate(double bytes_per_sec);

private:
    struct Sample {
        double time_sec; // seconds since start_
        std::uint64_t bytes;
    };

    std::optional<double> chooseRate() const;

    Clock::time_point start_;
    Clock::time_point last_sample_time_;
    std::uint64_t last_bytes_{0};
    std::optional<double> ema_bytes_per_sec_;
    std::deque<Sample> window_;
    std::size_t sample_count_{0};
};

} // namespace pipecdn::core
