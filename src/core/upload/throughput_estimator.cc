#include <algorithm>
#include <cmath>
#include <core/constant/upload.h>
#include <core/upload/throughput_estimator.h>

namespace pipecdn::core {

namespace {

bool IsUsableRate(const std::optional<double>& rate) {
    return rate && std::isfinite(*rate) && *rate > 0.0;
}

double SecondsBetween(ThroughputEstimator::Clock::time_point from,
                      ThroughputEstimator::Clock::time_point to) {
    return std::chrono::duration<double>(to - from).count();
}

} // namespace

ThroughputEstimator::ThroughputEstimator(Clock::time_point start)
    : start_(start)
    , last_sample_time_(start) {}

ThroughputEstimate ThroughputEstimator::AddSample(Clock::time_point now,
                                                  std::uint64_t cumulative_bytes,
                                                  std::uint64_t total_bytes) {
    double dt = std::max(upload::kMinSampleIntervalSec, SecondsBetween(last_sample_time_, now));
    std::uint64_t delta = cumulative_bytes > last_bytes_ ? cumulative_bytes - last_bytes_ : 0;
    double instantaneous = static_cast<double>(delta) / dt;

    if (ema_bytes_per_sec_) {
        ema_bytes_per_sec_ = *ema_bytes_per_sec_ * (1.0 - upload::kEmaAlpha)
                             + instantaneous * upload::kEmaAlpha;
    } else {
        ema_bytes_per_sec_ = instantaneous;
    }
    last_sample_time_ = now;
    last_bytes_ = std::max(last_bytes_, cumulative_bytes);
    ++sample_count_;

    double now_sec = SecondsBetween(start_, now);
    window_.push_back({now_sec, cumulative_bytes});
    while (!window_.empty() && now_sec - window_.front().time_sec > upload::kWindowSpanSec) {
        window_.pop_front();
    }

    if (sample_count_ < upload::kWarmupSamples || cumulative_bytes < upload::kWarmupBytes) {
        return {};
    }

    ThroughputEstimate estimate;
    if (IsUsableRate(ema_bytes_per_sec_)) {
        estimate.speed = ema_bytes_per_sec_;
    }

    auto rate = chooseRate();
    if (rate && total_bytes > 0) {
        double clamped = ClampRate(*rate);
        std::uint64_t remaining = total_bytes > cumulative_bytes ? total_bytes - cumulative_bytes
                                                                 : 0;
        double done_ratio = static_cast<double>(cumulative_bytes)
                            / static_cast<double>(total_bytes);
        if (remaining < upload::kFreezeRemainingBytes
            || done_ratio >= upload::kFreezeCompletedRatio) {
            estimate.eta = upload::kFrozenEtaSec;
        } else {
            estimate.eta = static_cast<double>(remaining) / clamped;
        }
    }
    return estimate;
}

std::optional<double> ThroughputEstimator::window_rate() const {
    if (window_.size() < 2) {
        return std::nullopt;
    }
    const auto& first = window_.front();
    const auto& last = window_.back();
    double span = std::max(upload::kMinWindowSpanSec, last.time_sec - first.time_sec);
    double bytes = last.bytes >= first.bytes ? static_cast<double>(last.bytes - first.bytes) : 0.0;
    return bytes / span;
}

double ThroughputEstimator::ClampRate(double bytes_per_sec) {
    return std::clamp(bytes_per_sec, upload::kMinBytesPerSec, upload::kMaxBytesPerSec);
}

std::optional<double> ThroughputEstimator::chooseRate() const {
    if (auto window = window_rate(); IsUsableRate(window)) {
        return window;
    }
    if (IsUsableRate(ema_bytes_per_sec_)) {
        return ema_bytes_per_sec_;
    }
    return std::nullopt;
}

} // namespace pipecdn::core
