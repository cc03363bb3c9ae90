#pragma once

#include <core/model/progress_event.h>
#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <optional>

namespace pipecdn::core {

struct NormalizedProgress {
    std::optional<double> percent; // unset: keep the previous percent
    std::optional<std::uint64_t> uploaded;
    std::uint64_t total = 0;
};

class ProgressNormalizer {
public:
    // Accepts a bare number (a percent or a fraction) or an object with any
    // subset of {id, percent, uploaded, total, completed, status, message, error}.
    static std::optional<ProgressEvent> Parse(const nlohmann::json& payload);

    // Bytes win over a reported percent whenever both uploaded and a positive
    // total are known. `cumulative_bytes` replaces the raw `uploaded` of the
    // event when the caller has reconstructed it; `known_total` is the total
    // already recorded for the task, which never shrinks.
    static NormalizedProgress Normalize(const ProgressEvent& event,
                                        std::optional<std::uint64_t> cumulative_bytes,
                                        std::uint64_t known_total);

    // Values <= 1 are fractions, anything larger is already a percent.
    static std::optional<double> ScaleReportedPercent(double reported);
};

} // namespace pipecdn::core
