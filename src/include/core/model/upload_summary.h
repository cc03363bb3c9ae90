#pragma once

#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace pipecdn::core {

// Aggregate over every task that is still uploading.
struct UploadSummary {
    std::size_t active_count = 0;
    std::uint64_t uploaded_bytes = 0;
    std::uint64_t total_bytes = 0;
    int percent = 0;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(
        UploadSummary, active_count, uploaded_bytes, total_bytes, percent);
};

} // namespace pipecdn::core
