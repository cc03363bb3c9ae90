#pragma once

#include "std_optional.h"
#include "task_status.h"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace pipecdn::core {

struct UploadTask {
    std::string id;
    std::string file_path;
    std::string remote_file_name;
    std::optional<std::string> tier;
    std::optional<std::uint32_t> epochs;

    TaskStatus status = TaskStatus::kIdle;
    double progress = 0.0; // percent, 0-100
    std::uint64_t uploaded_bytes = 0;
    std::uint64_t total_bytes = 0;

    std::optional<double> speed; // bytes/sec, unset during warm-up
    std::optional<double> eta;   // seconds remaining

    std::optional<std::string> message;
    std::optional<std::string> error; // only set together with kError

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(UploadTask,
                                   id,
                                   file_path,
                                   remote_file_name,
                                   tier,
                                   epochs,
                                   status,
                                   progress,
                                   uploaded_bytes,
                                   total_bytes,
                                   speed,
                                   eta,
                                   message,
                                   error);
};

} // namespace pipecdn::core
