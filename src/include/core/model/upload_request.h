#pragma once

#include "std_optional.h"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace pipecdn::core {

// What the transfer engine needs to start moving bytes for a task.
struct UploadRequest {
    std::string task_id;
    std::string user_id;
    std::string file_path;
    std::string remote_file_name;
    std::optional<std::string> tier;
    std::optional<std::uint32_t> epochs;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(
        UploadRequest, task_id, user_id, file_path, remote_file_name, tier, epochs);
};

} // namespace pipecdn::core
