#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace pipecdn::core::feedback {

struct TaskStarted {
    std::string task_id;
    std::string file_path;
    std::string remote_file_name;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(TaskStarted, task_id, file_path, remote_file_name);
};

} // namespace pipecdn::core::feedback
