#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace pipecdn::ipc::operation {

struct CancelUpload {
    std::string task_id;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(CancelUpload, task_id);
};

} // namespace pipecdn::ipc::operation
