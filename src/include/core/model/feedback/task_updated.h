#pragma once

#include "core/model/upload_summary.h"
#include "core/model/upload_task.h"
#include <nlohmann/json.hpp>

namespace pipecdn::core::feedback {

struct TaskUpdated {
    UploadTask task;
    UploadSummary summary;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(TaskUpdated, task, summary);
};

} // namespace pipecdn::core::feedback
