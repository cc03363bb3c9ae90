#pragma once

#include <nlohmann/json.hpp>

namespace pipecdn::core {

enum class TaskStatus {
    kIdle,      // created but never started
    kUploading, // the only state that consumes progress events
    kSuccess,
    kError,
    kCancelled, // cancelled on the client side, the engine may still be running
};

NLOHMANN_JSON_SERIALIZE_ENUM(TaskStatus,
                             {
                                 {TaskStatus::kIdle, "Idle"},
                                 {TaskStatus::kUploading, "Uploading"},
                                 {TaskStatus::kSuccess, "Success"},
                                 {TaskStatus::kError, "Error"},
                                 {TaskStatus::kCancelled, "Cancelled"},
                             });

constexpr bool IsTerminal(TaskStatus status) {
    return status == TaskStatus::kSuccess || status == TaskStatus::kError
           || status == TaskStatus::kCancelled;
}

} // namespace pipecdn::core
