#pragma once

#include <nlohmann/json.hpp>

namespace pipecdn::core {

enum class FeedbackType {
    kBackendStarted,  // the backend is ready to accept operations
    kTaskStarted,     // a StartUpload was accepted, carries the new task id
    kBeginUpload,     // request for the external engine to start transferring (UploadRequest)
    kTaskUpdated,     // a task snapshot changed (task + summary of active uploads)
    kUploadCompleted, // raised once per task on Uploading -> Success
    kTasksReset,      // every task was dropped (account switch)
    kError,           // an operation could not be processed
};

NLOHMANN_JSON_SERIALIZE_ENUM(FeedbackType,
                             {
                                 {FeedbackType::kBackendStarted, "BackendStarted"},
                                 {FeedbackType::kTaskStarted, "TaskStarted"},
                                 {FeedbackType::kBeginUpload, "BeginUpload"},
                                 {FeedbackType::kTaskUpdated, "TaskUpdated"},
                                 {FeedbackType::kUploadCompleted, "UploadCompleted"},
                                 {FeedbackType::kTasksReset, "TasksReset"},
                                 {FeedbackType::kError, "Error"},
                             });

} // namespace pipecdn::core
