#pragma once

#include <nlohmann/json.hpp>

namespace pipecdn::ipc {

enum class OperationType {
    kStartUpload,    // file path, optional remote name, tier and epochs
    kCancelUpload,   // task id
    kResetTasks,     // the active account changed, drop every task
    kUploadProgress, // sent by the transfer engine, a bare number or a progress object
    kModifySettings, // key and value
    kExitApp,
};

NLOHMANN_JSON_SERIALIZE_ENUM(OperationType,
                             {
                                 {OperationType::kStartUpload, "StartUpload"},
                                 {OperationType::kCancelUpload, "CancelUpload"},
                                 {OperationType::kResetTasks, "ResetTasks"},
                                 {OperationType::kUploadProgress, "UploadProgress"},
                                 {OperationType::kModifySettings, "ModifySettings"},
                                 {OperationType::kExitApp, "ExitApp"},
                             });

} // namespace pipecdn::ipc
