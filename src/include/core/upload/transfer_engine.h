#pragma once

#include <core/model/upload_request.h>

namespace pipecdn::core {

// The component that actually moves bytes. It reports back through the
// orchestrator's ProgressEventStream using the task id of the request.
class TransferEngine {
public:
    virtual ~TransferEngine() = default;

    // Fire-and-forget. Throwing means the request never reached the engine.
    virtual void BeginUpload(const UploadRequest& request) = 0;
};

} // namespace pipecdn::core
