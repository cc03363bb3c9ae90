#pragma once

#include "ipc_event_stream.h"
#include <core/upload/transfer_engine.h>

namespace pipecdn::ipc {

// The transfer engine runs in the frontend process. Upload requests are
// forwarded to it as BeginUpload feedback; its progress comes back as
// UploadProgress operations.
class IpcTransferEngine : public core::TransferEngine {
public:
    explicit IpcTransferEngine(IpcEventStream& event_stream)
        : event_stream_(event_stream) {}

    void BeginUpload(const core::UploadRequest& request) override;

private:
    IpcEventStream& event_stream_;
};

} // namespace pipecdn::ipc
