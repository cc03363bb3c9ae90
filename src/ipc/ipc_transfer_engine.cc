#include <ipc/ipc_transfer_engine.h>
#include <spdlog/spdlog.h>

namespace pipecdn::ipc {

void IpcTransferEngine::BeginUpload(const core::UploadRequest& request) {
    spdlog::debug("Forwarding upload {} to the transfer engine", request.task_id);
    event_stream_.PostFeedback(core::Feedback{
        .type = core::FeedbackType::kBeginUpload,
        .data = request,
    });
}

} // namespace pipecdn::ipc
