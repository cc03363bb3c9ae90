#pragma once

#include <core/model/feedback.h>
#include <deque>
#include <functional>
#include <ipc/model.h>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>

namespace pipecdn::ipc {

// Mailbox between the pipe (IpcService) and the backend (IpcBackendService).
class IpcEventStream {
    using Feedback = core::Feedback;

public:
    using ProgressSink = std::function<void(nlohmann::json&&)>;

    void PostOperation(Operation&& operation);
    void PostOperation(const Operation& operation);
    void PostFeedback(Feedback&& feedback);
    void PostFeedback(const Feedback& feedback);

    // UploadProgress operations bypass the operation queue and go straight here
    void SetProgressSink(ProgressSink sink);

    std::optional<Operation> PollActiveOperation();
    std::optional<Feedback> PollFeedback();

private:
    std::mutex mutex_;

    // operations polled by the backend loop
    std::deque<Operation> active_operations_;

    ProgressSink progress_sink_ = nullptr;

    // for notifications
    std::deque<Feedback> feedbacks_;
};

} // namespace pipecdn::ipc
