#include <core/model/feedback.h>
#include <ipc/ipc_event_stream.h>
#include <ipc/model.h>
#include <spdlog/spdlog.h>

namespace pipecdn::ipc {

using Feedback = core::Feedback;

void IpcEventStream::PostOperation(Operation&& operation) {
    ProgressSink sink;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (operation.type != OperationType::kUploadProgress) {
            active_operations_.emplace_back(std::move(operation));
            return;
        }
        sink = progress_sink_;
    }
    if (!sink) {
        spdlog::warn("Dropping upload progress: no consumer attached");
        return;
    }
    sink(std::move(operation.data));
}

void IpcEventStream::PostOperation(const Operation& operation) {
    PostOperation(Operation(operation));
}

void IpcEventStream::PostFeedback(Feedback&& feedback) {
    std::lock_guard<std::mutex> lock(mutex_);
    feedbacks_.emplace_back(std::move(feedback));
}

void IpcEventStream::PostFeedback(const Feedback& feedback) {
    std::lock_guard<std::mutex> lock(mutex_);
    feedbacks_.emplace_back(feedback);
}

void IpcEventStream::SetProgressSink(ProgressSink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    progress_sink_ = std::move(sink);
}

std::optional<Operation> IpcEventStream::PollActiveOperation() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_operations_.empty()) {
        return std::nullopt;
    }
    Operation op = std::move(active_operations_.front());
    active_operations_.pop_front();
    return op;
}

std::optional<Feedback> IpcEventStream::PollFeedback() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (feedbacks_.empty()) {
        return std::nullopt;
    }
    Feedback feedback = std::move(feedbacks_.front());
    feedbacks_.pop_front();
    return feedback;
}

} // namespace pipecdn::ipc
