#pragma once

#include "event_router.h"
#include "progress_event_stream.h"
#include "runtime_state.h"
#include "task_registry.h"
#include "transfer_engine.h"
#include <atomic>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <core/model/feedback/feedback.h>
#include <cstdint>
#include <mutex>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <vector>

namespace pipecdn::core {

/**
 * @brief Tracks upload tasks and drives them from engine progress events.
 *
 * @details Each orchestrator owns its event stream. Start() spawns a
 * coroutine on the io_context that drains the stream in arrival order, so
 * the registry has a single writer for progress. StartUpload, CancelUpload
 * and ResetTasks may be called from other threads; they are serialized with
 * event processing.
 *
 * Cancellation is client side only: the engine is not told to stop, the
 * orchestrator just ignores everything it reports for the task afterwards.
 */
class UploadOrchestrator {
public:
    using Clock = EventRouter::Clock;

    UploadOrchestrator(boost::asio::io_context& ioc,
                       TransferEngine& engine,
                       std::string user_id = {});
    ~UploadOrchestrator();
    UploadOrchestrator(const UploadOrchestrator&) = delete;
    UploadOrchestrator& operator=(const UploadOrchestrator&) = delete;

    void Start();
    void Stop();

    // Returns the new task id immediately. Precondition failures leave the
    // task in Error without contacting the engine.
    std::string StartUpload(const std::string& file_path,
                            const std::string& remote_file_name,
                            std::optional<std::string> tier = std::nullopt,
                            std::optional<std::uint32_t> epochs = std::nullopt);

    // False if the task is unknown or already terminal.
    bool CancelUpload(const std::string& task_id);

    void ResetTasks();

    void SetUserId(std::string user_id);

    ProgressEventStream& events() { return event_stream_; }

    // Processes every queued payload, returns how many were taken.
    std::size_t ProcessPending();

    RouteOutcome HandleProgress(const nlohmann::json& payload, Clock::time_point now = Clock::now());

    TaskRegistry::Snapshot Tasks() const { return registry_.Tasks(); }
    std::optional<UploadTask> GetTask(std::string_view task_id) const {
        return registry_.Find(task_id);
    }
    UploadSummary Summary() const { return registry_.Summary(); }

    void SetFeedbackCallback(FeedbackCallback callback);
    void SetCompletionCallback(CompletionCallback callback);

private:
    boost::asio::io_context& ioc_;
    TransferEngine& engine_;
    std::string user_id_;

    std::mutex mutex_;
    TaskRegistry registry_;
    RuntimeStates states_;
    EventRouter router_;
    ProgressEventStream event_stream_;

    FeedbackCallback feedback_callback_ = nullptr;
    CompletionCallback completion_callback_ = nullptr;
    std::atomic<bool> is_running_{false};

    // Filled while mutex_ is held, delivered after it is released so that
    // callbacks may call back into the orchestrator.
    std::vector<Feedback> outbox_;
    std::vector<feedback::UploadCompleted> completed_;

    boost::asio::awaitable<void> drainEvents();

    // Caller holds mutex_
    void publishTask(const UploadTask& task);

    void deliver();
};

} // namespace pipecdn::core
