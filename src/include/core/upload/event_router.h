#pragma once

#include "runtime_state.h"
#include "task_registry.h"
#include <core/model/feedback/upload_completed.h>
#include <core/model/progress_event.h>
#include <core/model/upload_task.h>
#include <functional>
#include <optional>
#include <string>

namespace pipecdn::core {

enum class RouteOutcome {
    kUpdated,         // progress applied, task still uploading
    kCompleted,       // Uploading -> Success, completion raised
    kFailed,          // Uploading -> Error
    kCancelled,       // engine reported the task as cancelled
    kCorrelationMiss, // no task matches the event
    kStale,           // the task is already terminal
    kSuppressed,      // the task was cancelled by the client
    kMalformed,       // the payload is neither a number nor an object
};

using CompletionCallback = std::function<void(const feedback::UploadCompleted&)>;
using TaskUpdatedCallback = std::function<void(const UploadTask&)>;

/**
 * @brief Attributes progress events to tasks and applies them.
 *
 * @details An event with an id goes to the task with that id. An event
 * without one goes to the most recently created task that is still
 * uploading. This guess is only sound while a single task is uploading at a
 * time; engines that run uploads concurrently must always send the id.
 *
 * The completion callback fires exactly once per task, at the moment the
 * task becomes Success. Later events for that task are stale and dropped.
 */
class EventRouter {
public:
    using Clock = ThroughputEstimator::Clock;

    EventRouter(TaskRegistry& registry, RuntimeStates& states);
    EventRouter(const EventRouter&) = delete;
    EventRouter& operator=(const EventRouter&) = delete;

    void SetCompletionCallback(CompletionCallback callback);
    void SetTaskUpdatedCallback(TaskUpdatedCallback callback);

    RouteOutcome Route(const ProgressEvent& event, Clock::time_point now = Clock::now());

    static std::optional<std::string> Correlate(const TaskRegistry::TaskList& tasks,
                                                const ProgressEvent& event);

    // Next snapshot of an uploading task after `event`. Advances `state`.
    static UploadTask Apply(const UploadTask& task,
                            RuntimeState& state,
                            const ProgressEvent& event,
                            Clock::time_point now);

private:
    TaskRegistry& registry_;
    RuntimeStates& states_;
    CompletionCallback completion_callback_ = nullptr;
    TaskUpdatedCallback task_updated_callback_ = nullptr;
};

} // namespace pipecdn::core
