#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <core/upload/event_router.h>
#include <core/upload/progress_normalizer.h>
#include <spdlog/spdlog.h>

namespace pipecdn::core {

namespace {

std::string Lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

bool StatusIs(const std::optional<std::string>& status, std::initializer_list<const char*> names) {
    if (!status) {
        return false;
    }
    auto lowered = Lowercase(*status);
    return std::any_of(names.begin(), names.end(), [&](const char* name) {
        return lowered == name;
    });
}

void ClearEstimates(UploadTask& task) {
    task.speed.reset();
    task.eta.reset();
}

} // namespace

EventRouter::EventRouter(TaskRegistry& registry, RuntimeStates& states)
    : registry_(registry)
    , states_(states) {}

void EventRouter::SetCompletionCallback(CompletionCallback callback) {
    completion_callback_ = std::move(callback);
}

void EventRouter::SetTaskUpdatedCallback(TaskUpdatedCallback callback) {
    task_updated_callback_ = std::move(callback);
}

RouteOutcome EventRouter::Route(const ProgressEvent& event, Clock::time_point now) {
    auto snapshot = registry_.Tasks();
    auto id = Correlate(*snapshot, event);
    if (!id) {
        spdlog::debug("Dropping progress event for {}: no matching task",
                      event.id.value_or("<no id>"));
        return RouteOutcome::kCorrelationMiss;
    }

    const auto* task = TaskRegistry::FindIn(*snapshot, *id);
    auto state = states_.find(*id);
    if (!task || state == states_.end()) {
        spdlog::warn("Task {} has no runtime state, dropping event", *id);
        return RouteOutcome::kCorrelationMiss;
    }
    if (state->second.cancelled) {
        spdlog::debug("Task {} was cancelled, dropping event", *id);
        return RouteOutcome::kSuppressed;
    }
    if (task->status != TaskStatus::kUploading) {
        spdlog::debug("Task {} is no longer uploading, dropping event", *id);
        return RouteOutcome::kStale;
    }

    UploadTask next = Apply(*task, state->second, event, now);
    if (!registry_.Commit(next)) {
        return RouteOutcome::kStale;
    }
    if (task_updated_callback_) {
        task_updated_callback_(next);
    }

    switch (next.status) {
    case TaskStatus::kSuccess:
        spdlog::info("Upload {} completed ({} bytes)", next.id, next.total_bytes);
        if (completion_callback_) {
            completion_callback_(feedback::UploadCompleted{
                .id = next.id,
                .file_path = next.file_path,
                .remote_file_name = next.remote_file_name,
                .total_bytes = next.total_bytes,
            });
        }
        return RouteOutcome::kCompleted;
    case TaskStatus::kError:
        spdlog::error("Upload {} failed: {}", next.id, next.error.value_or(""));
        return RouteOutcome::kFailed;
    case TaskStatus::kCancelled:
        spdlog::info("Upload {} cancelled by the engine", next.id);
        return RouteOutcome::kCancelled;
    default:
        return RouteOutcome::kUpdated;
    }
}

std::optional<std::string> EventRouter::Correlate(const TaskRegistry::TaskList& tasks,
                                                  const ProgressEvent& event) {
    if (event.id) {
        if (TaskRegistry::FindIn(tasks, *event.id)) {
            return event.id;
        }
        return std::nullopt;
    }
    auto it = std::find_if(tasks.rbegin(), tasks.rend(), [](const UploadTask& task) {
        return task.status == TaskStatus::kUploading;
    });
    if (it == tasks.rend()) {
        return std::nullopt;
    }
    return it->id;
}

UploadTask EventRouter::Apply(const UploadTask& task,
                              RuntimeState& state,
                              const ProgressEvent& event,
                              Clock::time_point now) {
    UploadTask next = task;
    if (event.message) {
        next.message = event.message;
    }

    if (event.error || StatusIs(event.status, {"error", "failed"})) {
        next.status = TaskStatus::kError;
        next.error = event.error ? event.error
                                 : (event.message ? event.message
                                                  : std::optional<std::string>("Upload failed"));
        ClearEstimates(next);
        return next;
    }
    if (StatusIs(event.status, {"cancelled", "canceled"})) {
        state.cancelled = true;
        next.status = TaskStatus::kCancelled;
        ClearEstimates(next);
        return next;
    }

    std::optional<std::uint64_t> cumulative;
    if (event.uploaded) {
        cumulative = state.bytes.Accumulate(*event.uploaded);
    }
    auto normalized = ProgressNormalizer::Normalize(event, cumulative, task.total_bytes);
    next.total_bytes = normalized.total;
    if (cumulative && *cumulative >= next.uploaded_bytes) {
        next.uploaded_bytes = *cumulative;
    }
    if (normalized.percent) {
        next.progress = std::max(next.progress, *normalized.percent);
    }
    if (cumulative) {
        auto estimate = state.throughput.AddSample(now, next.uploaded_bytes, next.total_bytes);
        next.speed = estimate.speed;
        next.eta = estimate.eta;
    }

    bool completed = event.completed.value_or(false)
                     || StatusIs(event.status, {"success", "completed"})
                     || (next.total_bytes > 0 && next.uploaded_bytes >= next.total_bytes);
    if (completed) {
        next.status = TaskStatus::kSuccess;
        next.progress = 100.0;
        next.uploaded_bytes = std::max(next.uploaded_bytes, next.total_bytes);
        if (!event.message) {
            next.message = "Upload complete";
        }
        ClearEstimates(next);
    }
    return next;
}

} // namespace pipecdn::core
