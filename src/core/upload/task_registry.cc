#include <algorithm>
#include <cmath>
#include <core/upload/task_registry.h>
#include <spdlog/spdlog.h>

namespace pipecdn::core {

TaskRegistry::TaskRegistry()
    : tasks_(std::make_shared<const TaskList>()) {}

TaskRegistry::Snapshot TaskRegistry::Tasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_;
}

std::optional<UploadTask> TaskRegistry::Find(std::string_view id) const {
    auto snapshot = Tasks();
    if (const auto* task = FindIn(*snapshot, id); task) {
        return *task;
    }
    return std::nullopt;
}

std::size_t TaskRegistry::size() const {
    return Tasks()->size();
}

UploadSummary TaskRegistry::Summary() const {
    return Summarize(*Tasks());
}

bool TaskRegistry::Add(UploadTask task) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (FindIn(*tasks_, task.id)) {
        spdlog::error("Task {} already registered", task.id);
        return false;
    }
    auto next = std::make_shared<TaskList>(*tasks_);
    next->emplace_back(std::move(task));
    tasks_ = std::move(next);
    return true;
}

bool TaskRegistry::Commit(const UploadTask& task) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto* current = FindIn(*tasks_, task.id);
    if (!current) {
        spdlog::debug("Commit for unknown task {}", task.id);
        return false;
    }
    if (!CanTransition(current->status, task.status)) {
        spdlog::debug("Task {}: rejected change {} -> {}",
                      task.id,
                      nlohmann::json(current->status).get<std::string>(),
                      nlohmann::json(task.status).get<std::string>());
        return false;
    }
    tasks_ = std::make_shared<const TaskList>(WithTask(*tasks_, task));
    return true;
}

std::optional<UploadTask> TaskRegistry::Transition(std::string_view id,
                                                   TaskStatus to,
                                                   std::optional<std::string> message,
                                                   std::optional<std::string> error) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto* current = FindIn(*tasks_, id);
    if (!current || !CanTransition(current->status, to)) {
        return std::nullopt;
    }
    UploadTask next = *current;
    next.status = to;
    if (message) {
        next.message = std::move(message);
    }
    if (to == TaskStatus::kError) {
        next.error = error ? std::move(error) : std::optional<std::string>("Upload failed");
    }
    if (IsTerminal(to)) {
        next.speed.reset();
        next.eta.reset();
    }
    tasks_ = std::make_shared<const TaskList>(WithTask(*tasks_, next));
    return next;
}

void TaskRegistry::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    tasks_ = std::make_shared<const TaskList>();
}

bool TaskRegistry::CanTransition(TaskStatus from, TaskStatus to) {
    switch (from) {
    case TaskStatus::kIdle:
        return to == TaskStatus::kUploading;
    case TaskStatus::kUploading:
        return to != TaskStatus::kIdle;
    case TaskStatus::kSuccess:
    case TaskStatus::kError:
    case TaskStatus::kCancelled:
        return false;
    }
    return false;
}

TaskRegistry::TaskList TaskRegistry::WithTask(const TaskList& tasks, const UploadTask& task) {
    TaskList next = tasks;
    auto it = std::find_if(next.begin(), next.end(), [&](const UploadTask& t) {
        return t.id == task.id;
    });
    if (it != next.end()) {
        *it = task;
    } else {
        next.push_back(task);
    }
    return next;
}

const UploadTask* TaskRegistry::FindIn(const TaskList& tasks, std::string_view id) {
    auto it = std::find_if(tasks.begin(), tasks.end(), [id](const UploadTask& t) {
        return t.id == id;
    });
    return it != tasks.end() ? &*it : nullptr;
}

UploadSummary TaskRegistry::Summarize(const TaskList& tasks) {
    UploadSummary summary;
    for (const auto& task : tasks) {
        if (task.status != TaskStatus::kUploading) {
            continue;
        }
        ++summary.active_count;
        summary.uploaded_bytes += task.uploaded_bytes;
        summary.total_bytes += task.total_bytes;
    }
    if (summary.total_bytes > 0) {
        double percent = static_cast<double>(summary.uploaded_bytes)
                         / static_cast<double>(summary.total_bytes) * 100.0;
        summary.percent = static_cast<int>(std::floor(std::clamp(percent, 0.0, 100.0)));
    }
    return summary;
}

} // namespace pipecdn::core
