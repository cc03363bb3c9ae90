#pragma once

#include <core/model/task_status.h>
#include <core/model/upload_summary.h>
#include <core/model/upload_task.h>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pipecdn::core {

/**
 * @brief Ordered collection of upload tasks, oldest first.
 *
 * @details The collection is immutable once published: every change builds a
 * new vector and swaps the shared pointer, so a Snapshot obtained by a reader
 * never changes underneath it. Status changes are checked against the task
 * state machine (Idle -> Uploading -> {Success, Error, Cancelled}); terminal
 * tasks reject every further change.
 */
class TaskRegistry {
public:
    using TaskList = std::vector<UploadTask>;
    using Snapshot = std::shared_ptr<const TaskList>;

    TaskRegistry();
    TaskRegistry(const TaskRegistry&) = delete;
    TaskRegistry& operator=(const TaskRegistry&) = delete;

    Snapshot Tasks() const;
    std::optional<UploadTask> Find(std::string_view id) const;
    std::size_t size() const;
    UploadSummary Summary() const;

    // Returns false if a task with the same id already exists
    bool Add(UploadTask task);

    // Replaces the stored task that has the same id. Rejected when the id is
    // unknown or the status change is not a legal transition.
    bool Commit(const UploadTask& task);

    // Moves a task to `to`, recording message/error. Same rules as Commit.
    std::optional<UploadTask> Transition(std::string_view id,
                                         TaskStatus to,
                                         std::optional<std::string> message = std::nullopt,
                                         std::optional<std::string> error = std::nullopt);

    void Clear();

    static bool CanTransition(TaskStatus from, TaskStatus to);

    // Pure helpers, the registry itself is built on them
    static TaskList WithTask(const TaskList& tasks, const UploadTask& task);
    static const UploadTask* FindIn(const TaskList& tasks, std::string_view id);
    static UploadSummary Summarize(const TaskList& tasks);

private:
    mutable std::mutex mutex_;
    Snapshot tasks_;
};

} // namespace pipecdn::core
