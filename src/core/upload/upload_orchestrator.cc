#include <algorithm>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cctype>
#include <chrono>
#include <core/constant/upload.h>
#include <core/model/feedback.h>
#include <core/upload/progress_normalizer.h>
#include <core/upload/upload_orchestrator.h>
#include <core/util/config.h>
#include <exception>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace net = boost::asio;

namespace pipecdn::core {

namespace {

bool IsBlank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
}

} // namespace

UploadOrchestrator::UploadOrchestrator(boost::asio::io_context& ioc,
                                       TransferEngine& engine,
                                       std::string user_id)
    : ioc_(ioc)
    , engine_(engine)
    , user_id_(std::move(user_id))
    , router_(registry_, states_) {
    router_.SetTaskUpdatedCallback([this](const UploadTask& task) { publishTask(task); });
    router_.SetCompletionCallback([this](const feedback::UploadCompleted& completed) {
        outbox_.push_back(Feedback{
            .type = FeedbackType::kUploadCompleted,
            .data = completed,
        });
        completed_.push_back(completed);
    });
}

UploadOrchestrator::~UploadOrchestrator() {
    Stop();
}

void UploadOrchestrator::Start() {
    if (is_running_.exchange(true)) {
        return;
    }
    net::co_spawn(ioc_, drainEvents(), [](std::exception_ptr e) {
        if (e) {
            try {
                std::rethrow_exception(e);
            } catch (const std::exception& ex) {
                spdlog::error("Progress event loop stopped: {}", ex.what());
            }
        }
    });
    spdlog::debug("UploadOrchestrator started");
}

void UploadOrchestrator::Stop() {
    if (is_running_.exchange(false)) {
        spdlog::debug("UploadOrchestrator stopped");
    }
}

std::string UploadOrchestrator::StartUpload(const std::string& file_path,
                                            const std::string& remote_file_name,
                                            std::optional<std::string> tier,
                                            std::optional<std::uint32_t> epochs) {
    boost::uuids::random_generator uuid_gen;
    const std::string task_id = boost::uuids::to_string(uuid_gen());

    UploadTask task;
    task.id = task_id;
    task.file_path = file_path;
    task.remote_file_name = IsBlank(remote_file_name)
                                ? std::filesystem::path(file_path).filename().string()
                                : remote_file_name;
    if (tier && !tier->empty()) {
        task.tier = std::move(tier);
    } else if (!settings.default_tier.empty()) {
        task.tier = settings.default_tier;
    }
    if (epochs && *epochs > 0) {
        task.epochs = epochs;
    } else if (settings.default_epochs > 0) {
        task.epochs = settings.default_epochs;
    }
    task.status = TaskStatus::kUploading;

    UploadRequest request{
        .task_id = task_id,
        .file_path = task.file_path,
        .remote_file_name = task.remote_file_name,
        .tier = task.tier,
        .epochs = task.epochs,
    };

    bool has_identity = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        request.user_id = user_id_;
        has_identity = !user_id_.empty();

        registry_.Add(task);
        states_.try_emplace(task_id, Clock::now());
        outbox_.push_back(Feedback{
            .type = FeedbackType::kTaskStarted,
            .data = feedback::TaskStarted{
                .task_id = task_id,
                .file_path = task.file_path,
                .remote_file_name = task.remote_file_name,
            },
        });
        publishTask(task);

        if (!has_identity) {
            spdlog::warn("Upload {} rejected: no active account", task_id);
            if (auto failed = registry_.Transition(task_id,
                                                   TaskStatus::kError,
                                                   std::nullopt,
                                                   "Not logged in or session expired");
                failed) {
                publishTask(*failed);
            }
        }
    }
    // The client learns about the task before the engine does
    deliver();

    if (has_identity) {
        spdlog::info("Upload {} started: {} -> {}", task_id, task.file_path, task.remote_file_name);
        try {
            engine_.BeginUpload(request);
        } catch (const std::exception& e) {
            spdlog::error("Upload {} could not be handed to the engine: {}", task_id, e.what());
            std::lock_guard<std::mutex> lock(mutex_);
            if (auto failed = registry_.Transition(task_id, TaskStatus::kError, std::nullopt, e.what());
                failed) {
                publishTask(*failed);
            }
        }
    }

    deliver();
    return task_id;
}

bool UploadOrchestrator::CancelUpload(const std::string& task_id) {
    bool cancelled = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto state = states_.find(task_id);
        if (state == states_.end()) {
            spdlog::debug("Cancel for unknown task {}", task_id);
            return false;
        }
        if (auto task = registry_.Transition(task_id, TaskStatus::kCancelled, "Upload cancelled");
            task) {
            state->second.cancelled = true;
            publishTask(*task);
            cancelled = true;
            spdlog::info("Upload {} cancelled", task_id);
        } else {
            spdlog::debug("Task {} is already finished, nothing to cancel", task_id);
        }
    }
    deliver();
    return cancelled;
}

void UploadOrchestrator::ResetTasks() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto dropped_events = event_stream_.Clear();
        spdlog::info("Resetting {} task(s), dropping {} pending event(s)",
                     registry_.size(),
                     dropped_events);
        registry_.Clear();
        states_.clear();
        outbox_.push_back(Feedback{.type = FeedbackType::kTasksReset, .data = nlohmann::json::object()});
    }
    deliver();
}

void UploadOrchestrator::SetUserId(std::string user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    user_id_ = std::move(user_id);
}

std::size_t UploadOrchestrator::ProcessPending() {
    std::size_t processed = 0;
    while (auto payload = event_stream_.Poll()) {
        HandleProgress(*payload);
        ++processed;
    }
    return processed;
}

RouteOutcome UploadOrchestrator::HandleProgress(const nlohmann::json& payload,
                                                Clock::time_point now) {
    auto event = ProgressNormalizer::Parse(payload);
    if (!event) {
        return RouteOutcome::kMalformed;
    }
    RouteOutcome outcome;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        outcome = router_.Route(*event, now);
    }
    deliver();
    return outcome;
}

void UploadOrchestrator::SetFeedbackCallback(FeedbackCallback callback) {
    feedback_callback_ = std::move(callback);
}

void UploadOrchestrator::SetCompletionCallback(CompletionCallback callback) {
    completion_callback_ = std::move(callback);
}

net::awaitable<void> UploadOrchestrator::drainEvents() {
    auto executor = co_await net::this_coro::executor;
    net::steady_timer timer(executor);
    while (is_running_) {
        if (ProcessPending() == 0) {
            timer.expires_after(std::chrono::milliseconds(upload::kEventPollIntervalMs));
            co_await timer.async_wait(net::use_awaitable);
        }
    }
}

void UploadOrchestrator::publishTask(const UploadTask& task) {
    outbox_.push_back(Feedback{
        .type = FeedbackType::kTaskUpdated,
        .data = feedback::TaskUpdated{
            .task = task,
            .summary = registry_.Summary(),
        },
    });
}

void UploadOrchestrator::deliver() {
    std::vector<Feedback> outbox;
    std::vector<feedback::UploadCompleted> completed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        outbox.swap(outbox_);
        completed.swap(completed_);
    }
    if (feedback_callback_) {
        for (auto& item : outbox) {
            feedback_callback_(std::move(item));
        }
    }
    if (completion_callback_) {
        for (const auto& item : completed) {
            completion_callback_(item);
        }
    }
}

} // namespace pipecdn::core
