#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <core/constant/upload.h>
#include <core/model/feedback.h>
#include <core/util/config.h>
#include <ipc/ipc_backend_service.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace net = boost::asio;

namespace pipecdn::ipc {

IpcBackendService::IpcBackendService(boost::asio::io_context& ioc, IpcEventStream& event_stream)
    : ioc_(ioc)
    , event_stream_(event_stream)
    , transfer_engine_(event_stream)
    , orchestrator_(ioc, transfer_engine_, core::settings.user_id) {
    orchestrator_.SetFeedbackCallback(
        [this](core::Feedback&& feedback) { event_stream_.PostFeedback(std::move(feedback)); });
    event_stream_.SetProgressSink(
        [this](nlohmann::json&& payload) { orchestrator_.events().Post(std::move(payload)); });
}

IpcBackendService::~IpcBackendService() {
    event_stream_.SetProgressSink(nullptr);
}

void IpcBackendService::Start() {
    is_running_ = true;
    orchestrator_.Start();
    net::co_spawn(ioc_, start(), net::detached);
    feedback(core::Feedback{
        .type = core::FeedbackType::kBackendStarted,
        .data = {{"user_id", core::settings.user_id}},
    });
    spdlog::debug("IpcBackendService started");
}

void IpcBackendService::Stop() {
    is_running_ = false;
    orchestrator_.Stop();
    spdlog::debug("IpcBackendService stopped");
}

void IpcBackendService::SetExitAppCallback(std::function<void()>&& callback) {
    exit_app_callback_ = std::move(callback);
}

net::awaitable<void> IpcBackendService::start() {
    auto executor = co_await net::this_coro::executor;
    net::steady_timer timer(executor);
    while (is_running_) {
        if (auto operation = event_stream_.PollActiveOperation(); operation) {
            DispatchOperation(*operation);
        } else {
            timer.expires_after(std::chrono::milliseconds(core::upload::kEventPollIntervalMs));
            co_await timer.async_wait(net::use_awaitable);
        }
    }
}

void IpcBackendService::DispatchOperation(const Operation& operation) {
    switch (operation.type) {
    case OperationType::kStartUpload: {
        spdlog::debug("IpcBackendService: dispatch operation \"StartUpload\"");
        if (auto data = operation.getData<operation::StartUpload>(); data) {
            startUpload(*data);
        } else {
            reportError("StartUpload", "invalid data");
        }
        break;
    }
    case OperationType::kCancelUpload: {
        spdlog::debug("IpcBackendService: dispatch operation \"CancelUpload\"");
        if (auto data = operation.getData<operation::CancelUpload>(); data) {
            cancelUpload(data->task_id);
        } else {
            reportError("CancelUpload", "invalid data");
        }
        break;
    }
    case OperationType::kResetTasks: {
        spdlog::debug("IpcBackendService: dispatch operation \"ResetTasks\"");
        orchestrator_.ResetTasks();
        break;
    }
    case OperationType::kUploadProgress: {
        // Normally routed by IpcEventStream, accept it here as well
        orchestrator_.events().Post(operation.data);
        break;
    }
    case OperationType::kModifySettings: {
        spdlog::debug("IpcBackendService: dispatch operation \"ModifySettings\"");
        if (auto data = operation.getData<operation::ModifySettings>(); data) {
            modifySettings(data->key, data->value);
        } else {
            reportError("ModifySettings", "invalid data");
        }
        break;
    }
    case OperationType::kExitApp: {
        exitApp();
        break;
    }
    }
}

void IpcBackendService::startUpload(const operation::StartUpload& start_upload) {
    if (start_upload.file_path.empty()) {
        reportError("StartUpload", "no file to upload");
        return;
    }
    orchestrator_.StartUpload(start_upload.file_path,
                              start_upload.remote_file_name,
                              start_upload.tier,
                              start_upload.epochs);
}

void IpcBackendService::cancelUpload(const std::string& task_id) {
    if (!orchestrator_.CancelUpload(task_id)) {
        spdlog::debug("IpcBackendService: nothing to cancel for {}", task_id);
    }
}

void IpcBackendService::modifySettings(std::string_view key, const nlohmann::json& value) {
    try {
        if (key == "user-id") {
            auto user_id = value.is_null() ? std::string{} : value.get<std::string>();
            if (user_id != core::settings.user_id) {
                spdlog::info("Active account changed, resetting upload tasks");
                core::settings.user_id = user_id;
                orchestrator_.SetUserId(user_id);
                orchestrator_.ResetTasks();
            }
        } else if (key == "default-tier") {
            core::settings.default_tier = value.get<std::string>();
        } else if (key == "default-epochs") {
            core::settings.default_epochs = value.get<std::uint32_t>();
        } else {
            reportError("ModifySettings", "unknown key");
            return;
        }
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("IPC Error: Failed to modify settings: {}", e.what());
        reportError("ModifySettings", e.what());
        return;
    }
}

void IpcBackendService::exitApp() {
    Stop();
    ioc_.stop();
    if (exit_app_callback_) {
        exit_app_callback_();
    }
}

void IpcBackendService::reportError(std::string_view operation, std::string_view message) {
    spdlog::error("IPC Error: operation \"{}\": {}", operation, message);
    feedback(core::Feedback{
        .type = core::FeedbackType::kError,
        .data = {{"operation", std::string(operation)}, {"message", std::string(message)}},
    });
}

} // namespace pipecdn::ipc
