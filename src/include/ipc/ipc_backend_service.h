#pragma once

#include "ipc_event_stream.h"
#include "ipc_transfer_engine.h"
#include "model.h"
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <core/upload/upload_orchestrator.h>
#include <functional>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <string_view>

/**
 * @brief Backend side of the IPC channel.
 *
 * @details Polls operations from the IpcEventStream and dispatches them to the
 * upload orchestrator; orchestrator feedback is posted back to the stream.
 * Progress from the transfer engine is fed directly into the orchestrator's
 * own event stream.
 *
 * @note Not copyable.
 */
namespace pipecdn::ipc {

class IpcBackendService {
public:
    IpcBackendService(boost::asio::io_context& ioc, IpcEventStream& event_stream);
    ~IpcBackendService();
    IpcBackendService(const IpcBackendService&) = delete;
    IpcBackendService& operator=(const IpcBackendService&) = delete;

    void Start();
    void Stop();

    void SetExitAppCallback(std::function<void()>&& callback);

    core::UploadOrchestrator& orchestrator() { return orchestrator_; }

    // Handles one operation synchronously
    void DispatchOperation(const Operation& operation);

private:
    boost::asio::io_context& ioc_;
    IpcEventStream& event_stream_;
    IpcTransferEngine transfer_engine_;
    core::UploadOrchestrator orchestrator_;
    std::function<void()> exit_app_callback_ = nullptr;
    bool is_running_{false};

    boost::asio::awaitable<void> start();

    void startUpload(const operation::StartUpload& start_upload);

    void cancelUpload(const std::string& task_id);

    void modifySettings(std::string_view key, const nlohmann::json& value);

    void exitApp();

    void feedback(core::Feedback&& feedback) { event_stream_.PostFeedback(std::move(feedback)); }

    void reportError(std::string_view operation, std::string_view message);
};

} // namespace pipecdn::ipc
