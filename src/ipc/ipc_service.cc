#include <algorithm>
#include <utility> // std::exchange, used by boost/asio/awaitable.hpp (Boost 1.74)
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/endian/conversion.hpp>
#include <chrono>
#include <ipc/ipc_service.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <system_error>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace net = boost::asio;

namespace pipecdn::ipc {

namespace {

#ifdef _WIN32
HANDLE OpenPipe(const std::string& name, DWORD access) {
    std::wstring wide_name(name.begin(), name.end());
    HANDLE handle = CreateFileW(wide_name.c_str(),
                                access,
                                0,
                                NULL,
                                OPEN_EXISTING,
                                FILE_FLAG_OVERLAPPED,
                                NULL);
    if (handle == INVALID_HANDLE_VALUE) {
        DWORD error = GetLastError();
        spdlog::error("Failed to connect to pipe '{}', error {}", name, error);
        throw std::runtime_error("Failed to connect to pipe " + name);
    }
    return handle;
}
#endif

bool IsPipeClosed(const boost::system::error_code& ec) {
    return ec == net::error::eof || ec == net::error::connection_reset
           || ec == net::error::connection_aborted || ec == net::error::broken_pipe;
}

net::awaitable<void> Backoff() {
    net::steady_timer timer(co_await net::this_coro::executor, std::chrono::milliseconds(100));
    co_await timer.async_wait(net::use_awaitable);
}

void LogException(std::exception_ptr e) {
    if (!e) {
        return;
    }
    try {
        std::rethrow_exception(e);
    } catch (const std::exception& ex) {
        spdlog::error("Pipe communication exception: {}", ex.what());
    }
}

} // namespace

IpcService::IpcService(boost::asio::io_context& io_context,
                       IpcEventStream& event_stream,
                       const std::string& stdin_pipe_name,
                       const std::string& stdout_pipe_name)
#ifdef _WIN32
    : io_context_(io_context)
    , event_stream_(event_stream)
    , input_(io_context, OpenPipe(stdin_pipe_name, GENERIC_READ))
    , output_(io_context, OpenPipe(stdout_pipe_name, GENERIC_WRITE)) {
}
#else
    : IpcService(io_context, event_stream, ::dup(STDIN_FILENO), ::dup(STDOUT_FILENO)) {
    // Named pipes are only used on Windows, POSIX inherits stdin/stdout
    if (!stdin_pipe_name.empty() || !stdout_pipe_name.empty()) {
        spdlog::debug("Ignoring pipe names on this platform");
    }
}

IpcService::IpcService(boost::asio::io_context& io_context,
                       IpcEventStream& event_stream,
                       int input_fd,
                       int output_fd)
    : io_context_(io_context)
    , event_stream_(event_stream)
    , input_(io_context, input_fd)
    , output_(io_context, output_fd) {}
#endif

void IpcService::Start() {
    if (running_.exchange(true)) {
        return;
    }
    spdlog::info("Pipe communication started");

    net::co_spawn(io_context_, readMessageLoop(), LogException);
    net::co_spawn(io_context_, readEventStreamLoop(), LogException);
}

void IpcService::Stop() {
    running_ = false;
}

net::awaitable<void> IpcService::SendMessage(const std::string& type, const nlohmann::json& data) {
    try {
        nlohmann::json message = {{"feedback", type},
                                  {"data", data},
                                  {"timestamp",
                                   std::chrono::system_clock::now().time_since_epoch().count()}};
        std::string body = message.dump();
        spdlog::debug("Sending message: {}", body);

        std::uint32_t length_be = boost::endian::native_to_big(
            static_cast<std::uint32_t>(body.size()));
        co_await net::async_write(output_,
                                  net::buffer(&length_be, sizeof(length_be)),
                                  net::use_awaitable);
        co_await net::async_write(output_, net::buffer(body), net::use_awaitable);
    } catch (const std::exception& e) {
        spdlog::error("Failed to send message: {}", e.what());
    }
}

std::optional<Operation> IpcService::ParseMessage(const std::string& message) {
    auto json = nlohmann::json::parse(message, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        spdlog::error("Invalid message: not a JSON object");
        return std::nullopt;
    }
    auto name = json.find("operation");
    if (name == json.end() || !name->is_string()) {
        spdlog::error("Invalid message format: missing operation field");
        return std::nullopt;
    }
    // Unknown names would silently map to the first enumerator
    auto type = name->get<OperationType>();
    if (nlohmann::json(type) != *name) {
        spdlog::error("Unknown operation \"{}\"", name->get<std::string>());
        return std::nullopt;
    }
    auto data = json.find("data");
    return Operation{
        .type = type,
        .data = data != json.end() ? *data : nlohmann::json(),
    };
}

net::awaitable<void> IpcService::readMessageLoop() {
    spdlog::info("Starting read message loop");
    std::vector<char> body;

    while (running_) {
        bool backoff = false;
        try {
            std::uint32_t length_be = 0;
            co_await net::async_read(input_,
                                     net::buffer(&length_be, sizeof(length_be)),
                                     net::use_awaitable);
            std::uint32_t length = boost::endian::big_to_native(length_be);
            if (length > kMaxMessageSize) {
                spdlog::error("Message too large: {} bytes, discarding it", length);
                co_await discardBytes(length);
                event_stream_.PostFeedback(core::Feedback{
                    .type = core::FeedbackType::kError,
                    .data = {{"error", "message_too_large"},
                             {"message", "Message exceeds the size limit"}},
                });
            } else {
                body.resize(length);
                co_await net::async_read(input_, net::buffer(body), net::use_awaitable);
                handleMessage(std::string(body.begin(), body.end()));
            }
        } catch (const boost::system::system_error& e) {
            if (IsPipeClosed(e.code())) {
                spdlog::info("Pipe closed, exiting read loop");
                running_ = false;
                break;
            }
            spdlog::error("Pipe read error: {} (code: {})", e.what(), e.code().value());
            backoff = true;
        }
        if (backoff) {
            co_await Backoff();
        }
    }
    spdlog::info("Exiting read message loop");
}

net::awaitable<void> IpcService::discardBytes(std::size_t count) {
    std::vector<char> scratch(std::min(count, kDiscardChunkSize));
    while (count > 0) {
        auto chunk = std::min(count, scratch.size());
        co_await net::async_read(input_, net::buffer(scratch.data(), chunk), net::use_awaitable);
        count -= chunk;
    }
}

net::awaitable<void> IpcService::readEventStreamLoop() {
    spdlog::info("Starting read event stream loop");
    auto executor = co_await net::this_coro::executor;
    net::steady_timer timer(executor);

    while (running_) {
        auto feedback = event_stream_.PollFeedback();
        if (!feedback) {
            timer.expires_after(std::chrono::milliseconds(10));
            co_await timer.async_wait(net::use_awaitable);
            continue;
        }
        std::string type = nlohmann::json(feedback->type).get<std::string>();
        spdlog::debug("Processing feedback: {}", type);
        co_await SendMessage(type, feedback->data);
    }
    spdlog::info("Exiting read event stream loop");
}

void IpcService::handleMessage(const std::string& message) {
    if (auto operation = ParseMessage(message); operation) {
        event_stream_.PostOperation(std::move(*operation));
        return;
    }
    event_stream_.PostFeedback(core::Feedback{
        .type = core::FeedbackType::kError,
        .data = {{"error", "message_processing_failed"},
                 {"message", "Failed to process message"}},
    });
}

} // namespace pipecdn::ipc
