#pragma once

#include <atomic>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <cstddef>
#include <cstdint>
#include <ipc/ipc_event_stream.h>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#ifdef _WIN32
#include <boost/asio/windows/stream_handle.hpp>
#else
#include <boost/asio/posix/stream_descriptor.hpp>
#endif

namespace pipecdn::ipc {

// Receives operations from the frontend process and posts them to
// IpcEventStream; polls feedback from IpcEventStream and writes it back.
// Every message is a 4-byte big-endian length followed by a JSON document.
// Only readEventStreamLoop writes to the pipe.
class IpcService {
public:
    static constexpr std::uint32_t kMaxMessageSize = 10 * 1024 * 1024;

    // Frames larger than kMaxMessageSize are read off the pipe in chunks of
    // this size and dropped
    static constexpr std::size_t kDiscardChunkSize = 64 * 1024;

    IpcService(boost::asio::io_context& io_context,
               IpcEventStream& event_stream,
               const std::string& stdin_pipe_name,
               const std::string& stdout_pipe_name);
#ifndef _WIN32
    // Takes ownership of both descriptors
    IpcService(boost::asio::io_context& io_context,
               IpcEventStream& event_stream,
               int input_fd,
               int output_fd);
#endif

    void Start();
    void Stop();

    boost::asio::awaitable<void> SendMessage(const std::string& type, const nlohmann::json& data);

    // {"operation": <name>, "data": <payload>}, nullopt for anything else
    static std::optional<Operation> ParseMessage(const std::string& message);

private:
    boost::asio::io_context& io_context_;
    IpcEventStream& event_stream_;
#ifdef _WIN32
    boost::asio::windows::stream_handle input_;
    boost::asio::windows::stream_handle output_;
#else
    boost::asio::posix::stream_descriptor input_;
    boost::asio::posix::stream_descriptor output_;
#endif
    std::atomic<bool> running_{false};

    boost::asio::awaitable<void> readMessageLoop();
    boost::asio::awaitable<void> discardBytes(std::size_t count);
    boost::asio::awaitable<void> readEventStreamLoop();
    void handleMessage(const std::string& message);
};

} // namespace pipecdn::ipc
