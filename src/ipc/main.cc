#include <boost/asio/io_context.hpp>
#include <core/constant/path.h>
#include <core/util/config.h>
#include <core/util/logger.h>
#include <exception>
#include <ipc/ipc_backend_service.h>
#include <ipc/ipc_event_stream.h>
#include <ipc/ipc_service.h>
#include <spdlog/spdlog.h>
#include <string>

using namespace pipecdn;
using namespace pipecdn::core;
namespace net = boost::asio;

int main(int argc, char* argv[]) {
    Logger logger(
#ifdef PIPECDN_DEBUG
        Logger::Level::debug,
#else
        Logger::Level::info,
#endif
        path::kLogDir);
    InitConfig();

    // Pipe names are passed by the frontend on Windows
    std::string stdin_pipe_name;
    std::string stdout_pipe_name;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--stdin-pipe-name" && i + 1 < argc) {
            stdin_pipe_name = argv[++i];
        } else if (arg == "--stdout-pipe-name" && i + 1 < argc) {
            stdout_pipe_name = argv[++i];
        }
    }

    try {
        net::io_context ioc;
        ipc::IpcEventStream event_stream;
        ipc::IpcService ipc_service(ioc, event_stream, stdin_pipe_name, stdout_pipe_name);
        ipc::IpcBackendService backend_service(ioc, event_stream);

        spdlog::info("pipecdn upload backend started");

        ipc_service.Start();     // communication with the frontend
        backend_service.Start(); // upload orchestration

        ioc.run();
    } catch (const std::exception& e) {
        spdlog::critical("Backend terminated: {}", e.what());
        SaveConfig();
        return 1;
    }

    SaveConfig();
    return 0;
}
