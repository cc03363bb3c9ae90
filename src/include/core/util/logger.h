#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <memory>
#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/details/thread_pool.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>

namespace pipecdn {

/**
 * @brief Process-wide logging for the upload backend.
 *
 * @details Installs an asynchronous default logger writing to a daily file
 * (`<log_dir>/pipecdn_YYYY-MM-DD.log`, a week kept) and to colored stderr.
 * Components log through the spdlog free functions. Nothing is logged to
 * stdout, which carries the pipe protocol on POSIX. Release builds silence
 * the console entirely.
 */
class Logger {
public:
    using Level = spdlog::level::level_enum;

    static constexpr std::uint16_t kKeptLogFiles = 7;

    Logger(Level level,
           const std::filesystem::path& log_dir,
           std::size_t queue_size = 8192,
           std::size_t worker_count = 1) {
        spdlog::file_event_handlers handlers;
        handlers.after_open = [](const spdlog::filename_t& filename, std::FILE* fstream) {
            writeMarker(fstream, "Upload backend started", filename);
        };
        handlers.before_close = [](const spdlog::filename_t& filename, std::FILE* fstream) {
            writeMarker(fstream, "Upload backend stopped", filename);
        };

        auto file_sink = std::make_shared<spdlog::sinks::daily_file_sink_mt>(
            (log_dir / "pipecdn.log").string(), 0, 0, false, kKeptLogFiles, handlers);
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_pattern("\033[36m[%H:%M:%S.%e] \033[0m%^[%l]%$ [tid %t] %v");
#ifdef PIPECDN_RELEASE
        console_sink->set_level(Level::off);
#endif

        thread_pool_ = std::make_shared<spdlog::details::thread_pool>(queue_size, worker_count);
        logger_ = std::make_shared<spdlog::async_logger>("pipecdn",
                                                         spdlog::sinks_init_list{file_sink,
                                                                                 console_sink},
                                                         thread_pool_,
                                                         spdlog::async_overflow_policy::block);
        logger_->set_level(level);
        // Task failures should reach the file even if the process dies right after
        logger_->flush_on(Level::warn);
        logger_->set_error_handler([](const std::string& msg) {
            std::fprintf(stderr, "pipecdn logger error: %s\n", msg.c_str());
        });
        spdlog::set_default_logger(logger_);
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    ~Logger() { spdlog::shutdown(); }

    [[nodiscard]] Level level() const { return logger_->level(); }
    void set_level(Level level) { logger_->set_level(level); }

private:
    std::shared_ptr<spdlog::details::thread_pool> thread_pool_;
    std::shared_ptr<spdlog::async_logger> logger_;

    static void writeMarker(std::FILE* fstream, const char* what, const spdlog::filename_t& file) {
        if (!fstream) {
            return;
        }
        auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::fprintf(fstream, "==== %s (%s) %s", what, file.c_str(), std::ctime(&now));
    }
};

} // namespace pipecdn
