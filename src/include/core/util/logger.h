#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <spdlog/async_logger.h>
#include <spdlog/details/thread_pool.h>
#include <spdlog/spdlog.h>
#include <string_view>

namespace sftpgate {

/**
 * @brief Process-wide logger, installed as spdlog's default
 *
 * Writes to a daily file `<log_dir>/sftpgate.log` and to colored stdout. Records are
 * queued and flushed by a background thread. Release builds keep stdout at warn and above.
 * Destroying the Logger flushes and shuts spdlog down, so it should outlive every worker.
 */
class Logger {
public:
    using Level = spdlog::level::level_enum;

    Logger(Level level,
           const std::filesystem::path& log_dir,
           std::size_t queue_size = 8192,
           std::size_t thread_count = 1);
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // "trace", "debug", "info", "warn", "error", "critical" or "off". Unknown names map to info.
    static Level ParseLevel(std::string_view name);

    const std::shared_ptr<spdlog::async_logger>& logger() const { return logger_; }
    [[nodiscard]] Level level() const { return logger_->level(); }
    void set_level(Level level) { logger_->set_level(level); }

private:
    std::shared_ptr<spdlog::details::thread_pool> thread_pool_;
    std::shared_ptr<spdlog::async_logger> logger_;
};

} // namespace sftpgate
