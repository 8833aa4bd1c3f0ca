#include <chrono>
#include <core/util/logger.h>
#include <cstdio>
#include <ctime>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <string>

namespace sftpgate {

namespace {

constexpr const char* kLoggerName = "sftpgate";
constexpr const char* kFilePattern = "[%Y-%m-%d %H:%M:%S.%e] [%t] [%l] %v";
constexpr const char* kConsolePattern = "\033[36m[%Y-%m-%d %H:%M:%S.%e] \033[92m[%n] \033[0m%^[%l]%$ %v";

// Marks where each process run starts and ends in the daily file.
void stampFile(std::FILE* file, const char* what, const spdlog::filename_t& filename) {
    if (file == nullptr) {
        return;
    }
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    char stamp[32];
    std::tm tm{};
    localtime_r(&now, &tm);
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm);
    std::fprintf(file, "==== %s %s (%s) ====\n", what, filename.c_str(), stamp);
}

} // namespace

Logger::Logger(Level level,
               const std::filesystem::path& log_dir,
               std::size_t queue_size,
               std::size_t thread_count) {
    std::error_code dir_error;
    std::filesystem::create_directories(log_dir, dir_error);

    spdlog::file_event_handlers handlers;
    handlers.after_open = [](const spdlog::filename_t& filename, std::FILE* file) {
        stampFile(file, "log opened", filename);
    };
    handlers.before_close = [](const spdlog::filename_t& filename, std::FILE* file) {
        stampFile(file, "log closed", filename);
    };

    auto file_sink = std::make_shared<spdlog::sinks::daily_file_sink_mt>(
        (log_dir / "sftpgate.log").string(), 0, 0, false, 0, handlers);
    file_sink->set_pattern(kFilePattern);

    auto stdout_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    stdout_sink->set_pattern(kConsolePattern);
#ifdef SFTPGATE_RELEASE
    stdout_sink->set_level(Level::warn);
#endif

    thread_pool_ = std::make_shared<spdlog::details::thread_pool>(queue_size, thread_count);
    logger_ = std::make_shared<spdlog::async_logger>(kLoggerName,
                                                     spdlog::sinks_init_list{file_sink,
                                                                             stdout_sink},
                                                     thread_pool_,
                                                     spdlog::async_overflow_policy::block);
    logger_->set_level(level);
    logger_->flush_on(Level::warn);
    logger_->set_error_handler([](const std::string& msg) {
        std::fprintf(stderr, "[sftpgate] logger error: %s\n", msg.c_str());
    });
    spdlog::set_default_logger(logger_);

    if (dir_error) {
        spdlog::warn("Could not create log directory {}: {}", log_dir.string(), dir_error.message());
    }
}

Logger::~Logger() {
    spdlog::shutdown();
}

Logger::Level Logger::ParseLevel(std::string_view name) {
    auto level = spdlog::level::from_str(std::string(name));
    if (level == Level::off && name != "off") {
        return Level::info;
    }
    return level;
}

} // namespace sftpgate
