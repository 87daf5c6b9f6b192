#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace logger {

enum class Level {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

const char* LevelName(Level level);

struct LogConfig {
    std::string log_dir = "/tmp/.chunk_cache_log";
    bool use_stdout = false;
    Level min_level = Level::INFO;
    size_t max_file_size = 10 * 1024 * 1024;  // 10MB
    size_t max_files = 5;
    bool async_mode = true;
    size_t flush_interval_ms = 1000;
};

/**
 * @brief Process-wide logger used by the cache and its workers.
 *
 * Entries are formatted on the calling thread and written either directly or
 * by a background writer thread (async mode). File output rotates by size.
 */
class Logger {
public:
    static Logger& instance();

    void configure(const LogConfig& config);

    void log(Level level, const char* file, const char* func, int line, const char* fmt, ...)
        __attribute__((format(printf, 6, 7)));

    bool enabled(Level level) const { return level >= min_level_.load(); }

    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger();

    void init();
    void rotate_log_files();
    std::filesystem::path get_log_path(size_t index) const;
    void open_new_log_file();
    std::string format_log(Level level, const char* file, const char* func, int line,
                           const std::string& message) const;
    void write_log(const std::string& log_entry);
    void enqueue_log(std::string log_entry);
    void start_async_thread();
    void stop_async_thread();
    void async_logging_thread();

    LogConfig config_;
    std::atomic<Level> min_level_{Level::INFO};
    std::unique_ptr<std::ofstream> file_stream_;
    bool init_success_ = false;
    std::mutex mutex_;
    std::filesystem::path current_log_path_;

    // Async logging members
    std::queue<std::string> log_queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::thread async_thread_;
    std::atomic<bool> stop_flag_{false};
};

} // namespace logger

#define LOG_DEBUG(fmt, ...) \
    logger::Logger::instance().log(logger::Level::DEBUG, __FILE__, __FUNCTION__, __LINE__, fmt, ## __VA_ARGS__)

#define LOG_INFO(fmt, ...) \
    logger::Logger::instance().log(logger::Level::INFO, __FILE__, __FUNCTION__, __LINE__, fmt, ## __VA_ARGS__)

#define LOG_WARNING(fmt, ...) \
    logger::Logger::instance().log(logger::Level::WARNING, __FILE__, __FUNCTION__, __LINE__, fmt, ## __VA_ARGS__)

#define LOG_ERROR(fmt, ...) \
    logger::Logger::instance().log(logger::Level::ERROR, __FILE__, __FUNCTION__, __LINE__, fmt, ## __VA_ARGS__)
