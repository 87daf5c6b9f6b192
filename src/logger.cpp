#include "logger.hpp"

#include <unistd.h>

#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <sstream>
#include <vector>

namespace logger {

const char* LevelName(Level level) {
    switch (level) {
        case Level::DEBUG: return "DEBUG";
        case Level::INFO: return "INFO";
        case Level::WARNING: return "WARNING";
        case Level::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    init();
    if (config_.async_mode) {
        start_async_thread();
    }
}

Logger::~Logger() {
    stop_async_thread();
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_stream_) {
        file_stream_->flush();
    }
}

void Logger::configure(const LogConfig& config) {
    bool was_async = async_thread_.joinable();
    if (was_async && !config.async_mode) {
        stop_async_thread();
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        config_ = config;
        min_level_.store(config.min_level);
        file_stream_.reset();
        init();
    }
    if (config.async_mode && !async_thread_.joinable()) {
        stop_flag_ = false;
        start_async_thread();
    }
}

void Logger::log(Level level, const char* file, const char* func, int line, const char* fmt, ...) {
    if (!enabled(level)) return;
    if (!init_success_) return;

    char buffer[256];
    va_list args;
    va_start(args, fmt);
    va_list retry;
    va_copy(retry, args);
    int needed = vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);

    std::string message;
    if (needed < 0) {
        message = fmt;
    } else if (static_cast<size_t>(needed) < sizeof(buffer)) {
        message.assign(buffer, static_cast<size_t>(needed));
    } else {
        std::vector<char> heap(static_cast<size_t>(needed) + 1);
        vsnprintf(heap.data(), heap.size(), fmt, retry);
        message.assign(heap.data(), static_cast<size_t>(needed));
    }
    va_end(retry);

    auto log_entry = format_log(level, file, func, line, message);

    if (config_.async_mode) {
        enqueue_log(std::move(log_entry));
    } else {
        write_log(log_entry);
    }
}

void Logger::init() {
    namespace fs = std::filesystem;

    try {
        if (config_.use_stdout) {
            init_success_ = true;
            return;
        }

        if (!fs::exists(config_.log_dir)) {
            fs::create_directories(config_.log_dir);
        }

        open_new_log_file();
        rotate_log_files();
    } catch (const std::exception& e) {
        init_success_ = false;
        std::cerr << "Logger initialization failed: " << e.what() << std::endl;
    }
}

void Logger::rotate_log_files() {
    namespace fs = std::filesystem;

    if (!file_stream_) return;

    file_stream_->flush();
    std::error_code ec;
    auto size = fs::file_size(current_log_path_, ec);
    if (ec || size < config_.max_file_size) {
        return;
    }

    file_stream_->close();
    for (size_t i = config_.max_files; i-- > 0;) {
        auto old_path = get_log_path(i);
        if (!fs::exists(old_path)) continue;
        if (i + 1 >= config_.max_files) {
            fs::remove(old_path);
        } else {
            fs::rename(old_path, get_log_path(i + 1));
        }
    }
    open_new_log_file();
}

std::filesystem::path Logger::get_log_path(size_t index) const {
    namespace fs = std::filesystem;
    auto base_name = "chunk_cache." + std::to_string(getpid()) + ".log";
    if (index == 0) return fs::path(config_.log_dir) / base_name;
    return fs::path(config_.log_dir) / (base_name + "." + std::to_string(index));
}

void Logger::open_new_log_file() {
    current_log_path_ = get_log_path(0);
    file_stream_ = std::make_unique<std::ofstream>(
        current_log_path_, std::ios::out | std::ios::app);
    init_success_ = file_stream_->is_open();
}

std::string Logger::format_log(Level level, const char* file, const char* func, int line,
                               const std::string& message) const {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&t, &local);
    char time_str[20];
    std::strftime(time_str, sizeof(time_str), "%Y%m%d%H%M%S", &local);

    std::ostringstream oss;
    oss << "[" << time_str << "] "
        << "[" << LevelName(level) << "] "
        << "[" << getpid() << "] "
        << "[" << file << ":" << func << ":" << line << "] "
        << message << "\n";
    return oss.str();
}

void Logger::write_log(const std::string& log_entry) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (config_.use_stdout) {
        std::cout << log_entry;
        return;
    }

    if (file_stream_ && file_stream_->is_open()) {
        *file_stream_ << log_entry;
        rotate_log_files();
    }
}

void Logger::enqueue_log(std::string log_entry) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        log_queue_.push(std::move(log_entry));
    }
    queue_cv_.notify_one();
}

void Logger::start_async_thread() {
    async_thread_ = std::thread([this] { async_logging_thread(); });
}

void Logger::stop_async_thread() {
    stop_flag_ = true;
    queue_cv_.notify_one();
    if (async_thread_.joinable()) {
        async_thread_.join();
    }
}

void Logger::async_logging_thread() {
    for (;;) {
        std::vector<std::string> batch;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait_for(lock,
                std::chrono::milliseconds(config_.flush_interval_ms),
                [this] { return !log_queue_.empty() || stop_flag_; });

            while (!log_queue_.empty()) {
                batch.push_back(std::move(log_queue_.front()));
                log_queue_.pop();
            }
        }

        for (const auto& entry : batch) {
            write_log(entry);
        }

        // Drain whatever was queued before the stop request, then exit.
        if (stop_flag_ && batch.empty()) break;
    }
}

} // namespace logger
