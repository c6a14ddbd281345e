#include "logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace dualattn {
namespace core {

LogLevel parseLogLevel(const std::string& name, LogLevel fallback) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARNING;
    if (upper == "ERROR") return LogLevel::LOAD_ERROR;
    if (upper == "FATAL") return LogLevel::FATAL;
    return fallback;
}

Logger::Logger()
    : current_level_(LogLevel::INFO)
    , console_output_(true) {
}

Logger::~Logger() {
    closeLogFile();
}

Logger& Logger::getInstance() {
    static Logger instance;
    static std::once_flag once;
    std::call_once(once, [] {
        if (const char* env = std::getenv("DUALATTN_LOG_LEVEL")) {
            instance.setLogLevel(parseLogLevel(env, LogLevel::INFO));
        }
    });
    return instance;
}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_level_ = level;
}

LogLevel Logger::getLogLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_level_;
}

bool Logger::isEnabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= current_level_;
}

bool Logger::setLogFile(const std::string& file_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_) {
        log_file_->close();
        log_file_.reset();
        log_file_path_.clear();
    }
    try {
        std::filesystem::path path(file_path);
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "Error creating log directory: " << e.what() << std::endl;
        return false;
    }
    auto file = std::make_unique<std::ofstream>(file_path, std::ios::app);
    if (!file->is_open()) {
        std::cerr << "Failed to open log file: " << file_path << std::endl;
        return false;
    }
    log_file_ = std::move(file);
    log_file_path_ = file_path;
    return true;
}

void Logger::closeLogFile() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_) {
        log_file_->flush();
        log_file_->close();
        log_file_.reset();
    }
    log_file_path_.clear();
}

void Logger::setConsoleOutput(bool enable) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_output_ = enable;
}

void Logger::setSink(Sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < current_level_) {
        return;
    }

    const std::string line =
        "[" + currentTimestamp() + "] [" + getLevelString(level) + "] " + message;

    if (console_output_) {
        std::ostream& out = level >= LogLevel::LOAD_ERROR ? std::cerr : std::cout;
        out << line << std::endl;
    }
    if (log_file_) {
        *log_file_ << line << '\n';
        if (level >= LogLevel::LOAD_ERROR) {
            log_file_->flush();
        }
    }
    if (sink_) {
        sink_(level, line);
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (console_output_) {
        std::cout.flush();
        std::cerr.flush();
    }
    if (log_file_) {
        log_file_->flush();
    }
}

std::string Logger::currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t);
#else
    localtime_r(&time_t, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

std::string Logger::getLevelString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:      return "DEBUG";
        case LogLevel::INFO:       return "INFO ";
        case LogLevel::WARNING:    return "WARN ";
        case LogLevel::LOAD_ERROR: return "ERROR";
        case LogLevel::FATAL:      return "FATAL";
        default:                   return "UNKNW";
    }
}

} // namespace core
} // namespace dualattn
