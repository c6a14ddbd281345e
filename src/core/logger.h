#pragma once

#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace dualattn {
namespace core {

/**
 * @brief Log level enumeration
 */
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    LOAD_ERROR = 3,
    FATAL = 4
};

/**
 * @brief Parse a level name ("DEBUG", "info", "warn", "error", ...)
 * @param name Level name, case-insensitive
 * @param fallback Level returned for unknown names
 */
LogLevel parseLogLevel(const std::string& name, LogLevel fallback = LogLevel::INFO);

/**
 * @brief Thread-safe logger writing "[timestamp] [LEVEL] message" lines
 *
 * Lines go to the console (errors and above to stderr), to an optional log
 * file and to an optional sink callback, in that order.
 */
class Logger {
public:
    /// Receives every line that passes the level filter, already formatted
    using Sink = std::function<void(LogLevel level, const std::string& line)>;

    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Process-wide logger used by the attention operators
     *
     * Created on first use with its level taken from DUALATTN_LOG_LEVEL
     * when that variable is set.
     */
    static Logger& getInstance();

    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;

    /**
     * @brief Whether a message at this level would be written
     *
     * Lets callers skip building expensive messages on hot paths.
     */
    bool isEnabled(LogLevel level) const;

    /**
     * @brief Append to a log file, creating parent directories
     * @return false if the file cannot be opened; file output is then off
     */
    bool setLogFile(const std::string& file_path);
    void closeLogFile();

    void setConsoleOutput(bool enable);

    /**
     * @brief Install or clear (nullptr) the sink callback
     *
     * The sink runs under the logger lock and must not log itself.
     */
    void setSink(Sink sink);

    void log(LogLevel level, const std::string& message);
    void debug(const std::string& message) { log(LogLevel::DEBUG, message); }
    void info(const std::string& message) { log(LogLevel::INFO, message); }
    void warning(const std::string& message) { log(LogLevel::WARNING, message); }
    void error(const std::string& message) { log(LogLevel::LOAD_ERROR, message); }
    void fatal(const std::string& message) { log(LogLevel::FATAL, message); }

    void flush();

    /**
     * @brief Level tag as printed, padded to five characters
     */
    static std::string getLevelString(LogLevel level);

private:
    static std::string currentTimestamp();

private:
    LogLevel current_level_;                   ///< Minimum level written
    bool console_output_;                      ///< Whether to output to console
    std::string log_file_path_;                ///< Log file path, empty when off
    std::unique_ptr<std::ofstream> log_file_;  ///< Log file stream
    Sink sink_;                                ///< Optional line receiver
    mutable std::mutex mutex_;                 ///< Guards all members
};

} // namespace core
} // namespace dualattn
