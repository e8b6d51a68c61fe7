// =================================================================
// include/ArgoAgent/Logger.hpp
// =================================================================
// Header for console and rotating file logging.

#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <chrono>
#include <memory>

namespace ArgoAgent {

/**
 * @brief Log levels for message classification
 */
enum class LogLevel {
    DEBUG,      ///< Detailed debug information
    INFO,       ///< General information
    WARNING,    ///< Warning conditions
    ERROR,      ///< Error conditions
    CRITICAL    ///< Critical conditions
};

/**
 * @brief Log entry structure
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string component;
    std::string message;
    std::string context;

    LogEntry(LogLevel lvl, const std::string& comp, const std::string& msg, const std::string& ctx = "")
        : timestamp(std::chrono::system_clock::now()), level(lvl), component(comp), message(msg), context(ctx) {}
};

/**
 * @brief Process-wide logger with a console sink and a rotating file sink
 *
 * Console output goes to stderr so that the model response printed on
 * stdout can be piped on its own.
 */
class Logger {
public:
    /**
     * @brief Get the singleton logger instance
     * @return Reference to logger instance
     */
    static Logger& getInstance();

    /**
     * @brief Initialize logger with configuration
     * @param log_dir Directory for log files
     * @param max_log_size Maximum size per log file (bytes)
     * @param max_log_files Maximum number of log files to keep
     */
    void initialize(const std::string& log_dir = ".argoagent/logs",
                   size_t max_log_size = 10 * 1024 * 1024,  // 10MB
                   size_t max_log_files = 5);

    /**
     * @brief Set minimum log level for console output
     */
    void setConsoleLogLevel(LogLevel level);

    /**
     * @brief Set minimum log level for file output
     */
    void setFileLogLevel(LogLevel level);

    /**
     * @brief Enable or disable console logging
     */
    void setConsoleLogging(bool enabled);

    /**
     * @brief Enable or disable the log file sink
     *
     * Disabling closes the current file. Used by tests and by
     * `--number-of-tokens` runs that should leave nothing behind.
     */
    void setFileLogging(bool enabled);

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");
    void critical(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log how one path specification was resolved
     * @param spec The specification as given by the user
     * @param kind Resolution kind ("pattern", "directory", "file", "missing")
     * @param files Files the specification resolved to
     */
    void logPathResolution(const std::string& spec, const std::string& kind,
                           const std::vector<std::string>& files);

    /**
     * @brief Log context aggregation statistics
     * @param files_resolved Files produced by path resolution
     * @param files_included Files whose text made it into the context
     * @param files_skipped Files skipped because extraction failed
     * @param tokens_counted Tokens counted against the budget
     * @param tokens_unknown Entries whose token count could not be measured
     */
    void logContextAggregation(size_t files_resolved, size_t files_included,
                               size_t files_skipped, size_t tokens_counted,
                               size_t tokens_unknown);

    /**
     * @brief Log LLM request/response metadata
     * @param model Model name
     * @param response_size Response size in characters
     * @param duration_ms Request duration in milliseconds
     * @param attempts Number of network attempts made
     * @param success Whether request succeeded
     */
    void logLlmInteraction(const std::string& model, size_t response_size,
                           long duration_ms, int attempts, bool success);

    /**
     * @brief Log session start
     */
    void logSessionStart(const std::string& model, const std::string& user_prompt);

    /**
     * @brief Log session end
     */
    void logSessionEnd(int exit_code, long duration_ms);

    /**
     * @brief Flush all log buffers
     */
    void flush();

    static std::string getLevelName(LogLevel level);
    static std::string getLevelColor(LogLevel level);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string m_log_dir;
    size_t m_max_log_size = 10 * 1024 * 1024;
    size_t m_max_log_files = 5;
    LogLevel m_console_level = LogLevel::INFO;
    LogLevel m_file_level = LogLevel::DEBUG;
    bool m_console_enabled = true;
    bool m_file_enabled = true;
    bool m_initialized = false;

    std::unique_ptr<std::ofstream> m_current_log_file;
    std::string m_current_log_filename;
    size_t m_current_log_size = 0;

    void logEntry(const LogEntry& entry);
    void writeToConsole(const LogEntry& entry);
    void writeToFile(const LogEntry& entry);

    /**
     * @brief Format log entry for output
     * @param entry Log entry
     * @param include_color Whether to include color codes
     * @return Formatted string
     */
    std::string formatEntry(const LogEntry& entry, bool include_color = false);

    /**
     * @brief Start a new file once the current one reaches the size limit,
     * keeping at most m_max_log_files files in the directory
     */
    void rotateLogsIfNeeded();

    std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point);
    void ensureLogDirectory();
    std::string generateLogFilename();
};

// Convenience macros for logging
#define LOG_DEBUG(component, message) \
    ArgoAgent::Logger::getInstance().debug(component, message)

#define LOG_INFO(component, message) \
    ArgoAgent::Logger::getInstance().info(component, message)

#define LOG_WARNING(component, message) \
    ArgoAgent::Logger::getInstance().warning(component, message)

#define LOG_ERROR(component, message) \
    ArgoAgent::Logger::getInstance().error(component, message)

#define LOG_CRITICAL(component, message) \
    ArgoAgent::Logger::getInstance().critical(component, message)

} // namespace ArgoAgent
