// =================================================================
// src/ArgoAgent/Logger.cpp
// =================================================================
// Implementation for the logging system.

#include "ArgoAgent/Logger.hpp"
#include <iostream>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <algorithm>

namespace ArgoAgent {

static constexpr long kSlowRequestMs = 60000;

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    flush();
}

void Logger::initialize(const std::string& log_dir, size_t max_log_size, size_t max_log_files) {
    m_log_dir = log_dir;
    m_max_log_size = max_log_size;
    m_max_log_files = max_log_files;
    m_current_log_size = 0;
    m_initialized = true;

    m_current_log_file.reset();
    if (m_file_enabled) {
        ensureLogDirectory();
        m_current_log_filename = generateLogFilename();
        m_current_log_file = std::make_unique<std::ofstream>(m_current_log_filename, std::ios::app);
    }

    debug("Logger", "Logging system initialized", m_log_dir);
}

void Logger::setConsoleLogLevel(LogLevel level) {
    m_console_level = level;
}

void Logger::setFileLogLevel(LogLevel level) {
    m_file_level = level;
}

void Logger::setConsoleLogging(bool enabled) {
    m_console_enabled = enabled;
}

void Logger::setFileLogging(bool enabled) {
    m_file_enabled = enabled;
    if (!enabled) {
        flush();
        m_current_log_file.reset();
    }
}

void Logger::debug(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::DEBUG, component, message, context));
}

void Logger::info(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::INFO, component, message, context));
}

void Logger::warning(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::WARNING, component, message, context));
}

void Logger::error(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::ERROR, component, message, context));
}

void Logger::critical(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::CRITICAL, component, message, context));
}

void Logger::logPathResolution(const std::string& spec, const std::string& kind,
                               const std::vector<std::string>& files) {
    std::ostringstream context;
    context << "Kind: " << kind << ", Files: " << files.size();

    debug("PathResolver", "Resolved '" + spec + "'", context.str());

    if (!files.empty()) {
        std::ostringstream file_list;
        for (size_t i = 0; i < std::min(size_t(10), files.size()); i++) {
            if (i > 0) file_list << ", ";
            file_list << files[i];
        }
        if (files.size() > 10) {
            file_list << " and " << (files.size() - 10) << " more";
        }
        debug("PathResolver", "Files: " + file_list.str());
    }
}

void Logger::logContextAggregation(size_t files_resolved, size_t files_included,
                                   size_t files_skipped, size_t tokens_counted,
                                   size_t tokens_unknown) {
    std::ostringstream context;
    context << "Resolved: " << files_resolved << ", ";
    context << "Included: " << files_included << ", ";
    context << "Skipped: " << files_skipped << ", ";
    context << "Tokens: " << tokens_counted;

    info("ContextAggregator", "Context aggregation completed", context.str());

    if (tokens_unknown > 0) {
        warning("ContextAggregator",
                "Some entries could not be measured and are not counted against the budget",
                "Unmeasured entries: " + std::to_string(tokens_unknown));
    }
}

void Logger::logLlmInteraction(const std::string& model, size_t response_size,
                               long duration_ms, int attempts, bool success) {
    std::string details = "model=" + model + " attempts=" + std::to_string(attempts);
    if (!success) {
        error("Request", "Argo request failed", details);
        return;
    }

    details += " response=" + std::to_string(response_size) + " chars elapsed=" +
               std::to_string(duration_ms) + "ms";
    info("Request", "Argo request completed", details);

    // Retried or slow
    if (attempts > 1 || duration_ms > kSlowRequestMs) {
        warning("Request", "Slow request to " + model, details);
    }
}

void Logger::logSessionStart(const std::string& model, const std::string& user_prompt) {
    debug("Session", "Prompt session for " + model,
          "prompt=" + std::to_string(user_prompt.size()) + " chars");
}

void Logger::logSessionEnd(int exit_code, long duration_ms) {
    std::string details = "exit=" + std::to_string(exit_code) + " elapsed=" +
                          std::to_string(duration_ms) + "ms";
    if (exit_code != 0) {
        error("Session", "Prompt session failed", details);
    } else {
        debug("Session", "Prompt session finished", details);
    }
}

void Logger::flush() {
    if (m_current_log_file && m_current_log_file->is_open()) {
        m_current_log_file->flush();
    }
}

std::string Logger::getLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRIT";
        default: return "UNKNOWN";
    }
}

std::string Logger::getLevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[90m";     // Dark gray
        case LogLevel::INFO: return "\033[36m";      // Cyan
        case LogLevel::WARNING: return "\033[33m";   // Yellow
        case LogLevel::ERROR: return "\033[31m";     // Red
        case LogLevel::CRITICAL: return "\033[91m";  // Bright red
        default: return "\033[0m";                   // Reset
    }
}

void Logger::logEntry(const LogEntry& entry) {
    if (!m_initialized) {
        initialize();
    }

    writeToConsole(entry);
    writeToFile(entry);
}

void Logger::writeToConsole(const LogEntry& entry) {
    if (!m_console_enabled || entry.level < m_console_level) {
        return;
    }

    std::cerr << formatEntry(entry, true) << std::endl;
}

void Logger::writeToFile(const LogEntry& entry) {
    if (!m_file_enabled || !m_current_log_file || entry.level < m_file_level) {
        return;
    }

    rotateLogsIfNeeded();

    std::string formatted = formatEntry(entry, false);
    *m_current_log_file << formatted << std::endl;
    m_current_log_size += formatted.length() + 1; // +1 for newline

    if (entry.level >= LogLevel::ERROR) {
        m_current_log_file->flush();
    }
}

std::string Logger::formatEntry(const LogEntry& entry, bool include_color) {
    std::ostringstream formatted;

    formatted << formatTimestamp(entry.timestamp) << " ";

    if (include_color) {
        formatted << getLevelColor(entry.level);
    }
    formatted << "[" << getLevelName(entry.level) << "]";
    if (include_color) {
        formatted << "\033[0m";
    }
    formatted << " ";

    formatted << entry.component << ": ";
    formatted << entry.message;

    if (!entry.context.empty()) {
        formatted << " (" << entry.context << ")";
    }

    return formatted.str();
}

void Logger::rotateLogsIfNeeded() {
    if (m_current_log_size < m_max_log_size) {
        return;
    }

    m_current_log_file.reset();

    m_current_log_filename = generateLogFilename();
    m_current_log_file = std::make_unique<std::ofstream>(m_current_log_filename);
    m_current_log_size = 0;

    try {
        std::vector<std::filesystem::path> log_files;
        for (const auto& entry : std::filesystem::directory_iterator(m_log_dir)) {
            if (entry.is_regular_file() && entry.path().extension() == ".log") {
                log_files.push_back(entry.path());
            }
        }

        // Newest first
        std::sort(log_files.begin(), log_files.end(),
                 [](const std::filesystem::path& a, const std::filesystem::path& b) {
                     return std::filesystem::last_write_time(a) > std::filesystem::last_write_time(b);
                 });

        for (size_t i = m_max_log_files; i < log_files.size(); i++) {
            std::filesystem::remove(log_files[i]);
        }

    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "[WARN] Log rotation failed: " << e.what() << std::endl;
    }
}

std::string Logger::formatTimestamp(const std::chrono::system_clock::time_point& time_point) {
    auto time_t = std::chrono::system_clock::to_time_t(time_point);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time_point.time_since_epoch()) % 1000;

    std::ostringstream oss;
    oss << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

void Logger::ensureLogDirectory() {
    std::error_code ec;
    std::filesystem::create_directories(m_log_dir, ec);
    if (ec) {
        std::cerr << "[ERROR] Cannot create log directory: " << ec.message() << std::endl;
        m_log_dir = ".";
    }
}

std::string Logger::generateLogFilename() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);

    std::ostringstream filename;
    filename << m_log_dir << "/argoagent_";
    filename << std::put_time(std::localtime(&time_t), "%Y%m%d_%H%M%S");
    filename << ".log";

    return filename.str();
}

} // namespace ArgoAgent
