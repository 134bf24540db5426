#ifndef XF_ERROR_H_
#define XF_ERROR_H_

#include <stdexcept>
#include <string>
#include <sstream>
#include <chrono>
#include <atomic>
#include <functional>
#include <fstream>
#include <mutex>
#include <deque>
#include <vector>
#include <memory>
#include <thread>

namespace xform {

/**
 * @brief Error raised when a transform is requested with invalid input
 */
class XFError : public std::runtime_error {
public:
    enum class Severity {
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };

    enum class Category {
        GENERAL,
        PRECONDITION,
        NUMERIC,
        CONFIG
    };

    XFError(Category category, Severity severity, const std::string& message,
            const std::string& context = "", const std::string& suggestion = "");

    Category getCategory() const { return category_; }
    Severity getSeverity() const { return severity_; }
    const std::string& getContext() const { return context_; }
    const std::string& getSuggestion() const { return suggestion_; }
    auto getTimestamp() const { return timestamp_; }

    std::string getFormattedMessage() const;

private:
    Category category_;
    Severity severity_;
    std::string context_;
    std::string suggestion_;
    std::chrono::steady_clock::time_point timestamp_;
};

const char* categoryName(XFError::Category category);

/**
 * @brief Macro helpers for throwing specific errors
 */
#define XFORM_THROW_PRECONDITION_ERROR(msg, context, suggestion) \
    throw ::xform::XFError(::xform::XFError::Category::PRECONDITION, \
                           ::xform::XFError::Severity::ERROR, msg, context, suggestion)

#define XFORM_THROW_NUMERIC_ERROR(msg, context, suggestion) \
    throw ::xform::XFError(::xform::XFError::Category::NUMERIC, \
                           ::xform::XFError::Severity::ERROR, msg, context, suggestion)

#define XFORM_THROW_CONFIG_ERROR(msg, context, suggestion) \
    throw ::xform::XFError(::xform::XFError::Category::CONFIG, \
                           ::xform::XFError::Severity::ERROR, msg, context, suggestion)

/**
 * @brief Process-wide logging with pluggable handlers
 */
class LogSystem {
public:
    enum class Level {
        TRACE = 0,
        DEBUG = 1,
        INFO = 2,
        WARN = 3,
        ERROR = 4,
        CRITICAL = 5
    };

    struct LogEntry {
        Level level;
        std::string message;
        std::string category;
        std::chrono::steady_clock::time_point timestamp;
        std::chrono::system_clock::time_point wall_time;    // shown when formatted
        std::thread::id thread_id;
        std::string file;
        int line;
        std::string function;
    };

    using LogHandler = std::function<void(const LogEntry&)>;

    static LogSystem& getInstance();

    static const char* levelName(Level level);

    /**
     * @brief Set minimum log level
     */
    void setLevel(Level level) { min_level_ = level; }
    Level getLevel() const { return min_level_; }

    bool isEnabled(Level level) const { return level >= getLevel(); }

    /**
     * @brief Add a log handler
     */
    void addHandler(LogHandler handler);

    /**
     * @brief Remove all handlers, the built-in console handler included
     *
     * A later setFileOutput() installs the file handler again.
     */
    void clearHandlers();

    /**
     * @brief Drop handlers and history and go back to console output at INFO
     */
    void reset();

    void log(Level level, const std::string& category, const std::string& message,
             const char* file = "", int line = 0, const char* function = "");

    /**
     * @brief Get recent log entries, oldest first
     */
    std::vector<LogEntry> getRecentEntries(std::size_t count = 100) const;

    void setConsoleOutput(bool enabled);

    /**
     * @brief Append every entry to the given file as well
     * @throws XFError (CONFIG) if the file cannot be opened
     */
    void setFileOutput(const std::string& filename);

    /**
     * @brief "[HH:MM:SS] [LEVEL] [category] message", stamped with the entry's wall time
     */
    static std::string formatEntry(const LogEntry& entry);

private:
    LogSystem();
    ~LogSystem() = default;

    void consoleHandler(const LogEntry& entry);
    void fileHandler(const LogEntry& entry);

    std::vector<LogHandler> handlers_;
    std::atomic<Level> min_level_{Level::INFO};
    mutable std::mutex mutex_;
    std::deque<LogEntry> history_;
    static constexpr std::size_t MAX_HISTORY_ENTRIES = 1000;

    std::atomic<bool> console_enabled_{true};
    std::unique_ptr<std::ofstream> log_file_;
    bool file_handler_installed_ = false;
};

/**
 * @brief Logging macros with automatic file/line information
 *
 * The message expression is only evaluated when the level is enabled.
 */
#define XFORM_LOG(level, category, message) \
    do { \
        if (::xform::LogSystem::getInstance().isEnabled(level)) { \
            ::xform::LogSystem::getInstance().log(level, category, message, \
                                                  __FILE__, __LINE__, __FUNCTION__); \
        } \
    } while (0)

#define XFORM_TRACE(category, message) XFORM_LOG(::xform::LogSystem::Level::TRACE, category, message)
#define XFORM_DEBUG(category, message) XFORM_LOG(::xform::LogSystem::Level::DEBUG, category, message)
#define XFORM_INFO(category, message) XFORM_LOG(::xform::LogSystem::Level::INFO, category, message)
#define XFORM_WARN(category, message) XFORM_LOG(::xform::LogSystem::Level::WARN, category, message)
#define XFORM_ERROR(category, message) XFORM_LOG(::xform::LogSystem::Level::ERROR, category, message)
#define XFORM_CRITICAL(category, message) XFORM_LOG(::xform::LogSystem::Level::CRITICAL, category, message)

} // namespace xform

#endif // XF_ERROR_H_
