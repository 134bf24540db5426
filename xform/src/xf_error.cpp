#include "xf_error.h"
#include <iostream>
#include <iomanip>
#include <algorithm>
#include <ctime>

namespace xform {

// XFError implementation
XFError::XFError(Category category, Severity severity, const std::string& message,
                 const std::string& context, const std::string& suggestion)
    : std::runtime_error(message), category_(category), severity_(severity),
      context_(context), suggestion_(suggestion),
      timestamp_(std::chrono::steady_clock::now()) {
}

std::string XFError::getFormattedMessage() const {
    std::ostringstream oss;
    oss << "[" << categoryName(category_) << "] " << what();
    if (!context_.empty()) {
        oss << " (Context: " << context_ << ")";
    }
    if (!suggestion_.empty()) {
        oss << " (Suggestion: " << suggestion_ << ")";
    }
    return oss.str();
}

const char* categoryName(XFError::Category category) {
    switch (category) {
        case XFError::Category::GENERAL:      return "GENERAL";
        case XFError::Category::PRECONDITION: return "PRECONDITION";
        case XFError::Category::NUMERIC:      return "NUMERIC";
        case XFError::Category::CONFIG:       return "CONFIG";
    }
    return "UNKNOWN";
}

// LogSystem implementation
LogSystem& LogSystem::getInstance() {
    static LogSystem instance;
    return instance;
}

LogSystem::LogSystem() {
    addHandler([this](const LogEntry& entry) { consoleHandler(entry); });
}

const char* LogSystem::levelName(Level level) {
    switch (level) {
        case Level::TRACE:    return "TRACE";
        case Level::DEBUG:    return "DEBUG";
        case Level::INFO:     return "INFO";
        case Level::WARN:     return "WARN";
        case Level::ERROR:    return "ERROR";
        case Level::CRITICAL: return "CRITICAL";
    }
    return "UNKNOWN";
}

void LogSystem::addHandler(LogHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.push_back(std::move(handler));
}

void LogSystem::clearHandlers() {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.clear();
    file_handler_installed_ = false;
}

void LogSystem::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.clear();
    handlers_.push_back([this](const LogEntry& entry) { consoleHandler(entry); });
    history_.clear();
    log_file_.reset();
    file_handler_installed_ = false;
    min_level_ = Level::INFO;
    console_enabled_ = true;
}

void LogSystem::log(Level level, const std::string& category, const std::string& message,
                    const char* file, int line, const char* function) {
    if (level < min_level_) {
        return;
    }

    LogEntry entry;
    entry.level = level;
    entry.message = message;
    entry.category = category;
    entry.timestamp = std::chrono::steady_clock::now();
    entry.wall_time = std::chrono::system_clock::now();
    entry.thread_id = std::this_thread::get_id();
    entry.file = file ? file : "";
    entry.line = line;
    entry.function = function ? function : "";

    std::lock_guard<std::mutex> lock(mutex_);

    if (history_.size() == MAX_HISTORY_ENTRIES) {
        history_.pop_front();
    }
    history_.push_back(entry);

    for (const auto& handler : handlers_) {
        try {
            handler(entry);
        } catch (const std::exception& e) {
            // A failing handler must not take the caller down with it
            std::cerr << "xform: log handler failed: " << e.what() << std::endl;
        }
    }
}

std::vector<LogSystem::LogEntry> LogSystem::getRecentEntries(std::size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::size_t n = std::min(count, history_.size());
    return std::vector<LogEntry>(history_.end() - static_cast<std::ptrdiff_t>(n), history_.end());
}

void LogSystem::setConsoleOutput(bool enabled) {
    console_enabled_ = enabled;
}

void LogSystem::setFileOutput(const std::string& filename) {
    auto file = std::make_unique<std::ofstream>(filename, std::ios::app);
    if (!file->is_open()) {
        XFORM_THROW_CONFIG_ERROR("Cannot open log file", filename,
                                 "Check that the directory exists and is writable");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    log_file_ = std::move(file);
    if (!file_handler_installed_) {
        handlers_.push_back([this](const LogEntry& entry) { fileHandler(entry); });
        file_handler_installed_ = true;
    }
}

std::string LogSystem::formatEntry(const LogEntry& entry) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(entry.wall_time);

    std::ostringstream oss;
    oss << "[" << std::put_time(std::localtime(&seconds), "%H:%M:%S")
        << "] [" << levelName(entry.level) << "] [" << entry.category << "] "
        << entry.message;
    return oss.str();
}

void LogSystem::consoleHandler(const LogEntry& entry) {
    if (!console_enabled_) {
        return;
    }
    std::cout << formatEntry(entry) << std::endl;
}

// Called with mutex_ held
void LogSystem::fileHandler(const LogEntry& entry) {
    if (!log_file_ || !log_file_->is_open()) {
        return;
    }
    *log_file_ << formatEntry(entry) << std::endl;
    log_file_->flush();
}

} // namespace xform
