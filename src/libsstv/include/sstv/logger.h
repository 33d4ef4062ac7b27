#pragma once

#include <iostream>
#include <mutex>
#include <string>

enum class LogLevel {
    DEBUG = 0,
    INFO,
    WARN,
    ERROR,
};

/**
 * Logging sink handed to every component at construction.
 * Components accept a null pointer, meaning "do not log".
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    /**
     * Emit one log line
     * @param level Severity
     * @param component Short tag of the emitting component (e.g. "TCPTransport")
     * @param message Text without trailing newline
     */
    virtual void log(LogLevel level, const std::string& component, const std::string& message) = 0;
};

/**
 * Writes "[Component] message" lines to a stream, coloured per level.
 * Safe to share between the caller thread and a listener worker.
 */
class ConsoleLogger : public ILogger {
private:
    std::ostream& out;
    LogLevel min_level;
    bool use_colors;
    std::mutex mtx;

public:
    explicit ConsoleLogger(LogLevel min_level = LogLevel::INFO,
                           std::ostream& out = std::cerr,
                           bool use_colors = true);

    void log(LogLevel level, const std::string& component, const std::string& message) override;

    void set_min_level(LogLevel level) { min_level = level; }
    LogLevel get_min_level() const { return min_level; }
};

const char* log_level_name(LogLevel level);

// Null-safe shortcut used throughout the library
void log_message(ILogger* logger, LogLevel level, const std::string& component, const std::string& message);
