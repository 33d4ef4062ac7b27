#include <sstv/logger.h>
#include <sstv/colors.h>

ConsoleLogger::ConsoleLogger(LogLevel min_level, std::ostream& out, bool use_colors)
    : out(out), min_level(min_level), use_colors(use_colors) {
}

void ConsoleLogger::log(LogLevel level, const std::string& component, const std::string& message) {
    if (level < min_level) {
        return;
    }

    const char* color = RESET;
    switch (level) {
        case LogLevel::DEBUG: color = CYAN; break;
        case LogLevel::INFO:  color = RESET; break;
        case LogLevel::WARN:  color = YELLOW; break;
        case LogLevel::ERROR: color = RED; break;
    }

    std::lock_guard<std::mutex> lock(mtx);
    if (use_colors) {
        out << color << "[" << component << "] " << message << RESET << "\n";
    } else {
        out << "[" << component << "] " << message << "\n";
    }
    out.flush();
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?";
}

void log_message(ILogger* logger, LogLevel level, const std::string& component, const std::string& message) {
    if (logger) {
        logger->log(level, component, message);
    }
}
