#pragma once

#include <iostream>
#include <mutex>
#include <string>
#include <utility>

namespace semnote {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3
};

const char* log_level_name(LogLevel level);

class Logger {
public:
    virtual ~Logger() = default;

    virtual void log(LogLevel level, const std::string& message) = 0;

    void debug(const std::string& msg) { log(LogLevel::DEBUG, msg); }
    void info(const std::string& msg) { log(LogLevel::INFO, msg); }
    void warning(const std::string& msg) { log(LogLevel::WARNING, msg); }
    void error(const std::string& msg) { log(LogLevel::ERROR, msg); }

    void set_min_level(LogLevel level) { min_level_ = level; }
    LogLevel get_min_level() const { return min_level_; }

protected:
    LogLevel min_level_ = LogLevel::INFO;
};

/**
 * Writes "[LEVEL] component: message" lines to a stream (stderr by default).
 */
class ConsoleLogger : public Logger {
public:
    explicit ConsoleLogger(std::string component = "", std::ostream& out = std::cerr)
        : component_(std::move(component)), out_(out) {}

    void log(LogLevel level, const std::string& message) override;

private:
    std::string component_;
    std::ostream& out_;
    std::mutex mutex_;
};

class NullLogger : public Logger {
public:
    void log(LogLevel, const std::string&) override {}
};

}  // namespace semnote
