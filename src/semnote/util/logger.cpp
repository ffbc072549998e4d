#include <semnote/util/logger.hpp>

namespace semnote {

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR:   return "ERROR";
    }
    return "UNKNOWN";
}

void ConsoleLogger::log(LogLevel level, const std::string& message) {
    if (level < min_level_) return;

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << '[' << log_level_name(level) << "] ";
    if (!component_.empty()) {
        out_ << component_ << ": ";
    }
    out_ << message << std::endl;
}

}  // namespace semnote
