#include "logger.hpp"
#include <algorithm>
#include <cctype>

namespace logging {

const char* level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

LogLevel parse_log_level(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

void initialize_logging(const std::string& log_file, LogLevel min_level) {
    LogManager::get_instance().initialize(log_file, min_level);
}

void cleanup_logging() {
    LogManager::get_instance().shutdown();
}

} // namespace logging
