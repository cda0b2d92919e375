#pragma once
#include "../../utils/logging/logger.hpp"
#include <mutex>
#include <string>
#include <vector>

namespace test_utils {

// Keeps entries in memory instead of writing them
class CapturingLogger : public logging::Logger {
public:
    struct Entry {
        logging::LogLevel level;
        std::string message;
        std::map<std::string, std::string> metadata;
    };

    CapturingLogger() : logging::Logger("TEST") {}

    void log(logging::LogLevel level, const std::string& message,
             const std::map<std::string, std::string>& metadata = {}) override {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.push_back({level, message, metadata});
    }

    std::vector<Entry> get_entries() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

    size_t count(logging::LogLevel level) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& entry : entries_) {
            if (entry.level == level) n++;
        }
        return n;
    }

    bool contains(logging::LogLevel level, const std::string& fragment) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : entries_) {
            if (entry.level == level && entry.message.find(fragment) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

private:
    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
};

} // namespace test_utils
