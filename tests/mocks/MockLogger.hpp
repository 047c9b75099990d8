/**
 * @file MockLogger.hpp
 * @brief Google Mock implementation of util::ILogger
 */

#pragma once

#include "util/Logger.hpp"

#include <gmock/gmock.h>

#include <mutex>
#include <string>
#include <vector>

class MockLogger : public util::ILogger {
public:
    MOCK_METHOD(void, log,
                (util::LogLevel level, std::string_view component, std::string_view message),
                (override));
};

/**
 * @brief Logger that keeps every line for later assertions
 */
class RecordingLogger : public util::ILogger {
public:
    struct Entry {
        util::LogLevel level;
        std::string component;
        std::string message;
    };

    void log(util::LogLevel level, std::string_view component, std::string_view message) override {
        std::lock_guard lock(mutex_);
        entries_.push_back(Entry{level, std::string(component), std::string(message)});
    }

    std::vector<Entry> entries() const {
        std::lock_guard lock(mutex_);
        return entries_;
    }

    bool Contains(util::LogLevel level, const std::string& needle) const {
        std::lock_guard lock(mutex_);
        for (const auto& entry : entries_) {
            if (entry.level == level && entry.message.find(needle) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

private:
    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
};
