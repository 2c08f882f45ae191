#pragma once

#include <atomic>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

enum class log_level {
    debug = 0,
    info = 1,
    warn = 2,
    error = 3,
};

// Line oriented console logger. Each line is written whole under a lock so that
// concurrent transfers never interleave inside a line.
class logger {
public:
    static void set_level(log_level level) {
        level_ref().store(level, std::memory_order_relaxed);
    }

    static bool enabled(log_level level) {
        return level >= level_ref().load(std::memory_order_relaxed);
    }

    static void write(log_level level, const char* component, const std::string& message) {
        std::lock_guard<std::mutex> lk(mutex_ref());
        std::ostream& out = level >= log_level::warn ? std::cerr : std::cout;
        out << "[" << component << "] ";
        if (level == log_level::warn) {
            out << "warning: ";
        } else if (level == log_level::error) {
            out << "error: ";
        }
        out << message << std::endl;
    }

private:
    static std::atomic<log_level>& level_ref() {
        static std::atomic<log_level> level(log_level::info);
        return level;
    }

    static std::mutex& mutex_ref() {
        static std::mutex mutex;
        return mutex;
    }
};

#define EOG_LOG(level, component, stmt)                                                            \
    do {                                                                                           \
        if (logger::enabled(level)) {                                                              \
            std::ostringstream eog_log_stream_;                                                    \
            eog_log_stream_ << stmt;                                                               \
            logger::write(level, component, eog_log_stream_.str());                                \
        }                                                                                          \
    } while (0)

#define LOG_DEBUG(component, stmt) EOG_LOG(log_level::debug, component, stmt)
#define LOG_INFO(component, stmt) EOG_LOG(log_level::info, component, stmt)
#define LOG_WARN(component, stmt) EOG_LOG(log_level::warn, component, stmt)
#define LOG_ERROR(component, stmt) EOG_LOG(log_level::error, component, stmt)
