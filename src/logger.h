#pragma once

#include <string>
#include <iostream>
#include <mutex>
#include <sstream>
#include <chrono>
#include <iomanip>
#include <cstdint>
#include <optional>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>

#ifdef _WIN32
    #include <windows.h>
    #include <io.h>
    #define isatty _isatty
    #define fileno _fileno
    // Undefine Windows ERROR macro to avoid conflicts with our enum
    #ifdef ERROR
        #undef ERROR
    #endif
#else
    #include <unistd.h>
#endif

namespace btcore {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * @brief Parse a level name ("debug", "info", "warn"/"warning", "error")
 * @return Parsed level, or empty if the name is unknown
 */
inline std::optional<LogLevel> log_level_from_string(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info") return LogLevel::INFO;
    if (name == "warn" || name == "warning") return LogLevel::WARN;
    if (name == "error") return LogLevel::ERROR;
    return std::nullopt;
}

inline const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO:  return "info";
        case LogLevel::WARN:  return "warn";
        case LogLevel::ERROR: return "error";
        default: return "unknown";
    }
}

class Logger {
public:
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_log_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = level;
    }

    LogLevel get_log_level() {
        std::lock_guard<std::mutex> lock(mutex_);
        return min_level_;
    }

    void set_colors_enabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        colors_enabled_ = enabled;
    }

    void set_timestamps_enabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        timestamps_enabled_ = enabled;
    }

    /**
     * @brief Redirect all output (every level) to a single stream
     *
     * Passing nullptr restores the default stdout/stderr split. The stream
     * must outlive its use by the logger. Colors are never written to a
     * redirected stream.
     */
    void set_output_stream(std::ostream* stream) {
        std::lock_guard<std::mutex> lock(mutex_);
        output_ = stream;
    }

    void log(LogLevel level, const std::string& module, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (level < min_level_) {
            return;
        }

        const bool colored = colors_enabled_ && is_terminal_ && output_ == nullptr;
        std::ostringstream oss;

        if (timestamps_enabled_) {
            auto now = std::chrono::system_clock::now();
            auto time_t = std::chrono::system_clock::to_time_t(now);
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) % 1000;

            oss << "[" << std::put_time(std::localtime(&time_t), "%H:%M:%S");
            oss << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";
        }

        if (colored) {
            oss << get_color_code(level) << "[" << get_level_string(level) << "]" << get_reset_code();
        } else {
            oss << "[" << get_level_string(level) << "]";
        }

        if (!module.empty()) {
            if (colored) {
                oss << " " << get_module_color(module) << "[" << module << "]" << get_reset_code();
            } else {
                oss << " [" << module << "]";
            }
        }

        oss << " " << message << std::endl;

        if (output_ != nullptr) {
            *output_ << oss.str();
            output_->flush();
        } else if (level >= LogLevel::ERROR) {
            std::cerr << oss.str();
            std::cerr.flush();
        } else {
            std::cout << oss.str();
            std::cout.flush();
        }
    }

private:
    Logger() : min_level_(LogLevel::INFO), colors_enabled_(true), timestamps_enabled_(true), output_(nullptr) {
        is_terminal_ = isatty(fileno(stdout));

#ifdef _WIN32
        if (is_terminal_) {
            HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
            DWORD dwMode = 0;
            GetConsoleMode(hOut, &dwMode);
            dwMode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
            SetConsoleMode(hOut, dwMode);
        }
#endif
    }

    std::string get_level_string(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERROR: return "ERROR";
            default: return "UNKNOWN";
        }
    }

    std::string get_color_code(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "\033[36m";  // Cyan
            case LogLevel::INFO:  return "\033[32m";  // Green
            case LogLevel::WARN:  return "\033[33m";  // Yellow
            case LogLevel::ERROR: return "\033[31m";  // Red
            default: return "";
        }
    }

    // Modules get a stable color picked from a small palette
    std::string get_module_color(const std::string& module) {
        static const char* colors[] = {
            "\033[35m",  // Magenta
            "\033[94m",  // Bright Blue
            "\033[95m",  // Bright Magenta
            "\033[96m",  // Bright Cyan
            "\033[93m",  // Bright Yellow
            "\033[92m",  // Bright Green
            "\033[38;5;208m", // Orange
            "\033[38;5;141m"  // Purple
        };

        size_t color_count = sizeof(colors) / sizeof(colors[0]);
        return colors[hash_string(module) % color_count];
    }

    // djb2
    uint32_t hash_string(const std::string& str) {
        uint32_t hash = 5381;
        for (char c : str) {
            hash = ((hash << 5) + hash) + c;
        }
        return hash;
    }

    std::string get_reset_code() {
        return "\033[0m";
    }

    std::mutex mutex_;
    LogLevel min_level_;
    bool colors_enabled_;
    bool timestamps_enabled_;
    bool is_terminal_;
    std::ostream* output_;
};

} // namespace btcore

#define LOG_DEBUG(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        btcore::Logger::getInstance().log(btcore::LogLevel::DEBUG, module, oss.str()); \
    } while(0)

#define LOG_INFO(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        btcore::Logger::getInstance().log(btcore::LogLevel::INFO, module, oss.str()); \
    } while(0)

#define LOG_WARN(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        btcore::Logger::getInstance().log(btcore::LogLevel::WARN, module, oss.str()); \
    } while(0)

#define LOG_ERROR(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        btcore::Logger::getInstance().log(btcore::LogLevel::ERROR, module, oss.str()); \
    } while(0)
