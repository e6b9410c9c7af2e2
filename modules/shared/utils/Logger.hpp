#pragma once

#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace OverlayCut::Shared {

enum class LogLevel { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3, OFF = 4 };

class Logger {
  public:
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    void setLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        currentLevel_ = level;
    }

    LogLevel getLevel() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return currentLevel_;
    }

    bool isEnabled(LogLevel level) const { return level >= getLevel(); }

    template <typename... Args>
    void debug(Args&&... args) {
        log(LogLevel::DEBUG, "DEBUG", std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(Args&&... args) {
        log(LogLevel::INFO, "INFO", std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(Args&&... args) {
        log(LogLevel::WARN, "WARN", std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(Args&&... args) {
        log(LogLevel::ERROR, "ERROR", std::forward<Args>(args)...);
    }

  private:
    mutable std::mutex mutex_;
    LogLevel currentLevel_ = LogLevel::INFO;

    template <typename... Args>
    void log(LogLevel level, const std::string& levelStr, Args&&... args) {
        if (!isEnabled(level)) return;

        std::ostringstream oss;
        oss << "[" << levelStr << "] ";
        ((oss << std::forward<Args>(args)), ...);

        // Scan workers log concurrently; keep lines whole
        std::lock_guard<std::mutex> lock(mutex_);
        std::clog << oss.str() << std::endl;
    }

    Logger() = default;
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
};

#define LOG_DEBUG(...) OverlayCut::Shared::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) OverlayCut::Shared::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) OverlayCut::Shared::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) OverlayCut::Shared::Logger::getInstance().error(__VA_ARGS__)

}  // namespace OverlayCut::Shared
