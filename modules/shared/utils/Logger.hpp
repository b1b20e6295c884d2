#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace ImageOptimizer::Shared {

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
    LogLevel currentLevel_ = LogLevel::INFO;
    mutable std::mutex mutex_;

    template <typename... Args>
    void log(LogLevel level, const std::string& levelStr, Args&&... args) {
        if (level < getLevel()) return;

        std::ostringstream oss;
        oss << timestamp() << " [" << levelStr << "] ";
        ((oss << std::forward<Args>(args)), ...);

        // Workers log concurrently, keep lines whole
        std::lock_guard<std::mutex> lock(mutex_);
        std::ostream& out = level >= LogLevel::WARN ? std::cerr : std::cout;
        out << oss.str() << std::endl;
    }

    static std::string timestamp() {
        auto now = std::chrono::system_clock::now();
        std::time_t time = std::chrono::system_clock::to_time_t(now);
        std::tm tm{};
        localtime_r(&time, &tm);
        std::ostringstream oss;
        oss << std::put_time(&tm, "%H:%M:%S");
        return oss.str();
    }

    Logger() = default;
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
};

#define LOG_DEBUG(...) ImageOptimizer::Shared::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) ImageOptimizer::Shared::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) ImageOptimizer::Shared::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) ImageOptimizer::Shared::Logger::getInstance().error(__VA_ARGS__)

}  // namespace ImageOptimizer::Shared
