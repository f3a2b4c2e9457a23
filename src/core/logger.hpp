#pragma once

#include <atomic>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

namespace core {

enum class LogLevel {
    Trace = 0,
    Debug,
    Info,
    Warn,
    Error,
    Critical
};

// 配置文件里的字符串（"debug"、"WARN"...）转日志级别，无法识别时返回 Info
LogLevel parseLogLevel(std::string_view text);

// 全局日志（单例），控制台 + 文件两路输出
class Logger {
public:
    static Logger& instance();

    // 启动时调用一次
    // level: 最低日志级别
    // filePath: 日志文件路径（为空则不写文件）
    // useConsole: 是否同时输出到控制台
    void configure(LogLevel level, const std::string& filePath = "", bool useConsole = true);

    // LOG_INFO("pool", "created connection ", id, " total=", total);
    template <typename... Args>
    void log(LogLevel level, std::string_view component, Args&&... args) {
        if (level < minLevel_.load()) {
            return;
        }

        std::ostringstream oss;
        (oss << ... << std::forward<Args>(args));

        write(level, component, oss.str());
    }

private:
    Logger() = default;
    ~Logger() = default;

    void write(LogLevel level, std::string_view component, const std::string& message);

    std::string levelToString(LogLevel level) const;

    std::mutex mutex_;  // 保护两路输出
    std::atomic<LogLevel> minLevel_{LogLevel::Info};
    std::ofstream fileStream_;
    bool consoleEnabled_{true};
    bool fileEnabled_{false};
};

} // namespace core

#define LOG_TRACE(component, ...) ::core::Logger::instance().log(::core::LogLevel::Trace, component, __VA_ARGS__)
#define LOG_DEBUG(component, ...) ::core::Logger::instance().log(::core::LogLevel::Debug, component, __VA_ARGS__)
#define LOG_INFO(component, ...)  ::core::Logger::instance().log(::core::LogLevel::Info, component, __VA_ARGS__)
#define LOG_WARN(component, ...)  ::core::Logger::instance().log(::core::LogLevel::Warn, component, __VA_ARGS__)
#define LOG_ERROR(component, ...) ::core::Logger::instance().log(::core::LogLevel::Error, component, __VA_ARGS__)
#define LOG_CRITICAL(component, ...) ::core::Logger::instance().log(::core::LogLevel::Critical, component, __VA_ARGS__)
