#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <string>

namespace assetrelay::core {

enum class LogLevel {
    Trace = spdlog::level::trace,
    Debug = spdlog::level::debug,
    Info = spdlog::level::info,
    Warn = spdlog::level::warn,
    Error = spdlog::level::err,
    Critical = spdlog::level::critical,
    Off = spdlog::level::off
};

class Logger {
public:
    static void initialize(const std::string& log_file, LogLevel level = LogLevel::Info);
    static void shutdown();

    static std::shared_ptr<spdlog::logger> get() { return logger_; }

    // Accepts trace|debug|info|warn|error|critical|off, case-insensitive.
    static LogLevel parse_level(const std::string& name, LogLevel fallback = LogLevel::Info);

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace assetrelay::core

#define ASSETRELAY_LOG(level, ...)                                                  \
    do {                                                                            \
        if (auto* assetrelay_logger_ = spdlog::default_logger_raw()) {              \
            SPDLOG_LOGGER_CALL(assetrelay_logger_, level, __VA_ARGS__);             \
        }                                                                           \
    } while (0)

#define LOG_TRACE(...) ASSETRELAY_LOG(spdlog::level::trace, __VA_ARGS__)
#define LOG_DEBUG(...) ASSETRELAY_LOG(spdlog::level::debug, __VA_ARGS__)
#define LOG_INFO(...) ASSETRELAY_LOG(spdlog::level::info, __VA_ARGS__)
#define LOG_WARN(...) ASSETRELAY_LOG(spdlog::level::warn, __VA_ARGS__)
#define LOG_ERROR(...) ASSETRELAY_LOG(spdlog::level::err, __VA_ARGS__)
#define LOG_CRITICAL(...) ASSETRELAY_LOG(spdlog::level::critical, __VA_ARGS__)
