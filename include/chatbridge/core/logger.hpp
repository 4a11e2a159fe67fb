#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace chatbridge {

using LoggerPtr = std::shared_ptr<spdlog::logger>;

class Logger {
public:
    static void init(std::string_view name = "chatbridge", std::string_view level = "info");
    static auto get() -> std::shared_ptr<spdlog::logger>&;

    /// Builds a standalone logger that is not registered as the process
    /// default. Components take one of these at construction.
    static auto create(std::string_view name, std::string_view level = "info") -> LoggerPtr;

    static void set_level(std::string_view level);
    static void flush();

    static auto parse_level(std::string_view level) -> spdlog::level::level_enum;
};

} // namespace chatbridge

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::chatbridge::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::chatbridge::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...)  SPDLOG_LOGGER_INFO(::chatbridge::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...)  SPDLOG_LOGGER_WARN(::chatbridge::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::chatbridge::Logger::get(), __VA_ARGS__)
#define LOG_FATAL(...) SPDLOG_LOGGER_CRITICAL(::chatbridge::Logger::get(), __VA_ARGS__)
