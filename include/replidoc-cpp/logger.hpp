/// @file logger.hpp
/// @brief Library logging on top of spdlog.

#pragma once

#ifndef SPDLOG_ACTIVE_LEVEL
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

#include <spdlog/spdlog.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

namespace replidoc_cpp {

/// Verbosity of the library logger.
enum class LogLevel : std::uint8_t {
    trace,
    debug,
    info,
    warning,
    error,
    quiet,
};

/// Parse a verbosity name ("trace", "debug", "info", "warning", "error",
/// "quiet"), case-insensitively.
auto parse_log_level(std::string_view name) -> std::optional<LogLevel>;

/// The library logger. Created on first use, writing to stderr; the
/// initial level comes from REPLIDOC_LOG_LEVEL (default: warning).
auto logger() -> const std::shared_ptr<spdlog::logger>&;

/// Change the verbosity of the library logger.
void set_log_level(LogLevel level);

}  // namespace replidoc_cpp

#define REPLIDOC_TRACE(...) SPDLOG_LOGGER_TRACE(::replidoc_cpp::logger(), __VA_ARGS__)
#define REPLIDOC_DEBUG(...) SPDLOG_LOGGER_DEBUG(::replidoc_cpp::logger(), __VA_ARGS__)
#define REPLIDOC_INFO(...) SPDLOG_LOGGER_INFO(::replidoc_cpp::logger(), __VA_ARGS__)
#define REPLIDOC_WARN(...) SPDLOG_LOGGER_WARN(::replidoc_cpp::logger(), __VA_ARGS__)
#define REPLIDOC_ERROR(...) SPDLOG_LOGGER_ERROR(::replidoc_cpp::logger(), __VA_ARGS__)
