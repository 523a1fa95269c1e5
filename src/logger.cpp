#include <replidoc-cpp/logger.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <cctype>
#include <cstdlib>
#include <string>

namespace replidoc_cpp {

namespace {

auto to_spdlog(LogLevel level) -> spdlog::level::level_enum {
    switch (level) {
        case LogLevel::trace:   return spdlog::level::trace;
        case LogLevel::debug:   return spdlog::level::debug;
        case LogLevel::info:    return spdlog::level::info;
        case LogLevel::warning: return spdlog::level::warn;
        case LogLevel::error:   return spdlog::level::err;
        case LogLevel::quiet:   return spdlog::level::off;
    }
    return spdlog::level::warn;
}

auto make_logger() -> std::shared_ptr<spdlog::logger> {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto result = std::make_shared<spdlog::logger>("replidoc", std::move(sink));
    result->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
    auto level = LogLevel::warning;
    if (const auto* env = std::getenv("REPLIDOC_LOG_LEVEL")) {
        if (auto parsed = parse_log_level(env)) level = *parsed;
    }
    result->set_level(to_spdlog(level));
    return result;
}

}  // namespace

auto parse_log_level(std::string_view name) -> std::optional<LogLevel> {
    auto lower = std::string{name};
    for (auto& ch : lower) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    if (lower == "trace") return LogLevel::trace;
    if (lower == "debug") return LogLevel::debug;
    if (lower == "info") return LogLevel::info;
    if (lower == "warning" || lower == "warn") return LogLevel::warning;
    if (lower == "error") return LogLevel::error;
    if (lower == "quiet" || lower == "off") return LogLevel::quiet;
    return std::nullopt;
}

auto logger() -> const std::shared_ptr<spdlog::logger>& {
    static const auto instance = make_logger();
    return instance;
}

void set_log_level(LogLevel level) {
    logger()->set_level(to_spdlog(level));
}

}  // namespace replidoc_cpp
