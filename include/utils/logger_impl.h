#pragma once

#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace kvindex {
namespace utils {

namespace detail {
inline spdlog::level::level_enum toSpdlogLevel(Logger::Level level) {
    switch (level) {
        case Logger::Level::Trace: return spdlog::level::trace;
        case Logger::Level::Debug: return spdlog::level::debug;
        case Logger::Level::Info: return spdlog::level::info;
        case Logger::Level::Warn: return spdlog::level::warn;
        case Logger::Level::Error: return spdlog::level::err;
        case Logger::Level::Critical: return spdlog::level::critical;
    }
    return spdlog::level::info;
}
} // namespace detail

template<typename... Args>
void Logger::log(Level level, const std::string& fmt, Args&&... args) {
    if (!logger_) return;
    const auto lvl = detail::toSpdlogLevel(level);
    if (!logger_->should_log(lvl)) return;
    logger_->log(lvl, fmt::runtime(fmt), std::forward<Args>(args)...);
}

} // namespace utils
} // namespace kvindex
