#pragma once

#include <memory>
#include <string>

namespace spdlog { class logger; }

namespace kvindex {
namespace utils {

/// Process-wide spdlog logger ("kvindex"). Until init() every log call is a
/// no-op, so the library never writes to stdout unasked.
class Logger {
public:
    enum class Level { Trace, Debug, Info, Warn, Error, Critical };

    /// Console sink always; file sink only when log_file is non-empty
    static void init(const std::string& log_file = "", Level level = Level::Info);
    static void shutdown();
    static bool isInitialized();
    static void setPattern(const std::string& pattern);

    /// "trace".."critical" (case-insensitive, "warning"/"err"/"crit" too); Info on unknown
    static Level levelFromString(const std::string& lvl);
    static const char* levelToString(Level lvl);

    template<typename... Args>
    static void log(Level level, const std::string& fmt, Args&&... args);

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace utils
} // namespace kvindex

#include "utils/logger_impl.h"

#define KVINDEX_DEBUG(...) ::kvindex::utils::Logger::log(::kvindex::utils::Logger::Level::Debug, __VA_ARGS__)
#define KVINDEX_INFO(...) ::kvindex::utils::Logger::log(::kvindex::utils::Logger::Level::Info, __VA_ARGS__)
#define KVINDEX_WARN(...) ::kvindex::utils::Logger::log(::kvindex::utils::Logger::Level::Warn, __VA_ARGS__)
#define KVINDEX_ERROR(...) ::kvindex::utils::Logger::log(::kvindex::utils::Logger::Level::Error, __VA_ARGS__)
