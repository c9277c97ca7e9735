#include "utils/logger.h"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <memory>
#include <iostream>
#include <vector>
#include <cctype>

namespace kvindex {
namespace utils {

std::shared_ptr<spdlog::logger> Logger::logger_;

void Logger::init(const std::string& log_file, Level level) {
    try {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (!log_file.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true));
        }

        logger_ = std::make_shared<spdlog::logger>("kvindex", sinks.begin(), sinks.end());
        logger_->set_level(detail::toSpdlogLevel(level));
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [thread %t] %v");

        logger_->debug("Logger initialized (level={}, file={})", levelToString(level),
                       log_file.empty() ? "-" : log_file);
    }
    catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        logger_.reset();
    }
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
        logger_.reset();
    }
}

bool Logger::isInitialized() {
    return logger_ != nullptr;
}

// ohne init() kein Logger, also auch kein Pattern
void Logger::setPattern(const std::string& pattern) {
    if (logger_) logger_->set_pattern(pattern);
}

Logger::Level Logger::levelFromString(const std::string& lvl) {
    std::string s = lvl;
    for (auto& c : s) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    if (s == "trace") return Level::Trace;
    if (s == "debug") return Level::Debug;
    if (s == "info") return Level::Info;
    if (s == "warn" || s == "warning") return Level::Warn;
    if (s == "error" || s == "err") return Level::Error;
    if (s == "critical" || s == "crit") return Level::Critical;
    return Level::Info;
}

const char* Logger::levelToString(Level lvl) {
    switch (lvl) {
        case Level::Trace: return "trace";
        case Level::Debug: return "debug";
        case Level::Info: return "info";
        case Level::Warn: return "warn";
        case Level::Error: return "error";
        case Level::Critical: return "critical";
    }
    return "info";
}

} // namespace utils
} // namespace kvindex
