#include "../../include/logger.hpp"
#include <algorithm>
#include <cctype>

namespace driveaudit {

std::vector<std::unique_ptr<ILogSink>> Logger::sinks_;
std::mutex Logger::mtx_;

void Logger::add_sink(std::unique_ptr<ILogSink> sink) {
    std::lock_guard lock(mtx_);
    if (sink) {
        sinks_.push_back(std::move(sink));
    }
}

void Logger::remove_sink(const ILogSink* sink) {
    std::lock_guard lock(mtx_);
    std::erase_if(sinks_, [sink](const std::unique_ptr<ILogSink>& s) { return s.get() == sink; });
}

void Logger::clear_sinks() {
    std::lock_guard lock(mtx_);
    sinks_.clear();
}

void Logger::log(const LogLevel level,
                 const std::string_view msg,
                 const std::string_view tag) {
    std::lock_guard lock(mtx_);
    for (const auto& sink : sinks_) {
        sink->log(level, msg, tag);
    }
}

const char* Logger::level_to_string(const LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error:   return "ERROR";
    }
    return "";
}

std::optional<LogLevel> Logger::parse_level(const std::string_view name) {
    std::string upper(name);
    std::ranges::transform(upper, upper.begin(),
                           [](const unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG") return LogLevel::Debug;
    if (upper == "INFO") return LogLevel::Info;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::Warning;
    if (upper == "ERROR") return LogLevel::Error;
    return std::nullopt;
}

} // namespace driveaudit
