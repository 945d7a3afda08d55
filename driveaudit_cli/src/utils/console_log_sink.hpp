#ifndef DRIVEAUDIT_CONSOLE_LOG_SINK_HPP
#define DRIVEAUDIT_CONSOLE_LOG_SINK_HPP

#include "../../../libdriveaudit/include/log_sink.hpp"
#include "../../../libdriveaudit/include/logger.hpp"
#include <iostream>

// writes records at or above log_level to stderr, keeping stdout free for the summary
class ConsoleLogSink final : public driveaudit::ILogSink {
public:
    driveaudit::LogLevel log_level = driveaudit::LogLevel::Warning;

    void log(const driveaudit::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (level < log_level) return;
        std::cerr << "\n[" << driveaudit::Logger::level_to_string(level) << "]";
        if (!tag.empty()) std::cerr << "[" << tag << "]";
        std::cerr << " " << message << std::endl;
    }
};

#endif // DRIVEAUDIT_CONSOLE_LOG_SINK_HPP
