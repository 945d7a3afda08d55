/**
 * @file log_sink.hpp
 * @brief Severity levels and the sink interface behind the Logger facade.
 */

#ifndef DRIVEAUDIT_LOG_SINK_HPP
#define DRIVEAUDIT_LOG_SINK_HPP

#include <string_view>

namespace driveaudit {

/**
 * @brief Severity levels for log messages.
 *
 * Ordered from the most verbose to the most severe, so sinks can filter
 * with a plain comparison against a threshold.
 */
enum class LogLevel {
    Debug,   ///< Per-file and per-section diagnostics
    Info,    ///< Batch milestones (files sniffed, archives expanded, groups merged)
    Warning, ///< Recoverable problems, usually mirrored by a ParseError
    Error    ///< Failures that abort a file or the whole batch
};

/**
 * @brief Abstract destination for log records.
 *
 * Implementations decide where a record ends up (console, file, a library
 * observer). The Logger holds them and fans every record out to all of them.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Deliver one log record.
     * @param level Severity of the record.
     * @param message Record text.
     * @param tag Component that emitted the record (e.g. "ArchiveExpander").
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

} // namespace driveaudit

#endif // DRIVEAUDIT_LOG_SINK_HPP
