/**
 * @file logger.hpp
 * @brief Static, thread-safe logging facade used by every component.
 *
 * The library never installs a sink on its own: records are dropped until
 * the embedding program (the CLI, a test, an observer bridge) adds one.
 */

#ifndef DRIVEAUDIT_LOGGER_HPP
#define DRIVEAUDIT_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace driveaudit {

/**
 * @brief Global entry point for logging.
 *
 * Delegates each record to all registered ILogSink implementations under a
 * single mutex, so sinks do not need their own locking for ordering.
 */
class Logger {
public:
    /**
     * @brief Register a sink. The Logger takes ownership.
     * @param sink Sink implementation; null pointers are ignored.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Remove and destroy one registered sink.
     * @param sink Pointer previously passed to add_sink().
     */
    static void remove_sink(const ILogSink* sink);

    /**
     * @brief Remove every registered sink.
     */
    static void clear_sinks();

    /**
     * @brief Send a record to all sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Emitting component (default: "driveaudit").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "driveaudit");

    /**
     * @brief Fixed-width label for a level ("DEBUG", "INFO", "WARN", "ERROR").
     */
    static const char* level_to_string(LogLevel level);

    /**
     * @brief Parse a level name as accepted on the command line.
     *
     * Case-insensitive; accepts "WARN" and "WARNING".
     * @return The level, or std::nullopt for "NONE" and unknown names.
     */
    static std::optional<LogLevel> parse_level(std::string_view name);

private:
    static std::vector<std::unique_ptr<ILogSink>> sinks_; ///< Registered sinks
    static std::mutex mtx_;                               ///< Guards sinks_ and serializes records
};

} // namespace driveaudit

#endif // DRIVEAUDIT_LOGGER_HPP
