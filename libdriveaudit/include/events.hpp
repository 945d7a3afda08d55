#ifndef DRIVEAUDIT_EVENTS_HPP
#define DRIVEAUDIT_EVENTS_HPP

#include "parse_error.hpp"
#include "report_format.hpp"
#include <chrono>
#include <cstddef>
#include <string>

namespace driveaudit {

/**
 * @brief Progress events published on the EventBus during a batch.
 *
 * Plain data carriers. Sniffing and archive expansion happen on the calling
 * thread; extraction events come from pool workers.
 */

// --- Intake ---

/**
 * @brief Emitted once per top-level input after classification.
 */
struct FileSniffedEvent {
    std::string file_name;
    ReportFormat format = ReportFormat::Unsupported;
    std::size_t size = 0; ///< Input size in bytes
};

/**
 * @brief Emitted when a top-level archive has been expanded.
 */
struct ArchiveExpandedEvent {
    std::string archive_name;
    std::size_t members = 0; ///< Report candidates found, nested archives included
    std::size_t errors = 0;  ///< Archive-scoped errors raised while expanding
};

// --- Extraction ---

/**
 * @brief Emitted when a worker starts extracting one file or member.
 */
struct FileExtractStartEvent {
    std::string file_name;
    ReportFormat format = ReportFormat::Unsupported;
    std::size_t index = 0; ///< Position in the work list
    std::size_t total = 0; ///< Size of the work list
};

/**
 * @brief Emitted when extraction of one file finished, with or without errors.
 */
struct FileExtractCompleteEvent {
    std::string file_name;
    std::size_t records = 0;
    std::size_t errors = 0;
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Emitted when extraction of one file failed as a whole.
 */
struct FileExtractErrorEvent {
    std::string file_name;
    std::string error_message;
};

/**
 * @brief Emitted when a file is not extracted: unsupported, over the size
 * limit, or left unstarted by a stop request.
 */
struct FileExtractSkippedEvent {
    std::string file_name;
    std::string reason;
};

// --- Reconciliation ---

/**
 * @brief Emitted once after the reconciler merged the batch.
 */
struct BatchReconciledEvent {
    std::size_t records = 0;
    std::size_t groups = 0;
    std::size_t errors = 0;
};

} // namespace driveaudit

#endif // DRIVEAUDIT_EVENTS_HPP
