/**
 * @file driveaudit.hpp
 * @brief Public API for the driveaudit library.
 */

#ifndef DRIVEAUDIT_HPP
#define DRIVEAUDIT_HPP

#include "batch_orchestrator.hpp"
#include "batch_result.hpp"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace driveaudit {

/**
 * @brief Interface for receiving progress events during a batch.
 *
 * Callbacks arrive on the thread that produced the event, including pool
 * workers; implementations must be thread-safe.
 */
struct DriveAuditObserver {
    virtual ~DriveAuditObserver() = default;

    virtual void onFileStart(const std::string& file_name, std::size_t index, std::size_t total) {}

    virtual void onFileFinish(const std::string& file_name, std::size_t records, std::size_t errors) {}

    virtual void onFileError(const std::string& file_name, const std::string& error) {}

    virtual void onFileSkipped(const std::string& file_name, const std::string& reason) {}

    virtual void onBatchReconciled(std::size_t records, std::size_t groups, std::size_t errors) {}

    virtual void onLog(int level, const std::string& msg, const std::string& tag) {}
};

/**
 * @brief Main interface for the driveaudit library.
 *
 * @details Wraps the batch pipeline into a blocking call. Uses PIMPL to keep
 * the extractors and their libraries out of the public headers.
 */
class DriveAudit {
public:
    DriveAudit();
    ~DriveAudit();

    DriveAudit(const DriveAudit&) = delete;
    DriveAudit& operator=(const DriveAudit&) = delete;
    DriveAudit(DriveAudit&&) noexcept;
    DriveAudit& operator=(DriveAudit&&) noexcept;

    // --- Configuration ---

    /**
     * @brief Number of extraction workers.
     * Default: hardware concurrency / 2, at least 1.
     */
    DriveAudit& threads(unsigned val);

    /**
     * @brief Deepest archive nesting expanded; a top-level archive is depth 1.
     * Default: 3.
     */
    DriveAudit& maxArchiveDepth(unsigned val);

    /**
     * @brief Expanded bytes allowed per compressed byte of a top-level archive.
     * Default: 100.
     */
    DriveAudit& maxExpansionRatio(std::uint64_t val);

    /// Default: 1000 file entries per archive.
    DriveAudit& maxArchiveMembers(std::size_t val);

    /// Default: 100 MiB, per input file and per archive member.
    DriveAudit& maxFileSize(std::uint64_t val);

    /// Default: 512 MiB written by archive expansion per batch.
    DriveAudit& maxBatchBytes(std::uint64_t val);

    /**
     * @brief extracted_at for reports that carry no parsable date.
     * Default: the Unix epoch, which keeps runs reproducible.
     */
    DriveAudit& referenceTime(Timestamp val);

    /// Parent directory of the scratch area. Default: the system temp directory.
    DriveAudit& workDirectory(const std::filesystem::path& dir);

    [[nodiscard]] const BatchOptions& options() const;

    // --- Observability ---

    /**
     * @brief Sets the observer for progress events.
     * The caller retains ownership of the observer.
     */
    void setObserver(DriveAuditObserver* observer);

    // --- Execution ---

    /**
     * @brief Run one batch. Blocks until completion.
     * @throws ResourceExhaustedError when a resource bound is hit.
     */
    [[nodiscard]] BatchResult run(const std::vector<InputFile>& inputs);

    /**
     * @brief Read files from disk and run them as one batch.
     * @throws std::runtime_error if a file can't be read.
     * @throws ResourceExhaustedError when a resource bound is hit.
     */
    [[nodiscard]] BatchResult run(const std::vector<std::filesystem::path>& paths);

    /**
     * @brief Read a file into an InputFile named after its file name.
     * @throws std::runtime_error if the file can't be read.
     */
    static InputFile load_input(const std::filesystem::path& path);

    // --- Control ---

    /**
     * @brief Requests cancellation between files. Thread-safe.
     */
    void stop();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace driveaudit

#endif // DRIVEAUDIT_HPP
