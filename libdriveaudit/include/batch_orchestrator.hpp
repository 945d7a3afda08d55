/**
 * @file batch_orchestrator.hpp
 * @brief Runs one batch: sniff, expand, extract, normalize, reconcile.
 */

#ifndef DRIVEAUDIT_BATCH_ORCHESTRATOR_HPP
#define DRIVEAUDIT_BATCH_ORCHESTRATOR_HPP

#include "archive_expander.hpp"
#include "batch_result.hpp"
#include "drive_record.hpp"
#include "event_bus.hpp"
#include "extractor_registry.hpp"
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace driveaudit {

/**
 * @brief A named input buffer.
 */
struct InputFile {
    std::string name;
    std::vector<unsigned char> data;
};

/**
 * @brief Engine configuration for one batch.
 */
struct BatchOptions {
    unsigned threads = std::max(1u, std::thread::hardware_concurrency() / 2);
    unsigned max_archive_depth = 3;
    std::uint64_t max_expansion_ratio = 100;
    std::size_t max_archive_members = 1000;
    std::uint64_t max_file_size = 100ull * 1024 * 1024;   ///< Per input file and per archive member
    std::uint64_t max_batch_bytes = 512ull * 1024 * 1024; ///< Bytes archive expansion may write in total
    Timestamp reference_time{};                           ///< extracted_at when a report has no date
    std::filesystem::path work_directory;                 ///< Parent of the work area; system temp when empty
};

/**
 * @brief Orchestrates one batch of report files.
 *
 * @details Three phases, mirroring the data flow:
 * - Phase 1 (calling thread): enforce the per-file size cap, sniff every
 *   input, expand archives into a scoped WorkArea. All resource bounds are
 *   applied here, before extraction work is scheduled.
 * - Phase 2 (ThreadPool): extract and normalize each report file. A stop
 *   request is honored between tasks; a started task always completes.
 * - Phase 3 (calling thread): restore input order, reconcile, summarize.
 *
 * Per-file problems become ParseErrors in the result. Only
 * ResourceExhaustedError (archive bomb, batch byte budget, memory) escapes
 * run(); the work area is removed on every path.
 */
class BatchOrchestrator {
public:
    BatchOrchestrator(BatchOptions options, EventBus& bus);

    /**
     * @brief Process a batch.
     *
     * Clears any stop request left over from a previous run.
     * @throws ResourceExhaustedError when a resource bound is hit.
     */
    [[nodiscard]] BatchResult run(const std::vector<InputFile>& inputs);

    /// Thread-safe; may be called from a signal handler thread.
    void request_stop() noexcept { stop_flag_.store(true, std::memory_order_relaxed); }

    [[nodiscard]] bool is_stopped() const noexcept { return stop_flag_.load(std::memory_order_relaxed); }

    [[nodiscard]] const BatchOptions& options() const noexcept { return options_; }

private:
    struct WorkItem {
        std::string name;
        ReportFormat format = ReportFormat::Unsupported;
        std::size_t input_index = 0;               ///< Top-level input the item came from
        const std::vector<unsigned char>* bytes = nullptr; ///< Set for top-level inputs
        std::optional<ArchiveMember> member;       ///< Set for archive members
    };

    struct TaskOutcome {
        std::vector<CanonicalDriveRecord> records;
        std::vector<ParseError> errors;
        bool ran = false;
    };

    void intake(const std::vector<InputFile>& inputs,
                std::vector<WorkItem>& work,
                std::vector<std::vector<ParseError>>& intake_errors,
                std::size_t& archive_members);

    TaskOutcome extract_one(const WorkItem& item, std::size_t position, std::size_t total) const;

    BatchOptions options_;
    EventBus& bus_;
    ExtractorRegistry registry_;
    std::unique_ptr<WorkArea> area_; ///< Created on the first archive of a run
    std::atomic<bool> stop_flag_{false};
};

} // namespace driveaudit

#endif // DRIVEAUDIT_BATCH_ORCHESTRATOR_HPP
