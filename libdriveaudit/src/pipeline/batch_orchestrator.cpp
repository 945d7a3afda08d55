#include "../../include/batch_orchestrator.hpp"
#include "../../include/duplicate_reconciler.hpp"
#include "../../include/events.hpp"
#include "../../include/format_sniffer.hpp"
#include "../../include/logger.hpp"
#include "../../include/record_normalizer.hpp"
#include "../../include/thread_pool.hpp"
#include <chrono>
#include <future>
#include <new>
#include <stdexcept>
#include <variant>

namespace driveaudit {

static const char* orchestrator_tag() {
    return "Orchestrator";
}

BatchOrchestrator::BatchOrchestrator(BatchOptions options, EventBus& bus)
    : options_(std::move(options)), bus_(bus) {}

void BatchOrchestrator::intake(const std::vector<InputFile>& inputs,
                               std::vector<WorkItem>& work,
                               std::vector<std::vector<ParseError>>& intake_errors,
                               std::size_t& archive_members) {
    const ArchiveLimits limits{options_.max_archive_depth, options_.max_expansion_ratio,
                               options_.max_archive_members, options_.max_file_size};

    for (std::size_t i = 0; i < inputs.size(); ++i) {
        if (is_stopped()) return;
        const InputFile& input = inputs[i];

        if (input.data.size() > options_.max_file_size) {
            const std::string detail = "file size " + std::to_string(input.data.size()) +
                                       " exceeds limit of " + std::to_string(options_.max_file_size) + " bytes";
            Logger::log(LogLevel::Warning, input.name + ": " + detail, orchestrator_tag());
            intake_errors[i].emplace_back(input.name, ReportFormat::Unsupported, ErrorReason::UnsupportedFormat, detail);
            bus_.publish(FileExtractSkippedEvent{input.name, detail});
            continue;
        }

        const ReportFormat format = FormatSniffer::sniff(input.data, input.name);
        bus_.publish(FileSniffedEvent{input.name, format, input.data.size()});

        switch (format) {
            case ReportFormat::Unsupported: {
                const std::span<const unsigned char> head(input.data.data(),
                                                          std::min(input.data.size(), FormatSniffer::kSniffWindow));
                const std::string mime = FormatSniffer::detect_mime(head);
                intake_errors[i].emplace_back(input.name, ReportFormat::Unsupported, ErrorReason::UnsupportedFormat,
                                              mime.empty() ? std::string("not a recognized report format")
                                                           : "not a recognized report format (" + mime + ")");
                bus_.publish(FileExtractSkippedEvent{input.name, "Unsupported format"});
                break;
            }

            case ReportFormat::Zip: {
                if (!area_) {
                    area_ = std::make_unique<WorkArea>(options_.max_batch_bytes, options_.work_directory);
                }
                const ArchiveExpander expander(*area_, limits);
                ExpansionResult expanded;
                try {
                    expanded = expander.expand(input.data, input.name);
                } catch (const ResourceExhaustedError&) {
                    throw;
                } catch (const std::bad_alloc&) {
                    throw ResourceExhaustedError("memory exhausted while expanding " + input.name, input.name);
                } catch (const std::exception& e) {
                    Logger::log(LogLevel::Error, input.name + ": archive expansion failed: " + e.what(), orchestrator_tag());
                    intake_errors[i].emplace_back(input.name, ReportFormat::Zip, ErrorReason::ArchiveCorrupt,
                                                  std::string("cannot expand archive: ") + e.what());
                    bus_.publish(FileExtractErrorEvent{input.name, e.what()});
                    break;
                }
                bus_.publish(ArchiveExpandedEvent{input.name, expanded.members.size(), expanded.errors.size()});
                archive_members += expanded.members.size();
                for (auto& e : expanded.errors) {
                    intake_errors[i].push_back(std::move(e));
                }
                for (auto& member : expanded.members) {
                    if (member.format == ReportFormat::Unsupported) {
                        intake_errors[i].emplace_back(member.name, ReportFormat::Unsupported,
                                                      ErrorReason::UnsupportedFormat,
                                                      "archive member is not a recognized report format");
                        bus_.publish(FileExtractSkippedEvent{member.name, "Unsupported format"});
                        continue;
                    }
                    WorkItem item;
                    item.name = member.name;
                    item.format = member.format;
                    item.input_index = i;
                    item.member = std::move(member);
                    work.push_back(std::move(item));
                }
                break;
            }

            default: {
                WorkItem item;
                item.name = input.name;
                item.format = format;
                item.input_index = i;
                item.bytes = &input.data;
                work.push_back(std::move(item));
                break;
            }
        }
    }
}

BatchOrchestrator::TaskOutcome BatchOrchestrator::extract_one(const WorkItem& item,
                                                              const std::size_t position,
                                                              const std::size_t total) const {
    TaskOutcome outcome;
    if (is_stopped()) {
        bus_.publish(FileExtractSkippedEvent{item.name, "Interrupted"});
        return outcome;
    }
    outcome.ran = true;
    bus_.publish(FileExtractStartEvent{item.name, item.format, position, total});
    const auto start = std::chrono::steady_clock::now();

    try {
        const IExtractor* extractor = registry_.find(item.format);
        if (!extractor) {
            throw std::runtime_error("no extractor for format " + std::string(to_string(item.format)));
        }

        std::vector<unsigned char> loaded;
        std::span<const unsigned char> data;
        if (item.member) {
            loaded = item.member->load();
            data = loaded;
        } else {
            data = *item.bytes;
        }

        ExtractionResult extracted = extractor->extract(data, item.name);
        outcome.errors = std::move(extracted.errors);

        const RecordNormalizer normalizer(options_.reference_time);
        for (const auto& raw : extracted.records) {
            auto normalized = normalizer.normalize(raw);
            if (auto* record = std::get_if<CanonicalDriveRecord>(&normalized)) {
                outcome.records.push_back(std::move(*record));
            } else {
                outcome.errors.push_back(std::move(std::get<ParseError>(normalized)));
            }
        }
    } catch (const ResourceExhaustedError&) {
        throw;
    } catch (const std::bad_alloc&) {
        throw ResourceExhaustedError("memory exhausted while extracting " + item.name, item.name);
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, item.name + ": extraction failed: " + e.what(), orchestrator_tag());
        outcome.records.clear();
        outcome.errors.emplace_back(item.name, item.format, ErrorReason::MalformedContent,
                                    std::string("extraction failed: ") + e.what());
        bus_.publish(FileExtractErrorEvent{item.name, e.what()});
    }

    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    bus_.publish(FileExtractCompleteEvent{item.name, outcome.records.size(), outcome.errors.size(), duration});
    return outcome;
}

BatchResult BatchOrchestrator::run(const std::vector<InputFile>& inputs) {
    stop_flag_.store(false, std::memory_order_relaxed);
    Logger::log(LogLevel::Info, "Starting batch of " + std::to_string(inputs.size()) + " file(s)", orchestrator_tag());

    // the work area must not outlive this run, whatever the exit path
    struct AreaReset {
        std::unique_ptr<WorkArea>& area;
        ~AreaReset() { area.reset(); }
    } area_reset{area_};

    // --- Phase 1: intake ---
    std::vector<WorkItem> work;
    std::vector<std::vector<ParseError>> intake_errors(inputs.size());
    std::size_t archive_members = 0;
    intake(inputs, work, intake_errors, archive_members);

    // --- Phase 2: extraction ---
    std::vector<TaskOutcome> outcomes(work.size());
    if (!work.empty()) {
        const unsigned threads = static_cast<unsigned>(std::min<std::size_t>(std::max(1u, options_.threads), work.size()));
        ThreadPool pool(threads);
        std::vector<std::future<void>> futures;
        futures.reserve(work.size());
        for (std::size_t i = 0; i < work.size(); ++i) {
            futures.push_back(pool.enqueue([this, &work, &outcomes, i](const std::stop_token&) {
                outcomes[i] = extract_one(work[i], i, work.size());
            }));
        }
        pool.wait_idle();
        for (auto& f : futures) {
            f.get(); // rethrows ResourceExhaustedError
        }
    }

    // --- Phase 3: ordering and reconciliation ---
    BatchResult result;
    std::vector<CanonicalDriveRecord> records;
    for (std::size_t i = 0; i < inputs.size(); ++i) {
        for (auto& e : intake_errors[i]) {
            result.errors.push_back(std::move(e));
        }
        for (std::size_t w = 0; w < work.size(); ++w) {
            if (work[w].input_index != i) continue;
            for (auto& e : outcomes[w].errors) {
                result.errors.push_back(std::move(e));
            }
            for (auto& r : outcomes[w].records) {
                records.push_back(std::move(r));
            }
        }
    }

    result.summary.files_received = inputs.size();
    result.summary.archive_members = archive_members;
    result.summary.records_extracted = records.size();

    result.groups = DuplicateReconciler{}.reconcile(std::move(records));

    result.summary.groups = result.groups.size();
    result.summary.duplicates_merged = result.summary.records_extracted - result.summary.groups;
    result.summary.errors = result.errors.size();

    if (is_stopped()) {
        result.outcome = BatchOutcome::Cancelled;
    } else if (!result.errors.empty()) {
        result.outcome = BatchOutcome::CompletedWithErrors;
    } else {
        result.outcome = BatchOutcome::Completed;
    }

    bus_.publish(BatchReconciledEvent{result.summary.records_extracted, result.summary.groups, result.summary.errors});
    Logger::log(LogLevel::Info,
                "Batch finished: " + std::to_string(result.summary.groups) + " drive(s), " +
                std::to_string(result.summary.errors) + " error(s), " + std::string(to_string(result.outcome)),
                orchestrator_tag());
    return result;
}

} // namespace driveaudit
