/**
 * @file driveaudit.cpp
 * @brief Implementation of the public DriveAudit API.
 */

#include "../include/driveaudit.hpp"
#include "../include/event_bus.hpp"
#include "../include/events.hpp"
#include "../include/log_sink.hpp"
#include "../include/logger.hpp"

#include <algorithm>
#include <atomic>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <thread>

namespace driveaudit {

// bridge sink to redirect static logs to the instance observer
class BridgeLogSink final : public ILogSink {
    DriveAuditObserver* observer_;
public:
    explicit BridgeLogSink(DriveAuditObserver* obs) : observer_(obs) {}

    void log(const LogLevel level, const std::string_view message, const std::string_view tag) override {
        if (observer_) {
            observer_->onLog(static_cast<int>(level), std::string(message), std::string(tag));
        }
    }
};

struct DriveAudit::Impl {
    BatchOptions options;
    DriveAuditObserver* observer = nullptr;
    std::atomic<BatchOrchestrator*> current = nullptr;

    void bridge_events(EventBus& bus) const {
        if (!observer) return;
        DriveAuditObserver* obs = observer;

        bus.subscribe<FileExtractStartEvent>([obs](const FileExtractStartEvent& e) {
            obs->onFileStart(e.file_name, e.index, e.total);
        });

        bus.subscribe<FileExtractCompleteEvent>([obs](const FileExtractCompleteEvent& e) {
            obs->onFileFinish(e.file_name, e.records, e.errors);
        });

        bus.subscribe<FileExtractErrorEvent>([obs](const FileExtractErrorEvent& e) {
            obs->onFileError(e.file_name, e.error_message);
        });

        bus.subscribe<FileExtractSkippedEvent>([obs](const FileExtractSkippedEvent& e) {
            obs->onFileSkipped(e.file_name, e.reason);
        });

        bus.subscribe<BatchReconciledEvent>([obs](const BatchReconciledEvent& e) {
            obs->onBatchReconciled(e.records, e.groups, e.errors);
        });
    }
};

DriveAudit::DriveAudit() : impl_(std::make_unique<Impl>()) {}

DriveAudit::~DriveAudit() {
    if (impl_) stop();
}

DriveAudit::DriveAudit(DriveAudit&&) noexcept = default;
DriveAudit& DriveAudit::operator=(DriveAudit&&) noexcept = default;

DriveAudit& DriveAudit::threads(const unsigned val) {
    impl_->options.threads = val > 0 ? val : std::max(1u, std::thread::hardware_concurrency() / 2);
    return *this;
}

DriveAudit& DriveAudit::maxArchiveDepth(const unsigned val) {
    impl_->options.max_archive_depth = val;
    return *this;
}

DriveAudit& DriveAudit::maxExpansionRatio(const std::uint64_t val) {
    impl_->options.max_expansion_ratio = val;
    return *this;
}

DriveAudit& DriveAudit::maxArchiveMembers(const std::size_t val) {
    impl_->options.max_archive_members = val;
    return *this;
}

DriveAudit& DriveAudit::maxFileSize(const std::uint64_t val) {
    impl_->options.max_file_size = val;
    return *this;
}

DriveAudit& DriveAudit::maxBatchBytes(const std::uint64_t val) {
    impl_->options.max_batch_bytes = val;
    return *this;
}

DriveAudit& DriveAudit::referenceTime(const Timestamp val) {
    impl_->options.reference_time = val;
    return *this;
}

DriveAudit& DriveAudit::workDirectory(const std::filesystem::path& dir) {
    impl_->options.work_directory = dir;
    return *this;
}

const BatchOptions& DriveAudit::options() const {
    return impl_->options;
}

void DriveAudit::setObserver(DriveAuditObserver* observer) {
    impl_->observer = observer;
}

BatchResult DriveAudit::run(const std::vector<InputFile>& inputs) {
    // inject bridge sink for the duration of the run if observer is present
    const ILogSink* bridge = nullptr;
    if (impl_->observer) {
        auto sink = std::make_unique<BridgeLogSink>(impl_->observer);
        bridge = sink.get();
        Logger::add_sink(std::move(sink));
    }
    struct BridgeRemoval {
        const ILogSink* sink;
        ~BridgeRemoval() { if (sink) Logger::remove_sink(sink); }
    } removal{bridge};

    EventBus bus;
    impl_->bridge_events(bus);
    BatchOrchestrator orchestrator(impl_->options, bus);

    impl_->current.store(&orchestrator);
    struct CurrentReset {
        std::atomic<BatchOrchestrator*>& current;
        ~CurrentReset() { current.store(nullptr); }
    } reset{impl_->current};

    return orchestrator.run(inputs);
}

BatchResult DriveAudit::run(const std::vector<std::filesystem::path>& paths) {
    std::vector<InputFile> inputs;
    inputs.reserve(paths.size());
    for (const auto& p : paths) {
        inputs.push_back(load_input(p));
    }
    return run(inputs);
}

InputFile DriveAudit::load_input(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("can't open " + path.string());
    }
    InputFile input;
    input.name = path.filename().string();
    input.data.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw std::runtime_error("error reading " + path.string());
    }
    return input;
}

void DriveAudit::stop() {
    if (auto* orchestrator = impl_->current.load()) {
        orchestrator->request_stop();
    }
}

} // namespace driveaudit
