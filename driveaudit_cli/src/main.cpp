#include <atomic>
#include <chrono>
#include <clocale>
#include <csignal>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <CLI/CLI.hpp>
#include "utils/color.hpp"
#include "cli/cli_parser.hpp"
#include "report/report_generator.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "../../libdriveaudit/include/driveaudit.hpp"
#include "../../libdriveaudit/include/logger.hpp"

// simple progress bar printer
inline void print_progress_bar(const size_t done, const size_t total, const double elapsed_seconds) {
    const unsigned term_width = get_terminal_width();
    const unsigned int bar_width = std::max(10u, term_width > 40u ? term_width - 40u : 20u);

    const double progress = total ? static_cast<double>(done) / static_cast<double>(total) : (done > 0 ? 1.0 : 0.0);
    const unsigned pos = static_cast<unsigned>(bar_width * progress);

    double percent = progress * 100.0;
    if (done < total && percent >= 99.95) {
        percent = 99.9;
    }
    if (done == total) {
        percent = 100.0;
    }

    std::cerr << "\r[";
    for (unsigned i = 0; i < bar_width; ++i) {
        if (i < pos) std::cerr << "=";
        else if (i == pos && done < total) std::cerr << ">";
        else if (i == pos && done == total) std::cerr << "=";
        else std::cerr << " ";
    }
    std::cerr << "] "
              << std::setw(5) << std::fixed << std::setprecision(1) << percent << "%"
              << " (" << done << "/" << total << ")"
              << " elapsed: " << std::fixed << std::setprecision(1) << elapsed_seconds << "s"
              << std::flush;
}

using namespace driveaudit;

static std::atomic<bool> interrupted{false};
static DriveAudit* g_audit = nullptr;

// handle ctrl+c or termination signals
void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        std::cerr << CYAN
                  << "\n[INTERRUPT] Stop detected. Waiting for running files to finish..."
                  << RESET << std::endl;
        if (g_audit) {
            g_audit->stop();
        }
        interrupted.store(true);
    }
}

inline void init_utf8_locale() {
    std::setlocale(LC_ALL, "");

    const char *cur = std::setlocale(LC_CTYPE, nullptr);
    if (cur && std::string(cur).find("UTF-8") != std::string::npos) {
        Logger::log(LogLevel::Debug, std::string("Current locale: ") + cur, "LocaleInit");
        return; // ok
    }

    constexpr const char *fallbacks[] = {"C.UTF-8", "en_US.UTF-8"};
    for (const auto fb: fallbacks) {
        if (std::setlocale(LC_ALL, fb)) {
            Logger::log(LogLevel::Info, std::string("Locale set to ") + fb, "LocaleInit");
            return;
        }
    }

    // no UTF-8 available
    Logger::log(LogLevel::Warning, "UTF-8 locale not available; non-ASCII file names may be problematic.",
                "LocaleInit");
}

// drives the progress bar from pool workers
class ProgressObserver final : public DriveAuditObserver {
public:
    explicit ProgressObserver(const bool quiet)
        : quiet_(quiet), start_(std::chrono::steady_clock::now()) {}

    void onFileStart(const std::string&, const std::size_t, const std::size_t total) override {
        total_.store(total);
    }

    void onFileFinish(const std::string& file_name, const std::size_t records, const std::size_t errors) override {
        if (!quiet_ && errors > 0) {
            std::lock_guard lock(mtx_);
            std::cerr << YELLOW << "\n[WARN] " << file_name << ": " << records << " record(s), "
                      << errors << " error(s)" << RESET << std::endl;
        }
        advance();
    }

    void onFileError(const std::string& file_name, const std::string& error) override {
        Logger::log(LogLevel::Error, file_name + " " + error, "main");
    }

    void onFileSkipped(const std::string&, const std::string&) override {
        // intake rejections arrive before any file starts and are not part of the bar
        if (total_.load() > 0) advance();
    }

private:
    void advance() {
        const size_t current = ++done_;
        if (quiet_) return;
        const double elapsed = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start_).count();
        std::lock_guard lock(mtx_);
        print_progress_bar(current, total_.load(), elapsed);
    }

    bool quiet_;
    std::chrono::steady_clock::time_point start_;
    std::atomic<size_t> total_{0};
    std::atomic<size_t> done_{0};
    std::mutex mtx_;
};

int main(int argc, char* argv[]) {

    CLI::App app{"driveaudit: Hard-disk diagnostic report parser and drive reconciler."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        app.exit(e);
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // set loggers
    Logger::clear_sinks();
    if (!settings.log_file.empty()) {
        auto fileSink = std::make_unique<FileLogSink>(settings.log_file, false);
        if (!fileSink->is_open()) {
            std::cerr << RED << "Error: can't open log file " << settings.log_file.string() << RESET << std::endl;
            return 1;
        }
        Logger::add_sink(std::move(fileSink));
    }

    const auto console_level = Logger::parse_level(settings.log_level);
    if (console_level) {
        auto consoleSink = std::make_unique<ConsoleLogSink>();
        consoleSink->log_level = settings.quiet ? LogLevel::Error : *console_level;
        Logger::add_sink(std::move(consoleSink));
    }

    init_utf8_locale();

    DriveAudit audit;
    audit.threads(settings.num_threads)
         .maxArchiveDepth(settings.max_depth)
         .maxExpansionRatio(settings.max_ratio)
         .maxArchiveMembers(settings.max_members)
         .maxFileSize(settings.max_file_size);
    if (settings.parsed_reference_time) {
        audit.referenceTime(*settings.parsed_reference_time);
    }

    ProgressObserver observer(settings.quiet);
    audit.setObserver(&observer);

    // read inputs; a file that vanished since argument checking is a usage error
    std::vector<InputFile> inputs;
    inputs.reserve(settings.inputs.size());
    try {
        for (const auto& path : settings.inputs) {
            inputs.push_back(DriveAudit::load_input(path));
        }
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, e.what(), "main");
        return 1;
    }

    const auto start_total = std::chrono::steady_clock::now();

    BatchResult result;
    g_audit = &audit;
    try {
        result = audit.run(inputs);
    } catch (const ResourceExhaustedError& e) {
        g_audit = nullptr;
        std::cerr << RED << "\nFatal: " << e.what() << " (" << e.file_name() << ")" << RESET << std::endl;
        Logger::log(LogLevel::Error, e.what(), "main");
        return 2;
    } catch (const std::exception& e) {
        g_audit = nullptr;
        std::cerr << RED << "\nFatal: " << e.what() << RESET << std::endl;
        Logger::log(LogLevel::Error, e.what(), "main");
        return 2;
    }
    g_audit = nullptr;

    const double total_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start_total).count();

    if (!settings.quiet) {
        std::cerr << std::endl;
        print_console_report(result, audit.options().threads, total_seconds);
    }

    if (!export_csv_reports(result, settings.output_path, settings.errors_path, settings.audit_path)) {
        std::cerr << RED << "Error: failed to write one or more reports." << RESET << std::endl;
        return 1;
    }

    if (interrupted.load() || result.outcome == BatchOutcome::Cancelled) {
        return 130; // standard exit code for SIGINT
    }
    return result.outcome == BatchOutcome::Completed ? 0 : 1;
}
