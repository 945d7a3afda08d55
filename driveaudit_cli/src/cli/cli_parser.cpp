#include "cli_parser.hpp"
#include "../../../libdriveaudit/include/record_normalizer.hpp"
#include <CLI/CLI.hpp>
#include <algorithm>
#include <thread>

void setup_cli_parser(CLI::App& app, Settings& settings) {
    // setup standard help and version flags
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1.0");

    // --- Flags (booleans) ---
    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress non-error console output (progress bar, summary).");

    // --- Outputs ---
    app.add_option("-o,--output", settings.output_path,
                   "Write the merged drive records as CSV to PATH.")
                   ->take_last(); // if used multiple times, take the last one

    app.add_option("--errors", settings.errors_path,
                   "Write the files that could not be parsed as CSV to PATH.")
                   ->take_last();

    app.add_option("--audit", settings.audit_path,
                   "Write the per-field merge decisions as CSV to PATH.")
                   ->take_last();

    // --- Limits ---
    // calculate default thread count
    settings.num_threads = std::max(1U, std::thread::hardware_concurrency() / 2);
    app.add_option("--threads", settings.num_threads,
                   "Threads to use for parallel extraction.")
                   ->default_val(settings.num_threads)
                   ->check(CLI::PositiveNumber);

    app.add_option("--max-depth", settings.max_depth,
                   "Deepest nested archive expanded (top-level archive is 1).")
                   ->default_val(settings.max_depth)
                   ->check(CLI::PositiveNumber);

    app.add_option("--max-ratio", settings.max_ratio,
                   "Expanded bytes allowed per compressed byte of an archive.")
                   ->default_val(settings.max_ratio)
                   ->check(CLI::PositiveNumber);

    app.add_option("--max-members", settings.max_members,
                   "Maximum number of files inside one archive.")
                   ->default_val(settings.max_members)
                   ->check(CLI::PositiveNumber);

    app.add_option("--max-file-size", settings.max_file_size,
                   "Maximum size of an input file or archive member, in bytes.")
                   ->default_val(settings.max_file_size)
                   ->check(CLI::PositiveNumber);

    app.add_option("--reference-time", settings.reference_time,
                   "Timestamp used for reports without a generation date (e.g. 2024-01-31 12:00:00).\n"
                   "(Default: 1970-01-01 00:00:00 UTC).")
        ->check([](const std::string& str) {
            if (!driveaudit::RecordNormalizer::parse_timestamp(str)) {
                return "Unrecognized timestamp '" + str + "'.";
            }
            return std::string(); // ok
        });

    // --- Logging ---
    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
                   ->default_val("WARNING")
                   ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Write logs to a specific file (default: no file logging).");

    // --- Positional Arguments ---
    app.add_option("inputs", settings.inputs, "One or more report files (HTML, TXT, PDF or ZIP).")
        ->required()
        ->check(CLI::ExistingFile);

    // --- Cross-validation logic ---
    app.callback([&settings]() {
        if (!settings.reference_time.empty()) {
            settings.parsed_reference_time = driveaudit::RecordNormalizer::parse_timestamp(settings.reference_time);
        }

        const std::filesystem::path* outputs[] = {&settings.output_path, &settings.errors_path, &settings.audit_path};
        for (const auto* out : outputs) {
            if (out->empty()) continue;
            if (std::filesystem::is_directory(*out)) {
                throw CLI::ValidationError("Output path '" + out->string() + "' is a directory.");
            }
            for (const auto& in : settings.inputs) {
                std::error_code ec;
                if (std::filesystem::equivalent(*out, in, ec)) {
                    throw CLI::ValidationError("Output path '" + out->string() + "' would overwrite an input.");
                }
            }
        }
    });
}
