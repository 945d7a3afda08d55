#ifndef DRIVEAUDIT_CLI_PARSER_HPP
#define DRIVEAUDIT_CLI_PARSER_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "../../../libdriveaudit/include/drive_record.hpp"

// forward declaration
namespace CLI { class App; }

struct Settings {
    bool quiet = false;

    unsigned num_threads = 1;
    unsigned max_depth = 3;
    std::uint64_t max_ratio = 100;
    std::size_t max_members = 1000;
    std::uint64_t max_file_size = 100ULL * 1024 * 1024;
    std::string reference_time;
    std::optional<driveaudit::Timestamp> parsed_reference_time;

    std::string log_level = "WARNING";
    std::filesystem::path log_file;
    std::filesystem::path output_path;
    std::filesystem::path errors_path;
    std::filesystem::path audit_path;

    std::vector<std::filesystem::path> inputs;
};

/**
 * @brief Configures the CLI11 parser with all options, flags, and arguments.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif // DRIVEAUDIT_CLI_PARSER_HPP
