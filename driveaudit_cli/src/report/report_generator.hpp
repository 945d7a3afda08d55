#ifndef DRIVEAUDIT_REPORT_GENERATOR_HPP
#define DRIVEAUDIT_REPORT_GENERATOR_HPP

#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>
#include "../../../libdriveaudit/include/batch_result.hpp"

// merged drive records, one row per reconciliation group
void write_records_csv(const driveaudit::BatchResult& result, std::ostream& out);

// one row per ParseError, in batch order
void write_errors_csv(const std::vector<driveaudit::ParseError>& errors, std::ostream& out);

// one row per field resolution of every group
void write_audit_csv(const driveaudit::BatchResult& result, std::ostream& out);

/**
 * @brief Writes the CSV exports that have a non-empty path.
 * @return false if any of the files could not be written.
 */
bool export_csv_reports(const driveaudit::BatchResult& result,
                        const std::filesystem::path& records_path,
                        const std::filesystem::path& errors_path,
                        const std::filesystem::path& audit_path);

void print_console_report(const driveaudit::BatchResult& result,
                          unsigned num_threads,
                          double total_seconds);

// "2024-01-31T12:00:00Z"
std::string format_timestamp(driveaudit::Timestamp ts);

std::string csv_escape(const std::string& data);

unsigned get_terminal_width();

#endif // DRIVEAUDIT_REPORT_GENERATOR_HPP
