#include "report_generator.hpp"
#include "../../../libdriveaudit/include/logger.hpp"
#include <algorithm>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <sys/ioctl.h>
#include <unistd.h>

using namespace driveaudit;

static bool is_stderr_a_tty() {
    return isatty(fileno(stderr)) != 0;
}

unsigned get_terminal_width() {
    winsize w{};
    if (ioctl(STDERR_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
}

std::string csv_escape(const std::string& data) {
    if (data.find_first_of(",\"\n\r") == std::string::npos) {
        return data;
    }
    std::string result;
    result.reserve(data.size() + 4);
    result.push_back('"');
    for (char c : data) {
        if (c == '"') {
            result.push_back('"'); // escape quote with another quote
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

std::string format_timestamp(const Timestamp ts) {
    const auto day = std::chrono::floor<std::chrono::days>(ts);
    const std::chrono::year_month_day ymd{day};
    const std::chrono::hh_mm_ss hms{ts - day};

    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << static_cast<int>(ymd.year()) << "-"
        << std::setw(2) << static_cast<unsigned>(ymd.month()) << "-"
        << std::setw(2) << static_cast<unsigned>(ymd.day()) << "T"
        << std::setw(2) << hms.hours().count() << ":"
        << std::setw(2) << hms.minutes().count() << ":"
        << std::setw(2) << hms.seconds().count() << "Z";
    return oss.str();
}

template <typename T>
static std::string optional_cell(const std::optional<T>& v) {
    return v ? std::to_string(*v) : std::string();
}

static std::string render_source(const SourceRef& ref) {
    return ref.file_name + "#" + std::to_string(ref.index);
}

static std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

void write_records_csv(const BatchResult& result, std::ostream& out) {
    out << "Label Serial,Serial,Model,Vendor,Vendor Information,Interface,Capacity (bytes),"
           "Health,Health %,Temperature (C),Power-On Hours,Reallocated Sectors,Grown Defects,"
           "Firmware,Sources,Extracted At\n";

    for (const auto& g : result.groups) {
        const auto& r = g.merged;
        out << csv_escape(r.label_serial) << ","
            << csv_escape(r.serial_number) << ","
            << csv_escape(r.model) << ","
            << csv_escape(r.vendor) << ","
            << csv_escape(r.vendor_information) << ","
            << to_string(r.interface_type) << ","
            << (r.capacity_bytes ? std::to_string(r.capacity_bytes) : std::string()) << ","
            << to_string(r.overall_health) << ","
            << optional_cell(r.health_percent) << ","
            << optional_cell(r.temperature_celsius) << ","
            << optional_cell(r.power_on_hours) << ","
            << optional_cell(r.reallocated_sectors) << ","
            << optional_cell(r.grown_defects) << ","
            << csv_escape(r.firmware_revision) << ","
            << csv_escape(join(g.source_files(), "; ")) << ","
            << format_timestamp(r.extracted_at) << "\n";
    }
}

void write_errors_csv(const std::vector<ParseError>& errors, std::ostream& out) {
    out << "File,Format,Reason,Detail,Location,Encodings Tried\n";
    for (const auto& e : errors) {
        out << csv_escape(e.file_name()) << ","
            << to_string(e.format_guess()) << ","
            << to_string(e.reason()) << ","
            << csv_escape(e.detail()) << ","
            << csv_escape(e.offset_hint().value_or("")) << ","
            << csv_escape(join(e.encodings_tried(), "; ")) << "\n";
    }
}

void write_audit_csv(const BatchResult& result, std::ostream& out) {
    out << "Serial,Field,Chosen Source,Conflict,Values\n";
    for (const auto& g : result.groups) {
        for (const auto& res : g.resolutions) {
            std::vector<std::string> values;
            values.reserve(res.observed.size());
            for (const auto& o : res.observed) {
                values.push_back(o.value + " <- " + render_source(o.source));
            }
            out << csv_escape(g.serial_number) << ","
                << csv_escape(res.field) << ","
                << csv_escape(render_source(res.chosen)) << ","
                << (res.conflict ? "yes" : "no") << ","
                << csv_escape(join(values, "; ")) << "\n";
        }
    }
}

template <typename Writer>
static bool write_file(const std::filesystem::path& path, Writer&& writer) {
    if (path.empty()) return true;
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        Logger::log(LogLevel::Error, "Can't open " + path.string() + " for writing", "Report");
        return false;
    }
    writer(out);
    out.flush();
    if (!out) {
        Logger::log(LogLevel::Error, "Error while writing " + path.string(), "Report");
        return false;
    }
    Logger::log(LogLevel::Info, "Wrote " + path.string(), "Report");
    return true;
}

bool export_csv_reports(const BatchResult& result,
                        const std::filesystem::path& records_path,
                        const std::filesystem::path& errors_path,
                        const std::filesystem::path& audit_path) {
    bool ok = write_file(records_path, [&](std::ostream& out) { write_records_csv(result, out); });
    ok = write_file(errors_path, [&](std::ostream& out) { write_errors_csv(result.errors, out); }) && ok;
    ok = write_file(audit_path, [&](std::ostream& out) { write_audit_csv(result, out); }) && ok;
    return ok;
}

void print_console_report(const BatchResult& result,
                          const unsigned num_threads,
                          double total_seconds) {
    const unsigned term_width = get_terminal_width();
    const bool use_colors = is_stderr_a_tty();

    size_t max_serial = 8;
    size_t max_model = 7;
    size_t max_health = 8;
    for (const auto& g : result.groups) {
        max_serial = std::max(max_serial, g.serial_number.size() + 2);
        max_model  = std::max(max_model, g.merged.model.size() + 2);
    }
    constexpr size_t temp_width = 10;
    constexpr size_t members_width = 9;

    const size_t fixed_cols_width = max_serial + max_model + max_health + temp_width + members_width;
    const size_t sources_width = term_width > fixed_cols_width + 10
                                     ? term_width - fixed_cols_width
                                     : 10;

    auto truncate = [](const std::string& s, const size_t max_len) {
        return s.size() <= max_len ? s : s.substr(0, max_len - 3) + "...";
    };

    if (!result.groups.empty()) {
        std::cerr << "\n"
                  << std::left << std::setw(max_serial) << "Serial"
                  << std::setw(max_model) << "Model"
                  << std::setw(max_health) << "Health"
                  << std::setw(temp_width) << "Temp(C)"
                  << std::setw(members_width) << "Reports"
                  << "Sources"
                  << "\n";
    }

    for (const auto& g : result.groups) {
        const auto& r = g.merged;
        const std::string health(to_string(r.overall_health));
        const char* color = r.overall_health == HealthVerdict::Fail ? "\033[1;31m"
                          : r.overall_health == HealthVerdict::Warn ? "\033[1;33m"
                          : r.overall_health == HealthVerdict::Pass ? "\033[1;32m" : "";

        std::cerr << std::left << std::setw(max_serial) << r.serial_number
                  << std::setw(max_model) << r.model;
        if (use_colors && *color) {
            std::cerr << color << std::setw(max_health) << health << "\033[0m";
        } else {
            std::cerr << std::setw(max_health) << health;
        }
        std::cerr << std::setw(temp_width) << optional_cell(r.temperature_celsius)
                  << std::setw(members_width) << g.members.size()
                  << truncate(join(g.source_files(), ", "), sources_width)
                  << (g.has_conflicts() ? " (conflicts)" : "")
                  << "\n";
    }

    if (!result.errors.empty()) {
        std::cerr << "\n=== Errors ===\n";
        for (const auto& e : result.errors) {
            std::cerr << "  " << e.describe() << "\n";
        }
    }

    const auto& s = result.summary;
    std::cerr << "\nFiles received: " << s.files_received
              << " (" << s.archive_members << " from archives)\n"
              << "Records extracted: " << s.records_extracted << "\n"
              << "Drives: " << s.groups << " (" << s.duplicates_merged << " duplicates merged)\n"
              << "Errors: " << s.errors << "\n"
              << "Outcome: " << to_string(result.outcome) << "\n"
              << "Total time: " << std::fixed << std::setprecision(2)
              << total_seconds << " s (" << num_threads << " thread"
              << (num_threads > 1U ? "s" : "") << ")\n";
}
