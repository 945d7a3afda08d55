#include "../../include/format_sniffer.hpp"
#include "../../include/logger.hpp"
#include "../../include/string_utils.hpp"
#include "../../include/text_decoder.hpp"
#include <magic.h>
#include <algorithm>
#include <array>
#include <regex>
#include <string>

namespace driveaudit {

static const char* sniffer_tag() {
    return "FormatSniffer";
}

static bool has_zip_signature(const std::span<const unsigned char> data) {
    if (data.size() < 4 || data[0] != 'P' || data[1] != 'K') return false;
    // local file header, empty archive, spanned archive
    return (data[2] == 0x03 && data[3] == 0x04) ||
           (data[2] == 0x05 && data[3] == 0x06) ||
           (data[2] == 0x07 && data[3] == 0x08);
}

static bool has_pdf_signature(const std::span<const unsigned char> data) {
    const std::size_t limit = std::min<std::size_t>(data.size(), 1024);
    const std::string_view head(reinterpret_cast<const char*>(data.data()), limit);
    return head.find("%PDF-") != std::string_view::npos;
}

// MIME types that can still be one of our text dialects
static bool is_textual_mime(const std::string& mime) {
    if (mime.empty() || mime.starts_with("text/")) return true;
    static constexpr std::array<std::string_view, 7> textual = {
        "application/octet-stream", "application/x-empty", "application/xml",
        "application/xhtml+xml", "application/json", "application/javascript",
        "inode/x-empty",
    };
    return std::ranges::find(textual, std::string_view(mime)) != textual.end();
}

static bool has_html_markers(const std::string& lower) {
    static constexpr std::array<std::string_view, 5> markers = {
        "<!doctype html", "<html", "<body", "<table", "<head",
    };
    return std::ranges::any_of(markers, [&](const std::string_view m) {
        return lower.find(m) != std::string::npos;
    });
}

static bool has_text_markers(const std::string& lower) {
    static constexpr std::array<std::string_view, 6> markers = {
        "hard disk summary", "hard disk serial number", "scsi toolbox",
        "serial number", "s.m.a.r.t.", "hard disk number",
    };
    if (std::ranges::any_of(markers, [&](const std::string_view m) {
            return lower.find(m) != std::string::npos;
        })) {
        return true;
    }
    static const std::regex drive_line(R"((^|\n)[ \t]*(hard[ \t]+)?(disk|drive)[ \t]*#?[ \t]*\d+)");
    return std::regex_search(lower, drive_line);
}

std::string FormatSniffer::detect_mime(const std::span<const unsigned char> data) {
    const magic_t magic = magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR);
    if (!magic) return {};
    if (magic_load(magic, nullptr) != 0) {
        Logger::log(LogLevel::Debug, std::string("magic_load failed: ") + magic_error(magic), sniffer_tag());
        magic_close(magic);
        return {};
    }
    const char* mime = magic_buffer(magic, data.data(), data.size());
    std::string result = mime ? mime : "";
    magic_close(magic);
    return result;
}

ReportFormat FormatSniffer::sniff(const std::span<const unsigned char> data,
                                  const std::string_view file_name_hint) noexcept {
    try {
        if (data.empty()) return ReportFormat::Unsupported;
        if (has_zip_signature(data)) return ReportFormat::Zip;
        if (has_pdf_signature(data)) return ReportFormat::Pdf;

        const auto window = data.first(std::min(data.size(), kSniffWindow));

        const std::string mime = detect_mime(window);
        if (mime == "application/zip" || mime == "application/x-zip-compressed") return ReportFormat::Zip;
        if (mime == "application/pdf") return ReportFormat::Pdf;
        if (!is_textual_mime(mime)) {
            Logger::log(LogLevel::Debug, std::string(file_name_hint) + " rejected as " + mime, sniffer_tag());
            return ReportFormat::Unsupported;
        }

        const DecodedText decoded = decode_text(window);
        if (decoded.text.find('\0') != std::string::npos) return ReportFormat::Unsupported;

        const std::string lower = to_lower_copy(decoded.text);
        const bool html = has_html_markers(lower);
        const bool text = has_text_markers(lower);

        if (html && text) {
            const std::string hint = to_lower_copy(file_name_hint);
            return hint.ends_with(".txt") || hint.ends_with(".log") ? ReportFormat::Text : ReportFormat::Html;
        }
        if (html) return ReportFormat::Html;
        if (text) return ReportFormat::Text;
        return ReportFormat::Unsupported;
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Warning, std::string("sniffing ") + std::string(file_name_hint) +
                    " failed: " + e.what(), sniffer_tag());
        return ReportFormat::Unsupported;
    }
}

} // namespace driveaudit
