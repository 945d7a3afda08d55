/**
 * @file testing.hpp
 * @brief Fixtures shared by the unit tests: scratch directories, in-memory
 * ZIP and PDF builders, and sample reports in each supported dialect.
 */

#ifndef DRIVEAUDIT_TESTING_HPP
#define DRIVEAUDIT_TESTING_HPP

#include "random_utils.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <qpdf/Buffer.hh>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFWriter.hh>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace testutil {

    namespace fs = std::filesystem;

    // directory removed when the test ends
    class TemporaryDirectory {
    public:
        TemporaryDirectory()
            : path_(fs::temp_directory_path() / ("driveaudit-test-" + driveaudit::random_utils::random_suffix())) {
            fs::create_directories(path_);
        }

        ~TemporaryDirectory() {
            std::error_code ec;
            fs::remove_all(path_, ec);
        }

        TemporaryDirectory(const TemporaryDirectory&) = delete;
        TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

        [[nodiscard]] const fs::path& path() const noexcept { return path_; }

        // number of entries left anywhere below the directory
        [[nodiscard]] std::size_t entry_count() const {
            std::size_t n = 0;
            for ([[maybe_unused]] const auto& e : fs::recursive_directory_iterator(path_)) ++n;
            return n;
        }

    private:
        fs::path path_;
    };

    inline std::vector<unsigned char> bytes(const std::string& s) {
        return {s.begin(), s.end()};
    }

    using ZipEntry = std::pair<std::string, std::vector<unsigned char>>;

    /// Deflate-compressed ZIP written to memory with libarchive.
    inline std::vector<unsigned char> make_zip(const std::vector<ZipEntry>& entries) {
        std::size_t capacity = 64 * 1024;
        for (const auto& [name, data] : entries) capacity += data.size() + name.size() + 1024;

        std::vector<unsigned char> buffer(capacity);
        std::size_t used = 0;

        archive* a = archive_write_new();
        if (!a) throw std::runtime_error("archive_write_new failed");
        archive_write_set_format_zip(a);
        archive_write_set_options(a, "zip:compression=deflate");
        archive_write_set_bytes_in_last_block(a, 1);
        if (archive_write_open_memory(a, buffer.data(), buffer.size(), &used) != ARCHIVE_OK) {
            archive_write_free(a);
            throw std::runtime_error("archive_write_open_memory failed");
        }

        for (const auto& [name, data] : entries) {
            archive_entry* entry = archive_entry_new();
            archive_entry_set_pathname(entry, name.c_str());
            archive_entry_set_size(entry, static_cast<la_int64_t>(data.size()));
            archive_entry_set_filetype(entry, AE_IFREG);
            archive_entry_set_perm(entry, 0644);
            if (archive_write_header(a, entry) != ARCHIVE_OK) {
                archive_entry_free(entry);
                archive_write_free(a);
                throw std::runtime_error("archive_write_header failed for " + name);
            }
            if (!data.empty()) {
                archive_write_data(a, data.data(), data.size());
            }
            archive_entry_free(entry);
        }

        archive_write_close(a);
        archive_write_free(a);
        buffer.resize(used);
        return buffer;
    }

    inline std::string pdf_escape(const std::string& s) {
        std::string out;
        for (const char c : s) {
            if (c == '(' || c == ')' || c == '\\') out.push_back('\\');
            out.push_back(c);
        }
        return out;
    }

    /// Content stream printing one line of 10pt text per entry, top to bottom.
    inline std::string text_page(const std::vector<std::string>& lines) {
        std::string content = "BT /F1 10 Tf 12 TL 50 760 Td\n";
        for (const auto& line : lines) {
            content += "(" + pdf_escape(line) + ") Tj T*\n";
        }
        content += "ET\n";
        return content;
    }

    /// PDF with one page per content stream, all using Helvetica as /F1.
    inline std::vector<unsigned char> make_pdf(const std::vector<std::string>& page_contents) {
        QPDF pdf;
        pdf.emptyPDF();

        QPDFObjectHandle font = pdf.makeIndirectObject(QPDFObjectHandle::parse(
            "<< /Type /Font /Subtype /Type1 /Name /F1 /BaseFont /Helvetica /Encoding /WinAnsiEncoding >>"));
        QPDFObjectHandle fonts = QPDFObjectHandle::newDictionary();
        fonts.replaceKey("/F1", font);
        QPDFObjectHandle resources = QPDFObjectHandle::newDictionary();
        resources.replaceKey("/ProcSet", QPDFObjectHandle::parse("[/PDF /Text]"));
        resources.replaceKey("/Font", fonts);

        QPDFPageDocumentHelper pages(pdf);
        for (const auto& content : page_contents) {
            QPDFObjectHandle page = pdf.makeIndirectObject(QPDFObjectHandle::parse("<< /Type /Page >>"));
            page.replaceKey("/MediaBox", QPDFObjectHandle::parse("[0 0 612 792]"));
            page.replaceKey("/Contents", QPDFObjectHandle::newStream(&pdf, content));
            page.replaceKey("/Resources", resources);
            pages.addPage(QPDFPageObjectHelper(page), false);
        }

        QPDFWriter writer(pdf);
        writer.setOutputMemory();
        writer.setStaticID(true);
        writer.write();
        std::shared_ptr<Buffer> buffer = writer.getBufferSharedPointer();
        const unsigned char* begin = buffer->getBuffer();
        return {begin, begin + buffer->getSize()};
    }

    struct SampleDrive {
        std::string serial = "WD-WCC6Y0ABCDEF";
        std::string model = "WDC WD10EZEX-08WN4A0";
        std::string firmware = "01.01A01";
        std::string size = "953867 MB";
        std::string interface = "S-ATA Gen3, 6 Gbps";
        std::string temperature = "33";
        std::string power_on = "512 days, 7 hours";
        std::string health = "100 % (Excellent)";
    };

    // dotted-leader "label . . . : value" line as printed by Hard Disk Sentinel
    inline std::string hds_line(const std::string& label, const std::string& value) {
        std::string line = label + " ";
        while (line.size() < 48) line += ". ";
        return line + ": " + value + "\n";
    }

    /// Hard Disk Sentinel text report with one summary block per drive.
    inline std::string hds_text_report(const std::vector<SampleDrive>& drives,
                                       const std::string& created = "2024-03-01 09:00:00") {
        std::string out = "Hard Disk Sentinel 5.70 PRO\n";
        out += "Report created: " + created + "\n\n";
        for (std::size_t i = 0; i < drives.size(); ++i) {
            const SampleDrive& d = drives[i];
            out += "Hard Disk Summary\n-----------------\n";
            out += hds_line("Hard Disk Number", std::to_string(i));
            out += hds_line("Hard Disk Model ID", d.model);
            out += hds_line("Firmware Revision", d.firmware);
            if (!d.serial.empty()) out += hds_line("Hard Disk Serial Number", d.serial);
            out += hds_line("Total Size", d.size);
            out += hds_line("Interface", d.interface);
            out += hds_line("Current Temperature", d.temperature + " \xC2\xB0" "C");
            out += hds_line("Power on time", d.power_on);
            out += hds_line("Health", d.health);
            out += "\nS.M.A.R.T.\n-----------\n";
            out += "No.  Attribute                  Thre..  Value  Worst  Data          Status   Flags\n";
            out += "  5  Reallocated Sectors Count  140     200    200    000000000000  OK       Event count\n";
            out += "  9  Power On Hours Count       0       83     83     0000000030A7  OK       Always passing\n";
            out += "194  Temperature                0       110    97     000000000021  OK       Always passing\n";
            out += "\n";
        }
        return out;
    }

    /// Hard Disk Sentinel HTML report: one "hdd" container per drive.
    inline std::string hds_html_report(const std::vector<SampleDrive>& drives,
                                       const std::string& created = "2024-03-02 10:15:00") {
        std::string out = "<!DOCTYPE html>\n<html><head><title>Hard Disk Sentinel Report</title>"
                          "<style>td { padding: 2px; }</style></head><body>\n";
        out += "<p>Report created: " + created + "</p>\n";
        for (std::size_t i = 0; i < drives.size(); ++i) {
            const SampleDrive& d = drives[i];
            out += "<div class=\"hdd\">\n<h2>Hard Disk Summary</h2>\n<table>\n";
            auto row = [&out](const std::string& label, const std::string& value) {
                out += "<tr><td>" + label + " :</td><td>" + value + "</td></tr>\n";
            };
            row("Hard Disk Number", std::to_string(i));
            row("Hard Disk Model ID", d.model);
            row("Firmware Revision", d.firmware);
            if (!d.serial.empty()) row("Hard Disk Serial Number", d.serial);
            row("Total Size", d.size);
            row("Interface", d.interface);
            row("Current Temperature", d.temperature + " &deg;C");
            row("Power on time", d.power_on);
            if (!d.health.empty()) row("Health", d.health);
            out += "</table>\n<table>\n";
            out += "<tr><th>ID</th><th>Attribute name</th><th>Threshold</th><th>Value</th>"
                   "<th>Worst</th><th>Data</th><th>Status</th></tr>\n";
            out += "<tr><td>5</td><td>Reallocated Sectors Count</td><td>140</td><td>200</td>"
                   "<td>200</td><td>000000000000</td><td>OK</td></tr>\n";
            out += "<tr><td>194</td><td>Temperature</td><td>0</td><td>110</td>"
                   "<td>97</td><td>000000000021</td><td>OK</td></tr>\n";
            out += "</table>\n</div>\n";
        }
        out += "</body></html>\n";
        return out;
    }

    struct ScsiDrive {
        std::string serial = "S0M1ABCD";
        std::string product = "ST600MM0006";
        std::string revision = "0004";
        std::string capacity = "600 GB";
        std::string temperature = "38 C";
        std::string power_on = "21,504";
        std::string grown_defects = "3";
        std::string status = "OK";
    };

    /// Lines of one SCSI Toolbox drive report page.
    inline std::vector<std::string> scsi_toolbox_lines(const ScsiDrive& d,
                                                       const std::string& date = "03/05/2024 11:30:00") {
        return {
            "SCSI Toolbox Drive Report",
            "Report Date: " + date,
            "Vendor: SEAGATE",
            "Product ID: " + d.product,
            "Revision: " + d.revision,
            "Serial Number: " + d.serial,
            "Transport Protocol: SAS",
            "Capacity: " + d.capacity,
            "Drive Temperature: " + d.temperature,
            "Power On Hours: " + d.power_on,
            "Elements in grown defect list: " + d.grown_defects,
            "SMART Status: " + d.status,
        };
    }

    /// SCSI Toolbox PDF report, one page per drive.
    inline std::vector<unsigned char> scsi_toolbox_pdf(const std::vector<ScsiDrive>& drives) {
        std::vector<std::string> pages;
        for (const auto& d : drives) {
            pages.push_back(text_page(scsi_toolbox_lines(d)));
        }
        return make_pdf(pages);
    }

} // namespace testutil

#endif // DRIVEAUDIT_TESTING_HPP
