#include "../../include/pdf_extractor.hpp"
#include "../../include/drive_record.hpp"
#include "../../include/field_matcher.hpp"
#include "../../include/logger.hpp"
#include "../../include/string_utils.hpp"
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFLogger.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace driveaudit {

static const char* pdf_tag() {
    return "PdfExtractor";
}

namespace {

// redirects qpdf messages into our logger
struct LoggerStreamBuf final : std::stringbuf {
    LogLevel level;
    std::string module;
    LoggerStreamBuf(const LogLevel lvl, const char* mod) : level(lvl), module(mod) {}
    int sync() override {
        std::string s = str();
        if (!s.empty()) {
            Logger::log(level, s, module);
            str("");
        }
        return 0;
    }
    ~LoggerStreamBuf() override { LoggerStreamBuf::sync(); }
};

// PDF affine matrix [a b 0; c d 0; e f 1], row-vector convention
struct Matrix {
    double a = 1, b = 0, c = 0, d = 1, e = 0, f = 0;
};

Matrix multiply(const Matrix& p, const Matrix& q) {
    return Matrix{
        p.a * q.a + p.b * q.c,
        p.a * q.b + p.b * q.d,
        p.c * q.a + p.d * q.c,
        p.c * q.b + p.d * q.d,
        p.e * q.a + p.f * q.c + q.e,
        p.e * q.b + p.f * q.d + q.f,
    };
}

Matrix translation(const double tx, const double ty) {
    return Matrix{1, 0, 0, 1, tx, ty};
}

std::size_t utf8_length(const std::string_view s) {
    return static_cast<std::size_t>(std::ranges::count_if(s, [](const char ch) {
        return (static_cast<unsigned char>(ch) & 0xC0) != 0x80;
    }));
}

struct TextRun {
    double x = 0;
    double y = 0;
    double size = 0;   ///< Font size in page units
    std::string text;

    [[nodiscard]] double end_x() const {
        return x + static_cast<double>(utf8_length(text)) * size * 0.5;
    }
};

// a TJ adjustment below this (thousandths of an em) separates words
constexpr double kTjGapThreshold = -200.0;

class TextCollector final : public QPDFObjectHandle::ParserCallbacks {
public:
    void handleObject(QPDFObjectHandle obj) override {
        if (!obj.isOperator()) {
            operands_.push_back(obj);
            return;
        }
        apply(obj.getOperatorValue());
        operands_.clear();
    }

    void handleEOF() override {}

    [[nodiscard]] bool bad_position() const noexcept { return bad_position_; }

    [[nodiscard]] std::vector<TextRun> take_runs() { return std::move(runs_); }

private:
    bool numbers(const std::size_t count, std::vector<double>& out) {
        if (operands_.size() < count) return false;
        out.clear();
        for (std::size_t i = operands_.size() - count; i < operands_.size(); ++i) {
            QPDFObjectHandle& operand = operands_[i];
            if (!operand.isNumber()) return false;
            out.push_back(operand.getNumericValue());
        }
        return true;
    }

    void next_line() {
        move_text(0, -leading_);
    }

    void move_text(const double tx, const double ty) {
        tlm_ = multiply(translation(tx, ty), tlm_);
        tm_ = tlm_;
    }

    void show(const std::string& text) {
        if (text.empty()) return;
        const Matrix m = multiply(tm_, ctm_);
        const double scale = std::hypot(m.c, m.d);
        TextRun run{m.e, m.f, font_size_ * (scale > 0 ? scale : 1.0), text};
        if (!std::isfinite(run.x) || !std::isfinite(run.y) || !std::isfinite(run.size)) {
            bad_position_ = true;
            return;
        }
        runs_.push_back(std::move(run));
        advance(static_cast<double>(utf8_length(text)) * font_size_ * 0.5);
    }

    void advance(const double tx) {
        tm_ = multiply(translation(tx, 0), tm_);
    }

    void show_array(QPDFObjectHandle array) {
        std::string pending;
        for (auto item : array.getArrayAsVector()) {
            if (item.isString()) {
                pending += item.getUTF8Value();
            } else if (item.isNumber()) {
                const double adjust = item.getNumericValue();
                if (adjust < kTjGapThreshold) {
                    show(pending);
                    pending.clear();
                    advance(-adjust / 1000.0 * font_size_);
                }
            }
        }
        show(pending);
    }

    void apply(const std::string& op) {
        std::vector<double> n;
        if (op == "q") {
            ctm_stack_.push_back(ctm_);
        } else if (op == "Q") {
            if (!ctm_stack_.empty()) {
                ctm_ = ctm_stack_.back();
                ctm_stack_.pop_back();
            }
        } else if (op == "cm") {
            if (numbers(6, n)) ctm_ = multiply(Matrix{n[0], n[1], n[2], n[3], n[4], n[5]}, ctm_);
        } else if (op == "BT") {
            tm_ = Matrix{};
            tlm_ = Matrix{};
        } else if (op == "Tf") {
            if (numbers(1, n)) font_size_ = n[0];
        } else if (op == "TL") {
            if (numbers(1, n)) leading_ = n[0];
        } else if (op == "Td") {
            if (numbers(2, n)) move_text(n[0], n[1]);
        } else if (op == "TD") {
            if (numbers(2, n)) {
                leading_ = -n[1];
                move_text(n[0], n[1]);
            }
        } else if (op == "Tm") {
            if (numbers(6, n)) {
                tlm_ = Matrix{n[0], n[1], n[2], n[3], n[4], n[5]};
                tm_ = tlm_;
            }
        } else if (op == "T*") {
            next_line();
        } else if (op == "Tj" || op == "'" || op == "\"") {
            if (op != "Tj") next_line();
            if (!operands_.empty() && operands_.back().isString()) show(operands_.back().getUTF8Value());
        } else if (op == "TJ") {
            if (!operands_.empty() && operands_.back().isArray()) show_array(operands_.back());
        }
    }

    std::vector<QPDFObjectHandle> operands_;
    Matrix ctm_;
    std::vector<Matrix> ctm_stack_;
    Matrix tm_;
    Matrix tlm_;
    double font_size_ = 12;
    double leading_ = 0;
    bool bad_position_ = false;
    std::vector<TextRun> runs_;
};

// group runs sharing a baseline into rows, top of the page first
std::string assemble_rows(std::vector<TextRun> runs) {
    std::ranges::stable_sort(runs, [](const TextRun& l, const TextRun& r) { return l.y > r.y; });

    std::vector<std::vector<TextRun>> rows;
    for (auto& run : runs) {
        if (!rows.empty()) {
            const TextRun& anchor = rows.back().front();
            const double tolerance = std::max(2.0, 0.3 * std::max(anchor.size, run.size));
            if (std::abs(anchor.y - run.y) <= tolerance) {
                rows.back().push_back(std::move(run));
                continue;
            }
        }
        rows.emplace_back();
        rows.back().push_back(std::move(run));
    }

    std::string text;
    for (auto& row : rows) {
        std::ranges::stable_sort(row, [](const TextRun& l, const TextRun& r) { return l.x < r.x; });
        std::string line;
        for (std::size_t i = 0; i < row.size(); ++i) {
            if (i > 0) {
                const double gap = row[i].x - row[i - 1].end_x();
                if (gap > row[i].size) {
                    line += "  ";
                } else if (gap > 0.2 * row[i].size) {
                    line += " ";
                }
            }
            line += row[i].text;
        }
        text += line;
        text.push_back('\n');
    }
    return text;
}

} // namespace

ExtractionResult PdfExtractor::extract(const std::span<const unsigned char> data,
                                       const std::string& file_name) const {
    ExtractionResult result;

    LoggerStreamBuf warn_buf(LogLevel::Debug, "qpdf");
    LoggerStreamBuf err_buf(LogLevel::Warning, "qpdf");
    std::ostream warn_os(&warn_buf);
    std::ostream err_os(&err_buf);

    QPDF pdf;
    auto qlogger = QPDFLogger::create();
    qlogger->setOutputStreams(&warn_os, &err_os);
    pdf.setLogger(qlogger);

    std::vector<QPDFPageObjectHelper> pages;
    try {
        pdf.processMemoryFile(file_name.c_str(), reinterpret_cast<const char*>(data.data()), data.size());
        pages = QPDFPageDocumentHelper(pdf).getAllPages();
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Warning, file_name + ": can't open PDF: " + e.what(), pdf_tag());
        result.errors.emplace_back(file_name, ReportFormat::Pdf, ErrorReason::MalformedContent,
                                   std::string("cannot open PDF: ") + e.what());
        return result;
    }

    std::string text;
    for (std::size_t i = 0; i < pages.size(); ++i) {
        const std::string location = "page " + std::to_string(i + 1);
        TextCollector collector;
        try {
            pages[i].parseContents(&collector);
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Warning, file_name + ": " + location + ": " + e.what(), pdf_tag());
            result.errors.emplace_back(file_name, ReportFormat::Pdf, ErrorReason::MalformedContent,
                                       std::string("cannot parse page content: ") + e.what(), location);
            continue;
        }
        if (collector.bad_position()) {
            Logger::log(LogLevel::Warning, file_name + ": " + location + " places text at a non-finite position", pdf_tag());
            result.errors.emplace_back(file_name, ReportFormat::Pdf, ErrorReason::MalformedContent,
                                       "text positioned at a non-finite coordinate", location);
            continue;
        }
        text += assemble_rows(collector.take_runs());
    }

    if (trim(text).empty()) {
        if (result.errors.empty()) {
            result.errors.emplace_back(file_name, ReportFormat::Pdf, ErrorReason::MalformedContent,
                                       "no extractable text");
        }
        return result;
    }

    // boundaries repeat as page banners, so only split when several drives are present
    std::vector<TextBlock> sections;
    if (count_serial_labels(text) > 1) {
        sections = split_blocks(text).blocks;
    }
    if (sections.empty()) {
        sections.push_back(TextBlock{text, 1});
    }

    const auto document_date = match_field(text, Field::ReportDate);
    for (std::size_t i = 0; i < sections.size(); ++i) {
        const std::string location = "line " + std::to_string(sections[i].first_line);

        RawDriveRecord rec;
        rec.source_file_name = file_name;
        rec.source_format = ReportFormat::Pdf;
        rec.index = i;
        rec.location = location;
        rec.encoding = "utf-8";
        match_fields(sections[i].text, rec);
        if (rec.report_date.empty() && document_date) {
            rec.report_date = *document_date;
        }

        if (trim(rec.serial).empty()) {
            result.errors.emplace_back(file_name, ReportFormat::Pdf, ErrorReason::MissingRequiredField,
                                       "drive section has no serial number", location);
            continue;
        }
        rec.excerpt = bounded_copy(sections[i].text, kMaxRawExcerpt);
        result.records.push_back(std::move(rec));
    }

    Logger::log(LogLevel::Debug,
                file_name + ": " + std::to_string(pages.size()) + " page(s), " +
                std::to_string(result.records.size()) + " drive(s)", pdf_tag());
    return result;
}

} // namespace driveaudit
