#include "../../include/html_extractor.hpp"
#include "../../include/drive_record.hpp"
#include "../../include/field_matcher.hpp"
#include "../../include/logger.hpp"
#include "../../include/string_utils.hpp"
#include "../../include/text_decoder.hpp"
#include <gumbo.h>
#include <algorithm>
#include <memory>
#include <stdexcept>

namespace driveaudit {

static const char* html_tag() {
    return "HtmlExtractor";
}

namespace {

// marks a heading line in flattened text; never produced by decoding
constexpr char kHeadingSentinel = '\x1E';

struct GumboOutputDeleter {
    void operator()(GumboOutput* out) const noexcept {
        if (out) gumbo_destroy_output(&kGumboDefaultOptions, out);
    }
};

using GumboOutputPtr = std::unique_ptr<GumboOutput, GumboOutputDeleter>;

struct Section {
    std::string text;
    std::string location;
    std::size_t source_offset = std::string::npos; ///< Start of the section in the decoded source
};

bool is_heading(const GumboTag tag) {
    return tag == GUMBO_TAG_H1 || tag == GUMBO_TAG_H2 || tag == GUMBO_TAG_H3 ||
           tag == GUMBO_TAG_H4 || tag == GUMBO_TAG_H5 || tag == GUMBO_TAG_H6;
}

bool is_block(const GumboTag tag) {
    switch (tag) {
        case GUMBO_TAG_P:
        case GUMBO_TAG_DIV:
        case GUMBO_TAG_BR:
        case GUMBO_TAG_HR:
        case GUMBO_TAG_LI:
        case GUMBO_TAG_UL:
        case GUMBO_TAG_OL:
        case GUMBO_TAG_DL:
        case GUMBO_TAG_DT:
        case GUMBO_TAG_DD:
        case GUMBO_TAG_TABLE:
        case GUMBO_TAG_TBODY:
        case GUMBO_TAG_THEAD:
        case GUMBO_TAG_TFOOT:
        case GUMBO_TAG_CAPTION:
        case GUMBO_TAG_TR:
        case GUMBO_TAG_PRE:
        case GUMBO_TAG_BLOCKQUOTE:
        case GUMBO_TAG_ARTICLE:
        case GUMBO_TAG_SECTION:
        case GUMBO_TAG_HEADER:
        case GUMBO_TAG_FOOTER:
        case GUMBO_TAG_FORM:
        case GUMBO_TAG_FIELDSET:
        case GUMBO_TAG_CENTER:
        case GUMBO_TAG_BODY:
            return true;
        default:
            return is_heading(tag);
    }
}

const GumboVector& children_of(const GumboNode* node) {
    return node->type == GUMBO_NODE_DOCUMENT ? node->v.document.children : node->v.element.children;
}

std::string replace_nbsp(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\xC2' && i + 1 < text.size() && text[i + 1] == '\xA0') {
            out.push_back(' ');
            ++i;
        } else {
            out.push_back(text[i]);
        }
    }
    return out;
}

class Flattener {
public:
    explicit Flattener(const bool mark_headings) : mark_headings_(mark_headings) {}

    void walk(const GumboNode* node) {
        switch (node->type) {
            case GUMBO_NODE_TEXT:
            case GUMBO_NODE_CDATA:
            case GUMBO_NODE_WHITESPACE:
                text(node->v.text.text);
                return;
            case GUMBO_NODE_DOCUMENT:
                walk_children(node);
                return;
            case GUMBO_NODE_ELEMENT:
            case GUMBO_NODE_TEMPLATE:
                break;
            default:
                return;
        }

        const GumboTag tag = node->v.element.tag;
        if (tag == GUMBO_TAG_SCRIPT || tag == GUMBO_TAG_STYLE || tag == GUMBO_TAG_HEAD) return;

        if (tag == GUMBO_TAG_TR && !contains_table(node)) {
            row(node);
            return;
        }

        if (is_heading(tag) && mark_headings_) {
            Flattener inner(false);
            inner.walk_children(node);
            const std::string title = collapse_whitespace(inner.out_);
            newline();
            if (icontains(title, "disk") || icontains(title, "drive")) {
                out_.push_back(kHeadingSentinel);
            }
            out_ += title;
            newline();
            return;
        }

        const bool block = is_block(tag);
        if (block) newline();
        if (tag == GUMBO_TAG_PRE) ++pre_depth_;
        walk_children(node);
        if (tag == GUMBO_TAG_PRE) --pre_depth_;
        if (block) newline();
    }

    void walk_children(const GumboNode* node) {
        const GumboVector& children = children_of(node);
        for (unsigned i = 0; i < children.length; ++i) {
            walk(static_cast<const GumboNode*>(children.data[i]));
        }
    }

    [[nodiscard]] std::string take() { return std::move(out_); }

private:
    void text(const char* raw) {
        if (!raw) return;
        const std::string s = replace_nbsp(raw);
        if (pre_depth_ > 0) {
            out_ += s;
            return;
        }
        const std::string collapsed = collapse_whitespace(s);
        if (collapsed.empty()) return;
        if (!out_.empty() && out_.back() != '\n' && out_.back() != ' ') out_.push_back(' ');
        out_ += collapsed;
    }

    void newline() {
        if (!out_.empty() && out_.back() != '\n') out_.push_back('\n');
    }

    // cells of a row: two cells read as "label : value", more keep column gaps
    void row(const GumboNode* tr) {
        std::vector<std::string> cells;
        const GumboVector& children = tr->v.element.children;
        for (unsigned i = 0; i < children.length; ++i) {
            const auto* cell = static_cast<const GumboNode*>(children.data[i]);
            if (cell->type != GUMBO_NODE_ELEMENT) continue;
            if (cell->v.element.tag != GUMBO_TAG_TD && cell->v.element.tag != GUMBO_TAG_TH) continue;
            Flattener inner(false);
            inner.walk_children(cell);
            cells.push_back(collapse_whitespace(inner.out_));
        }
        if (cells.empty()) return;

        newline();
        if (cells.size() == 2 && !cells[0].empty()) {
            std::string label = cells[0];
            while (!label.empty() && (label.back() == ':' || label.back() == ' ')) label.pop_back();
            out_ += label + " : " + cells[1];
        } else {
            for (std::size_t i = 0; i < cells.size(); ++i) {
                if (i > 0) out_ += "  ";
                out_ += cells[i].empty() ? "-" : cells[i];
            }
        }
        newline();
    }

    static bool contains_table(const GumboNode* node) {
        const GumboVector& children = node->v.element.children;
        for (unsigned i = 0; i < children.length; ++i) {
            const auto* child = static_cast<const GumboNode*>(children.data[i]);
            if (child->type != GUMBO_NODE_ELEMENT) continue;
            if (child->v.element.tag == GUMBO_TAG_TABLE || contains_table(child)) return true;
        }
        return false;
    }

    bool mark_headings_;
    int pre_depth_ = 0;
    std::string out_;
};

std::string flatten_node(const GumboNode* node, const bool mark_headings) {
    Flattener f(mark_headings);
    f.walk(node);
    return f.take();
}

bool names_drive(const GumboNode* node) {
    for (const char* attr_name : {"class", "id"}) {
        const GumboAttribute* attr = gumbo_get_attribute(&node->v.element.attributes, attr_name);
        if (!attr || !attr->value) continue;
        const std::string_view value = attr->value;
        if (icontains(value, "drive") || icontains(value, "disk") || icontains(value, "hdd")) return true;
    }
    return false;
}

// outermost drive-named elements holding at most one drive; wrappers holding several are descended
void collect_drive_elements(const GumboNode* node, std::vector<const GumboNode*>& out) {
    if (node->type != GUMBO_NODE_ELEMENT && node->type != GUMBO_NODE_DOCUMENT) return;
    if (node->type == GUMBO_NODE_ELEMENT) {
        const GumboTag tag = node->v.element.tag;
        if (tag == GUMBO_TAG_SCRIPT || tag == GUMBO_TAG_STYLE || tag == GUMBO_TAG_HEAD) return;
        if (names_drive(node)) {
            const std::string text = flatten_node(node, false);
            const std::size_t serials = count_serial_labels(text);
            if (serials <= 1) {
                if (has_labeled_fields(text)) out.push_back(node);
                return;
            }
        }
    }
    const GumboVector& children = children_of(node);
    for (unsigned i = 0; i < children.length; ++i) {
        collect_drive_elements(static_cast<const GumboNode*>(children.data[i]), out);
    }
}

std::vector<Section> heading_sections(const std::string& marked) {
    std::vector<Section> sections;
    const auto lines = split_lines(marked);
    bool open = false;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        const std::string_view line = lines[i];
        if (!line.empty() && line.front() == kHeadingSentinel) {
            sections.push_back(Section{std::string(line.substr(1)) + "\n", "heading " + std::to_string(sections.size() + 1)});
            open = true;
            continue;
        }
        if (open) {
            sections.back().text.append(line);
            sections.back().text.push_back('\n');
        }
    }
    std::erase_if(sections, [](const Section& s) { return !has_labeled_fields(s.text); });
    return sections;
}

std::vector<Section> marker_sections(const std::string& text) {
    std::vector<Section> sections;
    for (auto& block : split_blocks(text).blocks) {
        sections.push_back(Section{std::move(block.text), "line " + std::to_string(block.first_line)});
    }
    return sections;
}

std::string strip_sentinels(std::string text) {
    std::erase(text, kHeadingSentinel);
    return text;
}

} // namespace

std::string HtmlExtractor::flatten(const std::string_view html) {
    GumboOutputPtr output(gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size()));
    if (!output) {
        throw std::runtime_error("gumbo_parse failed");
    }
    return flatten_node(output->document, false);
}

ExtractionResult HtmlExtractor::extract(const std::span<const unsigned char> data,
                                        const std::string& file_name) const {
    ExtractionResult result;
    const DecodedText decoded = decode_text(data);

    GumboOutputPtr output(gumbo_parse_with_options(&kGumboDefaultOptions, decoded.text.data(), decoded.text.size()));
    if (!output) {
        result.errors.emplace_back(file_name, ReportFormat::Html, ErrorReason::MalformedContent,
                                   "HTML parser returned no document", std::nullopt, decoded.encodings_tried);
        return result;
    }

    const std::string marked = flatten_node(output->document, true);
    const std::string plain = strip_sentinels(marked);
    const auto document_date = match_field(plain, Field::ReportDate);

    std::vector<Section> sections;

    std::vector<const GumboNode*> elements;
    collect_drive_elements(output->document, elements);
    for (const GumboNode* node : elements) {
        const std::size_t offset = node->v.element.start_pos.offset;
        sections.push_back(Section{flatten_node(node, false), "offset " + std::to_string(offset), offset});
    }

    if (sections.empty()) {
        sections = heading_sections(marked);
        // a heading over several drives (a page title) defers to the boundary markers
        const bool merged = std::ranges::any_of(sections, [](const Section& s) {
            return count_serial_labels(s.text) > 1;
        });
        if (merged) {
            if (auto blocks = marker_sections(plain); !blocks.empty()) sections = std::move(blocks);
        }
    }
    if (sections.empty()) sections = marker_sections(plain);
    if (sections.empty() && count_serial_labels(plain) == 1) {
        sections.push_back(Section{plain, "document"});
    }

    if (sections.empty()) {
        Logger::log(LogLevel::Warning, file_name + ": no drive sections found", html_tag());
        result.errors.emplace_back(file_name, ReportFormat::Html, ErrorReason::MalformedContent,
                                   "no drive sections found", std::nullopt, decoded.encodings_tried);
        return result;
    }

    for (std::size_t i = 0; i < sections.size(); ++i) {
        const Section& section = sections[i];

        RawDriveRecord rec;
        rec.source_file_name = file_name;
        rec.source_format = ReportFormat::Html;
        rec.index = i;
        rec.location = section.location;
        rec.encoding = decoded.encoding;
        match_fields(section.text, rec);
        if (rec.report_date.empty() && document_date) {
            rec.report_date = *document_date;
        }

        if (trim(rec.serial).empty()) {
            result.errors.emplace_back(file_name, ReportFormat::Html, ErrorReason::MissingRequiredField,
                                       "drive section has no serial number", section.location, decoded.encodings_tried);
            continue;
        }
        if (trim(rec.health).empty() && trim(rec.status).empty()) {
            result.errors.emplace_back(file_name, ReportFormat::Html, ErrorReason::MissingRequiredField,
                                       "drive section " + rec.serial + " has no health or status value",
                                       section.location, decoded.encodings_tried);
            continue;
        }

        if (section.source_offset != std::string::npos && section.source_offset < decoded.text.size()) {
            rec.excerpt = bounded_copy(std::string_view(decoded.text).substr(section.source_offset), kMaxRawExcerpt);
        } else {
            rec.excerpt = bounded_copy(section.text, kMaxRawExcerpt);
        }
        result.records.push_back(std::move(rec));
    }

    Logger::log(LogLevel::Debug,
                file_name + ": " + std::to_string(result.records.size()) + " drive(s) from " +
                std::to_string(sections.size()) + " section(s)", html_tag());
    return result;
}

} // namespace driveaudit
