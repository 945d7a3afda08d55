#include "../../include/text_extractor.hpp"
#include "../../include/drive_record.hpp"
#include "../../include/field_matcher.hpp"
#include "../../include/logger.hpp"
#include "../../include/string_utils.hpp"
#include "../../include/text_decoder.hpp"

namespace driveaudit {

static const char* text_tag() {
    return "TextExtractor";
}

ExtractionResult TextExtractor::extract(const std::span<const unsigned char> data,
                                        const std::string& file_name) const {
    ExtractionResult result;
    const DecodedText decoded = decode_text(data);
    const BlockSplit split = split_blocks(decoded.text);

    if (split.blocks.empty()) {
        Logger::log(LogLevel::Warning, file_name + ": no drive block markers", text_tag());
        result.errors.emplace_back(file_name, ReportFormat::Text, ErrorReason::MalformedContent,
                                   "no drive block markers found", std::nullopt, decoded.encodings_tried);
        return result;
    }

    const auto preamble_date = match_field(split.preamble, Field::ReportDate);

    for (std::size_t i = 0; i < split.blocks.size(); ++i) {
        const TextBlock& block = split.blocks[i];
        const std::string location = "line " + std::to_string(block.first_line);

        RawDriveRecord rec;
        rec.source_file_name = file_name;
        rec.source_format = ReportFormat::Text;
        rec.index = i;
        rec.location = location;
        rec.encoding = decoded.encoding;
        match_fields(block.text, rec);
        if (rec.report_date.empty() && preamble_date) {
            rec.report_date = *preamble_date;
        }

        if (trim(rec.serial).empty()) {
            Logger::log(LogLevel::Debug, file_name + ": block at " + location + " has no serial number", text_tag());
            result.errors.emplace_back(file_name, ReportFormat::Text, ErrorReason::MissingRequiredField,
                                       "drive block has no serial number", location, decoded.encodings_tried);
            continue;
        }
        rec.excerpt = bounded_copy(block.text, kMaxRawExcerpt);
        result.records.push_back(std::move(rec));
    }

    Logger::log(LogLevel::Debug,
                file_name + ": " + std::to_string(result.records.size()) + " drive(s) as " + decoded.encoding,
                text_tag());
    return result;
}

} // namespace driveaudit
