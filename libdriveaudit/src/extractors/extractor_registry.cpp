#include "../../include/extractor_registry.hpp"
#include "../../include/html_extractor.hpp"
#include "../../include/pdf_extractor.hpp"
#include "../../include/text_extractor.hpp"

namespace driveaudit {

ExtractorRegistry::ExtractorRegistry() {
    extractors_.push_back(std::make_unique<HtmlExtractor>());
    extractors_.push_back(std::make_unique<TextExtractor>());
    extractors_.push_back(std::make_unique<PdfExtractor>());
}

const IExtractor* ExtractorRegistry::find(const ReportFormat format) const noexcept {
    for (const auto& extractor : extractors_) {
        if (extractor->format() == format) {
            return extractor.get();
        }
    }
    return nullptr;
}

} // namespace driveaudit
