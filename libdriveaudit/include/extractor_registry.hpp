/**
 * @file extractor_registry.hpp
 * @brief Registry owning one extractor per report dialect.
 */

#ifndef DRIVEAUDIT_EXTRACTOR_REGISTRY_HPP
#define DRIVEAUDIT_EXTRACTOR_REGISTRY_HPP

#include "extractor.hpp"
#include <memory>
#include <vector>

namespace driveaudit {

/**
 * @brief Registry of all available extractors.
 *
 * @details Owns the concrete IExtractor implementations and maps a sniffed
 * ReportFormat to the one that reads it. Extractors are stateless, so one
 * registry is shared by every worker of a batch.
 */
class ExtractorRegistry {
public:
    /// Construct and register the HTML, text and PDF extractors.
    ExtractorRegistry();

    /**
     * @brief Find the extractor for a sniffed format.
     * @return Non-owning pointer, or nullptr for ZIP and unsupported formats.
     */
    [[nodiscard]] const IExtractor* find(ReportFormat format) const noexcept;

    [[nodiscard]] const std::vector<std::unique_ptr<IExtractor>>& all() const { return extractors_; }

private:
    std::vector<std::unique_ptr<IExtractor>> extractors_;
};

} // namespace driveaudit

#endif // DRIVEAUDIT_EXTRACTOR_REGISTRY_HPP
