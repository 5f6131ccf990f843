#pragma once
#include <string>
#include "cleaner.hpp"
#include "extraction_types.hpp"

namespace OpenCrawl {
namespace Extraction {

/**
 * @brief Turns raw HTML into an ExtractionResult.
 *
 * Stateless after construction and safe to call from several threads at once.
 * Equal input and configuration always give an equal result.
 */
class ExtractionPipeline {
public:
    explicit ExtractionPipeline(ExtractionConfig config = {});

    /**
     * @param html      Raw page body.
     * @param page_url  Final URL of the page, used to resolve links and images.
     * @throws Core::ExtractionError when the document is too large or unparseable.
     */
    ExtractionResult extract(const std::string& html, const std::string& page_url) const;

    // Same as above with the configured strategy replaced by `strategy`.
    ExtractionResult extract(const std::string& html,
                             const std::string& page_url,
                             ExtractionStrategy strategy) const;

    const ExtractionConfig& config() const;

private:
    ExtractionConfig config_;
    DocumentCleaner  cleaner_;
};

}  // namespace Extraction
}  // namespace OpenCrawl
