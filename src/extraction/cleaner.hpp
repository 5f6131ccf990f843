#pragma once
#include "extraction_types.hpp"
#include "html_document.hpp"

namespace OpenCrawl {
namespace Extraction {

/**
 * @brief Decides which parts of a parsed page are noise.
 *
 * Cleaning runs in two passes so that link and image collection can see the
 * structurally cleaned page before short text blocks disappear.
 */
class DocumentCleaner {
public:
    explicit DocumentCleaner(const CleaningOptions& options);

    /**
     * @brief Hides scripts, styles, comments and, when enabled, navigation,
     * header and footer regions.
     */
    void strip_structure(const GumboNode* root, NodeFilter& filter) const;

    /**
     * @brief Hides leaf text blocks (paragraphs, headings, list items, cells)
     * whose visible text is shorter than min_text_length code points. Blocks
     * holding an image are kept.
     */
    void drop_short_blocks(const GumboNode* root, NodeFilter& filter) const;

private:
    bool is_noise(const GumboNode* node) const;

    CleaningOptions options_;
};

}  // namespace Extraction
}  // namespace OpenCrawl
