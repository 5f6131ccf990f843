#include "extraction_types.hpp"
#include <stdexcept>
#include "../utils/text/string_utils.hpp"

namespace OpenCrawl {
namespace Extraction {

std::string to_string(ExtractionStrategy strategy) {
    switch (strategy) {
        case ExtractionStrategy::Html: return "html";
        case ExtractionStrategy::Content: return "content";
        case ExtractionStrategy::Markdown: return "markdown";
    }
    return "unknown";
}

ExtractionStrategy parse_strategy(const std::string& name) {
    std::string lower = Utils::Text::to_lower(Utils::Text::trim(name));
    if (lower == "html")
        return ExtractionStrategy::Html;
    if (lower == "content" || lower == "text")
        return ExtractionStrategy::Content;
    if (lower == "markdown" || lower == "md")
        return ExtractionStrategy::Markdown;
    throw std::invalid_argument("Unknown extraction strategy: " + name);
}

}  // namespace Extraction
}  // namespace OpenCrawl
