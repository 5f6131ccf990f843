#pragma once
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "../core/types/constants.hpp"

namespace OpenCrawl {
namespace Extraction {

enum class ExtractionStrategy { Html, Content, Markdown };

std::string to_string(ExtractionStrategy strategy);

// Case-insensitive "html", "content" or "markdown". Throws std::invalid_argument.
ExtractionStrategy parse_strategy(const std::string& name);

struct CleaningOptions {
    bool strip_scripts   = true;
    bool strip_styles    = true;
    bool strip_comments  = true;
    bool strip_nav       = false;
    bool strip_headers   = false;
    bool strip_footers   = false;
    int  min_text_length = Core::Constants::DEFAULT_MIN_TEXT_LENGTH;
};

struct ExtractionConfig {
    ExtractionStrategy strategy = ExtractionStrategy::Markdown;
    CleaningOptions    cleaning;
    bool               extract_metadata   = true;
    bool               extract_links      = true;
    bool               extract_images     = true;
    std::size_t        max_document_bytes = Core::Constants::DEFAULT_MAX_DOCUMENT_BYTES;
};

struct ExtractionResult {
    ExtractionStrategy                       strategy = ExtractionStrategy::Markdown;
    std::string                              content;
    std::map<std::string, std::string>       metadata;
    std::optional<std::vector<std::string>>  links;
    std::optional<std::vector<std::string>>  images;

    bool operator==(const ExtractionResult& other) const = default;
};

}  // namespace Extraction
}  // namespace OpenCrawl
