#pragma once
#include <memory>
#include <string>
#include "extraction_types.hpp"
#include "html_document.hpp"

namespace OpenCrawl {
namespace Extraction {

struct RenderContext {
    const HtmlDocument&     document;
    const NodeFilter&       filter;
    const GumboNode*        main_region;
    const std::string&      base_url;
    const ExtractionConfig& config;
};

// Produces the content string of one strategy from a cleaned document.
class ContentRenderer {
public:
    virtual ~ContentRenderer() = default;

    virtual ExtractionStrategy strategy() const                        = 0;
    virtual std::string        render(const RenderContext& ctx) const = 0;
};

// The cleaned document serialized back to HTML.
class HtmlRenderer : public ContentRenderer {
public:
    ExtractionStrategy strategy() const override;
    std::string        render(const RenderContext& ctx) const override;
};

// Visible text blocks of the main region, separated by blank lines.
class TextRenderer : public ContentRenderer {
public:
    ExtractionStrategy strategy() const override;
    std::string        render(const RenderContext& ctx) const override;
};

// The main region converted with html2md. Links and images are kept inline
// only when their extraction is enabled.
class MarkdownRenderer : public ContentRenderer {
public:
    ExtractionStrategy strategy() const override;
    std::string        render(const RenderContext& ctx) const override;
};

std::unique_ptr<ContentRenderer> make_renderer(ExtractionStrategy strategy);

}  // namespace Extraction
}  // namespace OpenCrawl
