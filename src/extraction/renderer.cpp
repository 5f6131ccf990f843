#include "renderer.hpp"
#include <vector>
#include "../utils/text/string_utils.hpp"
#include "html2md.h"
#include "serializer.hpp"

namespace OpenCrawl {
namespace Extraction {

using namespace OpenCrawl::Utils::Text;

namespace {

class BlockCollector {
public:
    BlockCollector(const NodeFilter& filter, int min_length)
        : filter_(filter), min_length_(min_length > 0 ? static_cast<std::size_t>(min_length) : 0) {
    }

    void walk(const GumboNode* node) {
        if (!filter_.visible(node))
            return;

        switch (node->type) {
            case GUMBO_NODE_TEXT:
            case GUMBO_NODE_WHITESPACE:
            case GUMBO_NODE_CDATA: current_ += node->v.text.text; return;
            case GUMBO_NODE_COMMENT: return;
            default: break;
        }

        GumboTag tag = Dom::tag(node);
        if (tag == GUMBO_TAG_SCRIPT || tag == GUMBO_TAG_STYLE || tag == GUMBO_TAG_NOSCRIPT
            || tag == GUMBO_TAG_TEMPLATE || tag == GUMBO_TAG_HEAD)
            return;
        if (tag == GUMBO_TAG_BR) {
            current_ += ' ';
            return;
        }

        bool block = node->type == GUMBO_NODE_DOCUMENT || Dom::is_block(tag);
        if (block)
            flush();
        const GumboVector* kids = Dom::children(node);
        if (kids) {
            for (unsigned int i = 0; i < kids->length; ++i)
                walk(static_cast<const GumboNode*>(kids->data[i]));
        }
        if (block)
            flush();
    }

    std::string join() {
        flush();
        std::string out;
        for (const auto& block : blocks_) {
            if (!out.empty())
                out += "\n\n";
            out += block;
        }
        return out;
    }

private:
    void flush() {
        std::string text = collapse_whitespace(current_);
        current_.clear();
        if (text.empty() || utf8_length(text) < min_length_)
            return;
        blocks_.push_back(std::move(text));
    }

    const NodeFilter&        filter_;
    std::size_t              min_length_;
    std::string              current_;
    std::vector<std::string> blocks_;
};

}  // namespace

ExtractionStrategy HtmlRenderer::strategy() const {
    return ExtractionStrategy::Html;
}

std::string HtmlRenderer::render(const RenderContext& ctx) const {
    return serialize_html(ctx.document.document(), ctx.filter);
}

ExtractionStrategy TextRenderer::strategy() const {
    return ExtractionStrategy::Content;
}

std::string TextRenderer::render(const RenderContext& ctx) const {
    BlockCollector collector(ctx.filter, ctx.config.cleaning.min_text_length);
    collector.walk(ctx.main_region);
    return collector.join();
}

ExtractionStrategy MarkdownRenderer::strategy() const {
    return ExtractionStrategy::Markdown;
}

std::string MarkdownRenderer::render(const RenderContext& ctx) const {
    SerializeOptions options;
    options.unwrap_links = !ctx.config.extract_links;
    options.drop_images  = !ctx.config.extract_images;
    options.base_url     = ctx.base_url;

    std::string html = serialize_html(ctx.main_region, ctx.filter, options);

    html2md::Options md_options;
    md_options.splitLines = false;
    html2md::Converter converter(html, &md_options);
    return trim(converter.convert());
}

std::unique_ptr<ContentRenderer> make_renderer(ExtractionStrategy strategy) {
    switch (strategy) {
        case ExtractionStrategy::Html: return std::make_unique<HtmlRenderer>();
        case ExtractionStrategy::Content: return std::make_unique<TextRenderer>();
        case ExtractionStrategy::Markdown: return std::make_unique<MarkdownRenderer>();
    }
    return std::make_unique<MarkdownRenderer>();
}

}  // namespace Extraction
}  // namespace OpenCrawl
