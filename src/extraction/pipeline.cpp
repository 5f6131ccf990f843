#include "pipeline.hpp"
#include "collectors.hpp"
#include "html_document.hpp"
#include "renderer.hpp"

namespace OpenCrawl {
namespace Extraction {

namespace {

const GumboNode* main_region(const HtmlDocument& doc, const NodeFilter& filter) {
    for (GumboTag tag : {GUMBO_TAG_MAIN, GUMBO_TAG_ARTICLE, GUMBO_TAG_BODY}) {
        const GumboNode* found = Dom::find_first(doc.root(), tag, &filter);
        if (found)
            return found;
    }
    return doc.document();
}

}  // namespace

ExtractionPipeline::ExtractionPipeline(ExtractionConfig config)
    : config_(std::move(config)), cleaner_(config_.cleaning) {
}

const ExtractionConfig& ExtractionPipeline::config() const {
    return config_;
}

ExtractionResult ExtractionPipeline::extract(const std::string& html, const std::string& page_url) const {
    return extract(html, page_url, config_.strategy);
}

ExtractionResult ExtractionPipeline::extract(const std::string& html,
                                             const std::string& page_url,
                                             ExtractionStrategy strategy) const {
    HtmlDocument doc(html, config_.max_document_bytes);

    ExtractionResult result;
    result.strategy = strategy;
    if (config_.extract_metadata)
        result.metadata = collect_metadata(doc.root());

    std::string base = document_base(doc.root(), page_url);

    NodeFilter filter;
    cleaner_.strip_structure(doc.document(), filter);

    if (config_.extract_links)
        result.links = collect_links(doc.root(), filter, base);
    if (config_.extract_images)
        result.images = collect_images(doc.root(), filter, base);

    cleaner_.drop_short_blocks(doc.document(), filter);

    RenderContext ctx{doc, filter, main_region(doc, filter), base, config_};
    result.content = make_renderer(strategy)->render(ctx);
    return result;
}

}  // namespace Extraction
}  // namespace OpenCrawl
