#include "cleaner.hpp"
#include "../utils/text/string_utils.hpp"

namespace OpenCrawl {
namespace Extraction {

using namespace OpenCrawl::Utils::Text;

namespace {

bool is_text_block(GumboTag tag) {
    switch (tag) {
        case GUMBO_TAG_P:
        case GUMBO_TAG_H1:
        case GUMBO_TAG_H2:
        case GUMBO_TAG_H3:
        case GUMBO_TAG_H4:
        case GUMBO_TAG_H5:
        case GUMBO_TAG_H6:
        case GUMBO_TAG_LI:
        case GUMBO_TAG_TD:
        case GUMBO_TAG_TH:
        case GUMBO_TAG_BLOCKQUOTE:
        case GUMBO_TAG_PRE:
        case GUMBO_TAG_DT:
        case GUMBO_TAG_DD:
        case GUMBO_TAG_FIGCAPTION:
        case GUMBO_TAG_CAPTION: return true;
        default: return false;
    }
}

bool has_visible_descendant(const GumboNode* node, const NodeFilter& filter, bool (*match)(GumboTag)) {
    const GumboVector* kids = Dom::children(node);
    if (!kids)
        return false;
    for (unsigned int i = 0; i < kids->length; ++i) {
        auto* child = static_cast<const GumboNode*>(kids->data[i]);
        if (!filter.visible(child) || !Dom::is_element(child))
            continue;
        if (match(Dom::tag(child)) || has_visible_descendant(child, filter, match))
            return true;
    }
    return false;
}

bool is_image(GumboTag tag) {
    return tag == GUMBO_TAG_IMG;
}

}  // namespace

DocumentCleaner::DocumentCleaner(const CleaningOptions& options) : options_(options) {
}

bool DocumentCleaner::is_noise(const GumboNode* node) const {
    if (node->type == GUMBO_NODE_COMMENT)
        return options_.strip_comments;
    if (!Dom::is_element(node))
        return false;

    switch (Dom::tag(node)) {
        case GUMBO_TAG_SCRIPT:
        case GUMBO_TAG_NOSCRIPT: return options_.strip_scripts;
        case GUMBO_TAG_STYLE: return options_.strip_styles;
        case GUMBO_TAG_NAV: return options_.strip_nav;
        case GUMBO_TAG_HEADER: return options_.strip_headers;
        case GUMBO_TAG_FOOTER: return options_.strip_footers;
        default: break;
    }

    if (options_.strip_nav) {
        const char* role = Dom::attribute(node, "role");
        if (role && iequals(trim(role), "navigation"))
            return true;
    }
    return false;
}

void DocumentCleaner::strip_structure(const GumboNode* node, NodeFilter& filter) const {
    if (is_noise(node)) {
        filter.remove(node);
        return;
    }
    const GumboVector* kids = Dom::children(node);
    if (!kids)
        return;
    for (unsigned int i = 0; i < kids->length; ++i)
        strip_structure(static_cast<const GumboNode*>(kids->data[i]), filter);
}

void DocumentCleaner::drop_short_blocks(const GumboNode* node, NodeFilter& filter) const {
    if (options_.min_text_length <= 0 || !filter.visible(node))
        return;

    if (Dom::is_element(node) && is_text_block(Dom::tag(node))
        && !has_visible_descendant(node, filter, &Dom::is_block)) {
        std::size_t length = utf8_length(collapse_whitespace(Dom::text_content(node, &filter)));
        if (length < static_cast<std::size_t>(options_.min_text_length)
            && !has_visible_descendant(node, filter, &is_image)) {
            filter.remove(node);
        }
        return;
    }

    const GumboVector* kids = Dom::children(node);
    if (!kids)
        return;
    for (unsigned int i = 0; i < kids->length; ++i)
        drop_short_blocks(static_cast<const GumboNode*>(kids->data[i]), filter);
}

}  // namespace Extraction
}  // namespace OpenCrawl
