#include "html_document.hpp"
#include <cctype>
#include "../core/types/errors.hpp"

namespace OpenCrawl {
namespace Extraction {

HtmlDocument::HtmlDocument(const std::string& html, std::size_t max_bytes) : source_(html) {
    if (source_.size() > max_bytes) {
        throw Core::ExtractionError("Document of " + std::to_string(source_.size())
                                    + " bytes exceeds the " + std::to_string(max_bytes)
                                    + " byte limit");
    }
    output_ = gumbo_parse_with_options(&kGumboDefaultOptions, source_.data(), source_.size());
    if (!output_ || !output_->root)
        throw Core::ExtractionError("Unparseable document");
}

HtmlDocument::~HtmlDocument() {
    if (output_)
        gumbo_destroy_output(&kGumboDefaultOptions, output_);
}

const GumboNode* HtmlDocument::root() const {
    return output_->root;
}

const GumboNode* HtmlDocument::document() const {
    return output_->document;
}

namespace Dom {

bool is_element(const GumboNode* node) {
    return node->type == GUMBO_NODE_ELEMENT || node->type == GUMBO_NODE_TEMPLATE;
}

const GumboVector* children(const GumboNode* node) {
    if (node->type == GUMBO_NODE_DOCUMENT)
        return &node->v.document.children;
    if (is_element(node))
        return &node->v.element.children;
    return nullptr;
}

GumboTag tag(const GumboNode* node) {
    return is_element(node) ? node->v.element.tag : GUMBO_TAG_UNKNOWN;
}

std::string tag_name(const GumboNode* node) {
    if (!is_element(node))
        return "";
    if (node->v.element.tag != GUMBO_TAG_UNKNOWN)
        return gumbo_normalized_tagname(node->v.element.tag);

    GumboStringPiece piece = node->v.element.original_tag;
    if (!piece.data || piece.length == 0)
        return "";
    gumbo_tag_from_original_text(&piece);
    std::string name(piece.data, piece.length);
    size_t      end = name.find_first_of(" \t\r\n\f/>");
    if (end != std::string::npos)
        name.resize(end);
    for (auto& c : name)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return name;
}

const char* attribute(const GumboNode* node, const char* name) {
    if (!is_element(node))
        return nullptr;
    GumboAttribute* attr = gumbo_get_attribute(&node->v.element.attributes, name);
    return attr ? attr->value : nullptr;
}

namespace {

void append_text(const GumboNode* node, const NodeFilter* filter, std::string& out) {
    if (filter && !filter->visible(node))
        return;
    switch (node->type) {
        case GUMBO_NODE_TEXT:
        case GUMBO_NODE_WHITESPACE:
        case GUMBO_NODE_CDATA: out += node->v.text.text; return;
        case GUMBO_NODE_COMMENT: return;
        default: break;
    }
    GumboTag t = tag(node);
    if (t == GUMBO_TAG_SCRIPT || t == GUMBO_TAG_STYLE || t == GUMBO_TAG_NOSCRIPT
        || t == GUMBO_TAG_TEMPLATE)
        return;
    const GumboVector* kids = children(node);
    if (!kids)
        return;
    for (unsigned int i = 0; i < kids->length; ++i)
        append_text(static_cast<const GumboNode*>(kids->data[i]), filter, out);
}

}  // namespace

std::string text_content(const GumboNode* node, const NodeFilter* filter) {
    std::string out;
    append_text(node, filter, out);
    return out;
}

const GumboNode* find_first(const GumboNode* node, GumboTag wanted, const NodeFilter* filter) {
    if (filter && !filter->visible(node))
        return nullptr;
    if (is_element(node) && node->v.element.tag == wanted)
        return node;
    const GumboVector* kids = children(node);
    if (!kids)
        return nullptr;
    for (unsigned int i = 0; i < kids->length; ++i) {
        const GumboNode* found = find_first(static_cast<const GumboNode*>(kids->data[i]), wanted, filter);
        if (found)
            return found;
    }
    return nullptr;
}

bool is_block(GumboTag t) {
    switch (t) {
        case GUMBO_TAG_ADDRESS:
        case GUMBO_TAG_ARTICLE:
        case GUMBO_TAG_ASIDE:
        case GUMBO_TAG_BLOCKQUOTE:
        case GUMBO_TAG_BODY:
        case GUMBO_TAG_CAPTION:
        case GUMBO_TAG_DD:
        case GUMBO_TAG_DETAILS:
        case GUMBO_TAG_DIV:
        case GUMBO_TAG_DL:
        case GUMBO_TAG_DT:
        case GUMBO_TAG_FIELDSET:
        case GUMBO_TAG_FIGCAPTION:
        case GUMBO_TAG_FIGURE:
        case GUMBO_TAG_FOOTER:
        case GUMBO_TAG_FORM:
        case GUMBO_TAG_H1:
        case GUMBO_TAG_H2:
        case GUMBO_TAG_H3:
        case GUMBO_TAG_H4:
        case GUMBO_TAG_H5:
        case GUMBO_TAG_H6:
        case GUMBO_TAG_HEADER:
        case GUMBO_TAG_HR:
        case GUMBO_TAG_LI:
        case GUMBO_TAG_MAIN:
        case GUMBO_TAG_NAV:
        case GUMBO_TAG_OL:
        case GUMBO_TAG_P:
        case GUMBO_TAG_PRE:
        case GUMBO_TAG_SECTION:
        case GUMBO_TAG_SUMMARY:
        case GUMBO_TAG_TABLE:
        case GUMBO_TAG_TBODY:
        case GUMBO_TAG_TD:
        case GUMBO_TAG_TFOOT:
        case GUMBO_TAG_TH:
        case GUMBO_TAG_THEAD:
        case GUMBO_TAG_TR:
        case GUMBO_TAG_UL: return true;
        default: return false;
    }
}

}  // namespace Dom

}  // namespace Extraction
}  // namespace OpenCrawl
