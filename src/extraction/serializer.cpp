#include "serializer.hpp"
#include "../utils/url/url.hpp"

namespace OpenCrawl {
namespace Extraction {

namespace {

bool is_void(GumboTag tag) {
    switch (tag) {
        case GUMBO_TAG_AREA:
        case GUMBO_TAG_BASE:
        case GUMBO_TAG_BR:
        case GUMBO_TAG_COL:
        case GUMBO_TAG_EMBED:
        case GUMBO_TAG_HR:
        case GUMBO_TAG_IMG:
        case GUMBO_TAG_INPUT:
        case GUMBO_TAG_LINK:
        case GUMBO_TAG_META:
        case GUMBO_TAG_PARAM:
        case GUMBO_TAG_SOURCE:
        case GUMBO_TAG_TRACK:
        case GUMBO_TAG_WBR: return true;
        default: return false;
    }
}

bool is_raw_text(GumboTag tag) {
    return tag == GUMBO_TAG_SCRIPT || tag == GUMBO_TAG_STYLE || tag == GUMBO_TAG_XMP
           || tag == GUMBO_TAG_IFRAME || tag == GUMBO_TAG_NOEMBED || tag == GUMBO_TAG_NOFRAMES
           || tag == GUMBO_TAG_PLAINTEXT;
}

void escape(const char* text, bool attribute, std::string& out) {
    for (const char* p = text; *p; ++p) {
        switch (*p) {
            case '&': out += "&amp;"; break;
            case '<': out += attribute ? "<" : "&lt;"; break;
            case '>': out += attribute ? ">" : "&gt;"; break;
            case '"': out += attribute ? "&quot;" : "\""; break;
            default: out += *p;
        }
    }
}

class Serializer {
public:
    Serializer(const NodeFilter& filter, const SerializeOptions& options)
        : filter_(filter), options_(options) {
    }

    void node(const GumboNode* node, bool raw_parent) {
        if (!filter_.visible(node))
            return;

        switch (node->type) {
            case GUMBO_NODE_DOCUMENT: document(node); return;
            case GUMBO_NODE_TEXT:
            case GUMBO_NODE_WHITESPACE:
                if (raw_parent)
                    out_ += node->v.text.text;
                else
                    escape(node->v.text.text, false, out_);
                return;
            case GUMBO_NODE_CDATA:
                out_ += "<![CDATA[";
                out_ += node->v.text.text;
                out_ += "]]>";
                return;
            case GUMBO_NODE_COMMENT:
                out_ += "<!--";
                out_ += node->v.text.text;
                out_ += "-->";
                return;
            default: element(node); return;
        }
    }

    std::string take() {
        return std::move(out_);
    }

private:
    void document(const GumboNode* node) {
        const GumboDocument& doc = node->v.document;
        if (doc.has_doctype) {
            out_ += "<!DOCTYPE ";
            out_ += (doc.name && *doc.name) ? doc.name : "html";
            out_ += ">\n";
        }
        children(node, false);
    }

    void element(const GumboNode* node) {
        GumboTag tag = Dom::tag(node);

        if (tag == GUMBO_TAG_A && options_.unwrap_links) {
            children(node, false);
            return;
        }
        if (tag == GUMBO_TAG_IMG && options_.drop_images) {
            const char* alt = Dom::attribute(node, "alt");
            if (alt)
                escape(alt, false, out_);
            return;
        }

        std::string name = Dom::tag_name(node);
        if (name.empty()) {
            children(node, false);
            return;
        }

        out_ += '<';
        out_ += name;
        const GumboVector& attrs = node->v.element.attributes;
        for (unsigned int i = 0; i < attrs.length; ++i)
            attribute(static_cast<const GumboAttribute*>(attrs.data[i]));
        out_ += '>';

        if (is_void(tag))
            return;

        children(node, is_raw_text(tag));
        out_ += "</";
        out_ += name;
        out_ += '>';
    }

    void attribute(const GumboAttribute* attr) {
        out_ += ' ';
        out_ += attr->name;
        std::string value = attr->value;
        if (!options_.base_url.empty()) {
            std::string name = attr->name;
            if (name == "href" || name == "src") {
                std::string absolute = Utils::Url::resolve(options_.base_url, value);
                if (!absolute.empty())
                    value = absolute;
            }
        }
        out_ += "=\"";
        escape(value.c_str(), true, out_);
        out_ += '"';
    }

    void children(const GumboNode* node, bool raw) {
        const GumboVector* kids = Dom::children(node);
        if (!kids)
            return;
        for (unsigned int i = 0; i < kids->length; ++i)
            this->node(static_cast<const GumboNode*>(kids->data[i]), raw);
    }

    const NodeFilter&       filter_;
    const SerializeOptions& options_;
    std::string             out_;
};

}  // namespace

std::string serialize_html(const GumboNode*        node,
                           const NodeFilter&       filter,
                           const SerializeOptions& options) {
    Serializer serializer(filter, options);
    serializer.node(node, false);
    return serializer.take();
}

}  // namespace Extraction
}  // namespace OpenCrawl
