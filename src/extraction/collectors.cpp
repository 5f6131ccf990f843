#include "collectors.hpp"
#include <initializer_list>
#include <unordered_set>
#include "../utils/text/string_utils.hpp"
#include "../utils/url/url.hpp"

namespace OpenCrawl {
namespace Extraction {

using namespace OpenCrawl::Utils::Text;
using OpenCrawl::Utils::Url;

namespace {

constexpr const char* kMetaKeys[] = {
    "description", "keywords", "author", "og:title", "og:description", "og:image"};

class UrlCollector {
public:
    UrlCollector(const NodeFilter& filter, const std::string& base, GumboTag tag, const char* attr)
        : filter_(filter), base_(base), tag_(tag), attr_(attr) {
    }

    void walk(const GumboNode* node) {
        if (!filter_.visible(node))
            return;
        if (Dom::tag(node) == tag_) {
            const char* value = Dom::attribute(node, attr_);
            if (value)
                add(value);
        }
        const GumboVector* kids = Dom::children(node);
        if (!kids)
            return;
        for (unsigned int i = 0; i < kids->length; ++i)
            walk(static_cast<const GumboNode*>(kids->data[i]));
    }

    std::vector<std::string> take() {
        return std::move(urls_);
    }

private:
    void add(const std::string& raw) {
        std::string value = trim(raw);
        if (value.empty() || value[0] == '#')
            return;
        std::string absolute = Url::strip_fragment(Url::resolve(base_, value));
        if (absolute.empty() || !Url::is_http(absolute))
            return;
        if (seen_.insert(absolute).second)
            urls_.push_back(absolute);
    }

    const NodeFilter&               filter_;
    const std::string&              base_;
    GumboTag                        tag_;
    const char*                     attr_;
    std::vector<std::string>        urls_;
    std::unordered_set<std::string> seen_;
};

void walk_meta(const GumboNode* node, std::map<std::string, std::string>& metadata) {
    GumboTag tag = Dom::tag(node);
    if (tag == GUMBO_TAG_TITLE) {
        std::string title = collapse_whitespace(Dom::text_content(node));
        if (!title.empty())
            metadata.emplace("title", title);
    }
    else if (tag == GUMBO_TAG_META) {
        const char* name     = Dom::attribute(node, "name");
        const char* property = Dom::attribute(node, "property");
        const char* content  = Dom::attribute(node, "content");
        std::string value    = content ? collapse_whitespace(content) : "";
        if (!value.empty()) {
            for (const char* key : {property, name}) {
                if (!key)
                    continue;
                std::string lowered = to_lower(trim(key));
                for (const char* wanted : kMetaKeys) {
                    if (lowered == wanted)
                        metadata.emplace(lowered, value);
                }
            }
        }
    }

    const GumboVector* kids = Dom::children(node);
    if (!kids)
        return;
    for (unsigned int i = 0; i < kids->length; ++i)
        walk_meta(static_cast<const GumboNode*>(kids->data[i]), metadata);
}

}  // namespace

std::map<std::string, std::string> collect_metadata(const GumboNode* root) {
    std::map<std::string, std::string> metadata;
    const GumboNode*                   head = Dom::find_first(root, GUMBO_TAG_HEAD);
    walk_meta(head ? head : root, metadata);
    return metadata;
}

std::string document_base(const GumboNode* root, const std::string& page_url) {
    const GumboNode* base = Dom::find_first(root, GUMBO_TAG_BASE);
    if (!base)
        return page_url;
    const char* href = Dom::attribute(base, "href");
    if (!href || trim(href).empty())
        return page_url;
    std::string resolved = page_url.empty() ? std::string(href) : Url::resolve(page_url, href);
    return Url::is_http(resolved) ? resolved : page_url;
}

std::vector<std::string> collect_links(const GumboNode* root, const NodeFilter& filter, const std::string& base) {
    UrlCollector collector(filter, base, GUMBO_TAG_A, "href");
    collector.walk(root);
    return collector.take();
}

std::vector<std::string> collect_images(const GumboNode* root, const NodeFilter& filter, const std::string& base) {
    UrlCollector collector(filter, base, GUMBO_TAG_IMG, "src");
    collector.walk(root);
    return collector.take();
}

}  // namespace Extraction
}  // namespace OpenCrawl
