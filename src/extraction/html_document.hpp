#pragma once
#include <gumbo.h>
#include <string>
#include <unordered_set>

namespace OpenCrawl {
namespace Extraction {

// Owns one gumbo parse tree. Gumbo trees are read-only here; cleaning is
// expressed as a NodeFilter over the tree instead of mutating it.
class HtmlDocument {
public:
    // Throws Core::ExtractionError when the input exceeds max_bytes or gumbo
    // produces no tree.
    HtmlDocument(const std::string& html, std::size_t max_bytes);
    ~HtmlDocument();

    HtmlDocument(const HtmlDocument&)            = delete;
    HtmlDocument& operator=(const HtmlDocument&) = delete;

    const GumboNode* root() const;
    const GumboNode* document() const;

private:
    std::string  source_;
    GumboOutput* output_ = nullptr;
};

// Nodes removed by cleaning. Every traversal consults it.
struct NodeFilter {
    std::unordered_set<const GumboNode*> removed;

    bool visible(const GumboNode* node) const {
        return removed.find(node) == removed.end();
    }
    void remove(const GumboNode* node) {
        removed.insert(node);
    }
};

namespace Dom {

bool               is_element(const GumboNode* node);
const GumboVector* children(const GumboNode* node);
GumboTag           tag(const GumboNode* node);

// Lowercase tag name, recovered from the source text for unknown tags.
// Empty when the parser synthesized an unknown element.
std::string tag_name(const GumboNode* node);

// nullptr when the attribute is absent.
const char* attribute(const GumboNode* node, const char* name);

// Concatenated text of the visible subtree.
std::string text_content(const GumboNode* node, const NodeFilter* filter = nullptr);

// First visible element with `tag` in document order.
const GumboNode* find_first(const GumboNode* node, GumboTag tag, const NodeFilter* filter = nullptr);

// Elements whose content is a separate paragraph of text.
bool is_block(GumboTag tag);

}  // namespace Dom

}  // namespace Extraction
}  // namespace OpenCrawl
