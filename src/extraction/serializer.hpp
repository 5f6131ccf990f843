#pragma once
#include <string>
#include "html_document.hpp"

namespace OpenCrawl {
namespace Extraction {

struct SerializeOptions {
    bool        unwrap_links = false;
    bool        drop_images  = false;
    std::string base_url;  // href/src are made absolute against it when set
};

// Writes the visible part of a gumbo tree back to HTML. Attribute order and
// child order follow the parse tree, so equal input gives equal output.
std::string serialize_html(const GumboNode*        node,
                           const NodeFilter&       filter,
                           const SerializeOptions& options = {});

}  // namespace Extraction
}  // namespace OpenCrawl
