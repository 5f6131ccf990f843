#pragma once
#include <map>
#include <string>
#include <vector>
#include "html_document.hpp"

namespace OpenCrawl {
namespace Extraction {

// title, description, keywords, author, og:title, og:description, og:image;
// the first non-empty occurrence of each inside <head> wins.
std::map<std::string, std::string> collect_metadata(const GumboNode* root);

// The page URL adjusted by the first <base href>, if any.
std::string document_base(const GumboNode* root, const std::string& page_url);

// Absolute http(s) targets of visible <a href>, fragments removed, first
// occurrence order, no duplicates.
std::vector<std::string> collect_links(const GumboNode* root, const NodeFilter& filter, const std::string& base);

// Same rules for visible <img src>.
std::vector<std::string> collect_images(const GumboNode* root, const NodeFilter& filter, const std::string& base);

}  // namespace Extraction
}  // namespace OpenCrawl
