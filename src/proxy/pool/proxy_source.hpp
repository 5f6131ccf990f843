#pragma once
#include <string>
#include <vector>

namespace OpenCrawl {
namespace Proxy {
namespace Pool {

// Adds an http:// scheme to bare host:port entries and trims whitespace.
// Returns an empty string for blank input.
std::string normalize_proxy_address(const std::string& entry);

// A source naming an existing file (any value containing '/') is read as
// newline-delimited entries, skipping blanks and '#' comments. Anything else is
// a comma-separated list. Throws std::runtime_error if a named file cannot be read.
std::vector<std::string> load_proxy_source(const std::string& source);

std::vector<std::string> parse_proxy_lines(const std::string& text);

}  // namespace Pool
}  // namespace Proxy
}  // namespace OpenCrawl
