#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace OpenCrawl {
namespace Utils {
namespace Text {

std::string trim(const std::string& str);
std::string to_lower(const std::string& str);
bool        iequals(const std::string& a, const std::string& b);

// Collapses every run of ASCII whitespace into one space and trims the ends.
std::string collapse_whitespace(const std::string& str);

// Number of code points in a UTF-8 string. Malformed bytes count as one each.
std::size_t utf8_length(const std::string& str);

std::vector<std::string> split(const std::string& str, char delimiter);

// Percent-encodes everything outside the RFC 3986 unreserved set.
std::string url_encode(const std::string& str);

}  // namespace Text
}  // namespace Utils
}  // namespace OpenCrawl
