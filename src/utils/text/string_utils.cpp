#include "string_utils.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace OpenCrawl {
namespace Utils {
namespace Text {

namespace {
bool is_space(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}
}  // namespace

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n\f\v");
    if (std::string::npos == first) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n\f\v");
    return str.substr(first, (last - first + 1));
}

std::string to_lower(const std::string& str) {
    std::string lower = str;
    std::transform(
        lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    return lower;
}

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size()
           && std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
                  return std::tolower(x) == std::tolower(y);
              });
}

std::string collapse_whitespace(const std::string& str) {
    std::string out;
    out.reserve(str.size());
    bool pending_space = false;
    for (unsigned char c : str) {
        if (is_space(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out += ' ';
            pending_space = false;
        }
        out += static_cast<char>(c);
    }
    return out;
}

std::size_t utf8_length(const std::string& str) {
    std::size_t count = 0;
    for (unsigned char c : str) {
        if ((c & 0xC0) != 0x80)
            ++count;
    }
    return count;
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::stringstream        ss(str);
    std::string              part;
    while (std::getline(ss, part, delimiter))
        parts.push_back(part);
    return parts;
}

std::string url_encode(const std::string& str) {
    static const char* HEX = "0123456789ABCDEF";
    std::string        out;
    out.reserve(str.size());
    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        }
        else {
            out += '%';
            out += HEX[c >> 4];
            out += HEX[c & 0x0F];
        }
    }
    return out;
}

}  // namespace Text
}  // namespace Utils
}  // namespace OpenCrawl
