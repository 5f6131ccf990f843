#include "proxy_source.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include "../../utils/text/string_utils.hpp"

namespace OpenCrawl {
namespace Proxy {
namespace Pool {

using namespace OpenCrawl::Utils::Text;

std::string normalize_proxy_address(const std::string& entry) {
    std::string address = trim(entry);
    if (address.empty())
        return "";
    if (address.find("://") == std::string::npos)
        address = "http://" + address;
    while (!address.empty() && address.back() == '/')
        address.pop_back();
    return address;
}

std::vector<std::string> parse_proxy_lines(const std::string& text) {
    std::vector<std::string> entries;
    std::istringstream       in(text);
    std::string              line;
    while (std::getline(in, line)) {
        size_t hash = line.find('#');
        if (hash != std::string::npos)
            line = line.substr(0, hash);
        line = trim(line);
        if (!line.empty())
            entries.push_back(line);
    }
    return entries;
}

std::vector<std::string> load_proxy_source(const std::string& source) {
    std::string value = trim(source);
    if (value.empty())
        return {};

    bool looks_like_path = value.find('/') != std::string::npos && value.find("://") == std::string::npos;
    if (looks_like_path || (value.find(',') == std::string::npos && std::filesystem::is_regular_file(value))) {
        std::ifstream file(value);
        if (!file)
            throw std::runtime_error("Cannot read proxy list: " + value);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return parse_proxy_lines(buffer.str());
    }

    std::vector<std::string> entries;
    for (const auto& part : split(value, ',')) {
        std::string entry = trim(part);
        if (!entry.empty())
            entries.push_back(entry);
    }
    return entries;
}

}  // namespace Pool
}  // namespace Proxy
}  // namespace OpenCrawl
