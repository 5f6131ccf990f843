#pragma once
#include <map>
#include <string>

namespace OpenCrawl {
namespace Utils {

struct UrlParsed {
    std::string scheme;
    std::string user;
    std::string password;
    std::string host;
    std::string port;
    std::string path;
    std::string query;
    std::string fragment;

    // Request target: path plus query, never the fragment.
    std::string target() const;
    std::string effective_port() const;
};

class Url {
public:
    static UrlParsed   parse(const std::string& url);
    static std::string resolve(const std::string& base, const std::string& relative);
    static bool        is_http(const std::string& url);
    static std::string origin(const UrlParsed& parsed);
    static std::string strip_fragment(const std::string& url);
    static std::string with_params(const std::string&                        url,
                                   const std::map<std::string, std::string>& params);
};

}  // namespace Utils
}  // namespace OpenCrawl
