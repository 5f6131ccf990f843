#include "url.hpp"
#include <cctype>
#include <sstream>
#include <string_view>
#include <vector>
#include "../text/string_utils.hpp"

namespace OpenCrawl {
namespace Utils {

namespace {

std::string normalize_path(const std::string& path) {
    std::vector<std::string> segments;
    std::stringstream        ss(path);
    std::string              segment;
    while (std::getline(ss, segment, '/')) {
        if (segment == "." || segment.empty())
            continue;
        if (segment == "..") {
            if (!segments.empty())
                segments.pop_back();
            continue;
        }
        segments.push_back(segment);
    }

    std::string normalized = "/";
    for (size_t i = 0; i < segments.size(); ++i) {
        normalized += segments[i];
        if (i < segments.size() - 1)
            normalized += "/";
    }

    bool trailing = !path.empty() && path.back() == '/';
    if (!trailing && path.size() >= 2) {
        std::string_view tail(path);
        trailing = tail.substr(tail.size() - 2) == "/." || (tail.size() >= 3 && tail.substr(tail.size() - 3) == "/..");
    }
    if (trailing && normalized.back() != '/')
        normalized += "/";
    return normalized;
}

std::string authority_of(const UrlParsed& parsed) {
    std::string auth = parsed.host;
    if (!parsed.port.empty())
        auth += ":" + parsed.port;
    return auth;
}

}  // namespace

std::string UrlParsed::target() const {
    std::string t = path.empty() ? "/" : path;
    if (!query.empty())
        t += "?" + query;
    return t;
}

std::string UrlParsed::effective_port() const {
    if (!port.empty())
        return port;
    if (scheme == "https")
        return "443";
    if (scheme == "socks4" || scheme == "socks5" || scheme == "socks5h")
        return "1080";
    return "80";
}

UrlParsed Url::parse(const std::string& url) {
    UrlParsed parsed;

    if (url.empty()) {
        parsed.path = "/";
        return parsed;
    }

    std::string_view sv = url;

    size_t colon       = sv.find(':');
    size_t first_slash = sv.find('/');
    size_t first_q     = sv.find('?');
    size_t first_h     = sv.find('#');
    bool   has_scheme  = (colon != std::string_view::npos && colon > 0);
    if (has_scheme && first_slash != std::string_view::npos && colon > first_slash)
        has_scheme = false;
    if (has_scheme && first_q != std::string_view::npos && colon > first_q)
        has_scheme = false;
    if (has_scheme && first_h != std::string_view::npos && colon > first_h)
        has_scheme = false;

    if (has_scheme) {
        parsed.scheme = Text::to_lower(std::string(sv.substr(0, colon)));
        sv.remove_prefix(colon + 1);
    }

    if (sv.size() >= 2 && sv[0] == '/' && sv[1] == '/') {
        sv.remove_prefix(2);
        size_t      end_auth  = sv.find_first_of("/?#");
        std::string authority = std::string(sv.substr(0, end_auth));
        sv = (end_auth != std::string_view::npos) ? sv.substr(end_auth) : std::string_view();

        size_t      at        = authority.find_last_of('@');
        std::string host_port = authority;
        if (at != std::string::npos) {
            std::string userinfo = authority.substr(0, at);
            host_port            = authority.substr(at + 1);
            size_t sep           = userinfo.find(':');
            parsed.user          = userinfo.substr(0, sep);
            if (sep != std::string::npos)
                parsed.password = userinfo.substr(sep + 1);
        }

        if (!host_port.empty() && host_port[0] == '[') {
            size_t end_bracket = host_port.find(']');
            if (end_bracket != std::string::npos) {
                parsed.host    = host_port.substr(0, end_bracket + 1);
                size_t p_colon = host_port.find(':', end_bracket + 1);
                if (p_colon != std::string::npos)
                    parsed.port = host_port.substr(p_colon + 1);
            }
            else {
                parsed.host = host_port;
            }
        }
        else {
            size_t p_colon = host_port.find_last_of(':');
            if (p_colon != std::string::npos) {
                parsed.host = host_port.substr(0, p_colon);
                parsed.port = host_port.substr(p_colon + 1);
            }
            else {
                parsed.host = host_port;
            }
        }
        parsed.host = Text::to_lower(parsed.host);
    }

    size_t h_pos = sv.find('#');
    if (h_pos != std::string_view::npos) {
        parsed.fragment = std::string(sv.substr(h_pos + 1));
        sv              = sv.substr(0, h_pos);
    }
    size_t q_pos = sv.find('?');
    if (q_pos != std::string_view::npos) {
        parsed.query = std::string(sv.substr(q_pos + 1));
        sv           = sv.substr(0, q_pos);
    }

    parsed.path = std::string(sv);
    if (parsed.path.empty())
        parsed.path = "/";
    return parsed;
}

namespace {

bool is_scheme(const std::string& candidate) {
    if (candidate.empty() || !std::isalpha(static_cast<unsigned char>(candidate[0])))
        return false;
    for (unsigned char c : candidate) {
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.')
            return false;
    }
    return true;
}

}  // namespace

std::string Url::resolve(const std::string& base, const std::string& relative) {
    std::string rel = Text::trim(relative);
    if (rel.empty())
        return strip_fragment(base);

    if (rel[0] == '#')
        return strip_fragment(base) + rel;

    size_t colon_pos = rel.find(':');
    size_t first_sep = rel.find_first_of("/?#");
    if (colon_pos != std::string::npos && (first_sep == std::string::npos || colon_pos < first_sep)
        && is_scheme(rel.substr(0, colon_pos))) {
        // Only hierarchical absolute references are usable.
        return rel.compare(colon_pos, 3, "://") == 0 ? rel : "";
    }

    UrlParsed   base_parsed = parse(base);
    std::string prefix      = base_parsed.scheme + "://" + authority_of(base_parsed);

    if (rel.substr(0, 2) == "//")
        return base_parsed.scheme + ":" + rel;

    if (rel[0] == '?')
        return prefix + (base_parsed.path.empty() ? "/" : base_parsed.path) + rel;

    std::string path_part  = rel;
    std::string query_frag;
    size_t      qf = rel.find_first_of("?#");
    if (qf != std::string::npos) {
        path_part  = rel.substr(0, qf);
        query_frag = rel.substr(qf);
    }

    std::string merged;
    if (path_part[0] == '/') {
        merged = path_part;
    }
    else {
        std::string dir        = base_parsed.path;
        size_t      last_slash = dir.find_last_of('/');
        dir = (last_slash != std::string::npos) ? dir.substr(0, last_slash + 1) : "/";
        merged = dir + path_part;
    }

    return prefix + normalize_path(merged) + query_frag;
}

bool Url::is_http(const std::string& url) {
    UrlParsed parsed = parse(url);
    return (parsed.scheme == "http" || parsed.scheme == "https") && !parsed.host.empty();
}

std::string Url::origin(const UrlParsed& parsed) {
    return parsed.scheme + "://" + parsed.host + ":" + parsed.effective_port();
}

std::string Url::strip_fragment(const std::string& url) {
    size_t hash = url.find('#');
    return hash == std::string::npos ? url : url.substr(0, hash);
}

std::string Url::with_params(const std::string&                        url,
                             const std::map<std::string, std::string>& params) {
    if (params.empty())
        return url;

    std::string fragment;
    std::string head = url;
    size_t      hash = url.find('#');
    if (hash != std::string::npos) {
        fragment = url.substr(hash);
        head     = url.substr(0, hash);
    }

    std::string encoded;
    for (const auto& [key, value] : params) {
        if (!encoded.empty())
            encoded += '&';
        encoded += Text::url_encode(key) + "=" + Text::url_encode(value);
    }

    char joiner = '?';
    if (head.find('?') != std::string::npos)
        joiner = (head.back() == '?' || head.back() == '&') ? '\0' : '&';
    if (joiner != '\0')
        head += joiner;
    return head + encoded + fragment;
}

}  // namespace Utils
}  // namespace OpenCrawl
