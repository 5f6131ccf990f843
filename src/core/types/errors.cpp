#include "errors.hpp"

namespace OpenCrawl {
namespace Core {

std::string to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::None: return "none";
        case FailureKind::ConnectionFailure: return "connection_failure";
        case FailureKind::DnsFailure: return "dns_failure";
        case FailureKind::Timeout: return "timeout";
        case FailureKind::HttpStatus: return "http_status";
        case FailureKind::RedirectLimitExceeded: return "redirect_limit_exceeded";
        case FailureKind::SslVerification: return "ssl_verification";
        case FailureKind::ProxyFailure: return "proxy_failure";
        case FailureKind::ProxyExhaustion: return "proxy_exhaustion";
        case FailureKind::MalformedUrl: return "malformed_url";
        case FailureKind::Extraction: return "extraction_failure";
        case FailureKind::Cancelled: return "cancelled";
    }
    return "unknown";
}

std::string CrawlError::describe() const {
    std::string text = to_string(kind);
    if (!message.empty())
        text += ": " + message;
    text += " (after " + std::to_string(attempts) + (attempts == 1 ? " attempt)" : " attempts)");
    return text;
}

}  // namespace Core
}  // namespace OpenCrawl
