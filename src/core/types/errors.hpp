#pragma once
#include <optional>
#include <stdexcept>
#include <string>

namespace OpenCrawl {
namespace Core {

enum class FailureKind {
    None,
    ConnectionFailure,
    DnsFailure,
    Timeout,
    HttpStatus,
    RedirectLimitExceeded,
    SslVerification,
    ProxyFailure,
    ProxyExhaustion,
    MalformedUrl,
    Extraction,
    Cancelled
};

std::string to_string(FailureKind kind);

struct CrawlError {
    FailureKind         kind = FailureKind::None;
    std::string         message;
    int                 attempts = 0;
    std::optional<long> status;

    std::string describe() const;
};

class ProxyExhaustedError : public std::runtime_error {
public:
    explicit ProxyExhaustedError(const std::string& what) : std::runtime_error(what) {
    }
};

class ExtractionError : public std::runtime_error {
public:
    explicit ExtractionError(const std::string& what) : std::runtime_error(what) {
    }
};

}  // namespace Core
}  // namespace OpenCrawl
