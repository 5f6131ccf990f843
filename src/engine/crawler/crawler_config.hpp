#pragma once
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "../../core/types/constants.hpp"
#include "../../core/types/errors.hpp"
#include "../../extraction/extraction_types.hpp"
#include "../retry/retry_policy.hpp"

namespace OpenCrawl {
namespace Engine {

struct ProxyConfig {
    std::vector<std::string>  proxies;
    std::string               source;  // file path or comma-separated list, merged into proxies
    std::string               test_url = Core::Constants::DEFAULT_PROXY_TEST_URL;
    std::chrono::milliseconds probe_timeout{Core::Constants::DEFAULT_PROXY_PROBE_TIMEOUT_MS};
    int                       failure_threshold = Core::Constants::DEFAULT_PROXY_FAILURE_THRESHOLD;
    std::chrono::seconds      revalidate_after{Core::Constants::DEFAULT_PROXY_REVALIDATE_SECS};
};

struct CrawlerConfig {
    int                                max_concurrent_requests = Core::Constants::DEFAULT_MAX_CONCURRENT_REQUESTS;
    std::map<std::string, std::string> default_headers;
    std::map<std::string, std::string> default_cookies;
    std::string                        user_agent       = Core::Constants::USER_AGENT;
    bool                               ssl_verify       = true;
    bool                               follow_redirects = true;
    int                                max_redirects    = Core::Constants::DEFAULT_MAX_REDIRECTS;
    std::chrono::milliseconds          default_timeout{Core::Constants::DEFAULT_TIMEOUT_MS};
    RetryConfig                        retry;
    ProxyConfig                        proxy;
    Extraction::ExtractionConfig       extraction;
    int                                extraction_threads = Core::Constants::DEFAULT_EXTRACTION_THREADS;

    // Throws std::invalid_argument naming the first offending field.
    void validate() const;
};

struct CrawlRequest {
    std::string                                     url;
    std::string                                     method = "GET";
    std::map<std::string, std::string>              headers;
    std::map<std::string, std::string>              cookies;
    std::map<std::string, std::string>              params;
    std::map<std::string, std::string>              metadata;
    std::string                                     body;
    std::optional<std::chrono::milliseconds>        timeout;
    std::optional<std::string>                      proxy;  // "" forces a direct connection
    std::optional<bool>                             follow_redirects;
    std::optional<Extraction::ExtractionStrategy>   strategy;

    CrawlRequest() = default;
    CrawlRequest(std::string target) : url(std::move(target)) {
    }
    CrawlRequest(const char* target) : url(target) {
    }
};

struct CrawlResponse {
    CrawlRequest                                  request;
    std::string                                   url;  // after redirects
    std::optional<long>                           status;
    std::chrono::milliseconds                     elapsed{0};
    int                                           attempts = 0;
    std::optional<std::string>                    proxy;
    std::string                                   content_type;
    std::map<std::string, std::string>            headers;
    std::string                                   body;
    std::optional<Extraction::ExtractionResult>   extracted;
    std::optional<Core::CrawlError>               error;

    bool ok() const {
        return extracted.has_value() && !error.has_value();
    }
    int retries() const {
        return attempts > 0 ? attempts - 1 : 0;
    }
};

}  // namespace Engine
}  // namespace OpenCrawl
