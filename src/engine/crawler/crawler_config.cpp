#include "crawler_config.hpp"
#include <stdexcept>

namespace OpenCrawl {
namespace Engine {

void CrawlerConfig::validate() const {
    if (max_concurrent_requests < 1)
        throw std::invalid_argument("max_concurrent_requests must be at least 1");
    if (max_redirects < 0)
        throw std::invalid_argument("max_redirects must not be negative");
    if (default_timeout.count() <= 0)
        throw std::invalid_argument("default_timeout must be positive");
    if (retry.max_attempts < 1)
        throw std::invalid_argument("max_retries must be at least 1");
    if (retry.base_delay.count() < 0 || retry.max_delay.count() < 0)
        throw std::invalid_argument("retry delays must not be negative");
    if (retry.backoff_factor < 1.0)
        throw std::invalid_argument("backoff_factor must be at least 1");
    if (extraction.cleaning.min_text_length < 0)
        throw std::invalid_argument("min_text_length must not be negative");
    if (extraction_threads < 0)
        throw std::invalid_argument("extraction_threads must not be negative");
    if (proxy.failure_threshold < 1)
        throw std::invalid_argument("proxy_failure_threshold must be at least 1");
    if (proxy.probe_timeout.count() <= 0)
        throw std::invalid_argument("proxy probe timeout must be positive");
}

}  // namespace Engine
}  // namespace OpenCrawl
