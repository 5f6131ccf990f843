#pragma once
#include <chrono>
#include <cstddef>

namespace OpenCrawl {
namespace Core {

struct Constants {
    static constexpr const char* VERSION    = "0.1.0";
    static constexpr const char* USER_AGENT = "OpenCrawl/0.1.0";

    static constexpr int DEFAULT_MAX_CONCURRENT_REQUESTS = 5;
    static constexpr int DEFAULT_MAX_REDIRECTS           = 10;
    static constexpr int DEFAULT_TIMEOUT_MS              = 30000;

    static constexpr int    DEFAULT_MAX_ATTEMPTS   = 3;
    static constexpr int    DEFAULT_BASE_DELAY_MS  = 1000;
    static constexpr double DEFAULT_BACKOFF_FACTOR = 2.0;
    static constexpr int    DEFAULT_MAX_DELAY_MS   = 30000;

    static constexpr const char* DEFAULT_PROXY_TEST_URL          = "http://httpbin.org/ip";
    static constexpr int         DEFAULT_PROXY_PROBE_TIMEOUT_MS  = 5000;
    static constexpr int         DEFAULT_PROXY_FAILURE_THRESHOLD = 3;
    static constexpr int         DEFAULT_PROXY_REVALIDATE_SECS   = 300;

    static constexpr int         DEFAULT_MIN_TEXT_LENGTH    = 10;
    static constexpr std::size_t DEFAULT_MAX_DOCUMENT_BYTES = 8 * 1024 * 1024;
    static constexpr int         DEFAULT_EXTRACTION_THREADS = 1;

    static constexpr std::size_t MAX_IDLE_CONNECTIONS_PER_HOST = 4;
    static constexpr std::size_t MAX_RESPONSE_BODY_BYTES       = 32 * 1024 * 1024;
    static constexpr const char* DEFAULT_OUTPUT_PATH           = "results.json";
};

}  // namespace Core
}  // namespace OpenCrawl
