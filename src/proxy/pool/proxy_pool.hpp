#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "../../core/types/constants.hpp"

namespace OpenCrawl {
namespace Proxy {
namespace Pool {

enum class ProxyHealth { Unvalidated, Healthy, Unhealthy };

std::string to_string(ProxyHealth health);

struct ProxyRecord {
    std::string                                          address;
    ProxyHealth                                          health               = ProxyHealth::Unvalidated;
    int                                                  consecutive_failures = 0;
    std::optional<std::chrono::steady_clock::time_point> last_validated_at;
};

struct ProxyPoolOptions {
    int                  failure_threshold = Core::Constants::DEFAULT_PROXY_FAILURE_THRESHOLD;
    std::chrono::seconds revalidate_after{Core::Constants::DEFAULT_PROXY_REVALIDATE_SECS};
};

// Holds the candidate egress proxies of one crawler instance. All record
// mutation happens under one mutex, so a proxy's counters are never updated
// concurrently; probes run outside the lock.
class ProxyPool {
public:
    using Clock = std::chrono::steady_clock;
    using Probe = std::function<boost::asio::awaitable<bool>(const std::string& address)>;

    explicit ProxyPool(const std::vector<std::string>& addresses, ProxyPoolOptions options = {});

    // Healthy proxy by round-robin, std::nullopt in pass-through mode.
    // Throws ProxyExhaustedError when proxies are configured but none is healthy.
    // `avoid` is skipped whenever another healthy proxy exists.
    std::optional<ProxyRecord> acquire(const std::string& avoid = "");

    void report_success(const std::string& address);
    void report_failure(const std::string& address);

    boost::asio::awaitable<void> validate_all(Probe probe);

    bool                       pass_through() const;
    size_t                     size() const;
    size_t                     healthy_count() const;
    std::vector<ProxyRecord>   snapshot() const;
    std::optional<ProxyRecord> find(const std::string& address) const;

private:
    bool needs_validation(const ProxyRecord& record, Clock::time_point now) const;
    void apply_probe_result(const std::string& address, bool ok);

    std::vector<ProxyRecord> proxies_;
    ProxyPoolOptions         options_;
    size_t                   cursor_ = 0;
    mutable std::mutex       mutex_;
};

}  // namespace Pool
}  // namespace Proxy
}  // namespace OpenCrawl
