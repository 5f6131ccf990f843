#include "proxy_pool.hpp"
#include <algorithm>
#include "../../core/async/gather.hpp"
#include "../../core/logger/logger.hpp"
#include "../../core/types/errors.hpp"
#include "proxy_source.hpp"

namespace OpenCrawl {
namespace Proxy {
namespace Pool {

using namespace OpenCrawl::Core;

std::string to_string(ProxyHealth health) {
    switch (health) {
        case ProxyHealth::Unvalidated: return "unvalidated";
        case ProxyHealth::Healthy: return "healthy";
        case ProxyHealth::Unhealthy: return "unhealthy";
    }
    return "unknown";
}

ProxyPool::ProxyPool(const std::vector<std::string>& addresses, ProxyPoolOptions options)
    : options_(options) {
    for (const auto& raw : addresses) {
        std::string address = normalize_proxy_address(raw);
        if (address.empty())
            continue;
        bool duplicate = std::any_of(proxies_.begin(), proxies_.end(), [&](const ProxyRecord& p) {
            return p.address == address;
        });
        if (duplicate)
            continue;
        ProxyRecord record;
        record.address = address;
        proxies_.push_back(record);
    }
}

std::optional<ProxyRecord> ProxyPool::acquire(const std::string& avoid) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (proxies_.empty())
        return std::nullopt;

    std::optional<size_t> fallback;
    for (size_t step = 0; step < proxies_.size(); ++step) {
        size_t idx = (cursor_ + step) % proxies_.size();
        if (proxies_[idx].health != ProxyHealth::Healthy)
            continue;
        if (!avoid.empty() && proxies_[idx].address == avoid) {
            if (!fallback)
                fallback = idx;
            continue;
        }
        cursor_ = idx + 1;
        return proxies_[idx];
    }

    if (fallback) {
        cursor_ = *fallback + 1;
        return proxies_[*fallback];
    }

    throw ProxyExhaustedError("No healthy proxy among " + std::to_string(proxies_.size())
                              + " configured");
}

void ProxyPool::report_success(const std::string& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(proxies_.begin(), proxies_.end(), [&](const ProxyRecord& p) {
        return p.address == address;
    });
    if (it != proxies_.end())
        it->consecutive_failures = 0;
}

void ProxyPool::report_failure(const std::string& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(proxies_.begin(), proxies_.end(), [&](const ProxyRecord& p) {
        return p.address == address;
    });
    if (it == proxies_.end())
        return;

    it->consecutive_failures++;
    if (it->health != ProxyHealth::Healthy)
        return;

    if (it->consecutive_failures >= options_.failure_threshold) {
        it->health = ProxyHealth::Unhealthy;
        Logger::error("Proxy demoted (" + std::to_string(it->consecutive_failures)
                      + " consecutive failures): " + it->address);
    }
    else {
        Logger::warn("Proxy failed (" + std::to_string(it->consecutive_failures) + "/"
                     + std::to_string(options_.failure_threshold) + "): " + it->address);
    }
}

bool ProxyPool::needs_validation(const ProxyRecord& record, Clock::time_point now) const {
    if (record.health != ProxyHealth::Healthy || !record.last_validated_at)
        return true;
    return now - *record.last_validated_at >= options_.revalidate_after;
}

void ProxyPool::apply_probe_result(const std::string& address, bool ok) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(proxies_.begin(), proxies_.end(), [&](const ProxyRecord& p) {
        return p.address == address;
    });
    if (it == proxies_.end())
        return;

    it->last_validated_at = Clock::now();
    if (ok) {
        it->health               = ProxyHealth::Healthy;
        it->consecutive_failures = 0;
        Logger::info("Proxy OK: " + address);
    }
    else {
        it->health = ProxyHealth::Unhealthy;
        Logger::warn("Proxy check failed: " + address);
    }
}

boost::asio::awaitable<void> ProxyPool::validate_all(Probe probe) {
    std::vector<std::string> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto                        now = Clock::now();
        for (const auto& record : proxies_) {
            if (needs_validation(record, now))
                pending.push_back(record.address);
        }
    }

    if (pending.empty())
        co_return;

    Logger::info("Checking " + std::to_string(pending.size()) + " proxies...");

    std::vector<TaskFactory<bool>> probes;
    for (const auto& address : pending) {
        probes.push_back([probe, address]() -> boost::asio::awaitable<bool> {
            try {
                co_return co_await probe(address);
            } catch (const std::exception& e) {
                Logger::debug("Proxy probe error for " + address + ": " + e.what());
                co_return false;
            }
        });
    }

    std::vector<bool> results = co_await gather<bool>(std::move(probes));
    for (size_t i = 0; i < pending.size(); ++i)
        apply_probe_result(pending[i], results[i]);

    Logger::info("Proxy pool: " + std::to_string(healthy_count()) + "/"
                 + std::to_string(size()) + " healthy");
}

bool ProxyPool::pass_through() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return proxies_.empty();
}

size_t ProxyPool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return proxies_.size();
}

size_t ProxyPool::healthy_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(
        std::count_if(proxies_.begin(), proxies_.end(), [](const ProxyRecord& p) {
            return p.health == ProxyHealth::Healthy;
        }));
}

std::vector<ProxyRecord> ProxyPool::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return proxies_;
}

std::optional<ProxyRecord> ProxyPool::find(const std::string& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string normalized = normalize_proxy_address(address);
    for (const auto& record : proxies_) {
        if (record.address == normalized)
            return record;
    }
    return std::nullopt;
}

}  // namespace Pool
}  // namespace Proxy
}  // namespace OpenCrawl
