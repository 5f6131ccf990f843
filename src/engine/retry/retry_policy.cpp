#include "retry_policy.hpp"
#include <algorithm>
#include <cmath>

namespace OpenCrawl {
namespace Engine {

using Core::FailureKind;

RetryPolicy::RetryPolicy(RetryConfig config, bool ssl_verify)
    : config_(config), ssl_verify_(ssl_verify) {
}

const RetryConfig& RetryPolicy::config() const {
    return config_;
}

bool RetryPolicy::is_retryable(FailureKind kind, std::optional<long> status) const {
    switch (kind) {
        case FailureKind::ConnectionFailure:
        case FailureKind::DnsFailure:
        case FailureKind::Timeout:
        case FailureKind::ProxyFailure: return true;
        case FailureKind::HttpStatus: return status && *status >= 500 && *status < 600;
        // Only reachable with verification on; a handshake error with it off
        // is an ordinary connection failure.
        case FailureKind::SslVerification: return !ssl_verify_;
        default: return false;
    }
}

std::chrono::milliseconds RetryPolicy::delay_for(int attempt_index) const {
    double base   = static_cast<double>(config_.base_delay.count());
    double factor = std::pow(config_.backoff_factor, std::max(attempt_index, 0));
    double capped = std::min(static_cast<double>(config_.max_delay.count()), base * factor);
    return std::chrono::milliseconds(static_cast<long long>(std::llround(capped)));
}

RetryDecision RetryPolicy::decide(int attempt_index, FailureKind kind, std::optional<long> status) const {
    if (attempt_index + 1 >= config_.max_attempts || !is_retryable(kind, status))
        return RetryDecision::stop();

    RetryDecision decision;
    decision.retry           = true;
    decision.delay           = delay_for(attempt_index);
    decision.reacquire_proxy = kind == FailureKind::ProxyFailure;
    return decision;
}

}  // namespace Engine
}  // namespace OpenCrawl
