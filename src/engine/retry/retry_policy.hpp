#pragma once
#include <chrono>
#include <optional>

#include "../../core/types/constants.hpp"
#include "../../core/types/errors.hpp"

namespace OpenCrawl {
namespace Engine {

struct RetryConfig {
    int                       max_attempts = Core::Constants::DEFAULT_MAX_ATTEMPTS;
    std::chrono::milliseconds base_delay{Core::Constants::DEFAULT_BASE_DELAY_MS};
    double                    backoff_factor = Core::Constants::DEFAULT_BACKOFF_FACTOR;
    std::chrono::milliseconds max_delay{Core::Constants::DEFAULT_MAX_DELAY_MS};
};

struct RetryDecision {
    bool                      retry = false;
    std::chrono::milliseconds delay{0};
    // Next attempt must not go through the proxy that just failed.
    bool reacquire_proxy = false;

    static RetryDecision stop() {
        return {};
    }
};

/**
 * @brief Pure retry/backoff decision.
 *
 * `attempt_index` is the 0-based index of the attempt that just failed. The
 * delay before the next attempt is min(max_delay, base_delay * factor^index);
 * once attempt_index + 1 reaches max_attempts the decision is Stop.
 */
class RetryPolicy {
public:
    explicit RetryPolicy(RetryConfig config = {}, bool ssl_verify = true);

    RetryDecision decide(int                 attempt_index,
                         Core::FailureKind   kind,
                         std::optional<long> status = std::nullopt) const;

    std::chrono::milliseconds delay_for(int attempt_index) const;
    bool is_retryable(Core::FailureKind kind, std::optional<long> status = std::nullopt) const;

    const RetryConfig& config() const;

private:
    RetryConfig config_;
    bool        ssl_verify_;
};

}  // namespace Engine
}  // namespace OpenCrawl
