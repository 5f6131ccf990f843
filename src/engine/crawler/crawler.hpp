#pragma once
#include <boost/asio/any_io_executor.hpp>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "../../extraction/pipeline.hpp"
#include "../../network/http/http_client.hpp"
#include "../../proxy/pool/proxy_pool.hpp"
#include "../concurrency/concurrency_gate.hpp"
#include "../retry/retry_policy.hpp"
#include "crawler_config.hpp"

namespace OpenCrawl {
namespace Engine {

/**
 * @brief Bounded-concurrency crawler for an explicit list of requests.
 *
 * Every request runs as a coroutine on the executor given at construction:
 * proxy selection, HTTP exchange, retry/backoff and extraction. At most
 * max_concurrent_requests requests hold a slot at a time; a slot is held for
 * the whole request, backoff sleeps included. Only misuse (fetch before
 * setup, setup twice) and invalid configuration raise; every per-request
 * failure is reported in CrawlResponse::error.
 *
 * The crawler is driven from one executor thread. cancel() may be called from
 * any thread.
 */
class AsyncCrawler {
public:
    // A null client means a BeastClient is created by setup().
    AsyncCrawler(boost::asio::any_io_executor             executor,
                 CrawlerConfig                            config,
                 std::unique_ptr<Network::Http::HttpClient> client = nullptr);
    ~AsyncCrawler();

    AsyncCrawler(const AsyncCrawler&)            = delete;
    AsyncCrawler& operator=(const AsyncCrawler&) = delete;

    // Creates the HTTP client and extraction workers and validates the proxy pool.
    boost::asio::awaitable<void> setup();

    boost::asio::awaitable<CrawlResponse> fetch(CrawlRequest request);

    // Results are in input order; one failed request never fails the batch.
    boost::asio::awaitable<std::vector<CrawlResponse>> fetch_many(std::vector<CrawlRequest> requests);

    // Releases pooled connections and joins extraction workers. Further calls are no-ops.
    void cleanup();

    // Aborts in-flight exchanges, wakes backoff sleeps and queued requests.
    // Affected responses carry FailureKind::Cancelled.
    void cancel();

    bool                   is_setup() const;
    bool                   cancelled() const;
    const CrawlerConfig&   config() const;
    Proxy::Pool::ProxyPool& proxy_pool();

private:
    boost::asio::awaitable<CrawlResponse> run_request(const CrawlRequest& request);
    boost::asio::awaitable<bool>          probe_proxy(const std::string& address);
    boost::asio::awaitable<Extraction::ExtractionResult>
    extract(std::string html, std::string url, Extraction::ExtractionStrategy strategy);
    boost::asio::awaitable<void> sleep(std::chrono::milliseconds delay);

    Network::Http::HttpRequest resolve_request(const CrawlRequest& request,
                                               const std::string&  url,
                                               const std::string&  proxy) const;
    void                       report_proxy(const std::string& proxy, const Network::Http::Response& res);
    void                       cancel_now();

    boost::asio::any_io_executor               executor_;
    CrawlerConfig                              config_;
    std::unique_ptr<Network::Http::HttpClient> client_;
    Proxy::Pool::ProxyPool                     proxy_pool_;
    RetryPolicy                                retry_policy_;
    Extraction::ExtractionPipeline             pipeline_;
    ConcurrencyGate                            gate_;
    std::unique_ptr<boost::asio::thread_pool>  worker_pool_;
    std::set<boost::asio::steady_timer*>       sleeping_;

    bool is_setup_     = false;
    bool is_cleaned_up_ = false;
    bool cancelled_    = false;
};

}  // namespace Engine
}  // namespace OpenCrawl
