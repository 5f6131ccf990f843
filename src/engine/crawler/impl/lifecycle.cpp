#include <boost/asio/post.hpp>
#include <stdexcept>
#include "../../../core/logger/logger.hpp"
#include "../../../network/http/beast_client.hpp"
#include "../../../proxy/pool/proxy_source.hpp"
#include "../crawler.hpp"

namespace OpenCrawl {
namespace Engine {

using namespace OpenCrawl::Core;
using namespace OpenCrawl::Network::Http;
using namespace OpenCrawl::Proxy::Pool;

namespace {

const CrawlerConfig& validated(const CrawlerConfig& config) {
    config.validate();
    return config;
}

std::vector<std::string> configured_proxies(const ProxyConfig& config) {
    std::vector<std::string> proxies = config.proxies;
    if (!config.source.empty()) {
        auto loaded = load_proxy_source(config.source);
        proxies.insert(proxies.end(), loaded.begin(), loaded.end());
    }
    return proxies;
}

ProxyPoolOptions pool_options(const ProxyConfig& config) {
    ProxyPoolOptions options;
    options.failure_threshold = config.failure_threshold;
    options.revalidate_after  = config.revalidate_after;
    return options;
}

}  // namespace

AsyncCrawler::AsyncCrawler(boost::asio::any_io_executor executor,
                           CrawlerConfig                config,
                           std::unique_ptr<HttpClient>  client)
    : executor_(std::move(executor)),
      config_(validated(config)),
      client_(std::move(client)),
      proxy_pool_(configured_proxies(config_.proxy), pool_options(config_.proxy)),
      retry_policy_(config_.retry, config_.ssl_verify),
      pipeline_(config_.extraction),
      gate_(static_cast<std::size_t>(config_.max_concurrent_requests)) {
}

AsyncCrawler::~AsyncCrawler() {
    cleanup();
}

boost::asio::awaitable<void> AsyncCrawler::setup() {
    if (is_setup_)
        throw std::logic_error("AsyncCrawler::setup() called twice");
    if (is_cleaned_up_)
        throw std::logic_error("AsyncCrawler cannot be set up again after cleanup()");

    if (!client_) {
        BeastClientOptions options;
        options.ssl_verify = config_.ssl_verify;
        options.user_agent = config_.user_agent;
        client_            = std::make_unique<BeastClient>(executor_, options);
    }
    if (config_.extraction_threads > 0)
        worker_pool_ = std::make_unique<boost::asio::thread_pool>(config_.extraction_threads);
    is_setup_ = true;

    Logger::info("Crawler ready: " + std::to_string(config_.max_concurrent_requests)
                 + " concurrent requests, strategy "
                 + Extraction::to_string(config_.extraction.strategy));

    if (!proxy_pool_.pass_through()) {
        co_await proxy_pool_.validate_all(
            [this](const std::string& address) { return probe_proxy(address); });
        if (proxy_pool_.healthy_count() == 0)
            Logger::warn("No healthy proxies; proxied requests will fail with proxy_exhaustion");
    }
}

boost::asio::awaitable<bool> AsyncCrawler::probe_proxy(const std::string& address) {
    HttpRequest probe;
    probe.url     = config_.proxy.test_url;
    probe.proxy   = address;
    probe.timeout = config_.proxy.probe_timeout;
    probe.headers = {{"User-Agent", config_.user_agent}};

    Response res = co_await client_->execute(probe);
    if (!res.success())
        Logger::debug("Proxy probe " + address + ": " + (res.error.empty() ? "failed" : res.error));
    co_return res.success();
}

void AsyncCrawler::cleanup() {
    if (!is_setup_ || is_cleaned_up_)
        return;
    is_cleaned_up_ = true;

    if (client_)
        client_->close();
    if (worker_pool_) {
        worker_pool_->join();
        worker_pool_.reset();
    }
    Logger::info("Crawler resources released.");
}

void AsyncCrawler::cancel() {
    boost::asio::post(executor_, [this]() { cancel_now(); });
}

void AsyncCrawler::cancel_now() {
    if (cancelled_)
        return;
    cancelled_ = true;
    Logger::warn("Crawl cancelled, aborting in-flight requests...");

    gate_.cancel_waiters();
    for (auto* timer : sleeping_)
        timer->cancel();
    if (client_)
        client_->abort_all();
}

bool AsyncCrawler::is_setup() const {
    return is_setup_;
}

bool AsyncCrawler::cancelled() const {
    return cancelled_;
}

const CrawlerConfig& AsyncCrawler::config() const {
    return config_;
}

Proxy::Pool::ProxyPool& AsyncCrawler::proxy_pool() {
    return proxy_pool_;
}

}  // namespace Engine
}  // namespace OpenCrawl
