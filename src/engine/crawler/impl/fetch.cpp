#include <cctype>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <stdexcept>
#include "../../../core/logger/logger.hpp"
#include "../../../proxy/pool/proxy_source.hpp"
#include "../../../utils/text/string_utils.hpp"
#include "../../../utils/url/url.hpp"
#include "../crawler.hpp"

namespace OpenCrawl {
namespace Engine {

using namespace OpenCrawl::Core;
using namespace OpenCrawl::Network::Http;
using OpenCrawl::Utils::Url;

namespace {

struct ElapsedClock {
    std::chrono::steady_clock::time_point started = std::chrono::steady_clock::now();

    std::chrono::milliseconds elapsed() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
    }
};

bool has_header(const std::map<std::string, std::string>& headers, const std::string& name) {
    for (const auto& [key, value] : headers) {
        if (Utils::Text::iequals(key, name))
            return true;
    }
    return false;
}

// Case-insensitive merge; later entries replace earlier ones.
void merge_headers(std::map<std::string, std::string>&       into,
                   const std::map<std::string, std::string>& from) {
    for (const auto& [key, value] : from) {
        for (auto it = into.begin(); it != into.end();) {
            if (Utils::Text::iequals(it->first, key))
                it = into.erase(it);
            else
                ++it;
        }
        into[key] = value;
    }
}

bool blames_proxy(const Response& res) {
    switch (res.failure) {
        case FailureKind::ProxyFailure:
        case FailureKind::ConnectionFailure:
        case FailureKind::Timeout: return true;
        default: break;
    }
    return res.status_code == 403 || res.status_code == 407 || res.status_code == 429;
}

CrawlError make_error(FailureKind kind, std::string message, int attempts, std::optional<long> status) {
    CrawlError error;
    error.kind     = kind;
    error.message  = std::move(message);
    error.attempts = attempts;
    error.status   = status;
    return error;
}

}  // namespace

HttpRequest AsyncCrawler::resolve_request(const CrawlRequest& request,
                                          const std::string&  url,
                                          const std::string&  proxy) const {
    HttpRequest resolved;
    resolved.method = request.method.empty() ? "GET" : Utils::Text::trim(request.method);
    for (auto& c : resolved.method)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    resolved.url = url;

    merge_headers(resolved.headers, config_.default_headers);
    merge_headers(resolved.headers, request.headers);
    if (!has_header(resolved.headers, "User-Agent"))
        resolved.headers["User-Agent"] = config_.user_agent;

    resolved.cookies = config_.default_cookies;
    for (const auto& [name, value] : request.cookies)
        resolved.cookies[name] = value;

    resolved.body             = request.body;
    resolved.proxy            = proxy;
    resolved.timeout          = request.timeout.value_or(config_.default_timeout);
    resolved.follow_redirects = request.follow_redirects.value_or(config_.follow_redirects);
    resolved.max_redirects    = config_.max_redirects;
    return resolved;
}

void AsyncCrawler::report_proxy(const std::string& proxy, const Response& res) {
    if (res.failure == FailureKind::Cancelled)
        return;
    if (blames_proxy(res))
        proxy_pool_.report_failure(proxy);
    else if (res.connected())
        proxy_pool_.report_success(proxy);
}

boost::asio::awaitable<void> AsyncCrawler::sleep(std::chrono::milliseconds delay) {
    boost::asio::steady_timer timer(executor_, delay);
    sleeping_.insert(&timer);
    boost::system::error_code ec;
    co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    sleeping_.erase(&timer);
}

boost::asio::awaitable<Extraction::ExtractionResult>
AsyncCrawler::extract(std::string html, std::string url, Extraction::ExtractionStrategy strategy) {
    if (!worker_pool_)
        co_return pipeline_.extract(html, url, strategy);

    struct Job {
        explicit Job(const boost::asio::any_io_executor& executor)
            : done(executor, boost::asio::steady_timer::time_point::max()) {
        }
        boost::asio::steady_timer                   done;
        std::optional<Extraction::ExtractionResult> result;
        std::exception_ptr                          error;
    };
    auto job = std::make_shared<Job>(executor_);

    boost::asio::post(*worker_pool_,
                      [this, job, html = std::move(html), url = std::move(url), strategy]() {
                          try {
                              job->result = pipeline_.extract(html, url, strategy);
                          } catch (...) {
                              job->error = std::current_exception();
                          }
                          boost::asio::post(executor_, [job]() {
                              job->done.expires_at(boost::asio::steady_timer::time_point::min());
                          });
                      });

    boost::system::error_code ec;
    co_await job->done.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (job->error)
        std::rethrow_exception(job->error);
    co_return std::move(*job->result);
}

boost::asio::awaitable<CrawlResponse> AsyncCrawler::fetch(CrawlRequest request) {
    if (!is_setup_ || is_cleaned_up_)
        throw std::logic_error("AsyncCrawler::fetch() requires setup() and no cleanup()");

    ElapsedClock clock;
    bool         admitted = false;
    {
        ConcurrencyGate::Permit permit;
        if (!cancelled_) {
            try {
                permit   = co_await gate_.acquire();
                admitted = true;
            } catch (const boost::system::system_error& e) {
                Logger::debug("Admission aborted for " + request.url + ": " + e.code().message());
            }
        }
        if (admitted) {
            CrawlResponse response = co_await run_request(request);
            response.elapsed       = clock.elapsed();
            co_return response;
        }
    }

    CrawlResponse response;
    response.request = std::move(request);
    response.url     = response.request.url;
    response.error   = make_error(FailureKind::Cancelled, "Cancelled before start", 0, std::nullopt);
    response.elapsed = clock.elapsed();
    co_return response;
}

boost::asio::awaitable<CrawlResponse> AsyncCrawler::run_request(const CrawlRequest& request) {
    CrawlResponse response;
    response.request = request;

    std::string url = Url::strip_fragment(Url::with_params(request.url, request.params));
    response.url    = url;
    if (!Url::is_http(url)) {
        response.error = make_error(FailureKind::MalformedUrl, "Invalid URL: " + request.url, 0, std::nullopt);
        Logger::error("Failed: " + request.url + " - " + response.error->describe());
        co_return response;
    }

    std::string avoid;
    for (int attempt = 0;; ++attempt) {
        if (cancelled_) {
            response.error = make_error(FailureKind::Cancelled, "Cancelled", attempt, response.status);
            break;
        }

        std::optional<std::string> proxy;
        bool                       pooled = false;
        if (request.proxy) {
            if (!Utils::Text::trim(*request.proxy).empty())
                proxy = Proxy::Pool::normalize_proxy_address(*request.proxy);
        }
        else {
            try {
                auto record = proxy_pool_.acquire(avoid);
                if (record) {
                    proxy  = record->address;
                    pooled = true;
                }
            } catch (const ProxyExhaustedError& e) {
                response.error = make_error(FailureKind::ProxyExhaustion, e.what(), attempt, response.status);
                Logger::error("Failed: " + url + " - " + response.error->describe());
                break;
            }
        }

        std::string log_msg = "Fetching: " + url;
        if (attempt > 0)
            log_msg += " [Retry " + std::to_string(attempt) + "]";
        if (proxy)
            log_msg += " [" + *proxy + "]";
        Logger::info(log_msg);

        response.attempts = attempt + 1;
        response.proxy    = proxy;

        Response res = co_await client_->execute(resolve_request(request, url, proxy.value_or("")));

        if (pooled)
            report_proxy(*proxy, res);

        if (res.connected()) {
            response.status       = res.status_code;
            response.url          = res.effective_url.empty() ? url : res.effective_url;
            response.headers      = res.headers;
            response.content_type = res.content_type;
            response.body         = res.body;
        }

        if (res.success()) {
            response.error.reset();
            break;
        }

        if (cancelled_ || res.failure == FailureKind::Cancelled) {
            response.error = make_error(FailureKind::Cancelled, "Cancelled", response.attempts, response.status);
            break;
        }

        FailureKind         kind   = res.failure == FailureKind::None ? FailureKind::HttpStatus : res.failure;
        std::optional<long> status = res.connected() ? std::optional<long>(res.status_code) : std::nullopt;
        std::string message = res.error.empty() ? "HTTP " + std::to_string(res.status_code) : res.error;
        response.error      = make_error(kind, message, response.attempts, status);

        RetryDecision decision = retry_policy_.decide(attempt, kind, status);
        if (!decision.retry) {
            Logger::error("Failed: " + url + " - " + response.error->describe());
            break;
        }

        avoid = (decision.reacquire_proxy && pooled) ? *proxy : "";
        Logger::warn("Retrying " + url + " in " + std::to_string(decision.delay.count()) + "ms ("
                     + to_string(kind) + ": " + message + ")");
        co_await sleep(decision.delay);
    }

    if (response.error)
        co_return response;

    try {
        response.extracted = co_await extract(
            response.body, response.url, request.strategy.value_or(config_.extraction.strategy));
        Logger::success("Fetched: " + response.url + " (" + std::to_string(*response.status) + ")");
    } catch (const std::exception& e) {
        response.error = make_error(FailureKind::Extraction, e.what(), response.attempts, response.status);
        Logger::error("Extraction failed: " + response.url + " - " + e.what());
    }
    co_return response;
}

}  // namespace Engine
}  // namespace OpenCrawl
