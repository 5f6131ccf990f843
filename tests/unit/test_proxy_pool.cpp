#include <atomic>
#include <gtest/gtest.h>
#include <set>
#include <thread>
#include "../../src/core/types/errors.hpp"
#include "../../src/proxy/pool/proxy_pool.hpp"
#include "test_helpers.hpp"

using namespace OpenCrawl::Proxy::Pool;
using OpenCrawl::Core::ProxyExhaustedError;
using OpenCrawl::Testing::run_sync;

namespace {

ProxyPool::Probe probe_passing(std::set<std::string> good) {
    return [good](const std::string& address) -> boost::asio::awaitable<bool> {
        co_return good.count(address) > 0;
    };
}

void validate(ProxyPool& pool, ProxyPool::Probe probe) {
    boost::asio::io_context ioc;
    run_sync(ioc, pool.validate_all(std::move(probe)));
}

}  // namespace

TEST(ProxyPoolTest, EntriesStartUnvalidatedAndNormalized) {
    ProxyPool pool({"1.1.1.1:80", "http://1.1.1.1:80", "socks5://2.2.2.2:1080"});
    auto      records = pool.snapshot();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].address, "http://1.1.1.1:80");
    for (const auto& record : records) {
        EXPECT_EQ(record.health, ProxyHealth::Unvalidated);
        EXPECT_EQ(record.consecutive_failures, 0);
        EXPECT_FALSE(record.last_validated_at.has_value());
    }
}

TEST(ProxyPoolTest, PassThroughWithoutProxies) {
    ProxyPool pool({});
    EXPECT_TRUE(pool.pass_through());
    EXPECT_FALSE(pool.acquire().has_value());
}

TEST(ProxyPoolTest, UnvalidatedPoolIsExhausted) {
    ProxyPool pool({"http://p1:1"});
    EXPECT_THROW(pool.acquire(), ProxyExhaustedError);
}

TEST(ProxyPoolTest, FailedValidationIsNeverSelected) {
    ProxyPool pool({"http://p1:1", "http://p2:2"});
    validate(pool, probe_passing({"http://p2:2"}));

    EXPECT_EQ(pool.find("http://p1:1")->health, ProxyHealth::Unhealthy);
    EXPECT_EQ(pool.find("http://p2:2")->health, ProxyHealth::Healthy);
    EXPECT_TRUE(pool.find("http://p2:2")->last_validated_at.has_value());
    for (int i = 0; i < 10; ++i)
        EXPECT_EQ(pool.acquire()->address, "http://p2:2");
}

TEST(ProxyPoolTest, RevalidationRestoresProxy) {
    ProxyPoolOptions options;
    options.revalidate_after = std::chrono::seconds(0);
    ProxyPool pool({"http://p1:1"}, options);

    validate(pool, probe_passing({}));
    EXPECT_THROW(pool.acquire(), ProxyExhaustedError);

    validate(pool, probe_passing({"http://p1:1"}));
    EXPECT_EQ(pool.acquire()->address, "http://p1:1");
}

TEST(ProxyPoolTest, ProbeExceptionCountsAsFailure) {
    ProxyPool pool({"http://p1:1"});
    validate(pool, [](const std::string&) -> boost::asio::awaitable<bool> {
        throw std::runtime_error("probe blew up");
        co_return true;
    });
    EXPECT_EQ(pool.find("http://p1:1")->health, ProxyHealth::Unhealthy);
}

TEST(ProxyPoolTest, HealthyFreshProxiesAreNotReprobed) {
    ProxyPool pool({"http://p1:1", "http://p2:2"});
    validate(pool, probe_passing({"http://p1:1"}));

    std::vector<std::string> probed;
    validate(pool, [&](const std::string& address) -> boost::asio::awaitable<bool> {
        probed.push_back(address);
        co_return false;
    });
    EXPECT_EQ(probed, (std::vector<std::string>{"http://p2:2"}));
    EXPECT_EQ(pool.find("http://p1:1")->health, ProxyHealth::Healthy);
}

TEST(ProxyPoolTest, RoundRobinAmongHealthy) {
    ProxyPool pool({"http://a:1", "http://b:1", "http://c:1"});
    validate(pool, probe_passing({"http://a:1", "http://b:1", "http://c:1"}));

    std::vector<std::string> order;
    for (int i = 0; i < 6; ++i)
        order.push_back(pool.acquire()->address);
    EXPECT_EQ(order,
              (std::vector<std::string>{
                  "http://a:1", "http://b:1", "http://c:1", "http://a:1", "http://b:1", "http://c:1"}));
}

TEST(ProxyPoolTest, AvoidSkipsFailedProxyWhenAlternativeExists) {
    ProxyPool pool({"http://a:1", "http://b:1"});
    validate(pool, probe_passing({"http://a:1", "http://b:1"}));

    for (int i = 0; i < 4; ++i)
        EXPECT_EQ(pool.acquire("http://a:1")->address, "http://b:1");

    ProxyPool single({"http://a:1"});
    validate(single, probe_passing({"http://a:1"}));
    EXPECT_EQ(single.acquire("http://a:1")->address, "http://a:1");
}

TEST(ProxyPoolTest, DemotedAfterThresholdFailures) {
    ProxyPoolOptions options;
    options.failure_threshold = 3;
    ProxyPool pool({"http://a:1", "http://b:1"}, options);
    validate(pool, probe_passing({"http://a:1", "http://b:1"}));

    pool.report_failure("http://a:1");
    pool.report_failure("http://a:1");
    EXPECT_EQ(pool.find("http://a:1")->health, ProxyHealth::Healthy);
    pool.report_success("http://a:1");
    EXPECT_EQ(pool.find("http://a:1")->consecutive_failures, 0);

    pool.report_failure("http://a:1");
    pool.report_failure("http://a:1");
    pool.report_failure("http://a:1");
    EXPECT_EQ(pool.find("http://a:1")->health, ProxyHealth::Unhealthy);
    EXPECT_EQ(pool.healthy_count(), 1u);
    for (int i = 0; i < 4; ++i)
        EXPECT_EQ(pool.acquire()->address, "http://b:1");
}

TEST(ProxyPoolTest, StressMultiThreaded) {
    std::vector<std::string> proxies;
    std::set<std::string>    good;
    for (int i = 0; i < 50; ++i) {
        proxies.push_back("http://proxy_" + std::to_string(i) + ":80");
        good.insert(proxies.back());
    }
    ProxyPoolOptions options;
    options.failure_threshold = 1000000;
    ProxyPool pool(proxies, options);
    validate(pool, probe_passing(good));

    std::vector<std::thread> threads;
    std::atomic<int>         acquired{0};
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 500; ++i) {
                auto proxy = pool.acquire();
                if (proxy) {
                    ++acquired;
                    if (i % 2)
                        pool.report_failure(proxy->address);
                    else
                        pool.report_success(proxy->address);
                }
            }
        });
    }
    for (auto& thread : threads)
        thread.join();

    EXPECT_EQ(acquired.load(), 8 * 500);
    EXPECT_EQ(pool.healthy_count(), 50u);
}
