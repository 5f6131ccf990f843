#include <cstdio>
#include <fstream>
#include <gtest/gtest.h>
#include "../../src/core/config/config.hpp"

using namespace OpenCrawl::Core;
using OpenCrawl::Extraction::ExtractionStrategy;

TEST(ConfigTest, Defaults) {
    Config config;
    EXPECT_EQ(config.crawler.max_concurrent_requests, 5);
    EXPECT_EQ(config.crawler.extraction.strategy, ExtractionStrategy::Markdown);
    EXPECT_TRUE(config.crawler.ssl_verify);
    EXPECT_EQ(config.crawler.max_redirects, 10);
    EXPECT_EQ(config.crawler.retry.max_attempts, 3);
    EXPECT_EQ(config.crawler.extraction.cleaning.min_text_length, 10);
    EXPECT_EQ(config.output, "results.json");
    EXPECT_NO_THROW(config.crawler.validate());
}

TEST(ConfigTest, ComplexCLI) {
    char* argv[] = {(char*)"opencrawl",
                    (char*)"https://test.com",
                    (char*)"-c",
                    (char*)"8",
                    (char*)"--strategy",
                    (char*)"content",
                    (char*)"--proxy",
                    (char*)"p1.com:8080",
                    (char*)"--timeout",
                    (char*)"2.5",
                    (char*)"--retries",
                    (char*)"4",
                    (char*)"--no-ssl-verify",
                    (char*)"--header",
                    (char*)"X-Token: abc",
                    (char*)"--min-text-length",
                    (char*)"25",
                    (char*)"https://test.org"};
    auto  config = Config::parse(18, argv);

    EXPECT_EQ(config.crawler.max_concurrent_requests, 8);
    EXPECT_EQ(config.crawler.extraction.strategy, ExtractionStrategy::Content);
    ASSERT_EQ(config.crawler.proxy.proxies.size(), 1u);
    EXPECT_EQ(config.crawler.proxy.proxies[0], "p1.com:8080");
    EXPECT_EQ(config.crawler.default_timeout.count(), 2500);
    EXPECT_EQ(config.crawler.retry.max_attempts, 4);
    EXPECT_FALSE(config.crawler.ssl_verify);
    EXPECT_EQ(config.crawler.default_headers.at("X-Token"), "abc");
    EXPECT_EQ(config.crawler.extraction.cleaning.min_text_length, 25);
    ASSERT_EQ(config.urls.size(), 2u);
    EXPECT_EQ(config.urls[1], "https://test.org");
}

TEST(ConfigTest, YamlLoading) {
    std::string yaml_content = R"(
max_concurrent_requests: 12
extraction_strategy: html
default_headers:
  Accept-Language: en
default_cookies:
  session: xyz
ssl_verify: false
default_timeout: 10
base_delay: 0.5
backoff_factor: 3
max_delay: 20
max_retries: 5
strip_nav: true
min_text_length: 40
extract_images: false
proxies:
  - "http://yaml_p1:8080"
  - "socks5://yaml_p2:1080"
proxy_failure_threshold: 4
urls:
  - https://a.example
output: out.json
)";
    std::ofstream ofs("test_config.yaml");
    ofs << yaml_content;
    ofs.close();

    char* argv[] = {(char*)"opencrawl", (char*)"--config", (char*)"test_config.yaml"};
    auto  config = Config::parse(3, argv);
    std::remove("test_config.yaml");

    const auto& c = config.crawler;
    EXPECT_EQ(c.max_concurrent_requests, 12);
    EXPECT_EQ(c.extraction.strategy, ExtractionStrategy::Html);
    EXPECT_EQ(c.default_headers.at("Accept-Language"), "en");
    EXPECT_EQ(c.default_cookies.at("session"), "xyz");
    EXPECT_FALSE(c.ssl_verify);
    EXPECT_EQ(c.default_timeout.count(), 10000);
    EXPECT_EQ(c.retry.base_delay.count(), 500);
    EXPECT_DOUBLE_EQ(c.retry.backoff_factor, 3.0);
    EXPECT_EQ(c.retry.max_delay.count(), 20000);
    EXPECT_EQ(c.retry.max_attempts, 5);
    EXPECT_TRUE(c.extraction.cleaning.strip_nav);
    EXPECT_EQ(c.extraction.cleaning.min_text_length, 40);
    EXPECT_FALSE(c.extraction.extract_images);
    EXPECT_EQ(c.proxy.proxies.size(), 2u);
    EXPECT_EQ(c.proxy.failure_threshold, 4);
    EXPECT_EQ(config.urls.size(), 1u);
    EXPECT_EQ(config.output, "out.json");
}

TEST(ConfigTest, CliOverridesYaml) {
    std::ofstream ofs("test_ovr.yaml");
    ofs << "max_concurrent_requests: 20\nextraction_strategy: html\n";
    ofs.close();

    char* argv[] = {
        (char*)"opencrawl", (char*)"--config", (char*)"test_ovr.yaml", (char*)"-c", (char*)"2"};
    auto config = Config::parse(5, argv);
    std::remove("test_ovr.yaml");

    EXPECT_EQ(config.crawler.max_concurrent_requests, 2);
    EXPECT_EQ(config.crawler.extraction.strategy, ExtractionStrategy::Html);
}

TEST(ConfigTest, ProxyStringInYamlBecomesSource) {
    Config config;
    apply_yaml(config, YAML::Load("proxies: \"a:1,b:2\""));
    EXPECT_EQ(config.crawler.proxy.source, "a:1,b:2");
}

TEST(ConfigTest, BadYamlValueThrows) {
    Config config;
    EXPECT_THROW(apply_yaml(config, YAML::Load("max_concurrent_requests: many")), std::runtime_error);
    EXPECT_THROW(apply_yaml(config, YAML::Load("extraction_strategy: pdf")), std::runtime_error);
}

TEST(ConfigTest, HeaderArguments) {
    EXPECT_EQ(parse_header_arg("Accept: text/html").second, "text/html");
    EXPECT_EQ(parse_header_arg("X-A=1").first, "X-A");
    EXPECT_THROW(parse_header_arg("novalue"), std::invalid_argument);
}

TEST(ConfigTest, ValidationRejectsBadValues) {
    Config config;
    config.crawler.max_concurrent_requests = 0;
    EXPECT_THROW(config.crawler.validate(), std::invalid_argument);

    config = Config{};
    config.crawler.retry.backoff_factor = 0.5;
    EXPECT_THROW(config.crawler.validate(), std::invalid_argument);

    config = Config{};
    config.crawler.extraction.cleaning.min_text_length = -1;
    EXPECT_THROW(config.crawler.validate(), std::invalid_argument);
}
