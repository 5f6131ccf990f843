#include "config.hpp"
#include <CLI/CLI.hpp>
#include <cmath>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include "../../extraction/extraction_types.hpp"
#include "../../utils/text/string_utils.hpp"

namespace OpenCrawl {
namespace Core {

namespace {

std::chrono::milliseconds seconds_to_ms(double seconds) {
    if (seconds < 0)
        throw std::invalid_argument("Durations must not be negative");
    return std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
}

std::map<std::string, std::string> string_map(const YAML::Node& node, const char* key) {
    if (!node.IsMap())
        throw std::runtime_error(std::string(key) + " must be a mapping");
    std::map<std::string, std::string> out;
    for (auto it = node.begin(); it != node.end(); ++it)
        out[it->first.as<std::string>()] = it->second.as<std::string>();
    return out;
}

template <typename T>
void read(const YAML::Node& yaml, const char* key, T& target) {
    if (yaml[key])
        target = yaml[key].as<T>();
}

}  // namespace

std::pair<std::string, std::string> parse_header_arg(const std::string& arg) {
    size_t sep = arg.find_first_of(":=");
    if (sep == std::string::npos || sep == 0)
        throw std::invalid_argument("Header must look like 'Name: value': " + arg);
    std::string name = Utils::Text::trim(arg.substr(0, sep));
    if (name.empty())
        throw std::invalid_argument("Header must look like 'Name: value': " + arg);
    return {name, Utils::Text::trim(arg.substr(sep + 1))};
}

void apply_yaml(Config& config, const YAML::Node& yaml) {
    auto& crawler = config.crawler;
    try {
        read(yaml, "max_concurrent_requests", crawler.max_concurrent_requests);
        read(yaml, "user_agent", crawler.user_agent);
        read(yaml, "ssl_verify", crawler.ssl_verify);
        read(yaml, "follow_redirects", crawler.follow_redirects);
        read(yaml, "max_redirects", crawler.max_redirects);
        read(yaml, "max_retries", crawler.retry.max_attempts);
        read(yaml, "backoff_factor", crawler.retry.backoff_factor);
        read(yaml, "extraction_threads", crawler.extraction_threads);

        if (yaml["default_timeout"])
            crawler.default_timeout = seconds_to_ms(yaml["default_timeout"].as<double>());
        if (yaml["base_delay"])
            crawler.retry.base_delay = seconds_to_ms(yaml["base_delay"].as<double>());
        if (yaml["max_delay"])
            crawler.retry.max_delay = seconds_to_ms(yaml["max_delay"].as<double>());

        if (yaml["default_headers"])
            crawler.default_headers = string_map(yaml["default_headers"], "default_headers");
        if (yaml["default_cookies"])
            crawler.default_cookies = string_map(yaml["default_cookies"], "default_cookies");

        if (yaml["extraction_strategy"])
            crawler.extraction.strategy =
                Extraction::parse_strategy(yaml["extraction_strategy"].as<std::string>());
        auto& cleaning = crawler.extraction.cleaning;
        read(yaml, "strip_scripts", cleaning.strip_scripts);
        read(yaml, "strip_styles", cleaning.strip_styles);
        read(yaml, "strip_comments", cleaning.strip_comments);
        read(yaml, "strip_nav", cleaning.strip_nav);
        read(yaml, "strip_headers", cleaning.strip_headers);
        read(yaml, "strip_footers", cleaning.strip_footers);
        read(yaml, "min_text_length", cleaning.min_text_length);
        read(yaml, "extract_metadata", crawler.extraction.extract_metadata);
        read(yaml, "extract_links", crawler.extraction.extract_links);
        read(yaml, "extract_images", crawler.extraction.extract_images);

        if (yaml["proxies"]) {
            const YAML::Node& proxies = yaml["proxies"];
            if (proxies.IsSequence()) {
                for (const auto& node : proxies)
                    crawler.proxy.proxies.push_back(node.as<std::string>());
            }
            else {
                crawler.proxy.source = proxies.as<std::string>();
            }
        }
        read(yaml, "proxy_test_url", crawler.proxy.test_url);
        read(yaml, "proxy_failure_threshold", crawler.proxy.failure_threshold);
        if (yaml["proxy_probe_timeout"])
            crawler.proxy.probe_timeout = seconds_to_ms(yaml["proxy_probe_timeout"].as<double>());

        if (yaml["urls"] && yaml["urls"].IsSequence()) {
            for (const auto& node : yaml["urls"])
                config.urls.push_back(node.as<std::string>());
        }
        read(yaml, "output", config.output);
        read(yaml, "log_level", config.log_level);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Error parsing config: " + std::string(e.what()));
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error("Error parsing config: " + std::string(e.what()));
    }
}

void load_yaml(Config& config, const std::string& path) {
    YAML::Node yaml;
    try {
        yaml = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Error loading config file " + path + ": " + e.what());
    }
    apply_yaml(config, yaml);
}

Config Config::parse(int argc, char* argv[]) {
    Config   config;
    CLI::App app{"OpenCrawl - concurrent web page fetching and content extraction"};

    int                      concurrency = 0;
    std::string              strategy;
    std::string              output;
    std::vector<std::string> proxies;
    std::string              proxy_list;
    double                   timeout_secs = 0;
    int                      retries      = 0;
    int                      min_text     = 0;
    std::vector<std::string> headers;
    std::string              log_level;
    std::string              user_agent;
    std::vector<std::string> urls;

    app.set_version_flag("--version", Constants::VERSION);
    app.add_option("--config", config.config_path, "Path to YAML configuration file");
    app.add_option("-c,--concurrency", concurrency, "Maximum concurrent requests");
    app.add_option("-s,--strategy", strategy, "Extraction strategy: html, content or markdown");
    app.add_option("-o,--output", output, "Output JSON file");
    app.add_option("--proxy", proxies, "Proxy URL (repeatable)");
    app.add_option("--proxy-list", proxy_list, "Proxy file or comma-separated list");
    app.add_option("--timeout", timeout_secs, "Request timeout in seconds");
    app.add_option("--retries", retries, "Maximum attempts per request");
    app.add_option("--min-text-length", min_text, "Minimum characters per text block");
    app.add_option("--header", headers, "Default header 'Name: value' (repeatable)");
    app.add_option("--user-agent", user_agent, "User-Agent header");
    app.add_option("--log-level", log_level, "debug, info, warn, error or none");
    auto* no_ssl      = app.add_flag("--no-ssl-verify", "Disable TLS certificate verification");
    auto* strip_nav   = app.add_flag("--strip-nav", "Remove navigation regions");
    auto* strip_head  = app.add_flag("--strip-headers", "Remove page headers");
    auto* strip_foot  = app.add_flag("--strip-footers", "Remove page footers");
    auto* no_links    = app.add_flag("--no-links", "Skip link extraction");
    auto* no_images   = app.add_flag("--no-images", "Skip image extraction");
    auto* no_metadata = app.add_flag("--no-metadata", "Skip metadata extraction");
    app.add_option("urls", urls, "URLs to crawl");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit(app.exit(e));
    }

    if (!config.config_path.empty())
        load_yaml(config, config.config_path);

    auto& crawler = config.crawler;
    if (app.count("--concurrency"))
        crawler.max_concurrent_requests = concurrency;
    if (app.count("--strategy"))
        crawler.extraction.strategy = Extraction::parse_strategy(strategy);
    if (app.count("--output"))
        config.output = output;
    crawler.proxy.proxies.insert(crawler.proxy.proxies.end(), proxies.begin(), proxies.end());
    if (app.count("--proxy-list"))
        crawler.proxy.source = proxy_list;
    if (app.count("--timeout"))
        crawler.default_timeout = seconds_to_ms(timeout_secs);
    if (app.count("--retries"))
        crawler.retry.max_attempts = retries;
    if (app.count("--min-text-length"))
        crawler.extraction.cleaning.min_text_length = min_text;
    for (const auto& header : headers) {
        auto [name, value]             = parse_header_arg(header);
        crawler.default_headers[name] = value;
    }
    if (app.count("--user-agent"))
        crawler.user_agent = user_agent;
    if (app.count("--log-level"))
        config.log_level = log_level;
    if (*no_ssl)
        crawler.ssl_verify = false;
    if (*strip_nav)
        crawler.extraction.cleaning.strip_nav = true;
    if (*strip_head)
        crawler.extraction.cleaning.strip_headers = true;
    if (*strip_foot)
        crawler.extraction.cleaning.strip_footers = true;
    if (*no_links)
        crawler.extraction.extract_links = false;
    if (*no_images)
        crawler.extraction.extract_images = false;
    if (*no_metadata)
        crawler.extraction.extract_metadata = false;
    config.urls.insert(config.urls.end(), urls.begin(), urls.end());

    return config;
}

}  // namespace Core
}  // namespace OpenCrawl
