#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <exception>
#include <memory>
#include "core/config/config.hpp"
#include "core/logger/logger.hpp"
#include "engine/crawler/crawler.hpp"
#include "engine/output/json_output.hpp"

using namespace OpenCrawl;

namespace {

boost::asio::awaitable<int> run_crawler(Engine::AsyncCrawler& crawler, const Core::Config& config) {
    co_await crawler.setup();

    std::vector<Engine::CrawlRequest> requests(config.urls.begin(), config.urls.end());
    auto responses = co_await crawler.fetch_many(std::move(requests));
    crawler.cleanup();

    Engine::write_results(responses, config.output);
    Core::Logger::success("Wrote " + std::to_string(responses.size()) + " results to " + config.output);
    co_return crawler.cancelled() ? 130 : 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    Core::Config config;
    try {
        config = Core::Config::parse(argc, argv);
        Core::Logger::set_level(Core::parse_log_level(config.log_level));
    } catch (const std::exception& e) {
        Core::Logger::error(e.what());
        return 1;
    }

    if (config.urls.empty()) {
        Core::Logger::error("No URLs provided.");
        return 1;
    }

    boost::asio::io_context               ioc;
    std::unique_ptr<Engine::AsyncCrawler> crawler;
    try {
        crawler = std::make_unique<Engine::AsyncCrawler>(ioc.get_executor(), config.crawler);
    } catch (const std::exception& e) {
        Core::Logger::error(e.what());
        return 1;
    }

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& error, int signal_number) {
        if (!error) {
            Core::Logger::info("Signal " + std::to_string(signal_number) + " received. Stopping...");
            crawler->cancel();
        }
    });

    int exit_code = 0;
    boost::asio::co_spawn(ioc,
                          run_crawler(*crawler, config),
                          [&](std::exception_ptr error, int code) {
                              signals.cancel();
                              exit_code = code;
                              if (!error)
                                  return;
                              exit_code = 1;
                              try {
                                  std::rethrow_exception(error);
                              } catch (const std::exception& e) {
                                  Core::Logger::error(std::string("Crawl failed: ") + e.what());
                              }
                          });
    ioc.run();
    return exit_code;
}
