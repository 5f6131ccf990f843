#include <stdexcept>
#include "../../../core/async/gather.hpp"
#include "../../../core/logger/logger.hpp"
#include "../crawler.hpp"

namespace OpenCrawl {
namespace Engine {

using namespace OpenCrawl::Core;

boost::asio::awaitable<std::vector<CrawlResponse>>
AsyncCrawler::fetch_many(std::vector<CrawlRequest> requests) {
    if (!is_setup_ || is_cleaned_up_)
        throw std::logic_error("AsyncCrawler::fetch_many() requires setup() and no cleanup()");

    Logger::info("Crawling " + std::to_string(requests.size()) + " URLs with concurrency "
                 + std::to_string(config_.max_concurrent_requests));

    std::vector<TaskFactory<CrawlResponse>> tasks;
    tasks.reserve(requests.size());
    for (auto& request : requests) {
        tasks.push_back([this, request = std::move(request)]() { return fetch(request); });
    }

    std::vector<CrawlResponse> responses = co_await gather<CrawlResponse>(std::move(tasks));

    std::size_t failed = 0;
    for (const auto& response : responses) {
        if (response.error)
            ++failed;
    }
    Logger::info("Batch finished: " + std::to_string(responses.size() - failed) + " succeeded, "
                 + std::to_string(failed) + " failed");
    co_return responses;
}

}  // namespace Engine
}  // namespace OpenCrawl
