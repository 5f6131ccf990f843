#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "../crawler/crawler_config.hpp"

namespace OpenCrawl {
namespace Engine {

// {"url", "content", "metadata", "error", ...}; "content" and "error" are null
// when absent.
nlohmann::json to_json(const CrawlResponse& response);
nlohmann::json to_json(const std::vector<CrawlResponse>& responses);

// Writes the JSON array to `path`. Throws std::runtime_error if the file cannot be written.
void write_results(const std::vector<CrawlResponse>& responses, const std::string& path);

}  // namespace Engine
}  // namespace OpenCrawl
