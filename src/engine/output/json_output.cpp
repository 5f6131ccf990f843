#include "json_output.hpp"
#include <fstream>
#include <stdexcept>

namespace OpenCrawl {
namespace Engine {

nlohmann::json to_json(const CrawlResponse& response) {
    nlohmann::json j;
    j["url"]         = response.request.url;
    j["final_url"]   = response.url;
    j["status"]      = response.status ? nlohmann::json(*response.status) : nlohmann::json(nullptr);
    j["attempts"]    = response.attempts;
    j["elapsed_ms"]  = response.elapsed.count();
    j["proxy"]       = response.proxy ? nlohmann::json(*response.proxy) : nlohmann::json(nullptr);
    j["request_metadata"] = response.request.metadata;

    if (response.extracted) {
        const auto& extracted = *response.extracted;
        j["strategy"] = Extraction::to_string(extracted.strategy);
        j["content"]  = extracted.content;
        j["metadata"] = extracted.metadata;
        if (extracted.links)
            j["links"] = *extracted.links;
        if (extracted.images)
            j["images"] = *extracted.images;
    }
    else {
        j["content"]  = nullptr;
        j["metadata"] = nlohmann::json::object();
    }

    if (response.error) {
        j["error"] = {{"kind", Core::to_string(response.error->kind)},
                      {"message", response.error->describe()},
                      {"attempts", response.error->attempts}};
    }
    else {
        j["error"] = nullptr;
    }
    return j;
}

nlohmann::json to_json(const std::vector<CrawlResponse>& responses) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& response : responses)
        array.push_back(to_json(response));
    return array;
}

void write_results(const std::vector<CrawlResponse>& responses, const std::string& path) {
    // Server-supplied bytes (bodies, Location values) are not guaranteed UTF-8.
    std::string text = to_json(responses).dump(2, ' ', false, nlohmann::json::error_handler_t::replace);

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file)
        throw std::runtime_error("Cannot open output file: " + path);
    file << text << '\n';
    if (!file)
        throw std::runtime_error("Failed writing output file: " + path);
}

}  // namespace Engine
}  // namespace OpenCrawl
