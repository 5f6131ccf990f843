#pragma once
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "../../engine/crawler/crawler_config.hpp"
#include "../types/constants.hpp"

namespace OpenCrawl {
namespace Core {

struct Config {
    Engine::CrawlerConfig    crawler;
    std::vector<std::string> urls;
    std::string              output    = Constants::DEFAULT_OUTPUT_PATH;
    std::string              log_level = "info";
    std::string              config_path;

    // Command line over YAML file over defaults. Exits on --help or a parse error.
    static Config parse(int argc, char* argv[]);
};

// Applies the keys present in `yaml`; absent keys keep their current value.
// Throws std::runtime_error on a malformed value.
void apply_yaml(Config& config, const YAML::Node& yaml);
void load_yaml(Config& config, const std::string& path);

// "Name: value" or "Name=value". Throws std::invalid_argument otherwise.
std::pair<std::string, std::string> parse_header_arg(const std::string& arg);

}  // namespace Core
}  // namespace OpenCrawl
