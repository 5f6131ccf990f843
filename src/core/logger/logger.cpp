#include "logger.hpp"
#include <iostream>
#include <stdexcept>
#include "../../utils/text/string_utils.hpp"

namespace OpenCrawl {
namespace Core {

int        Logger::level_ = LogLevel::LOG_INFO | LogLevel::LOG_WARN | LogLevel::LOG_ERROR
                     | LogLevel::LOG_SUCCESS;
std::mutex Logger::mutex_;

namespace {
const char* RESET   = "\033[0m";
const char* RED     = "\033[31m";
const char* GREEN   = "\033[32m";
const char* YELLOW  = "\033[33m";
const char* BLUE    = "\033[34m";
const char* MAGENTA = "\033[35m";
}  // namespace

int parse_log_level(const std::string& name) {
    std::string lowered = Utils::Text::to_lower(Utils::Text::trim(name));
    if (lowered == "none" || lowered == "off")
        return LOG_NONE;
    if (lowered == "debug" || lowered == "all")
        return LOG_ALL;
    if (lowered == "info")
        return LOG_INFO | LOG_SUCCESS | LOG_WARN | LOG_ERROR;
    if (lowered == "warn" || lowered == "warning")
        return LOG_WARN | LOG_ERROR;
    if (lowered == "error")
        return LOG_ERROR;
    throw std::invalid_argument("Unknown log level: " + name);
}

void Logger::set_level(int level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

int Logger::level() {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::write(int level, const char* color, const char* tag, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!(level_ & level))
        return;

    std::ostream& out = (level == LOG_WARN || level == LOG_ERROR) ? std::cerr : std::cout;
    out << color << tag << RESET << message << std::endl;
}

void Logger::debug(const std::string& message) {
    write(LOG_DEBUG, MAGENTA, "[DEBUG] ", message);
}

void Logger::info(const std::string& message) {
    write(LOG_INFO, BLUE, "[INFO] ", message);
}

void Logger::success(const std::string& message) {
    write(LOG_SUCCESS, GREEN, "[SUCCESS] ", message);
}

void Logger::warn(const std::string& message) {
    write(LOG_WARN, YELLOW, "[WARN] ", message);
}

void Logger::error(const std::string& message) {
    write(LOG_ERROR, RED, "[ERROR] ", message);
}

}  // namespace Core
}  // namespace OpenCrawl
