#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <map>
#include <string>

#include "../../core/types/constants.hpp"
#include "../../core/types/errors.hpp"

namespace OpenCrawl {
namespace Network {
namespace Http {

enum class HTTPCode { NetworkError = 0 };

// A fully resolved exchange: defaults already merged with per-request overrides
// and the proxy already chosen.
struct HttpRequest {
    std::string                        method = "GET";
    std::string                        url;
    std::map<std::string, std::string> headers;
    std::map<std::string, std::string> cookies;
    std::string                        body;
    std::string                        proxy;
    std::chrono::milliseconds          timeout{Core::Constants::DEFAULT_TIMEOUT_MS};
    bool                               follow_redirects = true;
    int                                max_redirects    = Core::Constants::DEFAULT_MAX_REDIRECTS;
};

struct Response {
    std::string                        effective_url;
    long                               status_code = 0;
    std::string                        content_type;
    std::map<std::string, std::string> headers;
    std::string                        body;
    std::string                        error;
    int                                redirects = 0;
    Core::FailureKind                  failure   = Core::FailureKind::None;

    bool connected() const {
        return status_code != static_cast<long>(HTTPCode::NetworkError);
    }
    bool success() const {
        return failure == Core::FailureKind::None && status_code >= 200 && status_code < 300;
    }
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Never throws for a per-request failure; the outcome is classified in
    // Response::failure.
    virtual boost::asio::awaitable<Response> execute(const HttpRequest& request) = 0;

    // Aborts every in-flight exchange; each completes with FailureKind::Cancelled.
    virtual void abort_all() {
    }

    // Drops pooled connections.
    virtual void close() {
    }
};

}  // namespace Http
}  // namespace Network
}  // namespace OpenCrawl
