#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/http.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <string>

#include "../../utils/url/url.hpp"
#include "connection_pool.hpp"
#include "http_client.hpp"

namespace OpenCrawl {
namespace Network {
namespace Http {

struct BeastClientOptions {
    bool                 ssl_verify         = true;
    std::string          user_agent         = Core::Constants::USER_AGENT;
    std::size_t          max_idle_per_route = Core::Constants::MAX_IDLE_CONNECTIONS_PER_HOST;
    std::chrono::seconds idle_timeout{30};
    std::size_t          max_body_bytes = Core::Constants::MAX_RESPONSE_BODY_BYTES;
};

// HTTP/1.1 executor on Boost.Beast. Keep-alive connections are pooled per
// route and shared by every request run through this client. Must be used from
// a single executor.
class BeastClient : public HttpClient {
public:
    BeastClient(boost::asio::any_io_executor executor, BeastClientOptions options = {});
    ~BeastClient() override;

    boost::asio::awaitable<Response> execute(const HttpRequest& request) override;
    void                             abort_all() override;
    void                             close() override;

    std::size_t idle_connections() const;

    // State of one logical request across its redirect hops.
    struct Exchange;

private:
    using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;
    using HttpRequestMessage = boost::beast::http::request<boost::beast::http::string_body>;

    boost::asio::awaitable<Response> execute_hop(const HttpRequest&                         request,
                                                 const std::string&                         method,
                                                 const std::string&                         url,
                                                 const std::string&                         body,
                                                 std::map<std::string, std::string>&       cookies,
                                                 std::shared_ptr<Exchange>                  exchange);

    boost::asio::awaitable<std::unique_ptr<Connection>>
    open_connection(const Utils::UrlParsed& target, const std::string& proxy, Exchange& exchange);

    boost::asio::awaitable<void> connect_tcp(Connection&        conn,
                                             const std::string& host,
                                             const std::string& port,
                                             Exchange&          exchange);

    boost::asio::awaitable<void> open_tunnel(Connection&             conn,
                                             const Utils::UrlParsed& target,
                                             const Utils::UrlParsed& proxy);

    boost::asio::awaitable<HttpResponse>
    round_trip(Connection& conn, HttpRequestMessage& req, bool head_request);

    boost::asio::any_io_executor                executor_;
    BeastClientOptions                          options_;
    boost::asio::ssl::context                   ssl_ctx_{boost::asio::ssl::context::tls_client};
    ConnectionPool                              pool_;
    std::map<std::uint64_t, std::weak_ptr<Exchange>> in_flight_;
    std::uint64_t                               next_exchange_id_ = 0;
};

}  // namespace Http
}  // namespace Network
}  // namespace OpenCrawl
