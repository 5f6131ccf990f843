#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/ssl.hpp>
#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <string>

namespace OpenCrawl {
namespace Network {
namespace Http {

// One transport to an origin, either plain TCP or TLS over TCP.
class Connection {
public:
    Connection(boost::asio::any_io_executor executor, boost::asio::ssl::context* tls_ctx);

    bool                                                  secure() const;
    boost::beast::tcp_stream&                             lowest();
    boost::beast::tcp_stream&                             plain();
    boost::beast::ssl_stream<boost::beast::tcp_stream>&   tls();
    boost::beast::flat_buffer&                            buffer();
    bool                                                  is_open();
    void                                                  close();

    bool                                  reused = false;
    std::chrono::steady_clock::time_point last_used;

private:
    std::unique_ptr<boost::beast::tcp_stream>                           plain_;
    std::unique_ptr<boost::beast::ssl_stream<boost::beast::tcp_stream>> tls_;
    boost::beast::flat_buffer                                           buffer_;
};

// Idle keep-alive connections keyed by route (proxy + origin). Not thread-safe:
// it belongs to the executor that runs the exchanges.
class ConnectionPool {
public:
    ConnectionPool(std::size_t max_idle_per_route, std::chrono::seconds idle_timeout);

    std::unique_ptr<Connection> take(const std::string& route);
    void                        give_back(const std::string& route, std::unique_ptr<Connection> conn);
    void                        clear();
    std::size_t                 idle_count() const;

    static std::string route_key(const std::string& proxy, const std::string& origin);

    // True for errors a reused connection produces when the peer already
    // closed it; the request may be replayed on a fresh connection.
    static bool is_stale_error(const boost::beast::error_code& ec);

private:
    std::map<std::string, std::deque<std::unique_ptr<Connection>>> idle_;
    std::size_t                                                    max_idle_per_route_;
    std::chrono::seconds                                           idle_timeout_;
};

}  // namespace Http
}  // namespace Network
}  // namespace OpenCrawl
