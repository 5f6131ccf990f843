#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <string>

namespace OpenCrawl {
namespace Network {
namespace Proxy {

/**
 * @brief Asynchronous SOCKS handshakes on an already connected socket.
 *
 * Both methods throw std::runtime_error when the proxy refuses the request and
 * boost::system::system_error on transport errors.
 */
class SocksHandshake {
public:
    /**
     * @brief SOCKS4, falling back to SOCKS4a when the host is not an IPv4 literal.
     * @param user Sent as the SOCKS4 user id, may be empty.
     */
    static boost::asio::awaitable<void> perform_socks4(boost::asio::ip::tcp::socket& socket,
                                                       const std::string&            host,
                                                       const std::string&            port,
                                                       const std::string&            user);

    /**
     * @brief SOCKS5 CONNECT by domain name. Offers username/password
     * authentication (RFC 1929) when credentials are given, otherwise no-auth.
     */
    static boost::asio::awaitable<void> perform_socks5(boost::asio::ip::tcp::socket& socket,
                                                       const std::string&            host,
                                                       const std::string&            port,
                                                       const std::string&            user,
                                                       const std::string&            password);
};

}  // namespace Proxy
}  // namespace Network
}  // namespace OpenCrawl
