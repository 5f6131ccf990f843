#include "connection_pool.hpp"

namespace OpenCrawl {
namespace Network {
namespace Http {

namespace beast = boost::beast;

Connection::Connection(boost::asio::any_io_executor executor, boost::asio::ssl::context* tls_ctx)
    : last_used(std::chrono::steady_clock::now()) {
    if (tls_ctx)
        tls_ = std::make_unique<beast::ssl_stream<beast::tcp_stream>>(executor, *tls_ctx);
    else
        plain_ = std::make_unique<beast::tcp_stream>(executor);
}

bool Connection::secure() const {
    return tls_ != nullptr;
}

beast::tcp_stream& Connection::lowest() {
    return tls_ ? beast::get_lowest_layer(*tls_) : *plain_;
}

beast::tcp_stream& Connection::plain() {
    return *plain_;
}

beast::ssl_stream<beast::tcp_stream>& Connection::tls() {
    return *tls_;
}

beast::flat_buffer& Connection::buffer() {
    return buffer_;
}

bool Connection::is_open() {
    return lowest().socket().is_open();
}

void Connection::close() {
    beast::error_code ec;
    lowest().socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    lowest().socket().close(ec);
}

ConnectionPool::ConnectionPool(std::size_t max_idle_per_route, std::chrono::seconds idle_timeout)
    : max_idle_per_route_(max_idle_per_route), idle_timeout_(idle_timeout) {
}

std::unique_ptr<Connection> ConnectionPool::take(const std::string& route) {
    auto it = idle_.find(route);
    if (it == idle_.end())
        return nullptr;

    auto now = std::chrono::steady_clock::now();
    auto& queue = it->second;
    while (!queue.empty()) {
        std::unique_ptr<Connection> conn = std::move(queue.back());
        queue.pop_back();
        if (conn->is_open() && now - conn->last_used < idle_timeout_) {
            conn->reused = true;
            if (queue.empty())
                idle_.erase(it);
            return conn;
        }
        conn->close();
    }
    idle_.erase(it);
    return nullptr;
}

void ConnectionPool::give_back(const std::string& route, std::unique_ptr<Connection> conn) {
    if (!conn || !conn->is_open())
        return;

    auto& queue = idle_[route];
    if (queue.size() >= max_idle_per_route_) {
        conn->close();
        return;
    }
    conn->last_used = std::chrono::steady_clock::now();
    queue.push_back(std::move(conn));
}

void ConnectionPool::clear() {
    for (auto& [route, queue] : idle_) {
        for (auto& conn : queue)
            conn->close();
    }
    idle_.clear();
}

std::size_t ConnectionPool::idle_count() const {
    std::size_t count = 0;
    for (const auto& [route, queue] : idle_)
        count += queue.size();
    return count;
}

std::string ConnectionPool::route_key(const std::string& proxy, const std::string& origin) {
    return (proxy.empty() ? std::string("direct") : proxy) + "|" + origin;
}

bool ConnectionPool::is_stale_error(const beast::error_code& ec) {
    namespace net = boost::asio;
    return ec == beast::http::error::end_of_stream || ec == net::error::eof
           || ec == net::error::connection_reset || ec == net::error::broken_pipe
           || ec == beast::http::error::partial_message || ec == net::ssl::error::stream_truncated;
}

}  // namespace Http
}  // namespace Network
}  // namespace OpenCrawl
