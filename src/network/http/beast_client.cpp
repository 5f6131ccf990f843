#include "beast_client.hpp"
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/detail/base64.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <stdexcept>
#include "../../core/logger/logger.hpp"
#include "../../utils/text/string_utils.hpp"
#include "../proxy/socks_handshake.hpp"

namespace OpenCrawl {
namespace Network {
namespace Http {

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
namespace ssl   = net::ssl;
using tcp       = net::ip::tcp;

using Core::FailureKind;
using Utils::Url;
using Utils::UrlParsed;

struct BeastClient::Exchange {
    explicit Exchange(net::any_io_executor executor) : watchdog(executor), resolver(executor) {
    }

    void interrupt() {
        resolver.cancel();
        if (active)
            active->close();
    }

    net::steady_timer watchdog;
    tcp::resolver     resolver;
    Connection*       active    = nullptr;
    bool              timed_out = false;
    bool              aborted   = false;
    bool              finished  = false;
};

namespace {

class ProxyStageError : public std::runtime_error {
public:
    explicit ProxyStageError(const std::string& what) : std::runtime_error(what) {
    }
};

struct ActiveConnectionGuard {
    BeastClient::Exchange* exchange;
    ~ActiveConnectionGuard();
};

std::string strip_brackets(const std::string& host) {
    if (host.size() > 2 && host.front() == '[' && host.back() == ']')
        return host.substr(1, host.size() - 2);
    return host;
}

std::string host_header(const UrlParsed& target) {
    bool default_port = target.port.empty() || (target.scheme == "http" && target.port == "80")
                        || (target.scheme == "https" && target.port == "443");
    return default_port ? target.host : target.host + ":" + target.port;
}

std::string basic_credentials(const std::string& user, const std::string& password) {
    std::string raw = user + ":" + password;
    std::string encoded(beast::detail::base64::encoded_size(raw.size()), '\0');
    encoded.resize(beast::detail::base64::encode(encoded.data(), raw.data(), raw.size()));
    return "Basic " + encoded;
}

std::string cookie_header(const std::map<std::string, std::string>& cookies) {
    std::string header;
    for (const auto& [name, value] : cookies) {
        if (!header.empty())
            header += "; ";
        header += name + "=" + value;
    }
    return header;
}

void absorb_set_cookie(const std::string& value, std::map<std::string, std::string>& cookies) {
    std::string pair = value.substr(0, value.find(';'));
    size_t      eq   = pair.find('=');
    if (eq == std::string::npos)
        return;
    std::string name = Utils::Text::trim(pair.substr(0, eq));
    if (!name.empty())
        cookies[name] = Utils::Text::trim(pair.substr(eq + 1));
}

bool is_redirect(long status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

FailureKind classify(const beast::error_code& ec) {
    if (ec == net::error::host_not_found || ec == net::error::host_not_found_try_again
        || ec == net::error::no_data || ec == net::error::no_recovery)
        return FailureKind::DnsFailure;
    if (ec == beast::error::timeout || ec == net::error::timed_out)
        return FailureKind::Timeout;
    if (ec.category() == net::error::get_ssl_category()
        && ERR_GET_REASON(static_cast<unsigned long>(ec.value())) == SSL_R_CERTIFICATE_VERIFY_FAILED)
        return FailureKind::SslVerification;
    return FailureKind::ConnectionFailure;
}

template <class Stream, class Message>
net::awaitable<http::response<http::string_body>> write_and_read(Stream&             stream,
                                                                 beast::flat_buffer& buffer,
                                                                 Message&            req,
                                                                 bool                head_request,
                                                                 std::size_t         body_limit) {
    co_await http::async_write(stream, req, net::use_awaitable);

    http::response_parser<http::string_body> parser;
    parser.body_limit(body_limit);
    if (head_request)
        parser.skip(true);
    co_await http::async_read(stream, buffer, parser, net::use_awaitable);
    co_return parser.release();
}

}  // namespace

ActiveConnectionGuard::~ActiveConnectionGuard() {
    exchange->active = nullptr;
}

BeastClient::BeastClient(net::any_io_executor executor, BeastClientOptions options)
    : executor_(std::move(executor)),
      options_(std::move(options)),
      pool_(options_.max_idle_per_route, options_.idle_timeout) {
    if (options_.ssl_verify) {
        ssl_ctx_.set_default_verify_paths();
        ssl_ctx_.set_verify_mode(ssl::verify_peer);
    }
    else {
        ssl_ctx_.set_verify_mode(ssl::verify_none);
    }
}

BeastClient::~BeastClient() {
    close();
}

std::size_t BeastClient::idle_connections() const {
    return pool_.idle_count();
}

void BeastClient::abort_all() {
    for (auto& [id, weak] : in_flight_) {
        if (auto exchange = weak.lock()) {
            exchange->aborted = true;
            exchange->interrupt();
        }
    }
}

void BeastClient::close() {
    pool_.clear();
}

net::awaitable<Response> BeastClient::execute(const HttpRequest& request) {
    Response response;
    response.effective_url = request.url;

    if (!Url::is_http(request.url)) {
        response.failure = FailureKind::MalformedUrl;
        response.error   = "Invalid URL: " + request.url;
        co_return response;
    }

    auto          exchange = std::make_shared<Exchange>(executor_);
    std::uint64_t id       = next_exchange_id_++;
    in_flight_[id]         = exchange;

    exchange->watchdog.expires_after(request.timeout);
    exchange->watchdog.async_wait([exchange](const boost::system::error_code& ec) {
        if (ec || exchange->finished)
            return;
        exchange->timed_out = true;
        exchange->interrupt();
    });

    std::string method  = Utils::Text::trim(request.method).empty() ? "GET" : request.method;
    std::string url     = Url::strip_fragment(request.url);
    std::string body    = request.body;
    auto        cookies = request.cookies;
    int         hops    = 0;

    try {
        while (true) {
            response           = co_await execute_hop(request, method, url, body, cookies, exchange);
            response.redirects = hops;

            if (!request.follow_redirects || !is_redirect(response.status_code))
                break;

            auto location = response.headers.find("location");
            if (location == response.headers.end() || location->second.empty())
                break;

            if (hops >= request.max_redirects) {
                response.failure = FailureKind::RedirectLimitExceeded;
                response.error   = "Exceeded " + std::to_string(request.max_redirects) + " redirects";
                break;
            }

            std::string next = Url::strip_fragment(Url::resolve(url, location->second));
            if (!Url::is_http(next)) {
                response.failure = FailureKind::MalformedUrl;
                response.error   = "Redirect to unsupported URL: " + location->second;
                break;
            }

            long status = response.status_code;
            if (status == 303 || ((status == 301 || status == 302) && method == "POST")) {
                method = "GET";
                body.clear();
            }
            Core::Logger::debug("Redirect " + std::to_string(status) + ": " + url + " -> " + next);
            url = next;
            ++hops;
        }
    } catch (const ProxyStageError& e) {
        response             = Response{};
        response.failure     = FailureKind::ProxyFailure;
        response.error       = e.what();
    } catch (const boost::system::system_error& e) {
        response         = Response{};
        response.failure = classify(e.code());
        response.error   = e.code().message();
    } catch (const std::exception& e) {
        response         = Response{};
        response.failure = FailureKind::ConnectionFailure;
        response.error   = e.what();
    }

    if (exchange->aborted) {
        response.failure = FailureKind::Cancelled;
        response.error   = "Request aborted";
    }
    else if (exchange->timed_out && !response.success()) {
        response.failure = FailureKind::Timeout;
        response.error   = "Timed out after " + std::to_string(request.timeout.count()) + " ms";
    }

    if (response.effective_url.empty())
        response.effective_url = url;
    response.redirects = hops;

    exchange->finished = true;
    exchange->watchdog.cancel();
    in_flight_.erase(id);
    co_return response;
}

net::awaitable<Response> BeastClient::execute_hop(const HttpRequest&                  request,
                                                  const std::string&                  method,
                                                  const std::string&                  url,
                                                  const std::string&                  body,
                                                  std::map<std::string, std::string>& cookies,
                                                  std::shared_ptr<Exchange>           exchange) {
    UrlParsed   target = Url::parse(url);
    UrlParsed   proxy  = request.proxy.empty() ? UrlParsed{} : Url::parse(request.proxy);
    std::string route  = ConnectionPool::route_key(request.proxy, Url::origin(target));

    bool http_proxy    = !request.proxy.empty() && (proxy.scheme == "http" || proxy.scheme == "https");
    bool absolute_form = http_proxy && target.scheme == "http";

    HttpRequestMessage req;
    req.version(11);
    http::verb verb = http::string_to_verb(method);
    if (verb == http::verb::unknown)
        req.method_string(method);
    else
        req.method(verb);
    req.target(absolute_form ? url : target.target());
    req.set(http::field::host, host_header(target));
    req.set(http::field::user_agent, options_.user_agent);
    req.set(http::field::accept, "text/html,application/xhtml+xml,*/*;q=0.8");
    for (const auto& [name, value] : request.headers)
        req.set(name, value);
    if (!cookies.empty())
        req.set(http::field::cookie, cookie_header(cookies));
    if (absolute_form && !proxy.user.empty())
        req.set(http::field::proxy_authorization, basic_credentials(proxy.user, proxy.password));
    if (!body.empty()) {
        req.body() = body;
        req.prepare_payload();
    }
    req.keep_alive(true);

    bool head_request = method == "HEAD";

    std::unique_ptr<Connection> conn = pool_.take(route);
    bool                        fresh = !conn;
    if (!conn)
        conn = co_await open_connection(target, request.proxy, *exchange);

    HttpResponse res;
    bool         reconnect = false;
    {
        exchange->active = conn.get();
        ActiveConnectionGuard guard{exchange.get()};
        try {
            res = co_await round_trip(*conn, req, head_request);
        } catch (const boost::system::system_error& e) {
            if (fresh || exchange->timed_out || exchange->aborted || !ConnectionPool::is_stale_error(e.code()))
                throw;
            reconnect = true;
        }
    }

    if (reconnect) {
        Core::Logger::debug("Pooled connection went stale, reconnecting: " + route);
        conn             = co_await open_connection(target, request.proxy, *exchange);
        exchange->active = conn.get();
        ActiveConnectionGuard guard{exchange.get()};
        res = co_await round_trip(*conn, req, head_request);
    }

    Response response;
    response.effective_url = url;
    response.status_code   = res.result_int();
    for (const auto& field : res) {
        std::string name  = Utils::Text::to_lower(std::string(field.name_string()));
        std::string value = std::string(field.value());
        if (name == "set-cookie")
            absorb_set_cookie(value, cookies);
        auto it = response.headers.find(name);
        if (it == response.headers.end())
            response.headers.emplace(name, value);
        else
            it->second += ", " + value;
    }
    auto content_type = response.headers.find("content-type");
    if (content_type != response.headers.end())
        response.content_type = content_type->second;
    response.body = std::move(res.body());

    if (!response.success()) {
        response.failure = FailureKind::HttpStatus;
        response.error   = "HTTP " + std::to_string(response.status_code);
    }

    if (res.keep_alive())
        pool_.give_back(route, std::move(conn));
    else
        conn->close();

    co_return response;
}

net::awaitable<std::unique_ptr<Connection>>
BeastClient::open_connection(const UrlParsed& target, const std::string& proxy, Exchange& exchange) {
    bool secure = target.scheme == "https";
    auto conn   = std::make_unique<Connection>(executor_, secure ? &ssl_ctx_ : nullptr);

    exchange.active = conn.get();
    ActiveConnectionGuard guard{&exchange};

    if (proxy.empty()) {
        co_await connect_tcp(*conn, target.host, target.effective_port(), exchange);
    }
    else {
        UrlParsed proxy_parsed = Url::parse(proxy);
        try {
            co_await connect_tcp(*conn, proxy_parsed.host, proxy_parsed.effective_port(), exchange);
            if (proxy_parsed.scheme == "socks5" || proxy_parsed.scheme == "socks5h") {
                co_await Proxy::SocksHandshake::perform_socks5(conn->lowest().socket(),
                                                               target.host,
                                                               target.effective_port(),
                                                               proxy_parsed.user,
                                                               proxy_parsed.password);
            }
            else if (proxy_parsed.scheme == "socks4" || proxy_parsed.scheme == "socks4a") {
                co_await Proxy::SocksHandshake::perform_socks4(
                    conn->lowest().socket(), target.host, target.effective_port(), proxy_parsed.user);
            }
            else if (secure) {
                co_await open_tunnel(*conn, target, proxy_parsed);
            }
        } catch (const std::exception& e) {
            if (exchange.timed_out || exchange.aborted)
                throw;
            throw ProxyStageError("Proxy " + proxy + ": " + e.what());
        }
    }

    if (secure) {
        auto&       stream = conn->tls();
        std::string sni    = strip_brackets(target.host);
        if (!SSL_set_tlsext_host_name(stream.native_handle(), sni.c_str())) {
            throw beast::system_error(beast::error_code(static_cast<int>(::ERR_get_error()),
                                                        net::error::get_ssl_category()));
        }
        if (options_.ssl_verify)
            stream.set_verify_callback(ssl::host_name_verification(sni));
        co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);
    }

    co_return conn;
}

net::awaitable<void> BeastClient::connect_tcp(Connection&        conn,
                                              const std::string& host,
                                              const std::string& port,
                                              Exchange&          exchange) {
    auto results = co_await exchange.resolver.async_resolve(
        strip_brackets(host), port, net::use_awaitable);
    co_await conn.lowest().async_connect(results, net::use_awaitable);

    beast::error_code ec;
    conn.lowest().socket().set_option(tcp::no_delay(true), ec);
    co_return;
}

net::awaitable<void> BeastClient::open_tunnel(Connection&      conn,
                                              const UrlParsed& target,
                                              const UrlParsed& proxy) {
    std::string authority = target.host + ":" + target.effective_port();

    http::request<http::empty_body> req{http::verb::connect, authority, 11};
    req.set(http::field::host, authority);
    req.set(http::field::user_agent, options_.user_agent);
    if (!proxy.user.empty())
        req.set(http::field::proxy_authorization, basic_credentials(proxy.user, proxy.password));
    co_await http::async_write(conn.lowest(), req, net::use_awaitable);

    beast::flat_buffer                      buffer;
    http::response_parser<http::empty_body> parser;
    parser.skip(true);
    co_await http::async_read(conn.lowest(), buffer, parser, net::use_awaitable);

    if (parser.get().result() != http::status::ok) {
        throw std::runtime_error("CONNECT rejected with HTTP "
                                 + std::to_string(parser.get().result_int()));
    }
    co_return;
}

net::awaitable<BeastClient::HttpResponse>
BeastClient::round_trip(Connection& conn, HttpRequestMessage& req, bool head_request) {
    if (conn.secure())
        co_return co_await write_and_read(
            conn.tls(), conn.buffer(), req, head_request, options_.max_body_bytes);
    co_return co_await write_and_read(
        conn.plain(), conn.buffer(), req, head_request, options_.max_body_bytes);
}

}  // namespace Http
}  // namespace Network
}  // namespace OpenCrawl
