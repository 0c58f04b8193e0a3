#include "beast_client.hpp"
#include "../../core/logger/logger.hpp"
#include "../../utils/text/string_utils.hpp"
#include "../proxy/socks_handshake.hpp"

namespace Harvester {
namespace Network {
namespace Http {

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
namespace ssl   = net::ssl;
using tcp       = net::ip::tcp;
using Core::Logger;
using Proxy::ProxyError;

namespace {

template <typename T>
class ActiveScope {
public:
    ActiveScope(T*& slot, T& value) : slot_(slot) {
        slot_ = &value;
    }
    ~ActiveScope() {
        slot_ = nullptr;
    }

private:
    T*& slot_;
};

Response cancelled_response(const std::string& url) {
    Response response;
    response.effective_url = url;
    response.error         = "Request cancelled";
    response.error_type    = ErrorType::Timeout;
    return response;
}

}  // namespace

BeastClient::BeastClient() {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(ssl::verify_peer);
}

void BeastClient::set_proxy(const std::string& proxy) {
    proxy_        = proxy;
    proxy_parsed_ = proxy.empty() ? Utils::UrlParsed{} : Utils::Url::parse(proxy);
}

void BeastClient::set_connect_timeout(std::chrono::milliseconds timeout) {
    connect_timeout_ = timeout;
}

void BeastClient::set_request_timeout(std::chrono::milliseconds timeout) {
    request_timeout_ = timeout;
}

void BeastClient::cancel() {
    cancelled_ = true;
    if (active_resolver_)
        active_resolver_->cancel();
    if (active_stream_)
        active_stream_->close();
}

void BeastClient::set_user_agent(const std::string& user_agent) {
    user_agent_ = user_agent;
}

void BeastClient::set_accept_language(const std::string& language) {
    accept_language_ = language;
}

bool BeastClient::make_target(const std::string& url, Target& out) {
    auto parsed = Utils::Url::parse(url);
    if (parsed.host.empty() || (parsed.scheme != "http" && parsed.scheme != "https"))
        return false;

    out.is_ssl = parsed.scheme == "https";
    out.host   = parsed.host;
    out.port   = parsed.port.empty() ? (out.is_ssl ? "443" : "80") : parsed.port;
    out.path   = parsed.path.empty() ? "/" : parsed.path;
    if (!parsed.query.empty())
        out.path += "?" + parsed.query;
    out.url = url;
    return true;
}

std::string BeastClient::resolve_location(const Target& current, const std::string& location) {
    if (Utils::Url::is_http(location))
        return location;

    std::string origin = std::string(current.is_ssl ? "https://" : "http://") + current.host;
    bool default_port  = (current.is_ssl && current.port == "443") || (!current.is_ssl && current.port == "80");
    if (!default_port)
        origin += ":" + current.port;

    if (Utils::Text::starts_with(location, "//"))
        return std::string(current.is_ssl ? "https:" : "http:") + location;
    if (Utils::Text::starts_with(location, "/"))
        return origin + location;

    std::string base = current.path.substr(0, current.path.find('?'));
    base             = base.substr(0, base.find_last_of('/') + 1);
    return origin + base + location;
}

net::awaitable<Response> BeastClient::get(const std::string& url) {
    Target target;
    if (!make_target(url, target)) {
        Response response;
        response.effective_url = url;
        response.error         = "Invalid URL";
        response.error_type    = ErrorType::Network;
        co_return response;
    }

    cancelled_ = false;
    Response response;
    for (int redirect = 0; redirect <= MAX_REDIRECTS; ++redirect) {
        response = co_await do_request(target);
        if (cancelled_)
            co_return cancelled_response(target.url);
        if (response.error_type != ErrorType::None)
            co_return response;

        bool is_redirect = response.status_code == 301 || response.status_code == 302
                        || response.status_code == 303 || response.status_code == 307
                        || response.status_code == 308;
        if (!is_redirect || response.effective_url.empty())
            co_return response;

        std::string next = resolve_location(target, response.effective_url);
        Logger::debug("Redirect " + std::to_string(response.status_code) + ": " + next);
        if (!make_target(next, target)) {
            response.error      = "Invalid redirect target: " + next;
            response.error_type = ErrorType::Network;
            co_return response;
        }
    }

    response.success    = false;
    response.error      = "Too many redirects";
    response.error_type = ErrorType::Network;
    co_return response;
}

net::awaitable<Response> BeastClient::do_request(const Target& target) {
    try {
        if (target.is_ssl)
            co_return co_await perform_https_request(target);
        co_return co_await perform_http_request(target);
    } catch (const ProxyError& e) {
        Response response;
        response.effective_url = target.url;
        response.error         = e.what();
        response.error_type    = ErrorType::Proxy;
        co_return response;
    } catch (const boost::system::system_error& e) {
        Response response;
        response.effective_url = target.url;
        response.error         = e.code().message();
        response.error_type =
            e.code() == beast::error::timeout ? ErrorType::Timeout : ErrorType::Network;
        co_return response;
    } catch (const std::exception& e) {
        Response response;
        response.effective_url = target.url;
        response.error         = e.what();
        response.error_type    = ErrorType::Network;
        co_return response;
    }
}

net::awaitable<void> BeastClient::connect(beast::tcp_stream& stream, const Target& target) {
    std::string connect_host = target.host;
    std::string connect_port = target.port;
    if (uses_proxy()) {
        connect_host = proxy_parsed_.host;
        connect_port = proxy_parsed_.port.empty() ? "8080" : proxy_parsed_.port;
    }
    // IPv6 literals arrive bracketed from the URL parser.
    if (connect_host.size() > 2 && connect_host.front() == '[' && connect_host.back() == ']')
        connect_host = connect_host.substr(1, connect_host.size() - 2);

    tcp::resolver            resolver(co_await net::this_coro::executor);
    tcp::resolver::results_type results;
    {
        ActiveScope<tcp::resolver> active(active_resolver_, resolver);
        results = co_await resolver.async_resolve(connect_host, connect_port, net::use_awaitable);
    }

    stream.expires_after(connect_timeout_);
    try {
        co_await stream.async_connect(results, net::use_awaitable);
    } catch (const boost::system::system_error& e) {
        if (uses_proxy() && e.code() != beast::error::timeout)
            throw ProxyError("cannot reach proxy " + connect_host + ":" + connect_port + ": "
                             + e.code().message());
        throw;
    }

    // The handshake shares the connect deadline.
    const auto& scheme = proxy_parsed_.scheme;
    if (scheme == "socks5" || scheme == "socks5h") {
        stream.expires_after(connect_timeout_);
        Proxy::SocksCredentials credentials{proxy_parsed_.username, proxy_parsed_.password};
        co_await Proxy::SocksHandshake::perform_socks5(stream, target.host, target.port, credentials);
    }
    else if (scheme == "socks4" || scheme == "socks4a") {
        stream.expires_after(connect_timeout_);
        co_await Proxy::SocksHandshake::perform_socks4(stream, target.host, target.port, proxy_parsed_.username);
    }
    co_return;
}

// HTTP CONNECT through an http(s) proxy for TLS targets.
net::awaitable<void> BeastClient::open_tunnel(beast::tcp_stream& stream, const Target& target) {
    std::string authority = target.host + ":" + target.port;

    http::request<http::empty_body> req{http::verb::connect, authority, 11};
    req.set(http::field::host, authority);
    req.set(http::field::user_agent, user_agent_);
    if (!proxy_parsed_.username.empty()) {
        req.set(http::field::proxy_authorization,
                "Basic "
                    + Utils::Text::base64_encode(proxy_parsed_.username + ":"
                                                 + proxy_parsed_.password));
    }
    co_await http::async_write(stream, req, net::use_awaitable);

    // CONNECT replies carry no body.
    beast::flat_buffer                b;
    http::response_parser<http::empty_body> parser;
    parser.skip(true);
    co_await http::async_read(stream, b, parser, net::use_awaitable);

    if (parser.get().result() != http::status::ok)
        throw ProxyError("proxy CONNECT failed with HTTP " + std::to_string(parser.get().result_int()));
    co_return;
}

http::request<http::empty_body> BeastClient::build_request(const Target& target,
                                                           bool          absolute_form) const {
    http::request<http::empty_body> req{http::verb::get, absolute_form ? target.url : target.path, 11};
    req.set(http::field::host, target.host);
    req.set(http::field::user_agent, user_agent_);
    req.set(http::field::accept, "text/html,application/xhtml+xml,application/json;q=0.9,*/*;q=0.8");
    if (!accept_language_.empty())
        req.set(http::field::accept_language, accept_language_);
    req.set(http::field::connection, "close");
    if (absolute_form && !proxy_parsed_.username.empty()) {
        req.set(http::field::proxy_authorization,
                "Basic "
                    + Utils::Text::base64_encode(proxy_parsed_.username + ":"
                                                 + proxy_parsed_.password));
    }
    return req;
}

Response BeastClient::to_response(const Target& target, http::response<http::string_body>& res) {
    Response response;
    response.effective_url = target.url;
    response.status_code   = res.result_int();
    response.body          = std::move(res.body());
    response.success       = response.status_code >= 200 && response.status_code < 400;

    auto ct = res.find(http::field::content_type);
    if (ct != res.end())
        response.content_type = std::string(ct->value());

    // Redirects hand the Location back through effective_url; get() resolves it.
    if (response.status_code >= 300 && response.status_code < 400) {
        auto location = res.find(http::field::location);
        response.effective_url = location != res.end() ? std::string(location->value()) : "";
    }
    return response;
}

net::awaitable<Response> BeastClient::perform_http_request(const Target& target) {
    beast::tcp_stream              stream(co_await net::this_coro::executor);
    ActiveScope<beast::tcp_stream> active(active_stream_, stream);
    co_await connect(stream, target);

    // The deadline covers writing the request and reading the whole response.
    stream.expires_after(request_timeout_);

    auto req = build_request(target, uses_http_proxy());
    co_await http::async_write(stream, req, net::use_awaitable);

    beast::flat_buffer                b;
    http::response<http::string_body> res;
    co_await                          http::async_read(stream, b, res, net::use_awaitable);

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    co_return to_response(target, res);
}

net::awaitable<Response> BeastClient::perform_https_request(const Target& target) {
    beast::ssl_stream<beast::tcp_stream> ssl_stream(co_await net::this_coro::executor, ssl_ctx_);
    if (!SSL_set_tlsext_host_name(ssl_stream.native_handle(), target.host.c_str())) {
        throw beast::system_error(
            beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()));
    }

    auto&                          lowest = beast::get_lowest_layer(ssl_stream);
    ActiveScope<beast::tcp_stream> active(active_stream_, lowest);
    co_await connect(lowest, target);
    if (uses_http_proxy())
        co_await open_tunnel(lowest, target);

    lowest.expires_after(connect_timeout_);
    co_await ssl_stream.async_handshake(ssl::stream_base::client, net::use_awaitable);

    lowest.expires_after(request_timeout_);

    auto req = build_request(target, false);
    co_await http::async_write(ssl_stream, req, net::use_awaitable);

    beast::flat_buffer                b;
    http::response<http::string_body> res;
    co_await                          http::async_read(ssl_stream, b, res, net::use_awaitable);

    Response response = to_response(target, res);

    // Servers commonly drop the connection without close_notify.
    beast::error_code ec;
    co_await ssl_stream.async_shutdown(net::redirect_error(net::use_awaitable, ec));
    co_return response;
}

}  // namespace Http
}  // namespace Network
}  // namespace Harvester
