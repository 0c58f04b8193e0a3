#include "cdp_client.hpp"
#include <utility>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/http.hpp>
#include "../../core/logger/logger.hpp"

namespace Harvester {
namespace Browser {
namespace CDP {

namespace beast     = boost::beast;
namespace http      = beast::http;
namespace websocket = beast::websocket;
namespace net       = boost::asio;
using tcp           = net::ip::tcp;
using nlohmann::json;
using Core::Logger;

CDPClient::CDPClient(std::string host, int port) : host_(std::move(host)), port_(port) {
}

CDPClient::~CDPClient() {
    if (conn_) {
        conn_->deadline.cancel();
        beast::error_code ec;
        beast::get_lowest_layer(conn_->ws).socket().close(ec);
    }
}

// GET /json/version on the debugging port names the browser endpoint.
net::awaitable<std::string> CDPClient::get_web_socket_url() {
    auto          ex = co_await net::this_coro::executor;
    tcp::resolver resolver(ex);
    auto results = co_await resolver.async_resolve(host_, std::to_string(port_), net::use_awaitable);

    beast::tcp_stream stream(ex);
    stream.expires_after(std::chrono::seconds(5));
    co_await stream.async_connect(results, net::use_awaitable);

    http::request<http::empty_body> req{http::verb::get, "/json/version", 11};
    req.set(http::field::host, host_ + ":" + std::to_string(port_));
    co_await http::async_write(stream, req, net::use_awaitable);

    beast::flat_buffer                b;
    http::response<http::string_body> res;
    co_await                          http::async_read(stream, b, res, net::use_awaitable);

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    auto body = json::parse(res.body(), nullptr, false);
    if (body.is_discarded() || !body.contains("webSocketDebuggerUrl"))
        throw CDPError("no webSocketDebuggerUrl from " + host_ + ":" + std::to_string(port_));
    co_return body["webSocketDebuggerUrl"].get<std::string>();
}

net::awaitable<void> CDPClient::connect() {
    if (conn_)
        co_return;

    std::string ws_url = co_await get_web_socket_url();
    // ws://host:port/devtools/browser/<id>
    size_t path_start = ws_url.find('/', ws_url.find("//") + 2);
    if (path_start == std::string::npos)
        throw CDPError("malformed DevTools URL: " + ws_url);
    std::string path = ws_url.substr(path_start);

    auto ex = co_await net::this_coro::executor;
    conn_   = std::make_shared<Connection>(ex);

    tcp::resolver resolver(ex);
    auto results = co_await resolver.async_resolve(host_, std::to_string(port_), net::use_awaitable);

    auto& lowest = beast::get_lowest_layer(conn_->ws);
    lowest.expires_after(std::chrono::seconds(5));
    co_await lowest.async_connect(results, net::use_awaitable);
    lowest.expires_never();

    conn_->ws.read_message_max(64 * 1024 * 1024);
    co_await conn_->ws.async_handshake(host_ + ":" + std::to_string(port_), path, net::use_awaitable);
    co_return;
}

net::awaitable<void> CDPClient::close() {
    if (!conn_)
        co_return;
    conn_->deadline.cancel();
    beast::error_code ec;
    co_await conn_->ws.async_close(websocket::close_code::normal,
                                   net::redirect_error(net::use_awaitable, ec));
    conn_.reset();
    co_return;
}

void CDPClient::arm_deadline(std::chrono::milliseconds timeout) {
    conn_->timed_out = false;
    conn_->deadline.expires_after(timeout);
    std::weak_ptr<Connection> weak = conn_;
    conn_->deadline.async_wait([weak](const boost::system::error_code& ec) {
        if (ec)
            return;
        if (auto conn = weak.lock()) {
            conn->timed_out = true;
            beast::error_code ignored;
            beast::get_lowest_layer(conn->ws).socket().close(ignored);
        }
    });
}

net::awaitable<json> CDPClient::read_message() {
    beast::flat_buffer buffer;
    try {
        co_await conn_->ws.async_read(buffer, net::use_awaitable);
    } catch (const boost::system::system_error& e) {
        if (conn_->timed_out)
            throw CDPTimeout("render deadline exceeded");
        throw CDPError(std::string("DevTools connection lost: ") + e.code().message());
    }
    auto message = json::parse(beast::buffers_to_string(buffer.data()), nullptr, false);
    if (message.is_discarded())
        throw CDPError("undecodable DevTools message");
    co_return message;
}

net::awaitable<json> CDPClient::call(const std::string& method,
                                     json               params,
                                     const std::string& session_id) {
    int  id      = next_id_++;
    json message = {{"id", id}, {"method", method}, {"params", std::move(params)}};
    if (!session_id.empty())
        message["sessionId"] = session_id;

    std::string payload = message.dump();
    try {
        co_await conn_->ws.async_write(net::buffer(payload), net::use_awaitable);
    } catch (const boost::system::system_error& e) {
        if (conn_->timed_out)
            throw CDPTimeout("render deadline exceeded");
        throw CDPError(std::string("DevTools write failed: ") + e.code().message());
    }

    while (true) {
        auto it = replies_.find(id);
        if (it != replies_.end()) {
            json reply = std::move(it->second);
            replies_.erase(it);
            if (reply.contains("error"))
                throw CDPError(method + ": "
                               + reply["error"].value("message", reply["error"].dump()));
            co_return reply.value("result", json::object());
        }
        co_await pump();
    }
}

// Reads one message and files it as a reply or an event.
net::awaitable<void> CDPClient::pump() {
    json message = co_await read_message();
    if (message.contains("id")) {
        replies_[message["id"].get<int>()] = std::move(message);
        co_return;
    }
    if (co_await handle_fetch_event(message))
        co_return;
    events_.push_back(std::move(message));
}

// Fetch.* events only arrive when proxy credentials are in play. Paused
// requests block navigation, so they are answered as soon as they are read.
net::awaitable<bool> CDPClient::handle_fetch_event(const json& event) {
    if (!active_)
        co_return false;

    std::string method  = event.value("method", "");
    std::string session = event.value("sessionId", "");
    if (method == "Fetch.requestPaused") {
        json params = {{"requestId", event["params"]["requestId"]}};
        co_await call("Fetch.continueRequest", std::move(params), session);
        co_return true;
    }
    if (method == "Fetch.authRequired") {
        json params = {{"requestId", event["params"]["requestId"]},
                       {"authChallengeResponse",
                        {{"response", "ProvideCredentials"},
                         {"username", active_->proxy_username},
                         {"password", active_->proxy_password}}}};
        co_await call("Fetch.continueWithAuth", std::move(params), session);
        co_return true;
    }
    co_return false;
}

net::awaitable<json> CDPClient::wait_for_event(const std::string& method,
                                               const std::string& session_id) {
    while (true) {
        while (!events_.empty()) {
            json event = std::move(events_.front());
            events_.pop_front();
            if (event.value("sessionId", "") == session_id && event.value("method", "") == method)
                co_return event;
        }
        co_await pump();
    }
}

net::awaitable<RenderResult> CDPClient::render(const std::string& url, const RenderOptions& options) {
    co_await connect();
    events_.clear();
    replies_.clear();
    active_ = &options;
    arm_deadline(options.timeout);

    json context_params = json::object();
    if (!options.proxy_server.empty())
        context_params["proxyServer"] = options.proxy_server;
    std::string context_id;
    try {
        json context = co_await call("Target.createBrowserContext", context_params);
        context_id   = context.value("browserContextId", "");
    } catch (const std::exception&) {
        active_ = nullptr;
        conn_->deadline.cancel();
        conn_.reset();
        throw;
    }

    RenderResult result;
    std::string  error;
    bool         timed_out = false;
    try {
        json create_params = {{"url", "about:blank"}, {"browserContextId", context_id}};
        json target        = co_await call("Target.createTarget", std::move(create_params));
        json attach_params = {{"targetId", target.value("targetId", "")}, {"flatten", true}};
        json attached      = co_await call("Target.attachToTarget", std::move(attach_params));
        std::string session = attached.value("sessionId", "");

        if (!options.proxy_username.empty()) {
            json params = {{"handleAuthRequests", true},
                           {"patterns", json::array({json{{"urlPattern", "*"}}})}};
            co_await call("Fetch.enable", std::move(params), session);
        }
        if (!options.user_agent.empty()) {
            json ua = {{"userAgent", options.user_agent}};
            if (!options.accept_language.empty())
                ua["acceptLanguage"] = options.accept_language;
            co_await call("Network.setUserAgentOverride", ua, session);
        }

        co_await call("Page.enable", json::object(), session);
        json nav_params = {{"url", url}};
        json nav        = co_await call("Page.navigate", std::move(nav_params), session);
        if (nav.contains("errorText") && !nav["errorText"].get<std::string>().empty())
            throw CDPError("navigation failed: " + nav["errorText"].get<std::string>());

        co_await wait_for_event("Page.loadEventFired", session);

        json html_params = {{"expression", "document.documentElement.outerHTML"},
                            {"returnByValue", true}};
        json html = co_await call("Runtime.evaluate", std::move(html_params), session);
        result.html = html["result"].value("value", "");

        json meta_params = {
            {"expression",
             "JSON.stringify({u: location.href, s: (performance.getEntriesByType('navigation')[0] "
             "|| {}).responseStatus || 0})"},
            {"returnByValue", true}};
        json meta = co_await call("Runtime.evaluate", std::move(meta_params), session);
        auto info = json::parse(meta["result"].value("value", "{}"), nullptr, false);
        if (!info.is_discarded()) {
            result.final_url   = info.value("u", url);
            result.status_code = info.value("s", 0L);
        }
    } catch (const CDPTimeout& e) {
        timed_out = true;
        error     = e.what();
    } catch (const CDPError& e) {
        error = e.what();
    }

    conn_->deadline.cancel();
    active_ = nullptr;
    if (timed_out) {
        // The socket is gone along with the context.
        conn_.reset();
        throw CDPTimeout(error);
    }

    arm_deadline(std::chrono::seconds(5));
    bool disposed = true;
    try {
        json dispose_params = {{"browserContextId", context_id}};
        co_await call("Target.disposeBrowserContext", std::move(dispose_params));
    } catch (const std::exception& e) {
        Logger::warn("CDP: could not dispose browser context: " + std::string(e.what()));
        disposed = false;
    }
    if (disposed)
        conn_->deadline.cancel();
    else
        conn_.reset();

    if (!error.empty())
        throw CDPError(error);
    if (result.final_url.empty())
        result.final_url = url;
    co_return result;
}

}  // namespace CDP
}  // namespace Browser
}  // namespace Harvester
