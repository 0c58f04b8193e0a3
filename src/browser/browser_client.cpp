#include "browser_client.hpp"
#include "../core/logger/logger.hpp"
#include "../utils/url/url.hpp"
#include "cdp/cdp_client.hpp"

namespace Harvester {
namespace Browser {

using Core::Logger;
using Network::Http::ErrorType;

BrowserClient::BrowserClient(std::string cdp_host, int cdp_port)
    : cdp_host_(std::move(cdp_host)), cdp_port_(cdp_port) {
}

void BrowserClient::set_proxy(const std::string& proxy) {
    proxy_ = proxy;
}

void BrowserClient::set_request_timeout(std::chrono::milliseconds timeout) {
    request_timeout_ = timeout;
}

void BrowserClient::set_user_agent(const std::string& user_agent) {
    user_agent_ = user_agent;
}

void BrowserClient::set_accept_language(const std::string& language) {
    accept_language_ = language;
}

boost::asio::awaitable<Response> BrowserClient::get(const std::string& url) {
    Response res;
    res.effective_url = url;

    if (!Utils::Url::is_http(url)) {
        res.error      = "Invalid URL scheme";
        res.error_type = ErrorType::Network;
        co_return res;
    }

    CDP::RenderOptions options;
    options.timeout         = request_timeout_;
    options.user_agent      = user_agent_;
    options.accept_language = accept_language_;
    if (!proxy_.empty()) {
        // Chromium takes credentials separately from --proxy-server.
        auto parsed            = Utils::Url::parse(proxy_);
        options.proxy_server   = parsed.scheme + "://" + parsed.host
                             + (parsed.port.empty() ? "" : ":" + parsed.port);
        options.proxy_username = parsed.username;
        options.proxy_password = parsed.password;
    }

    try {
        CDP::CDPClient client(cdp_host_, cdp_port_);
        Logger::debug("Browser: navigating to " + url);
        auto rendered = co_await client.render(url, options);
        co_await client.close();

        res.effective_url = rendered.final_url;
        res.body          = std::move(rendered.html);
        res.content_type  = "text/html";
        // Some Chromium builds do not report responseStatus.
        res.status_code = rendered.status_code > 0 ? rendered.status_code : 200;
        res.success     = res.status_code >= 200 && res.status_code < 400;
        if (res.body.empty()) {
            res.success    = false;
            res.error      = "Browser returned empty content";
            res.error_type = ErrorType::Render;
        }
    } catch (const CDP::CDPTimeout& e) {
        res.error      = e.what();
        res.error_type = ErrorType::Timeout;
    } catch (const CDP::CDPError& e) {
        // Chromium reports proxy trouble as net::ERR_PROXY_* / ERR_TUNNEL_*.
        std::string what = e.what();
        res.error        = what;
        if (what.find("ERR_PROXY") != std::string::npos || what.find("ERR_TUNNEL") != std::string::npos)
            res.error_type = ErrorType::Proxy;
        else if (what.find("TIMED_OUT") != std::string::npos)
            res.error_type = ErrorType::Timeout;
        else
            res.error_type = ErrorType::Network;
    } catch (const std::exception& e) {
        res.error      = std::string("Browser engine error: ") + e.what();
        res.error_type = ErrorType::Browser;
    }

    if (res.error_type != ErrorType::None)
        Logger::debug("Browser error [" + url + "]: " + res.error);
    co_return res;
}

}  // namespace Browser
}  // namespace Harvester
