#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <string>
#include "../../core/types/constants.hpp"
#include "../../utils/url/url.hpp"
#include "http_client.hpp"

namespace Harvester {
namespace Network {
namespace Http {

/**
 * @brief HTTP/1.1 client on Boost.Beast.
 *
 * Supports http://, https:// and socks4/socks5 proxies (credentials taken
 * from the proxy URL), follows a small number of redirects and enforces a
 * connect timeout and a request timeout.
 */
class BeastClient : public HttpClient {
public:
    static constexpr int MAX_REDIRECTS = 5;

    BeastClient();
    ~BeastClient() override = default;

    void set_proxy(const std::string& proxy) override;
    void set_connect_timeout(std::chrono::milliseconds timeout) override;
    void set_request_timeout(std::chrono::milliseconds timeout) override;
    void set_user_agent(const std::string& user_agent) override;
    void set_accept_language(const std::string& language) override;

    boost::asio::awaitable<Response> get(const std::string& url) override;
    void                             cancel() override;

private:
    struct Target {
        std::string host;
        std::string port;
        std::string path;  // origin-form request target
        bool        is_ssl = false;
        std::string url;
    };

    std::string               proxy_;
    Utils::UrlParsed          proxy_parsed_;
    std::chrono::milliseconds connect_timeout_{Core::Constants::DEFAULT_CONNECT_TIMEOUT_MS};
    std::chrono::milliseconds request_timeout_{Core::Constants::DEFAULT_REQUEST_TIMEOUT_MS};
    std::string               user_agent_ = Core::Constants::USER_AGENT;
    std::string               accept_language_;
    boost::asio::ssl::context ssl_ctx_{boost::asio::ssl::context::tlsv12_client};

    // Whatever the current request is waiting on, for cancel().
    boost::asio::ip::tcp::resolver* active_resolver_ = nullptr;
    boost::beast::tcp_stream*       active_stream_   = nullptr;
    bool                            cancelled_       = false;

    static bool make_target(const std::string& url, Target& out);
    static std::string resolve_location(const Target& current, const std::string& location);

    boost::asio::awaitable<Response> do_request(const Target& target);
    boost::asio::awaitable<Response> perform_http_request(const Target& target);
    boost::asio::awaitable<Response> perform_https_request(const Target& target);

    boost::asio::awaitable<void> connect(boost::beast::tcp_stream& stream, const Target& target);
    boost::asio::awaitable<void> open_tunnel(boost::beast::tcp_stream& stream,
                                             const Target&             target);

    boost::beast::http::request<boost::beast::http::empty_body>
    build_request(const Target& target, bool absolute_form) const;

    static Response
    to_response(const Target&                                                       target,
                boost::beast::http::response<boost::beast::http::string_body>& res);

    bool uses_proxy() const {
        return !proxy_.empty();
    }
    bool uses_http_proxy() const {
        return uses_proxy() && (proxy_parsed_.scheme == "http" || proxy_parsed_.scheme == "https");
    }
};

}  // namespace Http
}  // namespace Network
}  // namespace Harvester
