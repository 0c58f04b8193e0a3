#pragma once
#include <string>
#include "../core/types/constants.hpp"
#include "../network/http/http_client.hpp"

namespace Harvester {
namespace Browser {

using Network::Http::HttpClient;
using Network::Http::Response;

// Renders pages in a running Chromium reached over the DevTools port.
class BrowserClient : public HttpClient {
public:
    explicit BrowserClient(std::string cdp_host = "127.0.0.1",
                           int         cdp_port = Core::Constants::DEFAULT_CDP_PORT);
    ~BrowserClient() override = default;

    void set_proxy(const std::string& proxy) override;
    void set_request_timeout(std::chrono::milliseconds timeout) override;
    void set_user_agent(const std::string& user_agent) override;
    void set_accept_language(const std::string& language) override;

    boost::asio::awaitable<Response> get(const std::string& url) override;

private:
    std::string               cdp_host_;
    int                       cdp_port_;
    std::string               proxy_;
    std::chrono::milliseconds request_timeout_{Core::Constants::DEFAULT_REQUEST_TIMEOUT_MS};
    std::string               user_agent_;
    std::string               accept_language_;
};

}  // namespace Browser
}  // namespace Harvester
