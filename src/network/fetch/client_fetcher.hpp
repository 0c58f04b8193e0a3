#pragma once
#include <functional>
#include <memory>
#include "../../engine/config/run_config.hpp"
#include "fetcher.hpp"
#include "request_builder.hpp"

namespace Harvester {
namespace Network {
namespace Fetch {

using ClientFactory = std::function<std::unique_ptr<Http::HttpClient>(Engine::Purpose)>;

/**
 * @brief Fetcher over HttpClient instances, one fresh client per fetch.
 *
 * The default factory gives suggestion tasks a BeastClient and search pages
 * either a BrowserClient (render_serp) or a BeastClient.
 */
class ClientFetcher : public Fetcher {
public:
    explicit ClientFetcher(const Engine::RunConfig&             config,
                           ClientFactory                        factory  = nullptr,
                           std::shared_ptr<const BlockDetector> detector = nullptr);

    static ClientFactory default_factory(const Engine::RunConfig& config);

    const RequestBuilder& requests() const {
        return builder_;
    }

    // "en" + "us" -> "en-US,en;q=0.9"
    static std::string accept_language(const std::string& language, const std::string& country);

protected:
    boost::asio::awaitable<Http::Response> perform(const Engine::FetchTask&       task,
                                                   const Proxy::Pool::ProxyLease& lease) override;

private:
    RequestBuilder            builder_;
    ClientFactory             factory_;
    std::chrono::milliseconds connect_timeout_;
    std::chrono::milliseconds request_timeout_;
    std::string               user_agent_;
    std::string               accept_language_;
};

}  // namespace Fetch
}  // namespace Network
}  // namespace Harvester
