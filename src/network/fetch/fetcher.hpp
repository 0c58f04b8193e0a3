#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <memory>
#include <string>
#include "../../core/types/errors.hpp"
#include "../../engine/task/fetch_task.hpp"
#include "../../proxy/pool/proxy_pool.hpp"
#include "../http/http_client.hpp"
#include "block_detector.hpp"

namespace Harvester {
namespace Network {
namespace Fetch {

struct FetchResult {
    bool            ok    = false;
    Core::ErrorKind error = Core::ErrorKind::None;
    long            status_code = 0;
    std::string     body;
    std::string     effective_url;
    std::string     message;
    std::string     proxy;  // "direct" when no proxy was used
    bool            proxy_quarantined = false;
};

/**
 * @brief Performs one fetch for a task through a proxy lease.
 *
 * fetch() classifies whatever perform() returns (transport error, challenge
 * page, HTTP error or content) and reports exactly one outcome to the bound
 * ProxyPool when a proxy was used. Subclasses only implement the transport.
 */
class Fetcher {
public:
    explicit Fetcher(std::shared_ptr<const BlockDetector> detector = nullptr);
    virtual ~Fetcher() = default;

    void bind_pool(Proxy::Pool::ProxyPool* pool) {
        pool_ = pool;
    }

    boost::asio::awaitable<FetchResult> fetch(const Engine::FetchTask&       task,
                                              const Proxy::Pool::ProxyLease& lease);

    static bool is_proxy_failure(long status_code);

protected:
    virtual boost::asio::awaitable<Http::Response>
    perform(const Engine::FetchTask& task, const Proxy::Pool::ProxyLease& lease) = 0;

private:
    std::shared_ptr<const BlockDetector> detector_;
    Proxy::Pool::ProxyPool*              pool_ = nullptr;

    FetchResult classify(Http::Response response, const Engine::FetchTask& task) const;
};

}  // namespace Fetch
}  // namespace Network
}  // namespace Harvester
