#include "fetcher.hpp"

namespace Harvester {
namespace Network {
namespace Fetch {

using Core::ErrorKind;
using Http::ErrorType;
using Proxy::Pool::ProxyOutcome;

// No reply at all, or a status a forwarding proxy answers with itself.
bool Fetcher::is_proxy_failure(long status_code) {
    return status_code == 0 || status_code == 407 || status_code == 502 || status_code == 503
        || status_code == 504;
}

Fetcher::Fetcher(std::shared_ptr<const BlockDetector> detector)
    : detector_(detector ? std::move(detector) : std::make_shared<DefaultBlockDetector>()) {
}

FetchResult Fetcher::classify(Http::Response response, const Engine::FetchTask& task) const {
    FetchResult result;
    result.status_code   = response.status_code;
    result.effective_url = response.effective_url;

    switch (response.error_type) {
        case ErrorType::None: break;
        case ErrorType::Timeout:
            result.error   = ErrorKind::Timeout;
            result.message = response.error;
            return result;
        default:
            result.error   = ErrorKind::Network;
            result.message = std::string(Http::to_string(response.error_type)) + ": " + response.error;
            return result;
    }

    if (detector_->is_blocked(response.status_code, response.body, response.effective_url)) {
        result.error   = ErrorKind::Blocked;
        result.message = "challenge page for " + task.describe() + " (HTTP "
                       + std::to_string(response.status_code) + ")";
        return result;
    }

    if (response.status_code < 200 || response.status_code >= 400) {
        result.error   = ErrorKind::Network;
        result.message = "HTTP " + std::to_string(response.status_code);
        return result;
    }

    result.ok   = true;
    result.body = std::move(response.body);
    return result;
}

boost::asio::awaitable<FetchResult> Fetcher::fetch(const Engine::FetchTask&       task,
                                                   const Proxy::Pool::ProxyLease& lease) {
    Http::Response response = co_await perform(task, lease);
    FetchResult    result   = classify(std::move(response), task);
    result.proxy            = lease.describe();

    if (pool_ && !lease.direct()) {
        ProxyOutcome outcome = ProxyOutcome::Success;
        if (result.error == ErrorKind::Blocked)
            outcome = ProxyOutcome::Blocked;
        else if (result.error == ErrorKind::Timeout || is_proxy_failure(result.status_code))
            outcome = ProxyOutcome::Failure;
        result.proxy_quarantined = pool_->report(*lease.url, outcome);
    }
    co_return result;
}

}  // namespace Fetch
}  // namespace Network
}  // namespace Harvester
