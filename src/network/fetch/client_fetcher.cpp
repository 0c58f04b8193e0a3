#include "client_fetcher.hpp"
#include <algorithm>
#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <cctype>
#include <exception>
#include <optional>
#include "../../browser/browser_client.hpp"
#include "../../core/logger/logger.hpp"
#include "../../core/types/constants.hpp"
#include "../http/beast_client.hpp"

namespace Harvester {
namespace Network {
namespace Fetch {

using Core::Logger;
namespace net = boost::asio;

namespace {

struct PendingGet {
    PendingGet(const net::any_io_executor& executor, std::string target)
        : wakeup(executor), url(std::move(target)) {
    }

    net::steady_timer             wakeup;
    std::string                   url;
    std::optional<Http::Response> response;
};

/**
 * Runs client->get() next to a deadline and returns whichever finishes first.
 * Must run on a strand so the completion handler and cancel() never race.
 * A request that misses the deadline is cancelled and left to unwind on its own.
 */
net::awaitable<Http::Response> get_with_deadline(std::shared_ptr<Http::HttpClient> client,
                                                 std::string                       url,
                                                 std::chrono::milliseconds         limit) {
    auto pending = std::make_shared<PendingGet>(co_await net::this_coro::executor, std::move(url));
    pending->wakeup.expires_after(limit);

    net::co_spawn(pending->wakeup.get_executor(),
                  client->get(pending->url),
                  [pending, client](std::exception_ptr e, Http::Response response) {
                      if (e) {
                          try {
                              std::rethrow_exception(e);
                          } catch (const std::exception& ex) {
                              response.error      = ex.what();
                              response.error_type = Http::ErrorType::Network;
                          }
                      }
                      pending->response = std::move(response);
                      pending->wakeup.cancel();
                  });

    if (!pending->response) {
        boost::system::error_code ec;
        co_await pending->wakeup.async_wait(net::redirect_error(net::use_awaitable, ec));
    }
    if (pending->response)
        co_return std::move(*pending->response);

    client->cancel();
    Http::Response timeout;
    timeout.effective_url = pending->url;
    timeout.error         = "no response within " + std::to_string(limit.count()) + "ms";
    timeout.error_type    = Http::ErrorType::Timeout;
    co_return timeout;
}

}  // namespace

ClientFetcher::ClientFetcher(const Engine::RunConfig&             config,
                             ClientFactory                        factory,
                             std::shared_ptr<const BlockDetector> detector)
    : Fetcher(std::move(detector)),
      builder_(config),
      factory_(factory ? std::move(factory) : default_factory(config)),
      connect_timeout_(config.connect_timeout_ms),
      request_timeout_(config.request_timeout_ms),
      user_agent_(config.user_agent),
      accept_language_(accept_language(config.language, config.country)) {
}

ClientFactory ClientFetcher::default_factory(const Engine::RunConfig& config) {
    bool render = config.render_serp;
    int  port   = config.cdp_port;
    return [render, port](Engine::Purpose purpose) -> std::unique_ptr<Http::HttpClient> {
        if (render && purpose == Engine::Purpose::Scrape)
            return std::make_unique<Browser::BrowserClient>("127.0.0.1", port);
        return std::make_unique<Http::BeastClient>();
    };
}

std::string ClientFetcher::accept_language(const std::string& language, const std::string& country) {
    std::string region = country;
    std::transform(region.begin(), region.end(), region.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (region.empty())
        return language;
    return language + "-" + region + "," + language + ";q=0.9";
}

boost::asio::awaitable<Http::Response> ClientFetcher::perform(const Engine::FetchTask&       task,
                                                              const Proxy::Pool::ProxyLease& lease) {
    std::shared_ptr<Http::HttpClient> client = factory_(task.purpose);
    client->set_proxy(lease.url.value_or(""));
    client->set_connect_timeout(connect_timeout_);
    client->set_request_timeout(request_timeout_);
    client->set_accept_language(accept_language_);

    if (!user_agent_.empty()) {
        client->set_user_agent(user_agent_);
    }
    else {
        const auto& agents = Core::get_user_agents();
        client->set_user_agent(agents[task.sequence % agents.size()]);
    }

    std::string url = builder_.url_for(task);
    Logger::debug("GET " + url + " [" + lease.describe() + "]");

    // request_timeout bounds the whole fetch: resolve, proxy handshake, redirects.
    auto strand = net::make_strand(co_await net::this_coro::executor);
    co_return co_await net::co_spawn(
        strand, get_with_deadline(std::move(client), std::move(url), request_timeout_), net::use_awaitable);
}

}  // namespace Fetch
}  // namespace Network
}  // namespace Harvester
