#include "proxy_pool.hpp"
#include <algorithm>
#include <utility>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include "../../core/logger/logger.hpp"

namespace Harvester {
namespace Proxy {
namespace Pool {

using namespace Harvester::Core;
namespace net = boost::asio;

ProxyPool::ProxyPool(const std::vector<std::string>& proxies, PoolOptions options)
    : options_(options) {
    size_t id_counter = 0;
    for (const auto& url : proxies) {
        bool duplicate = std::any_of(
            proxies_.begin(), proxies_.end(), [&](const ProxyRecord& p) { return p.url == url; });
        if (url.empty() || duplicate)
            continue;
        ProxyRecord p;
        p.url = url;
        p.id  = id_counter++;
        proxies_.push_back(p);
    }
    if (options_.quarantine_threshold < 1)
        options_.quarantine_threshold = 1;
}

void ProxyPool::release_expired(Clock::time_point now) {
    for (auto& p : proxies_) {
        if (p.quarantined && p.quarantined_until <= now) {
            p.quarantined          = false;
            p.successes            = 0;
            p.consecutive_failures = 0;
            Logger::info("Proxy back in rotation: " + p.url);
        }
    }
}

ProxyPool::Selection ProxyPool::try_acquire(const std::optional<std::string>& avoid) {
    std::lock_guard<std::mutex> lock(mutex_);
    Selection                   selection;

    if (proxies_.empty() || !options_.rotate) {
        selection.lease = ProxyLease{};
        return selection;
    }

    auto now = Clock::now();
    release_expired(now);

    ProxyRecord* best    = nullptr;
    ProxyRecord* avoided = nullptr;
    for (auto& p : proxies_) {
        if (p.quarantined)
            continue;
        if (avoid && p.url == *avoid) {
            avoided = &p;
            continue;
        }
        if (!best) {
            best = &p;
            continue;
        }
        if (p.health_score() != best->health_score()) {
            if (p.health_score() > best->health_score())
                best = &p;
            continue;
        }
        if (p.last_used != best->last_used) {
            if (p.last_used < best->last_used)
                best = &p;
            continue;
        }
        if (p.id < best->id)
            best = &p;
    }
    if (!best)
        best = avoided;

    if (best) {
        best->last_used = now;
        selection.lease = ProxyLease{best->url};
        return selection;
    }

    if (options_.allow_direct_fallback) {
        Logger::warn("All proxies quarantined, falling back to direct connection");
        selection.lease = ProxyLease{};
        return selection;
    }

    selection.retry_at = Clock::time_point::max();
    for (const auto& p : proxies_)
        selection.retry_at = std::min(selection.retry_at, p.quarantined_until);
    return selection;
}

net::awaitable<std::optional<ProxyLease>> ProxyPool::acquire(std::function<bool()>      cancelled,
                                                             std::optional<std::string> avoid) {
    bool logged = false;
    while (true) {
        Selection selection = try_acquire(avoid);
        if (selection.lease)
            co_return selection.lease;
        if (cancelled && cancelled())
            co_return std::nullopt;

        if (!logged) {
            Logger::warn("All proxies quarantined, waiting for the earliest cooldown to expire");
            logged = true;
        }
        net::steady_timer timer(co_await net::this_coro::executor);
        timer.expires_at(std::min(selection.retry_at, Clock::now() + ACQUIRE_POLL_INTERVAL));
        co_await timer.async_wait(net::use_awaitable);
    }
}

void ProxyPool::quarantine(ProxyRecord& record, Clock::time_point now, const std::string& reason) {
    record.quarantined       = true;
    record.quarantined_until = now + options_.quarantine_cooldown;
    Logger::warn("Proxy quarantined (" + reason + "): " + record.url);
}

bool ProxyPool::report(const std::string& url, ProxyOutcome outcome) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = std::find_if(
        proxies_.begin(), proxies_.end(), [&](const ProxyRecord& p) { return p.url == url; });
    if (it == proxies_.end())
        return false;

    if (outcome == ProxyOutcome::Success) {
        it->successes++;
        it->consecutive_failures = 0;
        return false;
    }

    it->consecutive_failures++;
    if (it->quarantined)
        return false;

    auto now = Clock::now();
    if (outcome == ProxyOutcome::Blocked) {
        quarantine(*it, now, "challenge page");
        return true;
    }

    if (it->consecutive_failures >= options_.quarantine_threshold) {
        quarantine(*it,
                   now,
                   std::to_string(it->consecutive_failures) + " consecutive failures");
        return true;
    }

    Logger::warn("Proxy failed (" + std::to_string(it->consecutive_failures) + "/"
                 + std::to_string(options_.quarantine_threshold) + "): " + it->url);
    return false;
}

std::vector<ProxyRecord> ProxyPool::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return proxies_;
}

std::optional<ProxyRecord> ProxyPool::find(const std::string& url) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& p : proxies_) {
        if (p.url == url)
            return p;
    }
    return std::nullopt;
}

bool ProxyPool::is_quarantined(const std::string& url) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        now = Clock::now();
    for (const auto& p : proxies_) {
        if (p.url == url)
            return p.quarantined && p.quarantined_until > now;
    }
    return false;
}

size_t ProxyPool::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        now = Clock::now();
    return std::count_if(proxies_.begin(), proxies_.end(), [&](const ProxyRecord& p) {
        return !p.quarantined || p.quarantined_until <= now;
    });
}

size_t ProxyPool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return proxies_.size();
}

bool ProxyPool::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return proxies_.empty();
}

}  // namespace Pool
}  // namespace Proxy
}  // namespace Harvester
