#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "../../core/types/constants.hpp"

namespace Harvester {
namespace Proxy {
namespace Pool {

using Clock = std::chrono::steady_clock;

enum class ProxyOutcome { Success, Failure, Blocked };

struct ProxyRecord {
    std::string       url;
    int               successes            = 0;
    int               consecutive_failures = 0;
    Clock::time_point last_used{};  // epoch means never used
    Clock::time_point quarantined_until{};
    bool              quarantined = false;
    size_t            id          = 0;  // Stable ordering tie-breaker

    int health_score() const {
        return successes - 2 * consecutive_failures;
    }
};

// A proxy handed to one fetch attempt; no url means a direct connection.
struct ProxyLease {
    std::optional<std::string> url;

    bool direct() const {
        return !url.has_value();
    }
    std::string describe() const {
        return url ? *url : "direct";
    }
};

struct PoolOptions {
    bool                      rotate                = true;
    int                       quarantine_threshold  = Core::Constants::DEFAULT_QUARANTINE_THRESHOLD;
    std::chrono::milliseconds quarantine_cooldown   = std::chrono::milliseconds(Core::Constants::DEFAULT_QUARANTINE_COOLDOWN_MS);
    bool                      allow_direct_fallback = false;
};

class ProxyPool {
public:
    struct Selection {
        std::optional<ProxyLease> lease;
        Clock::time_point         retry_at{};  // set when every proxy is quarantined
    };

    ProxyPool(const std::vector<std::string>& proxies, PoolOptions options);

    static constexpr std::chrono::milliseconds ACQUIRE_POLL_INTERVAL{250};

    /**
     * @param avoid Proxy of the previous attempt. It is only handed out again
     *        when no other proxy is in rotation.
     */
    Selection try_acquire(const std::optional<std::string>& avoid = std::nullopt);

    /**
     * @brief Waits until a lease is available.
     * @param cancelled Polled while every proxy is quarantined; returning true
     *        gives up and yields nullopt.
     */
    boost::asio::awaitable<std::optional<ProxyLease>> acquire(std::function<bool()>      cancelled = nullptr,
                                                              std::optional<std::string> avoid     = std::nullopt);

    /**
     * @brief Records the outcome of one fetch made through a proxy.
     * @return true when this report put the proxy into quarantine.
     */
    bool report(const std::string& url, ProxyOutcome outcome);

    std::vector<ProxyRecord>   snapshot() const;
    std::optional<ProxyRecord> find(const std::string& url) const;
    bool                       is_quarantined(const std::string& url) const;
    size_t                     available() const;
    size_t                     size() const;
    bool                       empty() const;
    bool                       rotation_enabled() const {
        return options_.rotate;
    }

private:
    void release_expired(Clock::time_point now);
    void quarantine(ProxyRecord& record, Clock::time_point now, const std::string& reason);

    std::vector<ProxyRecord> proxies_;
    PoolOptions              options_;
    mutable std::mutex       mutex_;
};

}  // namespace Pool
}  // namespace Proxy
}  // namespace Harvester
