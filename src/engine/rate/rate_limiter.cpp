#include "rate_limiter.hpp"
#include <algorithm>
#include <utility>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace Harvester {
namespace Engine {

namespace net = boost::asio;

namespace {
std::chrono::microseconds to_micros(double seconds) {
    return std::chrono::ceil<std::chrono::microseconds>(
        std::chrono::duration<double>(std::max(0.0, seconds)));
}
}  // namespace

RateLimiter::RateLimiter(double min_delay_seconds, double max_delay_seconds)
    : RateLimiter(min_delay_seconds, max_delay_seconds, std::random_device{}()) {
}

RateLimiter::RateLimiter(double min_delay_seconds, double max_delay_seconds, unsigned int seed)
    : min_delay_(to_micros(min_delay_seconds)),
      max_delay_(std::max(to_micros(min_delay_seconds), to_micros(max_delay_seconds))),
      rng_(seed) {
}

std::chrono::microseconds RateLimiter::next_delay() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::uniform_int_distribution<long long> dist(min_delay_.count(), max_delay_.count());
    return std::chrono::microseconds(dist(rng_));
}

net::awaitable<RateLimiter::Clock::time_point> RateLimiter::wait(int worker_id) {
    auto delay = next_delay();

    Clock::time_point target = Clock::now();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto                        it = last_dispatch_.find(worker_id);
        if (it != last_dispatch_.end())
            target = it->second + delay;
    }

    if (Clock::now() < target) {
        net::steady_timer timer(co_await net::this_coro::executor);
        timer.expires_at(target);
        co_await timer.async_wait(net::use_awaitable);
    }

    auto dispatched = Clock::now();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_dispatch_[worker_id] = dispatched;
    }
    co_return dispatched;
}

void RateLimiter::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    last_dispatch_.clear();
}

}  // namespace Engine
}  // namespace Harvester
