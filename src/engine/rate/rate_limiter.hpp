#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <map>
#include <mutex>
#include <random>

namespace Harvester {
namespace Engine {

/**
 * @brief Randomized inter-request delay, tracked per worker.
 *
 * Every wait() draws a fresh delay uniformly from [min_delay, max_delay] and
 * suspends the worker until that much time has passed since its previous
 * dispatch. Workers do not wait on each other.
 */
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    RateLimiter(double min_delay_seconds, double max_delay_seconds);
    RateLimiter(double min_delay_seconds, double max_delay_seconds, unsigned int seed);

    /**
     * @brief Suspends until the worker may dispatch again.
     * @return The dispatch time recorded for the worker.
     */
    boost::asio::awaitable<Clock::time_point> wait(int worker_id);

    std::chrono::microseconds next_delay();

    std::chrono::microseconds min_delay() const {
        return min_delay_;
    }
    std::chrono::microseconds max_delay() const {
        return max_delay_;
    }

    void reset();

private:
    std::chrono::microseconds min_delay_;
    std::chrono::microseconds max_delay_;

    std::mutex                     mutex_;
    std::mt19937                   rng_;
    std::map<int, Clock::time_point> last_dispatch_;
};

}  // namespace Engine
}  // namespace Harvester
