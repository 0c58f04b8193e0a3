#pragma once
#include <chrono>
#include "../../core/types/constants.hpp"

namespace Harvester {
namespace Engine {

// Retry budget and backoff curve for failed fetches.
class RetryPolicy {
public:
    virtual ~RetryPolicy() = default;

    virtual int max_retries() const = 0;
    // Delay before retry number `retry` (1-based).
    virtual std::chrono::milliseconds backoff(int retry) const = 0;
};

// base * 2^(retry - 1)
class ExponentialBackoff : public RetryPolicy {
public:
    ExponentialBackoff(int max_retries, int base_ms) : max_retries_(max_retries), base_ms_(base_ms) {
    }

    int max_retries() const override {
        return max_retries_;
    }
    std::chrono::milliseconds backoff(int retry) const override {
        return Core::get_backoff_time(retry, base_ms_);
    }

private:
    int max_retries_;
    int base_ms_;
};

}  // namespace Engine
}  // namespace Harvester
