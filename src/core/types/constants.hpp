#pragma once
#include <algorithm>
#include <chrono>
#include <string>
#include <vector>

namespace Harvester {
namespace Core {

struct Constants {
    static constexpr const char* VERSION = "1.0.0";

    static constexpr int    DEFAULT_MAX_CONCURRENCY   = 1;
    static constexpr int    DEFAULT_IO_THREADS        = 2;
    static constexpr int    DEFAULT_MAX_DEPTH         = 2;
    static constexpr int    DEFAULT_PAGES_PER_KEYWORD = 1;
    static constexpr int    DEFAULT_RESULTS_PER_PAGE  = 10;
    static constexpr int    DEFAULT_MAX_RESULTS       = 100;
    static constexpr int    DEFAULT_MAX_PER_SEED      = 100;
    static constexpr double DEFAULT_MIN_DELAY         = 2.0;
    static constexpr double DEFAULT_MAX_DELAY         = 5.0;

    static constexpr int DEFAULT_REQUEST_TIMEOUT_MS = 60000;
    static constexpr int DEFAULT_CONNECT_TIMEOUT_MS = 5000;
    static constexpr int DEFAULT_MAX_RETRIES        = 3;
    static constexpr int DEFAULT_BACKOFF_BASE_MS    = 1000;
    static constexpr int MAX_RETRIES_LIMIT          = 20;
    static constexpr int MAX_BACKOFF_MS             = 600000;

    static constexpr int DEFAULT_QUARANTINE_THRESHOLD   = 3;
    static constexpr int DEFAULT_QUARANTINE_COOLDOWN_MS = 300000;

    static constexpr int DEFAULT_CDP_PORT = 9222;

    static constexpr const char* DEFAULT_LANGUAGE         = "en";
    static constexpr const char* DEFAULT_COUNTRY          = "us";
    static constexpr const char* DEFAULT_GOOGLE_DOMAIN    = "google.com";
    static constexpr const char* DEFAULT_SUGGEST_ENDPOINT = "https://suggestqueries.google.com/complete/search";
    static constexpr const char* DEFAULT_OUTPUT_DIR       = "data/results";

    static constexpr const char* USER_AGENT =
        "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) "
        "Chrome/120.0.0.0 Safari/537.36";
};

inline const std::vector<std::string>& get_user_agents() {
    static const std::vector<std::string> agents = {
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) "
        "Chrome/120.0.0.0 Safari/537.36",
        "Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) AppleWebKit/537.36 (KHTML, like Gecko) "
        "Chrome/120.0.0.0 Safari/537.36",
        Constants::USER_AGENT};
    return agents;
}

inline std::chrono::milliseconds get_backoff_time(int attempt, int base_ms = Constants::DEFAULT_BACKOFF_BASE_MS) {
    if (attempt <= 0 || base_ms <= 0)
        return std::chrono::milliseconds(0);
    // Past 2^20 any positive base is over the cap already.
    int       exponent = std::min(attempt - 1, 20);
    long long delay    = static_cast<long long>(base_ms) * (1LL << exponent);
    return std::chrono::milliseconds(std::min<long long>(delay, Constants::MAX_BACKOFF_MS));
}

}  // namespace Core
}  // namespace Harvester
