#pragma once
#include <string>
#include <vector>

#include "../../core/types/constants.hpp"

namespace Harvester {
namespace Engine {

enum class BrowserType { Chromium, Firefox, Webkit };

enum class Modifier { Alphabet, Questions, Prepositions };

const char* to_string(BrowserType type);
const char* to_string(Modifier modifier);

// Both throw Core::ConfigError on unknown names.
BrowserType parse_browser_type(const std::string& name);
Modifier    parse_modifier(const std::string& name);

/**
 * @brief Everything one engine run needs.
 *
 * Built by the CLI layer (or by hand in tests) and validated once before
 * anything is scheduled. Delays are in seconds, everything else in
 * milliseconds unless the name says otherwise.
 */
struct RunConfig {
    // Browser
    bool        headless     = true;
    BrowserType browser_type = BrowserType::Chromium;
    bool        render_serp  = false;
    std::string browser_path;
    int         cdp_port = Core::Constants::DEFAULT_CDP_PORT;

    // Timing
    int    request_timeout_ms = Core::Constants::DEFAULT_REQUEST_TIMEOUT_MS;
    int    connect_timeout_ms = Core::Constants::DEFAULT_CONNECT_TIMEOUT_MS;
    double min_delay          = Core::Constants::DEFAULT_MIN_DELAY;
    double max_delay          = Core::Constants::DEFAULT_MAX_DELAY;

    // Workers
    int max_concurrency = Core::Constants::DEFAULT_MAX_CONCURRENCY;
    int io_threads      = Core::Constants::DEFAULT_IO_THREADS;

    // Proxies
    std::vector<std::string> proxy_urls;
    bool                     rotate_proxy           = true;
    bool                     allow_direct_fallback  = false;
    int                      quarantine_threshold   = Core::Constants::DEFAULT_QUARANTINE_THRESHOLD;
    int                      quarantine_cooldown_ms = Core::Constants::DEFAULT_QUARANTINE_COOLDOWN_MS;

    // Retries
    int max_retries     = Core::Constants::DEFAULT_MAX_RETRIES;
    int backoff_base_ms = Core::Constants::DEFAULT_BACKOFF_BASE_MS;

    // Locale and endpoints
    std::string language      = Core::Constants::DEFAULT_LANGUAGE;
    std::string country       = Core::Constants::DEFAULT_COUNTRY;
    std::string google_domain = Core::Constants::DEFAULT_GOOGLE_DOMAIN;
    std::string search_endpoint;  // overrides https://www.<google_domain>/search
    std::string suggest_endpoint = Core::Constants::DEFAULT_SUGGEST_ENDPOINT;
    std::string user_agent       = Core::Constants::USER_AGENT;

    // Scraping
    int pages_per_keyword = Core::Constants::DEFAULT_PAGES_PER_KEYWORD;
    int results_per_page  = Core::Constants::DEFAULT_RESULTS_PER_PAGE;
    int max_results       = Core::Constants::DEFAULT_MAX_RESULTS;  // SERP pages per run, 0 = no cap

    // Keyword expansion
    int                   max_depth = Core::Constants::DEFAULT_MAX_DEPTH;
    std::vector<Modifier> modifiers = {Modifier::Alphabet, Modifier::Questions, Modifier::Prepositions};
    bool                  include_base_query = true;
    std::string           data_source;  // suggestion "ds" parameter, e.g. "yt"
    int                   min_relevance = 0;
    int                   max_keywords  = 0;  // 0 = max_keywords_per_seed x seeds
    int                   max_keywords_per_seed = Core::Constants::DEFAULT_MAX_PER_SEED;

    /**
     * @brief Rejects configurations the engine cannot run.
     * @throws Core::ConfigError naming the first offending field.
     */
    void validate() const;

    bool has_modifier(Modifier modifier) const;
    int  keyword_cap(size_t seed_count) const;
};

}  // namespace Engine
}  // namespace Harvester
