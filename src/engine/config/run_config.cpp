#include "run_config.hpp"

#include <algorithm>
#include <limits>

#include "../../core/types/errors.hpp"
#include "../../utils/text/string_utils.hpp"
#include "../../utils/url/url.hpp"

namespace Harvester {
namespace Engine {

using Core::ConfigError;

const char* to_string(BrowserType type) {
    switch (type) {
        case BrowserType::Chromium: return "chromium";
        case BrowserType::Firefox: return "firefox";
        case BrowserType::Webkit: return "webkit";
    }
    return "unknown";
}

const char* to_string(Modifier modifier) {
    switch (modifier) {
        case Modifier::Alphabet: return "alphabet";
        case Modifier::Questions: return "questions";
        case Modifier::Prepositions: return "prepositions";
    }
    return "unknown";
}

BrowserType parse_browser_type(const std::string& name) {
    std::string lower = Utils::Text::to_lower(Utils::Text::trim(name));
    if (lower == "chromium" || lower == "chrome")
        return BrowserType::Chromium;
    if (lower == "firefox")
        return BrowserType::Firefox;
    if (lower == "webkit")
        return BrowserType::Webkit;
    throw ConfigError("unknown browser type: '" + name + "'");
}

Modifier parse_modifier(const std::string& name) {
    std::string lower = Utils::Text::to_lower(Utils::Text::trim(name));
    if (lower == "alphabet")
        return Modifier::Alphabet;
    if (lower == "questions")
        return Modifier::Questions;
    if (lower == "prepositions")
        return Modifier::Prepositions;
    throw ConfigError("unknown modifier: '" + name + "'");
}

namespace {

void require(bool condition, const std::string& message) {
    if (!condition)
        throw ConfigError(message);
}

void validate_proxy_url(const std::string& proxy) {
    auto parsed = Utils::Url::parse(proxy);
    bool known  = parsed.scheme == "http" || parsed.scheme == "https" || parsed.scheme == "socks4"
               || parsed.scheme == "socks4a" || parsed.scheme == "socks5"
               || parsed.scheme == "socks5h";
    require(known, "proxy_urls: unsupported scheme in '" + proxy + "'");
    require(!parsed.host.empty(), "proxy_urls: missing host in '" + proxy + "'");
}

}  // namespace

void RunConfig::validate() const {
    require(max_concurrency >= 1, "max_concurrency must be at least 1");
    require(io_threads >= 1, "io_threads must be at least 1");
    require(max_depth >= 0, "max_depth must not be negative");
    require(pages_per_keyword >= 1, "pages_per_keyword must be at least 1");
    require(min_delay >= 0 && max_delay >= 0, "delays must not be negative");
    require(min_delay <= max_delay, "min_delay must not exceed max_delay");
    require(request_timeout_ms > 0, "request_timeout_ms must be positive");
    require(connect_timeout_ms > 0, "connect_timeout_ms must be positive");
    require(max_retries >= 0 && max_retries <= Core::Constants::MAX_RETRIES_LIMIT,
            "max_retries must be between 0 and " + std::to_string(Core::Constants::MAX_RETRIES_LIMIT));
    require(backoff_base_ms >= 0, "backoff_base_ms must not be negative");
    require(quarantine_threshold >= 1, "quarantine_threshold must be at least 1");
    require(quarantine_cooldown_ms >= 0, "quarantine_cooldown_ms must not be negative");
    require(results_per_page >= 10 && results_per_page <= 100,
            "results_per_page must be between 10 and 100");
    require(max_results >= 0, "max_results must not be negative");
    require(max_keywords >= 0, "max_keywords must not be negative");
    require(max_keywords_per_seed >= 1, "max_keywords_per_seed must be at least 1");
    require(!language.empty(), "language must not be empty");
    require(!country.empty(), "country must not be empty");
    require(Utils::Url::is_http(suggest_endpoint), "suggest_endpoint must be an http(s) URL");
    require(search_endpoint.empty() || Utils::Url::is_http(search_endpoint),
            "search_endpoint must be an http(s) URL");
    require(!render_serp || browser_type == BrowserType::Chromium,
            std::string("browser_type '") + to_string(browser_type)
                + "' cannot render pages, only chromium is supported");
    require(!render_serp || (cdp_port > 0 && cdp_port < 65536), "cdp_port out of range");

    for (const auto& proxy : proxy_urls)
        validate_proxy_url(proxy);
}

bool RunConfig::has_modifier(Modifier modifier) const {
    return std::find(modifiers.begin(), modifiers.end(), modifier) != modifiers.end();
}

int RunConfig::keyword_cap(size_t seed_count) const {
    if (max_keywords > 0)
        return max_keywords;
    long long cap = static_cast<long long>(max_keywords_per_seed) * static_cast<long long>(seed_count);
    return static_cast<int>(std::min<long long>(cap, std::numeric_limits<int>::max()));
}

}  // namespace Engine
}  // namespace Harvester
