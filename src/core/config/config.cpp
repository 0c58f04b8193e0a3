#include "config.hpp"
#include <CLI/CLI.hpp>
#include <fstream>
#include <yaml-cpp/yaml.h>
#include "../../utils/text/string_utils.hpp"
#include "../types/errors.hpp"

namespace Harvester {
namespace Core {

using Engine::parse_browser_type;
using Engine::parse_modifier;
using Harvester::Utils::Text::trim;

namespace {

template <typename T>
void read(const YAML::Node& yaml, const char* key, T& target) {
    if (yaml[key])
        target = yaml[key].as<T>();
}

std::vector<std::string> read_list(const YAML::Node& node) {
    std::vector<std::string> out;
    if (node.IsSequence()) {
        for (const auto& item : node)
            out.push_back(item.as<std::string>());
    }
    else if (node.IsScalar()) {
        out.push_back(node.as<std::string>());
    }
    return out;
}

std::vector<Engine::Modifier> to_modifiers(const std::vector<std::string>& names) {
    std::vector<Engine::Modifier> modifiers;
    for (const auto& name : names) {
        // "alphabet,questions" is accepted as one value too.
        std::string rest = name;
        size_t      pos;
        while (true) {
            pos              = rest.find(',');
            std::string item = trim(rest.substr(0, pos));
            if (!item.empty())
                modifiers.push_back(parse_modifier(item));
            if (pos == std::string::npos)
                break;
            rest = rest.substr(pos + 1);
        }
    }
    return modifiers;
}

}  // namespace

std::vector<std::string> load_list_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open())
        throw ConfigError("Cannot open file: " + path);

    std::vector<std::string> entries;
    std::string              line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#')
            continue;
        entries.push_back(line);
    }
    return entries;
}

void load_yaml(Config& config, const std::string& path) {
    auto& run = config.run;
    try {
        YAML::Node yaml = YAML::LoadFile(path);
        if (!yaml || yaml.IsNull())
            return;

        read(yaml, "headless", run.headless);
        if (yaml["browser"])
            run.browser_type = parse_browser_type(yaml["browser"].as<std::string>());
        if (yaml["browser_type"])
            run.browser_type = parse_browser_type(yaml["browser_type"].as<std::string>());
        read(yaml, "render_serp", run.render_serp);
        read(yaml, "browser_path", run.browser_path);
        read(yaml, "cdp_port", run.cdp_port);

        read(yaml, "request_timeout", run.request_timeout_ms);
        read(yaml, "request_timeout_ms", run.request_timeout_ms);
        read(yaml, "connect_timeout_ms", run.connect_timeout_ms);
        read(yaml, "min_delay", run.min_delay);
        read(yaml, "max_delay", run.max_delay);

        read(yaml, "concurrency", run.max_concurrency);
        read(yaml, "max_concurrency", run.max_concurrency);
        read(yaml, "io_threads", run.io_threads);

        if (yaml["proxies"])
            run.proxy_urls = read_list(yaml["proxies"]);
        if (yaml["proxy_urls"])
            run.proxy_urls = read_list(yaml["proxy_urls"]);
        read(yaml, "proxy_file", config.proxy_file);
        read(yaml, "rotate_proxy", run.rotate_proxy);
        read(yaml, "allow_direct_fallback", run.allow_direct_fallback);
        read(yaml, "quarantine_threshold", run.quarantine_threshold);
        read(yaml, "quarantine_cooldown_ms", run.quarantine_cooldown_ms);

        read(yaml, "max_retries", run.max_retries);
        read(yaml, "backoff_base_ms", run.backoff_base_ms);

        read(yaml, "language", run.language);
        read(yaml, "country", run.country);
        read(yaml, "google_domain", run.google_domain);
        read(yaml, "search_endpoint", run.search_endpoint);
        read(yaml, "suggest_endpoint", run.suggest_endpoint);
        read(yaml, "user_agent", run.user_agent);

        read(yaml, "pages", run.pages_per_keyword);
        read(yaml, "pages_per_keyword", run.pages_per_keyword);
        read(yaml, "results_per_page", run.results_per_page);
        read(yaml, "max_results", run.max_results);

        read(yaml, "max_depth", run.max_depth);
        if (yaml["modifiers"])
            run.modifiers = to_modifiers(read_list(yaml["modifiers"]));
        read(yaml, "include_base_query", run.include_base_query);
        read(yaml, "data_source", run.data_source);
        read(yaml, "min_relevance", run.min_relevance);
        read(yaml, "max_keywords", run.max_keywords);
        read(yaml, "max_keywords_per_seed", run.max_keywords_per_seed);

        if (yaml["keywords"])
            config.keywords = read_list(yaml["keywords"]);
        read(yaml, "keywords_file", config.keywords_file);
        read(yaml, "output", config.output_dir);
        read(yaml, "output_dir", config.output_dir);
        read(yaml, "format", config.format);
        read(yaml, "include_metadata", config.include_metadata);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Error parsing config file: " + std::string(e.what()));
    }
}

Config Config::parse(int argc, char* argv[]) {
    Config   config;
    auto&    run = config.run;
    CLI::App app{"Harvester - Google SERP and keyword harvester"};
    app.set_version_flag("--version", Constants::VERSION);
    app.require_subcommand(1);
    app.fallthrough();

    std::string              browser_name;
    std::vector<std::string> modifier_names;
    std::vector<std::string> proxies;

    app.add_option("--config", config.config_path, "Path to YAML configuration file");
    app.add_option("-d,--output-dir", config.output_dir, "Output directory");
    app.add_flag("-v,--verbose", config.verbose, "Show debug output");
    app.add_flag(
        "--no-color",
        [&](size_t count) {
            if (count > 0)
                config.color = false;
        },
        "Disable coloured output");

    auto add_network = [&](CLI::App* cmd) {
        cmd->add_option("--proxy", proxies, "Proxy URL (repeatable)");
        cmd->add_option("--proxy-file", config.proxy_file, "File containing proxy URLs (one per line)");
        cmd->add_flag(
            "--no-rotate",
            [&](size_t count) {
                if (count > 0)
                    run.rotate_proxy = false;
            },
            "Do not rotate proxies; connect directly");
        cmd->add_flag("--direct-fallback", run.allow_direct_fallback,
                      "Connect directly while every proxy is quarantined");
        cmd->add_option("--min-delay", run.min_delay, "Minimum delay between requests (seconds)");
        cmd->add_option("--max-delay", run.max_delay, "Maximum delay between requests (seconds)");
        cmd->add_option("-c,--concurrency", run.max_concurrency, "Maximum concurrent requests");
        cmd->add_option("--timeout", run.request_timeout_ms, "Request timeout (milliseconds)");
        cmd->add_option("--retries", run.max_retries, "Retries per request");
        cmd->add_option("--language", run.language, "Interface language (hl)");
        cmd->add_option("--country", run.country, "Country (gl)");
        cmd->add_option("-o,--output", config.output_name, "Output filename (without extension)");
        cmd->add_option("-k,--keywords", config.keywords, "Keywords (repeatable)");
        cmd->add_option("-f,--keywords-file", config.keywords_file, "File containing keywords (one per line)");
    };

    auto* scrape = app.add_subcommand("scrape", "Scrape Google SERP for URLs and keywords");
    add_network(scrape);
    scrape->add_option("-p,--pages", run.pages_per_keyword, "Number of result pages per keyword");
    scrape->add_option("--max-results", run.max_results, "Maximum result pages to scrape (0 = no limit)");
    scrape->add_option("--results-per-page", run.results_per_page, "Results per page (10-100)");
    scrape->add_option("--google-domain", run.google_domain, "Google domain, e.g. google.de");
    scrape->add_option("--browser", browser_name, "Browser type")
        ->check(CLI::IsMember({"chromium", "firefox", "webkit"}));
    scrape->add_option("--browser-path", run.browser_path, "Path to Chromium/Chrome executable");
    scrape->add_option("--cdp-port", run.cdp_port, "Chrome DevTools Protocol port");
    scrape->add_flag("--render", run.render_serp, "Render result pages in a headless browser");
    scrape->add_flag(
        "--no-headless",
        [&](size_t count) {
            if (count > 0)
                run.headless = false;
        },
        "Run browser in windowed mode (debug only)");
    scrape->add_option("--format", config.format, "Export format")
        ->check(CLI::IsMember({"json", "jsonl", "csv"}));

    auto* keywords = app.add_subcommand("keywords", "Expand seed keywords through the suggestion API");
    add_network(keywords);
    keywords->add_option("seeds", config.keywords, "Seed keywords");
    keywords->add_option("--depth", run.max_depth, "Maximum expansion depth");
    keywords->add_option("--modifiers", modifier_names, "alphabet, questions, prepositions");
    keywords->add_flag(
        "--no-base",
        [&](size_t count) {
            if (count > 0)
                run.include_base_query = false;
        },
        "Skip the bare keyword query");
    keywords->add_option("--data-source", run.data_source, "Suggestion data source, e.g. yt");
    keywords->add_option("--min-relevance", run.min_relevance, "Drop suggestions below this relevance");
    keywords->add_option("--max-keywords", run.max_keywords, "Stop after this many keywords");
    keywords->add_option("--format", config.format, "Export format")
        ->check(CLI::IsMember({"json", "csv", "txt"}));
    keywords->add_flag("--metadata", config.include_metadata, "Add metadata to txt exports");

    app.add_subcommand("validate", "Validate configuration and setup");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit(app.exit(e));
    }

    if (!config.config_path.empty()) {
        load_yaml(config, config.config_path);

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            exit(app.exit(e));
        }
    }

    if (app.got_subcommand("scrape"))
        config.command = Command::Scrape;
    else if (app.got_subcommand("keywords"))
        config.command = Command::Keywords;
    else if (app.got_subcommand("validate"))
        config.command = Command::Validate;

    if (!browser_name.empty())
        run.browser_type = parse_browser_type(browser_name);
    if (!modifier_names.empty())
        run.modifiers = to_modifiers(modifier_names);

    for (auto& proxy : proxies)
        run.proxy_urls.push_back(proxy);
    if (!config.proxy_file.empty()) {
        for (auto& proxy : load_list_file(config.proxy_file))
            run.proxy_urls.push_back(proxy);
    }
    if (!config.keywords_file.empty()) {
        for (auto& keyword : load_list_file(config.keywords_file))
            config.keywords.push_back(keyword);
    }

    return config;
}

}  // namespace Core
}  // namespace Harvester
