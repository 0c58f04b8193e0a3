#include <curl/curl.h>
#include <iostream>
#include "browser/launcher/browser_launcher.hpp"
#include "core/config/config.hpp"
#include "core/logger/logger.hpp"
#include "core/types/errors.hpp"
#include "engine/runner/runner.hpp"
#include "export/exporter.hpp"
#include "network/fetch/request_builder.hpp"
#include "network/http/curl_client.hpp"
#include "storage/disk_storage.hpp"

namespace {

using namespace Harvester;
using Harvester::Core::Logger;

void print_summary(const Engine::HarvestReport& report) {
    Logger::info("Result pages: " + std::to_string(report.serps.size()));
    size_t organic = 0;
    for (const auto& serp : report.serps)
        organic += serp.organic.size();
    if (organic > 0)
        Logger::info("Organic results: " + std::to_string(organic));
    if (!report.keywords.empty())
        Logger::info("Keywords: " + std::to_string(report.keywords.size()));
    if (!report.failures.empty())
        Logger::warn("Failed tasks: " + std::to_string(report.failures.size()));
}

int run_scrape(const Core::Config& config) {
    if (config.keywords.empty()) {
        Logger::error("No keywords provided. Use -k or --keywords-file");
        return 1;
    }

    Engine::Runner runner(config.run);
    auto           format = Export::parse_serp_format(config.format);
    auto           report = runner.scrape(config.keywords);

    Storage::DiskStorage storage(config.output_dir);
    Export::Exporter     exporter(storage);
    exporter.export_serps(report, format, config.output_name);
    print_summary(report);
    return 0;
}

int run_keywords(const Core::Config& config) {
    if (config.keywords.empty()) {
        Logger::error("No seed keywords provided.");
        return 1;
    }

    Engine::Runner runner(config.run);
    auto           format = Export::parse_keyword_format(config.format);
    auto           report = runner.harvest_keywords(config.keywords);

    Storage::DiskStorage storage(config.output_dir);
    Export::Exporter     exporter(storage);
    exporter.export_keywords(report, format, config.output_name, config.include_metadata);

    const auto& stats = report.metadata.statistics;
    Logger::info("Average relevance: " + std::to_string(stats.average_relevance));
    Logger::info("Long-tail keywords: " + std::to_string(stats.long_tail_percentage) + "%");
    print_summary(report);
    return 0;
}

bool probe(const std::string& name, const std::string& url, const Core::Config& config) {
    Network::Http::CurlClient client;
    client.set_timeout(std::chrono::milliseconds(config.run.connect_timeout_ms));
    client.set_user_agent(config.run.user_agent);
    if (!config.run.proxy_urls.empty() && config.run.rotate_proxy)
        client.set_proxy(config.run.proxy_urls.front());

    auto response = client.get(url);
    if (response.success) {
        Logger::success(name + " reachable (HTTP " + std::to_string(response.status_code) + ")");
        return true;
    }
    Logger::error(name + " not reachable: " + response.error);
    return false;
}

int run_validate(const Core::Config& config) {
    Logger::info("Validating setup...");
    bool ok = true;

    try {
        config.run.validate();
        Logger::success("Configuration is valid");
    } catch (const Core::ConfigError& e) {
        Logger::error("Configuration: " + std::string(e.what()));
        ok = false;
    }

    std::string browser = config.run.browser_path.empty()
                              ? Browser::Launcher::BrowserLauncher::find_browser()
                              : config.run.browser_path;
    if (!browser.empty())
        Logger::success("Browser found: " + browser);
    else if (config.run.render_serp) {
        Logger::error("No Chromium browser found. Use --browser-path to specify one.");
        ok = false;
    }
    else
        Logger::warn("No Chromium browser found (only needed with --render)");

    Network::Fetch::RequestBuilder requests(config.run);
    ok = probe("Search endpoint", requests.search_url("test", 1), config) && ok;
    ok = probe("Suggestion endpoint", requests.suggest_url("test"), config) && ok;

    Storage::DiskStorage storage(config.output_dir);
    if (storage.writable())
        Logger::success("Output directory is writable: " + config.output_dir);
    else {
        Logger::error("Output directory is not writable: " + config.output_dir);
        ok = false;
    }

    if (ok)
        Logger::success("Validation complete!");
    return ok ? 0 : 1;
}

}  // namespace

int main(int argc, char* argv[]) {
    int status = 1;
    curl_global_init(CURL_GLOBAL_ALL);

    try {
        auto config = Core::Config::parse(argc, argv);
        Logger::set_color(config.color);
        if (config.verbose)
            Logger::set_level(Core::LOG_ALL);

        switch (config.command) {
            case Core::Command::Scrape: status = run_scrape(config); break;
            case Core::Command::Keywords: status = run_keywords(config); break;
            case Core::Command::Validate: status = run_validate(config); break;
            case Core::Command::None: break;
        }
    } catch (const Core::ConfigError& e) {
        Logger::error("Invalid configuration: " + std::string(e.what()));
        status = 2;
    } catch (const std::exception& e) {
        Logger::error(e.what());
        status = 1;
    }

    curl_global_cleanup();
    return status;
}
