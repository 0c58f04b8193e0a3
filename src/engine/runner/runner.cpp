#include "runner.hpp"
#include <stdexcept>
#include "../../core/logger/logger.hpp"
#include "../expander/keyword_expander.hpp"

namespace Harvester {
namespace Engine {

using namespace Harvester::Core;
using Harvester::Browser::Launcher::BrowserLauncher;
using Harvester::Browser::Launcher::LaunchOptions;

Runner::Runner(RunConfig config, FetcherFactory fetchers)
    : config_(std::move(config)), fetchers_(std::move(fetchers)) {
    config_.validate();
    diagnostics_.subscribe(log_event);
}

Runner::~Runner() {
    if (launcher_)
        launcher_->stop();
}

void Runner::ensure_browser() {
    if (!config_.render_serp || fetchers_ || launcher_)
        return;

    LaunchOptions options;
    options.path       = config_.browser_path;
    options.port       = config_.cdp_port;
    options.headless   = config_.headless;
    options.user_agent = config_.user_agent;

    auto launcher = std::make_unique<BrowserLauncher>();
    if (!launcher->launch(options))
        throw std::runtime_error("Failed to launch browser for SERP rendering on port "
                                 + std::to_string(config_.cdp_port));
    Logger::info("Browser ready: " + launcher->path());
    launcher_ = std::move(launcher);
}

std::unique_ptr<Scheduler> Runner::make_scheduler(ResultAggregator& results) {
    std::unique_ptr<Fetcher> fetcher;
    if (fetchers_)
        fetcher = fetchers_(config_);
    return std::make_unique<Scheduler>(config_, std::move(fetcher), results, diagnostics_);
}

HarvestReport Runner::scrape(const std::vector<std::string>& keywords) {
    ensure_browser();

    ResultAggregator results;
    auto             scheduler = make_scheduler(results);

    size_t submitted = 0;
    for (const auto& keyword : keywords) {
        for (int page = 1; page <= config_.pages_per_keyword; ++page) {
            if (scheduler->submit(FetchTask::scrape(keyword, page)))
                ++submitted;
        }
    }

    Logger::info("Starting scrape: " + std::to_string(keywords.size()) + " keywords, "
                 + std::to_string(submitted) + " total requests");
    scheduler->run();

    auto report = build_report(results, keywords.size());
    Logger::success("Scraping complete: " + std::to_string(report.serps.size()) + " pages, "
                    + std::to_string(report.failures.size()) + " failures");
    return report;
}

HarvestReport Runner::harvest_keywords(const std::vector<std::string>& seeds) {
    ResultAggregator results;
    auto             scheduler = make_scheduler(results);

    KeywordExpander expander(*scheduler, results, config_);
    expander.expand(seeds);

    return build_report(results, seeds.size());
}

HarvestReport Runner::build_report(const ResultAggregator& results, size_t seed_count) const {
    HarvestReport report;
    report.serps    = results.serp_results();
    report.keywords = results.keyword_forest();
    report.failures = results.failures();

    auto& meta        = report.metadata;
    meta.language     = config_.language;
    meta.country      = config_.country;
    meta.generated_at = SystemClock::now();
    meta.max_depth    = config_.max_depth;
    meta.data_source  = config_.data_source;
    meta.seed_count   = seed_count;
    meta.statistics   = compute_statistics(report.keywords);
    return report;
}

}  // namespace Engine
}  // namespace Harvester
