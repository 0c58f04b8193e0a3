#pragma once
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "../../browser/launcher/browser_launcher.hpp"
#include "../aggregator/records.hpp"
#include "../config/run_config.hpp"
#include "../events/diagnostics.hpp"
#include "../scheduler/scheduler.hpp"

namespace Harvester {
namespace Engine {

/**
 * @brief Wires a full engine from one RunConfig.
 *
 * Each scrape() or harvest_keywords() call gets a fresh scheduler, proxy
 * pool and result set, and returns a self-contained report.
 */
class Runner {
public:
    using FetcherFactory = std::function<std::unique_ptr<Fetcher>(const RunConfig&)>;

    /**
     * @throws Core::ConfigError when the configuration is invalid.
     */
    explicit Runner(RunConfig config, FetcherFactory fetchers = nullptr);
    ~Runner();

    Runner(const Runner&)            = delete;
    Runner& operator=(const Runner&) = delete;

    // pages_per_keyword pages for each keyword.
    HarvestReport scrape(const std::vector<std::string>& keywords);
    HarvestReport harvest_keywords(const std::vector<std::string>& seeds);

    Diagnostics& diagnostics() {
        return diagnostics_;
    }
    const RunConfig& config() const {
        return config_;
    }

private:
    RunConfig      config_;
    FetcherFactory fetchers_;
    Diagnostics    diagnostics_;

    std::unique_ptr<Browser::Launcher::BrowserLauncher> launcher_;

    void                       ensure_browser();
    std::unique_ptr<Scheduler> make_scheduler(ResultAggregator& results);
    HarvestReport              build_report(const ResultAggregator& results, size_t seed_count) const;
};

}  // namespace Engine
}  // namespace Harvester
