#include "scheduler.hpp"
#include "../../core/logger/logger.hpp"
#include "../../network/fetch/client_fetcher.hpp"

namespace Harvester {
namespace Engine {

using namespace Harvester::Core;

namespace {

Proxy::Pool::PoolOptions pool_options(const RunConfig& config) {
    Proxy::Pool::PoolOptions options;
    options.rotate                = config.rotate_proxy;
    options.quarantine_threshold  = config.quarantine_threshold;
    options.quarantine_cooldown   = std::chrono::milliseconds(config.quarantine_cooldown_ms);
    options.allow_direct_fallback = config.allow_direct_fallback;
    return options;
}

}  // namespace

Scheduler::Scheduler(const RunConfig&                   config,
                     std::unique_ptr<Fetcher>           fetcher,
                     ResultAggregator&                  results,
                     Diagnostics&                       diagnostics,
                     std::shared_ptr<const RetryPolicy> retry)
    : max_concurrency_(config.max_concurrency),
      io_thread_count_(config.io_threads),
      max_results_(config.max_results),
      proxy_pool_(config.proxy_urls, pool_options(config)),
      rate_limiter_(config.min_delay, config.max_delay),
      fetcher_(fetcher ? std::move(fetcher)
                       : std::make_unique<Network::Fetch::ClientFetcher>(config)),
      retry_(retry ? std::move(retry)
                   : std::make_shared<ExponentialBackoff>(config.max_retries, config.backoff_base_ms)),
      suggestions_(Network::Fetch::RequestBuilder(config), config.min_relevance),
      results_(results),
      diagnostics_(diagnostics) {
    fetcher_->bind_pool(&proxy_pool_);
    if (!config.rotate_proxy && !config.proxy_urls.empty())
        Logger::warn("Proxy rotation disabled, " + std::to_string(config.proxy_urls.size())
                     + " configured proxies will not be used");
}

Scheduler::~Scheduler() {
    shutdown();
}

bool Scheduler::submit(FetchTask task) {
    if (stop_requested())
        return false;
    if (!deduplicator_.try_visit(VisitedKey::of(task)))
        return false;

    std::lock_guard<std::mutex> lock(queue_mutex_);
    task.sequence   = next_sequence_++;
    task.state      = TaskState::Pending;
    task.not_before = {};
    queue_.push_back(std::move(task));
    return true;
}

void Scheduler::request_stop(const std::string& reason) {
    if (stop_.exchange(true))
        return;
    Logger::warn("Stop requested" + (reason.empty() ? std::string() : ": " + reason)
                 + ". Finishing in-flight tasks...");
}

void Scheduler::on_suggestions(SuggestionHandler handler) {
    suggestion_handler_ = std::move(handler);
}

size_t Scheduler::pending() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

void Scheduler::run() {
    if (stop_requested()) {
        Logger::debug("Scheduler: stop already requested, not running");
        return;
    }
    if (pending() == 0)
        return;

    Logger::debug("Scheduler: draining " + std::to_string(pending()) + " tasks with "
                  + std::to_string(max_concurrency_) + " workers");

    done_ = false;
    init_io_services();
    init_signals();
    spawn_workers();
    await_completion();
    shutdown();
}

}  // namespace Engine
}  // namespace Harvester
