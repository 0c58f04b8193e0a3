#pragma once
#include <atomic>
#include <utility>
#include <boost/asio.hpp>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "../../extract/serp_extractor.hpp"
#include "../../network/fetch/fetcher.hpp"
#include "../../proxy/pool/proxy_pool.hpp"
#include "../../suggest/suggestion_client.hpp"
#include "../aggregator/result_aggregator.hpp"
#include "../config/run_config.hpp"
#include "../dedup/deduplicator.hpp"
#include "../events/diagnostics.hpp"
#include "../rate/rate_limiter.hpp"
#include "../task/fetch_task.hpp"
#include "retry_policy.hpp"

#ifndef CPPCHECK
class SchedulerTest_FetchNextTaskHonoursBackoff_Test;
#endif

namespace Harvester {
namespace Engine {

using Proxy::Pool::ProxyLease;
using Proxy::Pool::ProxyPool;
using Network::Fetch::Fetcher;
using Network::Fetch::FetchResult;

/**
 * @brief Bounded worker pool over one shared task queue.
 *
 * Both flows go through here: scrape tasks end in the aggregator as
 * SerpResults, suggest tasks end in the suggestion handler. A task moves
 * pending -> in_flight -> {succeeded | retrying(n) | failed}; terminal
 * failures are recorded as TaskFailure and never stop the run.
 *
 * run() blocks until the queue drains or a stop is requested, and may be
 * called again after more submissions.
 */
class Scheduler {
#ifndef CPPCHECK
    friend class ::SchedulerTest_FetchNextTaskHonoursBackoff_Test;
#endif

public:
    using SuggestionHandler =
        std::function<void(const FetchTask& task, const std::vector<Suggest::Suggestion>& suggestions)>;

    Scheduler(const RunConfig&                   config,
              std::unique_ptr<Fetcher>           fetcher,
              ResultAggregator&                  results,
              Diagnostics&                       diagnostics,
              std::shared_ptr<const RetryPolicy> retry = nullptr);
    ~Scheduler();

    Scheduler(const Scheduler&)            = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * @brief Queues a task unless an equal one was already accepted.
     * @return false for duplicates and after a stop was requested.
     */
    bool submit(FetchTask task);

    void run();

    // In-flight tasks finish; nothing new is dequeued or retried.
    void request_stop(const std::string& reason = "");
    bool stop_requested() const {
        return stop_.load();
    }

    // Called from worker threads; must be thread-safe.
    void on_suggestions(SuggestionHandler handler);

    size_t pending() const;
    size_t completed_scrapes() const {
        return completed_scrapes_.load();
    }

    ProxyPool& proxy_pool() {
        return proxy_pool_;
    }
    RateLimiter& rate_limiter() {
        return rate_limiter_;
    }
    Deduplicator& deduplicator() {
        return deduplicator_;
    }

#ifdef CPPCHECK
public:
#else
private:
#endif
    int max_concurrency_;
    int io_thread_count_;
    int max_results_;

    ProxyPool                          proxy_pool_;
    RateLimiter                        rate_limiter_;
    Deduplicator                       deduplicator_;
    std::unique_ptr<Fetcher>           fetcher_;
    std::shared_ptr<const RetryPolicy> retry_;
    Extract::SerpExtractor             extractor_;
    Suggest::SuggestionClient          suggestions_;
    ResultAggregator&                  results_;
    Diagnostics&                       diagnostics_;
    SuggestionHandler                  suggestion_handler_;

    std::deque<FetchTask> queue_;
    mutable std::mutex    queue_mutex_;
    uint64_t              next_sequence_ = 0;

    boost::asio::io_context ioc_;
    std::unique_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
                             work_guard_;
    std::vector<std::thread> io_threads_;
    boost::asio::signal_set  signals_{ioc_};

    std::atomic<int>        active_workers_{0};
    std::atomic<int>        live_workers_{0};
    std::atomic<bool>       stop_{false};
    std::atomic<size_t>     completed_scrapes_{0};
    std::atomic<bool>       done_{false};
    std::condition_variable done_cv_;
    std::mutex              done_mutex_;

    // lifecycle
    void init_io_services();
    void init_signals();
    void spawn_workers();
    void await_completion();
    void trigger_done();
    void shutdown();

    // worker
    std::optional<FetchTask>     fetch_next_task();
    bool                         should_stop_worker();
    boost::asio::awaitable<void> worker_loop(int worker_id);
    boost::asio::awaitable<void> process_task(int worker_id, FetchTask task);

    void handle_content(FetchTask& task, FetchResult& result);
    void handle_failure(FetchTask task, const FetchResult& result);
    void requeue(FetchTask task, std::chrono::milliseconds delay, const std::string& reason);
    void fail(FetchTask task, Core::ErrorKind kind, const std::string& message);
};

}  // namespace Engine
}  // namespace Harvester
