#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include "../../../core/logger/logger.hpp"
#include "../scheduler.hpp"

namespace Harvester {
namespace Engine {

using namespace Harvester::Core;

namespace {
constexpr int WORKER_POLL_INTERVAL_MS = 50;
}  // namespace

struct WorkerGuard {
    std::atomic<int>& count;
    explicit WorkerGuard(std::atomic<int>& c) : count(c) {
    }
    ~WorkerGuard() {
        count--;
    }
};

std::optional<FetchTask> Scheduler::fetch_next_task() {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (stop_ || queue_.empty())
        return std::nullopt;

    auto now = std::chrono::steady_clock::now();
    for (auto it = queue_.begin(); it != queue_.end(); ++it) {
        if (it->not_before > now)
            continue;
        FetchTask task = std::move(*it);
        queue_.erase(it);
        active_workers_++;
        return task;
    }
    return std::nullopt;
}

bool Scheduler::should_stop_worker() {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return stop_ || (active_workers_ == 0 && queue_.empty());
}

boost::asio::awaitable<void> Scheduler::worker_loop(int worker_id) {
    try {
        boost::asio::steady_timer timer(ioc_);

        while (true) {
            auto task_opt = fetch_next_task();

            if (!task_opt) {
                if (should_stop_worker())
                    break;
                timer.expires_after(std::chrono::milliseconds(WORKER_POLL_INTERVAL_MS));
                boost::system::error_code ec;
                co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
                continue;
            }

            WorkerGuard guard(active_workers_);
            FetchTask   current = *task_opt;
            try {
                co_await process_task(worker_id, std::move(*task_opt));
            } catch (const std::exception& e) {
                Logger::error("Worker " + std::to_string(worker_id) + " failed on "
                              + current.describe() + ": " + e.what());
                fail(std::move(current), ErrorKind::ExhaustedRetries, e.what());
            }
        }
    } catch (const std::exception& e) {
        Logger::error("Worker Loop Exception: " + std::string(e.what()));
    }

    if (--live_workers_ == 0)
        trigger_done();
}

boost::asio::awaitable<void> Scheduler::process_task(int worker_id, FetchTask task) {
    co_await rate_limiter_.wait(worker_id);

    std::optional<ProxyLease> lease;
    if (!stop_requested())
        lease = co_await proxy_pool_.acquire([this] { return stop_requested(); }, task.proxy);

    if (!lease) {
        // Never dispatched; leave it visible in pending().
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.push_front(std::move(task));
        co_return;
    }

    task.proxy = lease->url;
    task.state = TaskState::InFlight;
    diagnostics_.emit(EngineEvent::for_task(EventKind::TaskStarted, task));

    FetchResult result = co_await fetcher_->fetch(task, *lease);

    if (result.proxy_quarantined) {
        auto event    = EngineEvent::for_task(EventKind::ProxyQuarantined, task);
        event.message = result.message;
        diagnostics_.emit(event);
    }

    if (result.ok) {
        try {
            handle_content(task, result);
            co_return;
        } catch (const ParseError& e) {
            result.ok      = false;
            result.error   = ErrorKind::Parse;
            result.message = e.what();
        }
    }

    handle_failure(std::move(task), result);
}

void Scheduler::handle_content(FetchTask& task, FetchResult& result) {
    std::string summary;

    if (task.purpose == Purpose::Scrape) {
        auto extraction               = extractor_.extract(result.body, task.target, task.page);
        extraction.serp.fetched_url   = result.effective_url;
        extraction.serp.retrieved_at  = SystemClock::now();
        if (extraction.skipped > 0)
            Logger::debug("Skipped " + std::to_string(extraction.skipped) + " malformed result blocks for "
                          + task.describe());

        summary = std::to_string(extraction.serp.organic.size()) + " results";
        results_.add_serp(std::move(extraction.serp));

        size_t completed = ++completed_scrapes_;
        if (max_results_ > 0 && completed >= static_cast<size_t>(max_results_))
            request_stop("reached max results (" + std::to_string(max_results_) + ")");
    } else {
        auto suggestions = suggestions_.parse(result.body);
        summary          = std::to_string(suggestions.size()) + " suggestions";
        if (suggestion_handler_)
            suggestion_handler_(task, suggestions);
    }

    task.state    = TaskState::Succeeded;
    auto event    = EngineEvent::for_task(EventKind::TaskSucceeded, task);
    event.message = summary;
    diagnostics_.emit(event);
}

void Scheduler::handle_failure(FetchTask task, const FetchResult& result) {
    task.last_error = result.error;

    // A challenge page earns one immediate retry on a different proxy.
    if (result.error == ErrorKind::Blocked && !task.block_retry_used) {
        task.block_retry_used = true;
        requeue(std::move(task), std::chrono::milliseconds(0), "blocked via " + result.proxy);
        return;
    }

    if (task.retry_count >= retry_->max_retries()) {
        fail(std::move(task), ErrorKind::ExhaustedRetries, result.message);
        return;
    }

    task.retry_count++;
    auto delay = retry_->backoff(task.retry_count);
    requeue(std::move(task), delay, result.message);
}

void Scheduler::requeue(FetchTask task, std::chrono::milliseconds delay, const std::string& reason) {
    if (stop_requested()) {
        ErrorKind kind = task.last_error;
        fail(std::move(task), kind, "stopped before retry: " + reason);
        return;
    }

    task.state      = TaskState::Retrying;
    task.not_before = std::chrono::steady_clock::now() + delay;

    auto event    = EngineEvent::for_task(EventKind::TaskRetrying, task);
    event.message = reason + " (next attempt in " + std::to_string(delay.count()) + "ms)";
    diagnostics_.emit(event);

    std::lock_guard<std::mutex> lock(queue_mutex_);
    queue_.push_back(std::move(task));
}

void Scheduler::fail(FetchTask task, ErrorKind kind, const std::string& message) {
    task.state = TaskState::Failed;

    TaskFailure failure;
    failure.target      = task.target;
    failure.purpose     = task.purpose;
    failure.page        = task.page;
    failure.depth       = task.depth;
    failure.kind        = kind;
    failure.last_error  = task.last_error;
    failure.retry_count = task.retry_count;
    failure.message     = message;
    failure.failed_at   = SystemClock::now();
    results_.add_failure(failure);

    auto event       = EngineEvent::for_task(EventKind::TaskFailed, task);
    event.error_kind = kind;
    event.message    = message;
    diagnostics_.emit(event);
}

}  // namespace Engine
}  // namespace Harvester
