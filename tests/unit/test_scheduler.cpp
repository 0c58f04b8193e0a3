#include <algorithm>
#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <mutex>
#include "../../src/engine/scheduler/scheduler.hpp"
#include "fake_fetcher.hpp"

using namespace Harvester;
using namespace Harvester::Engine;
using Harvester::Network::Http::ErrorType;
using Harvester::Testing::FakeFetcher;
using Harvester::Testing::FetchCall;
using Harvester::Testing::serp_page;
using Harvester::Testing::suggest_payload;

namespace {

RunConfig fast_config() {
    RunConfig config;
    config.min_delay       = 0;
    config.max_delay       = 0;
    config.backoff_base_ms = 1;
    config.max_retries     = 3;
    config.io_threads      = 1;
    config.max_results     = 0;
    return config;
}

const std::string CAPTCHA_PAGE =
    "<html><body><form id=\"captcha-form\"><div class=\"g-recaptcha\"></div></form></body></html>";

}  // namespace

TEST(RetryPolicyTest, BackoffDoublesUpToTheCap) {
    ExponentialBackoff policy(Core::Constants::MAX_RETRIES_LIMIT, 1000);
    EXPECT_EQ(policy.backoff(0).count(), 0);
    EXPECT_EQ(policy.backoff(1).count(), 1000);
    EXPECT_EQ(policy.backoff(2).count(), 2000);
    EXPECT_EQ(policy.backoff(4).count(), 8000);
    EXPECT_EQ(policy.backoff(11).count(), Core::Constants::MAX_BACKOFF_MS);
    EXPECT_EQ(policy.backoff(54).count(), Core::Constants::MAX_BACKOFF_MS);
    EXPECT_EQ(policy.backoff(65).count(), Core::Constants::MAX_BACKOFF_MS);
    EXPECT_EQ(policy.backoff(1000).count(), Core::Constants::MAX_BACKOFF_MS);
}

TEST(SchedulerTest, SubmitIsIdempotent) {
    ResultAggregator results;
    Diagnostics      diagnostics;
    Scheduler        scheduler(fast_config(),
                        std::make_unique<FakeFetcher>([](const FetchCall&) { return FakeFetcher::ok(""); }),
                        results,
                        diagnostics);

    EXPECT_TRUE(scheduler.submit(FetchTask::scrape("Cat Food")));
    EXPECT_FALSE(scheduler.submit(FetchTask::scrape("  cat   food ")));
    EXPECT_TRUE(scheduler.submit(FetchTask::scrape("cat food", 2)));
    EXPECT_TRUE(scheduler.submit(FetchTask::suggest("cat food")));
    EXPECT_FALSE(scheduler.submit(FetchTask::suggest("CAT FOOD", 1, std::string("cat"))));
    EXPECT_EQ(scheduler.pending(), 3);
}

TEST(SchedulerTest, RunOnEmptyQueueReturns) {
    ResultAggregator results;
    Diagnostics      diagnostics;
    Scheduler        scheduler(fast_config(),
                        std::make_unique<FakeFetcher>([](const FetchCall&) { return FakeFetcher::ok(""); }),
                        results,
                        diagnostics);
    scheduler.run();
    EXPECT_EQ(results.serp_count(), 0);
}

TEST(SchedulerTest, BlockedThenSuccessRotatesAndQuarantines) {
    auto config       = fast_config();
    config.proxy_urls = {"http://p1:8080", "http://p2:8080", "http://p3:8080"};

    ResultAggregator results;
    Diagnostics      diagnostics;
    std::mutex       events_mutex;
    std::vector<EventKind> kinds;
    diagnostics.subscribe([&](const EngineEvent& event) {
        std::lock_guard<std::mutex> lock(events_mutex);
        kinds.push_back(event.kind);
    });

    auto fetcher = std::make_unique<FakeFetcher>([](const FetchCall& call) {
        if (call.index <= 2)
            return FakeFetcher::ok(CAPTCHA_PAGE);
        return FakeFetcher::ok(serp_page({{"https://a.example/", "A"}, {"https://b.example/", "B"}}));
    });
    auto log = fetcher->log();

    Scheduler scheduler(config, std::move(fetcher), results, diagnostics);
    ASSERT_TRUE(scheduler.submit(FetchTask::scrape("cat")));
    scheduler.run();

    ASSERT_EQ(log->size(), 3);
    EXPECT_NE((*log)[0].proxy, (*log)[1].proxy);
    EXPECT_NE((*log)[1].proxy, (*log)[2].proxy);
    EXPECT_TRUE(scheduler.proxy_pool().is_quarantined((*log)[0].proxy));
    EXPECT_TRUE(scheduler.proxy_pool().is_quarantined((*log)[1].proxy));
    EXPECT_FALSE(scheduler.proxy_pool().is_quarantined((*log)[2].proxy));

    auto serps = results.serp_results();
    ASSERT_EQ(serps.size(), 1);
    EXPECT_EQ(serps[0].keyword, "cat");
    ASSERT_EQ(serps[0].organic.size(), 2);
    EXPECT_EQ(serps[0].organic[0].url, "https://a.example/");
    EXPECT_EQ(results.failure_count(), 0);

    auto count = [&](EventKind kind) { return std::count(kinds.begin(), kinds.end(), kind); };
    EXPECT_EQ(count(EventKind::TaskStarted), 3);
    EXPECT_EQ(count(EventKind::TaskRetrying), 2);
    EXPECT_EQ(count(EventKind::ProxyQuarantined), 2);
    EXPECT_EQ(count(EventKind::TaskSucceeded), 1);
}

TEST(SchedulerTest, TimeoutRetryMovesToAnotherProxy) {
    auto config       = fast_config();
    config.proxy_urls = {"http://p1:8080", "http://p2:8080"};

    ResultAggregator results;
    Diagnostics      diagnostics;
    auto             fetcher = std::make_unique<FakeFetcher>([](const FetchCall& call) {
        if (call.index == 1)
            return FakeFetcher::error(ErrorType::Timeout, "timed out");
        return FakeFetcher::ok(serp_page({{"https://x.example/", "X"}}));
    });
    auto log = fetcher->log();

    Scheduler scheduler(config, std::move(fetcher), results, diagnostics);
    // p1 has history, so one failure leaves it ahead of p2 on score.
    for (int i = 0; i < 3; ++i)
        scheduler.proxy_pool().report("http://p1:8080", Proxy::Pool::ProxyOutcome::Success);

    scheduler.submit(FetchTask::scrape("otter"));
    scheduler.run();

    ASSERT_EQ(log->size(), 2);
    EXPECT_EQ((*log)[0].proxy, "http://p1:8080");
    EXPECT_NE((*log)[0].proxy, (*log)[1].proxy);
    EXPECT_FALSE(scheduler.proxy_pool().is_quarantined("http://p1:8080"));
    EXPECT_EQ(results.serp_count(), 1);
}

TEST(SchedulerTest, ExhaustedRetriesAreRecorded) {
    auto config        = fast_config();
    config.max_retries = 2;

    ResultAggregator results;
    Diagnostics      diagnostics;
    auto             fetcher = std::make_unique<FakeFetcher>(
        [](const FetchCall&) { return FakeFetcher::error(ErrorType::Network, "connection refused"); });
    auto log = fetcher->log();

    Scheduler scheduler(config, std::move(fetcher), results, diagnostics);
    scheduler.submit(FetchTask::scrape("dog"));
    scheduler.submit(FetchTask::suggest("dog"));
    scheduler.run();

    EXPECT_EQ(log->size(), 6);
    auto failures = results.failures();
    ASSERT_EQ(failures.size(), 2);
    for (const auto& failure : failures) {
        EXPECT_EQ(failure.kind, Core::ErrorKind::ExhaustedRetries);
        EXPECT_EQ(failure.last_error, Core::ErrorKind::Network);
        EXPECT_EQ(failure.retry_count, 2);
        EXPECT_EQ(failure.target, "dog");
    }
    EXPECT_EQ(results.serp_count(), 0);
}

TEST(SchedulerTest, TimeoutsAreRetriedThenSucceed) {
    ResultAggregator results;
    Diagnostics      diagnostics;
    auto             fetcher = std::make_unique<FakeFetcher>([](const FetchCall& call) {
        if (call.index == 1)
            return FakeFetcher::error(ErrorType::Timeout, "timed out");
        return FakeFetcher::ok(serp_page({{"https://x.example/", "X"}}));
    });
    auto log = fetcher->log();

    Scheduler scheduler(fast_config(), std::move(fetcher), results, diagnostics);
    scheduler.submit(FetchTask::scrape("fish"));
    scheduler.run();

    EXPECT_EQ(log->size(), 2);
    EXPECT_EQ(results.serp_count(), 1);
    EXPECT_EQ(results.failure_count(), 0);
}

TEST(SchedulerTest, WholePageParseErrorIsRetried) {
    ResultAggregator results;
    Diagnostics      diagnostics;
    auto             fetcher = std::make_unique<FakeFetcher>([](const FetchCall& call) {
        if (call.index == 1)
            return FakeFetcher::ok("<html><body><p>Nothing to see</p></body></html>");
        return FakeFetcher::ok(serp_page({{"https://x.example/", "X"}}));
    });
    auto log = fetcher->log();

    Scheduler scheduler(fast_config(), std::move(fetcher), results, diagnostics);
    scheduler.submit(FetchTask::scrape("bird"));
    scheduler.run();

    EXPECT_EQ(log->size(), 2);
    EXPECT_EQ(results.serp_count(), 1);
}

TEST(SchedulerTest, MaxResultsStopsTheRun) {
    auto config        = fast_config();
    config.max_results = 1;

    ResultAggregator results;
    Diagnostics      diagnostics;
    auto             fetcher = std::make_unique<FakeFetcher>(
        [](const FetchCall&) { return FakeFetcher::ok(serp_page({{"https://x.example/", "X"}})); });
    auto log = fetcher->log();

    Scheduler scheduler(config, std::move(fetcher), results, diagnostics);
    scheduler.submit(FetchTask::scrape("one"));
    scheduler.submit(FetchTask::scrape("two"));
    scheduler.submit(FetchTask::scrape("three"));
    scheduler.run();

    EXPECT_TRUE(scheduler.stop_requested());
    EXPECT_EQ(log->size(), 1);
    EXPECT_EQ(results.serp_count(), 1);
    EXPECT_EQ(scheduler.completed_scrapes(), 1);
    EXPECT_FALSE(scheduler.submit(FetchTask::scrape("four")));
}

TEST(SchedulerTest, StopDropsPendingRetries) {
    ResultAggregator results;
    Diagnostics      diagnostics;
    Scheduler*       self    = nullptr;
    auto             fetcher = std::make_unique<FakeFetcher>([&self](const FetchCall&) {
        self->request_stop("test");
        return FakeFetcher::error(ErrorType::Network);
    });
    auto log = fetcher->log();

    Scheduler scheduler(fast_config(), std::move(fetcher), results, diagnostics);
    self = &scheduler;
    scheduler.submit(FetchTask::scrape("lizard"));
    scheduler.run();

    EXPECT_EQ(log->size(), 1);
    auto failures = results.failures();
    ASSERT_EQ(failures.size(), 1);
    EXPECT_EQ(failures[0].kind, Core::ErrorKind::Network);
}

TEST(SchedulerTest, RateLimiterSpacesDispatches) {
    auto config            = fast_config();
    config.min_delay       = 0.05;
    config.max_delay       = 0.05;
    config.max_concurrency = 1;

    using Clock = std::chrono::steady_clock;
    std::mutex                     times_mutex;
    std::vector<Clock::time_point> times;

    ResultAggregator results;
    Diagnostics      diagnostics;
    auto             fetcher = std::make_unique<FakeFetcher>([&](const FetchCall&) {
        {
            std::lock_guard<std::mutex> lock(times_mutex);
            times.push_back(Clock::now());
        }
        return FakeFetcher::ok(suggest_payload("q", {}));
    });

    Scheduler scheduler(config, std::move(fetcher), results, diagnostics);
    scheduler.submit(FetchTask::suggest("a"));
    scheduler.submit(FetchTask::suggest("b"));
    scheduler.submit(FetchTask::suggest("c"));
    scheduler.run();

    ASSERT_EQ(times.size(), 3);
    for (size_t i = 1; i < times.size(); ++i)
        EXPECT_GE(times[i] - times[i - 1], std::chrono::milliseconds(45));
}

TEST(SchedulerTest, SuggestionsReachTheHandler) {
    ResultAggregator results;
    Diagnostics      diagnostics;
    auto             fetcher = std::make_unique<FakeFetcher>(
        [](const FetchCall& call) { return FakeFetcher::ok(suggest_payload(call.target, {"cat food", "cat toys"})); });

    Scheduler scheduler(fast_config(), std::move(fetcher), results, diagnostics);

    std::mutex                          mutex;
    std::vector<Suggest::Suggestion>    received;
    std::string                         parent;
    scheduler.on_suggestions([&](const FetchTask& task, const std::vector<Suggest::Suggestion>& suggestions) {
        std::lock_guard<std::mutex> lock(mutex);
        received = suggestions;
        parent   = task.parent.value_or("");
    });

    scheduler.submit(FetchTask::suggest("cat", 0, std::string("cat")));
    scheduler.run();

    ASSERT_EQ(received.size(), 2);
    EXPECT_EQ(received[0].text, "cat food");
    EXPECT_GT(received[0].relevance, received[1].relevance);
    EXPECT_EQ(parent, "cat");
}

TEST(SchedulerTest, ConcurrentWorkersDrainEverything) {
    auto config            = fast_config();
    config.max_concurrency = 4;
    config.io_threads      = 2;

    ResultAggregator results;
    Diagnostics      diagnostics;
    auto             fetcher = std::make_unique<FakeFetcher>(
        [](const FetchCall&) { return FakeFetcher::ok(serp_page({{"https://x.example/", "X"}})); });
    auto log = fetcher->log();

    Scheduler scheduler(config, std::move(fetcher), results, diagnostics);
    for (int i = 0; i < 20; ++i)
        scheduler.submit(FetchTask::scrape("keyword " + std::to_string(i)));
    scheduler.run();

    EXPECT_EQ(log->size(), 20);
    auto serps = results.serp_results();
    ASSERT_EQ(serps.size(), 20);
    for (size_t i = 1; i < serps.size(); ++i)
        EXPECT_LE(serps[i - 1].keyword, serps[i].keyword);
}

TEST(SchedulerTest, FetchNextTaskHonoursBackoff) {
    ResultAggregator results;
    Diagnostics      diagnostics;
    Scheduler        scheduler(fast_config(),
                        std::make_unique<FakeFetcher>([](const FetchCall&) { return FakeFetcher::ok(""); }),
                        results,
                        diagnostics);

    auto later       = FetchTask::scrape("later");
    later.not_before = std::chrono::steady_clock::now() + std::chrono::hours(1);
    auto now         = FetchTask::scrape("now");
    scheduler.queue_.push_back(later);
    scheduler.queue_.push_back(now);

    auto first = scheduler.fetch_next_task();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->target, "now");
    EXPECT_EQ(scheduler.active_workers_.load(), 1);

    EXPECT_FALSE(scheduler.fetch_next_task().has_value());
    EXPECT_EQ(scheduler.pending(), 1);
    EXPECT_FALSE(scheduler.should_stop_worker());

    scheduler.active_workers_--;
    scheduler.request_stop();
    EXPECT_TRUE(scheduler.should_stop_worker());
}
