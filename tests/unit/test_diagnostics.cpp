#include <gtest/gtest.h>
#include <vector>
#include "../../src/core/logger/logger.hpp"
#include "../../src/engine/events/diagnostics.hpp"

using namespace Harvester;
using namespace Harvester::Engine;

TEST(DiagnosticsTest, EventFromTask) {
    auto task             = FetchTask::scrape("cat", 2);
    task.retry_count      = 1;
    task.block_retry_used = true;
    task.proxy            = "http://p1:8080";
    task.last_error       = Core::ErrorKind::Blocked;

    auto event = EngineEvent::for_task(EventKind::TaskRetrying, task);
    EXPECT_EQ(event.target, "cat");
    EXPECT_EQ(event.page, 2);
    EXPECT_EQ(event.attempt, 3);
    EXPECT_EQ(event.proxy, "http://p1:8080");
    EXPECT_EQ(event.error_kind, Core::ErrorKind::Blocked);

    auto direct = EngineEvent::for_task(EventKind::TaskStarted, FetchTask::suggest("cat"));
    EXPECT_EQ(direct.proxy, "direct");
    EXPECT_EQ(direct.attempt, 1);
}

TEST(DiagnosticsTest, FanOut) {
    Diagnostics diagnostics;
    EXPECT_FALSE(diagnostics.has_listeners());
    diagnostics.emit(EngineEvent{});

    std::vector<EventKind> first;
    std::vector<EventKind> second;
    diagnostics.subscribe([&](const EngineEvent& e) { first.push_back(e.kind); });
    diagnostics.subscribe([&](const EngineEvent& e) { second.push_back(e.kind); });
    EXPECT_TRUE(diagnostics.has_listeners());

    EngineEvent event;
    event.kind = EventKind::TaskFailed;
    diagnostics.emit(event);
    event.kind = EventKind::ProxyQuarantined;
    diagnostics.emit(event);

    std::vector<EventKind> expected = {EventKind::TaskFailed, EventKind::ProxyQuarantined};
    EXPECT_EQ(first, expected);
    EXPECT_EQ(second, expected);
}

TEST(DiagnosticsTest, LogsEveryKind) {
    Core::Logger::set_level(Core::LOG_NONE);
    auto task = FetchTask::scrape("cat");
    for (auto kind : {EventKind::TaskStarted, EventKind::TaskSucceeded, EventKind::TaskRetrying,
                      EventKind::TaskFailed, EventKind::ProxyQuarantined}) {
        EXPECT_STRNE(to_string(kind), "unknown");
        log_event(EngineEvent::for_task(kind, task));
    }
    Core::Logger::set_level(Core::LOG_DEFAULT);
}
