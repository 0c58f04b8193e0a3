#include <atomic>
#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include "../../src/engine/dedup/deduplicator.hpp"

using namespace Harvester::Engine;

TEST(DeduplicatorTest, Normalization) {
    EXPECT_EQ(normalize_keyword("  Cat   FOOD\t"), "cat food");
    EXPECT_EQ(normalize_keyword(""), "");
}

TEST(DeduplicatorTest, FirstVisitWins) {
    Deduplicator dedup;
    EXPECT_TRUE(dedup.try_visit(VisitedKey::of("cat food", Purpose::Suggest)));
    EXPECT_FALSE(dedup.try_visit(VisitedKey::of("Cat  Food", Purpose::Suggest)));
    EXPECT_TRUE(dedup.contains(VisitedKey::of("CAT FOOD", Purpose::Suggest)));
    EXPECT_EQ(dedup.size(), 1);
}

TEST(DeduplicatorTest, PurposeAndPageAreDistinct) {
    Deduplicator dedup;
    EXPECT_TRUE(dedup.try_visit(VisitedKey::of("cat", Purpose::Suggest)));
    EXPECT_TRUE(dedup.try_visit(VisitedKey::of("cat", Purpose::Scrape, 1)));
    EXPECT_TRUE(dedup.try_visit(VisitedKey::of("cat", Purpose::Scrape, 2)));
    EXPECT_FALSE(dedup.try_visit(VisitedKey::of(FetchTask::scrape("cat", 2))));

    // Suggestions have no pages.
    EXPECT_FALSE(dedup.try_visit(VisitedKey::of("cat", Purpose::Suggest, 7)));

    dedup.clear();
    EXPECT_EQ(dedup.size(), 0);
}

TEST(DeduplicatorTest, ConcurrentClaims) {
    Deduplicator             dedup;
    std::atomic<int>         winners{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            for (int j = 0; j < 100; ++j) {
                if (dedup.try_visit(VisitedKey::of("kw " + std::to_string(j), Purpose::Suggest)))
                    winners++;
            }
        });
    }
    for (auto& t : threads)
        t.join();
    EXPECT_EQ(winners.load(), 100);
}
