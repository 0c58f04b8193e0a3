#include <algorithm>
#include <gtest/gtest.h>
#include "../../src/engine/expander/keyword_expander.hpp"
#include "fake_fetcher.hpp"

using namespace Harvester;
using namespace Harvester::Engine;
using Harvester::Testing::FakeFetcher;
using Harvester::Testing::FetchCall;
using Harvester::Testing::suggest_payload;

namespace {

RunConfig expander_config() {
    RunConfig config;
    config.min_delay       = 0;
    config.max_delay       = 0;
    config.backoff_base_ms = 1;
    config.io_threads      = 1;
    config.max_concurrency = 2;
    config.modifiers       = {};
    return config;
}

struct Harness {
    ResultAggregator                        results;
    Diagnostics                             diagnostics;
    std::shared_ptr<std::vector<FetchCall>> calls;
    std::unique_ptr<Scheduler>              scheduler;
    std::unique_ptr<KeywordExpander>        expander;

    Harness(const RunConfig& config, FakeFetcher::Script script) {
        auto fetcher = std::make_unique<FakeFetcher>(std::move(script));
        calls        = fetcher->log();
        scheduler    = std::make_unique<Scheduler>(config, std::move(fetcher), results, diagnostics);
        expander     = std::make_unique<KeywordExpander>(*scheduler, results, config);
    }
};

void expect_tree_invariant(const KeywordForest& forest) {
    for (const auto& node : forest.nodes()) {
        if (!node.parent) {
            EXPECT_EQ(node.depth, 0) << node.text;
            continue;
        }
        const auto* parent = forest.find(*node.parent);
        ASSERT_NE(parent, nullptr) << node.text;
        EXPECT_EQ(parent->depth, node.depth - 1) << node.text;
    }
}

}  // namespace

TEST(ModifiersTest, PrefixOrderAndPlacement) {
    ExpansionOptions options{{Modifier::Questions, Modifier::Prepositions, Modifier::Alphabet}, true};
    auto             prefixes = expansion_prefixes("cat", options);

    ASSERT_EQ(prefixes.size(), 1 + 11 + 10 + 26);
    EXPECT_EQ(prefixes[0], "cat");
    EXPECT_EQ(prefixes[1], "how cat");
    EXPECT_EQ(prefixes[12], "cat for");
    EXPECT_EQ(prefixes[22], "cat a");
    EXPECT_EQ(prefixes.back(), "cat z");
}

TEST(ModifiersTest, DuplicatesAndBaseQuery) {
    ExpansionOptions options{{Modifier::Alphabet, Modifier::Alphabet}, false};
    auto             prefixes = expansion_prefixes("cat food", options);
    ASSERT_EQ(prefixes.size(), 26);
    EXPECT_EQ(prefixes[0], "cat food a");

    EXPECT_TRUE(expansion_prefixes("cat", ExpansionOptions{{}, false}).empty());
    auto base = expansion_prefixes("cat", ExpansionOptions{{}, true});
    ASSERT_EQ(base.size(), 1);
    EXPECT_EQ(base[0], "cat");
}

TEST(KeywordExpanderTest, SingleSuggestionUnderAlphabet) {
    auto config               = expander_config();
    config.max_depth          = 1;
    config.modifiers          = {Modifier::Alphabet};
    config.include_base_query = false;

    Harness harness(config, [](const FetchCall& call) {
        if (call.target == "cat a")
            return FakeFetcher::ok(suggest_payload(call.target, {"cat anatomy"}));
        return FakeFetcher::ok(suggest_payload(call.target, {}));
    });

    auto forest = harness.expander->expand({"cat"});

    EXPECT_EQ(harness.calls->size(), 26);
    ASSERT_EQ(forest.size(), 2);
    EXPECT_EQ(forest.nodes()[0].text, "cat");
    EXPECT_EQ(forest.nodes()[0].depth, 0);
    EXPECT_FALSE(forest.nodes()[0].parent.has_value());

    const auto& child = forest.nodes()[1];
    EXPECT_EQ(child.text, "cat anatomy");
    EXPECT_EQ(child.depth, 1);
    ASSERT_TRUE(child.parent.has_value());
    EXPECT_EQ(*child.parent, "cat");
    EXPECT_EQ(child.source_query, "cat a");
    EXPECT_EQ(forest.children("cat").size(), 1);
}

TEST(KeywordExpanderTest, OverlappingSuggestionClaimedOnce) {
    auto config            = expander_config();
    config.max_depth       = 1;
    config.max_concurrency = 4;

    Harness harness(config, [](const FetchCall& call) {
        if (call.target == "cat")
            return FakeFetcher::ok(suggest_payload(call.target, {"cat food", "cat toys"}));
        if (call.target == "pet")
            return FakeFetcher::ok(suggest_payload(call.target, {"Cat Food", "pet food"}));
        return FakeFetcher::ok(suggest_payload(call.target, {}));
    });

    auto forest = harness.expander->expand({"cat", "pet"});

    int cat_food = 0;
    for (const auto& node : forest.nodes()) {
        if (normalize_keyword(node.text) == "cat food") {
            ++cat_food;
            EXPECT_EQ(node.parent.value_or(""), "cat");
        }
    }
    EXPECT_EQ(cat_food, 1);
    EXPECT_EQ(forest.size(), 5);
    EXPECT_EQ(forest.children("pet").size(), 1);
    expect_tree_invariant(forest);
}

TEST(KeywordExpanderTest, TerminatesAtMaxDepth) {
    auto config         = expander_config();
    config.max_depth    = 3;
    config.max_keywords = 100000;

    // Every prefix yields two brand-new keywords.
    Harness harness(config, [](const FetchCall& call) {
        return FakeFetcher::ok(suggest_payload(call.target, {call.target + " one", call.target + " two"}));
    });

    auto forest = harness.expander->expand({"tea"});

    int deepest = 0;
    for (const auto& node : forest.nodes())
        deepest = std::max(deepest, node.depth);
    EXPECT_EQ(deepest, 3);
    EXPECT_EQ(forest.size(), 1 + 2 + 4 + 8);
    expect_tree_invariant(forest);

    for (size_t i = 1; i < forest.size(); ++i) {
        const auto& a = forest.nodes()[i - 1];
        const auto& b = forest.nodes()[i];
        EXPECT_TRUE(a.depth < b.depth || (a.depth == b.depth && a.discovery_order < b.discovery_order));
    }
}

TEST(KeywordExpanderTest, ZeroDepthReturnsSeedsOnly) {
    auto config      = expander_config();
    config.max_depth = 0;

    Harness harness(config, [](const FetchCall& call) {
        return FakeFetcher::ok(suggest_payload(call.target, {"anything"}));
    });

    auto forest = harness.expander->expand({"cat", "CAT", " ", "dog"});

    EXPECT_TRUE(harness.calls->empty());
    ASSERT_EQ(forest.size(), 2);
    EXPECT_EQ(forest.roots().size(), 2);
}

TEST(KeywordExpanderTest, KeywordCapStopsExpansion) {
    auto config         = expander_config();
    config.max_depth    = 5;
    config.max_keywords = 5;
    config.modifiers    = {Modifier::Prepositions};

    Harness harness(config, [](const FetchCall& call) {
        return FakeFetcher::ok(
            suggest_payload(call.target, {call.target + " a1", call.target + " b2", call.target + " c3"}));
    });

    auto forest = harness.expander->expand({"tea"});

    EXPECT_EQ(harness.expander->discovered(), 5);
    EXPECT_TRUE(harness.expander->cap_reached());
    EXPECT_EQ(forest.size(), 6);
    EXPECT_TRUE(harness.scheduler->stop_requested());
    expect_tree_invariant(forest);
}

TEST(KeywordExpanderTest, FailedPrefixesDoNotBreakTheLevel) {
    auto config        = expander_config();
    config.max_depth   = 1;
    config.max_retries = 0;
    config.modifiers   = {Modifier::Prepositions};

    Harness harness(config, [](const FetchCall& call) {
        if (call.target == "tea for")
            return FakeFetcher::error(Network::Http::ErrorType::Network, "reset");
        if (call.target == "tea with")
            return FakeFetcher::ok(suggest_payload(call.target, {"tea with milk"}));
        return FakeFetcher::ok(suggest_payload(call.target, {}));
    });

    auto forest = harness.expander->expand({"tea"});

    ASSERT_EQ(forest.size(), 2);
    EXPECT_EQ(forest.nodes()[1].text, "tea with milk");
    EXPECT_EQ(harness.results.failure_count(), 1);
}

TEST(KeywordExpanderTest, FoldSkipsParentAndEmptySuggestions) {
    auto    config = expander_config();
    Harness harness(config, [](const FetchCall&) { return FakeFetcher::ok(""); });
    auto&   expander = *harness.expander;

    KeywordExpander::Collected collected;
    collected.parent      = "cat";
    collected.suggestions = {{"  ", 900, "QUERY"},
                             {"CAT ", 800, "QUERY"},
                             {"cat toy", 700, "QUERY"},
                             {"Cat  Toy", 600, "QUERY"},
                             {"cat bed", 500, "NAVIGATION"}};
    expander.collected_["cat t"] = collected;

    std::vector<std::string>              level = {"cat"};
    std::vector<std::vector<std::string>> prefixes(1, std::vector<std::string>{"cat t"});
    auto                                  next = expander.fold_level(level, prefixes, 0);

    ASSERT_EQ(next.size(), 2);
    EXPECT_EQ(next[0], "cat toy");
    EXPECT_EQ(next[1], "cat bed");

    auto forest = harness.results.keyword_forest();
    ASSERT_EQ(forest.size(), 2);
    EXPECT_EQ(forest.nodes()[0].relevance, 700);
    EXPECT_EQ(forest.nodes()[1].suggestion_type, "NAVIGATION");
    EXPECT_EQ(forest.nodes()[1].source_query, "cat t");
    EXPECT_TRUE(expander.collected_.empty());
}
