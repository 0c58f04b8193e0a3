#pragma once
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "../aggregator/result_aggregator.hpp"
#include "../config/run_config.hpp"
#include "../dedup/deduplicator.hpp"
#include "../scheduler/scheduler.hpp"
#include "modifiers.hpp"

#ifndef CPPCHECK
class KeywordExpanderTest_FoldSkipsParentAndEmptySuggestions_Test;
#endif

namespace Harvester {
namespace Engine {

/**
 * @brief Breadth-first keyword expansion over the suggestion API.
 *
 * Each level's keywords are turned into suggest tasks, the scheduler drains
 * the level, and the collected suggestions are folded into the next level
 * in (keyword, prefix, rank) order. The fold never depends on completion
 * order, so a keyword reachable from several parents always goes to the
 * first one in that order.
 */
class KeywordExpander {
#ifndef CPPCHECK
    friend class ::KeywordExpanderTest_FoldSkipsParentAndEmptySuggestions_Test;
#endif

public:
    KeywordExpander(Scheduler& scheduler, ResultAggregator& results, const RunConfig& config);

    /**
     * @brief Expands the seeds down to max_depth.
     * @return The forest of every node added during this call and before it.
     */
    KeywordForest expand(const std::vector<std::string>& seeds);

    size_t discovered() const {
        return discovered_;
    }
    bool cap_reached() const {
        return cap_ > 0 && discovered_ >= static_cast<size_t>(cap_);
    }

#ifdef CPPCHECK
public:
#else
private:
#endif
    struct Collected {
        std::string                     parent;
        std::vector<Suggest::Suggestion> suggestions;
    };

    Scheduler&        scheduler_;
    ResultAggregator& results_;
    RunConfig         config_;
    ExpansionOptions  options_;

    Deduplicator claimed_;
    int          cap_        = 0;
    size_t       discovered_ = 0;

    std::mutex                       collected_mutex_;
    std::map<std::string, Collected> collected_;  // prefix -> parent and suggestions

    void collect(const FetchTask& task, const std::vector<Suggest::Suggestion>& suggestions);

    // Submits every prefix of the level; returns the prefixes per keyword.
    std::vector<std::vector<std::string>> submit_level(const std::vector<std::string>& level, int depth);

    std::vector<std::string> fold_level(const std::vector<std::string>&              level,
                                        const std::vector<std::vector<std::string>>& prefixes,
                                        int                                          depth);
};

}  // namespace Engine
}  // namespace Harvester
