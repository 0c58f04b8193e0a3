#pragma once
#include <cstdint>
#include <mutex>
#include <vector>

#include "records.hpp"

namespace Harvester {
namespace Engine {

/**
 * @brief Collects results from concurrent workers.
 *
 * Writes happen in completion order; every read accessor returns a sorted
 * copy, so callers never see completion order.
 */
class ResultAggregator {
public:
    void add_serp(SerpResult serp);
    // Assigns and returns the node's discovery order.
    uint64_t add_keyword(KeywordNode node);
    void     add_failure(TaskFailure failure);

    std::vector<SerpResult>  serp_results() const;
    KeywordForest            keyword_forest() const;
    std::vector<TaskFailure> failures() const;

    size_t serp_count() const;
    size_t keyword_count() const;
    size_t failure_count() const;

    void clear();

private:
    mutable std::mutex       mutex_;
    std::vector<SerpResult>  serps_;
    std::vector<KeywordNode> keywords_;
    std::vector<TaskFailure> failures_;
    uint64_t                 next_order_ = 0;
};

}  // namespace Engine
}  // namespace Harvester
