#include "result_aggregator.hpp"

#include <algorithm>

namespace Harvester {
namespace Engine {

void ResultAggregator::add_serp(SerpResult serp) {
    std::lock_guard<std::mutex> lock(mutex_);
    serps_.push_back(std::move(serp));
}

uint64_t ResultAggregator::add_keyword(KeywordNode node) {
    std::lock_guard<std::mutex> lock(mutex_);
    node.discovery_order = next_order_++;
    keywords_.push_back(std::move(node));
    return keywords_.back().discovery_order;
}

void ResultAggregator::add_failure(TaskFailure failure) {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_.push_back(std::move(failure));
}

std::vector<SerpResult> ResultAggregator::serp_results() const {
    std::vector<SerpResult> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        out = serps_;
    }

    for (auto& serp : out) {
        std::stable_sort(serp.organic.begin(), serp.organic.end(),
                         [](const OrganicResult& a, const OrganicResult& b) {
                             return a.position < b.position;
                         });
    }
    std::stable_sort(out.begin(), out.end(), [](const SerpResult& a, const SerpResult& b) {
        if (a.keyword != b.keyword)
            return a.keyword < b.keyword;
        return a.page < b.page;
    });
    return out;
}

KeywordForest ResultAggregator::keyword_forest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return KeywordForest(keywords_);
}

std::vector<TaskFailure> ResultAggregator::failures() const {
    std::vector<TaskFailure> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        out = failures_;
    }
    std::stable_sort(out.begin(), out.end(), [](const TaskFailure& a, const TaskFailure& b) {
        if (a.purpose != b.purpose)
            return a.purpose < b.purpose;
        if (a.target != b.target)
            return a.target < b.target;
        return a.page < b.page;
    });
    return out;
}

size_t ResultAggregator::serp_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return serps_.size();
}

size_t ResultAggregator::keyword_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return keywords_.size();
}

size_t ResultAggregator::failure_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failures_.size();
}

void ResultAggregator::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    serps_.clear();
    keywords_.clear();
    failures_.clear();
    next_order_ = 0;
}

}  // namespace Engine
}  // namespace Harvester
