#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "../../core/types/errors.hpp"
#include "../task/fetch_task.hpp"

namespace Harvester {
namespace Engine {

using SystemClock = std::chrono::system_clock;

struct OrganicResult {
    std::string url;
    std::string title;
    std::string description;
    std::string domain;
    int         position = 0;  // 1-based among kept results
};

struct SerpResult {
    std::string                keyword;
    int                        page = 1;
    std::vector<OrganicResult> organic;
    std::vector<std::string>   related_keywords;  // unique, insertion order
    std::vector<std::string>   people_also_ask;   // unique, insertion order
    SystemClock::time_point    retrieved_at{};
    std::string                fetched_url;
    size_t                     skipped = 0;
};

struct KeywordNode {
    std::string                text;
    int                        depth = 0;
    std::optional<std::string> parent;
    int                        relevance = 0;
    SystemClock::time_point    discovered_at{};
    std::string                source_query;
    std::string                suggestion_type;
    uint64_t                   discovery_order = 0;
};

struct TaskFailure {
    std::string             target;
    Purpose                 purpose = Purpose::Scrape;
    int                     page    = 1;
    int                     depth   = 0;
    Core::ErrorKind         kind    = Core::ErrorKind::ExhaustedRetries;
    Core::ErrorKind         last_error = Core::ErrorKind::None;
    int                     retry_count = 0;
    std::string             message;
    SystemClock::time_point failed_at{};
};

struct KeywordCount {
    std::string keyword;
    int         relevance = 0;
};

struct KeywordStatistics {
    size_t                    total_keywords        = 0;
    double                    average_relevance     = 0;
    double                    average_length        = 0;
    double                    average_word_count    = 0;
    std::map<int, size_t>     depth_distribution;
    std::vector<KeywordCount> top_keywords;
    double                    long_tail_percentage  = 0;
};

struct RunMetadata {
    std::string             language;
    std::string             country;
    SystemClock::time_point generated_at{};
    int                     max_depth = 0;
    std::string             data_source;
    size_t                  seed_count = 0;
    KeywordStatistics       statistics;
};

/**
 * @brief Immutable view of the expanded keywords.
 *
 * Nodes are ordered by (depth, discovery order); every non-root node's parent
 * is present at depth - 1.
 */
class KeywordForest {
public:
    KeywordForest() = default;
    explicit KeywordForest(std::vector<KeywordNode> nodes);

    const std::vector<KeywordNode>& nodes() const {
        return nodes_;
    }
    size_t size() const {
        return nodes_.size();
    }
    bool empty() const {
        return nodes_.empty();
    }

    std::vector<const KeywordNode*> roots() const;
    std::vector<const KeywordNode*> children(const std::string& keyword) const;
    const KeywordNode*              find(const std::string& keyword) const;

private:
    std::vector<KeywordNode>                nodes_;
    std::unordered_map<std::string, size_t> index_;  // normalized text -> position
};

// Statistics over the discovered (non-seed) nodes of a forest.
KeywordStatistics compute_statistics(const KeywordForest& forest, size_t top_n = 20);

struct HarvestReport {
    RunMetadata              metadata;
    std::vector<SerpResult>  serps;
    KeywordForest            keywords;
    std::vector<TaskFailure> failures;
};

}  // namespace Engine
}  // namespace Harvester
