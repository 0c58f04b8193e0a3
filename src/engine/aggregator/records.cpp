#include "records.hpp"

#include <algorithm>

#include "../../utils/text/string_utils.hpp"
#include "../dedup/deduplicator.hpp"

namespace Harvester {
namespace Engine {

KeywordForest::KeywordForest(std::vector<KeywordNode> nodes) : nodes_(std::move(nodes)) {
    std::stable_sort(nodes_.begin(), nodes_.end(), [](const KeywordNode& a, const KeywordNode& b) {
        if (a.depth != b.depth)
            return a.depth < b.depth;
        return a.discovery_order < b.discovery_order;
    });
    for (size_t i = 0; i < nodes_.size(); ++i)
        index_.emplace(normalize_keyword(nodes_[i].text), i);
}

std::vector<const KeywordNode*> KeywordForest::roots() const {
    std::vector<const KeywordNode*> out;
    for (const auto& node : nodes_) {
        if (!node.parent)
            out.push_back(&node);
    }
    return out;
}

std::vector<const KeywordNode*> KeywordForest::children(const std::string& keyword) const {
    std::vector<const KeywordNode*> out;
    std::string                     key = normalize_keyword(keyword);
    for (const auto& node : nodes_) {
        if (node.parent && normalize_keyword(*node.parent) == key)
            out.push_back(&node);
    }
    return out;
}

const KeywordNode* KeywordForest::find(const std::string& keyword) const {
    auto it = index_.find(normalize_keyword(keyword));
    return it == index_.end() ? nullptr : &nodes_[it->second];
}

KeywordStatistics compute_statistics(const KeywordForest& forest, size_t top_n) {
    KeywordStatistics stats;

    std::vector<const KeywordNode*> discovered;
    for (const auto& node : forest.nodes()) {
        if (node.parent)
            discovered.push_back(&node);
    }
    if (discovered.empty())
        return stats;

    double relevance = 0;
    double length    = 0;
    double words     = 0;
    size_t long_tail = 0;
    for (const auto* node : discovered) {
        size_t word_count = Utils::Text::split_words(node->text).size();
        relevance += node->relevance;
        length += static_cast<double>(node->text.size());
        words += static_cast<double>(word_count);
        if (word_count >= 3)
            long_tail++;
        stats.depth_distribution[node->depth]++;
    }

    double n                   = static_cast<double>(discovered.size());
    stats.total_keywords       = discovered.size();
    stats.average_relevance    = relevance / n;
    stats.average_length       = length / n;
    stats.average_word_count   = words / n;
    stats.long_tail_percentage = static_cast<double>(long_tail) / n * 100.0;

    std::stable_sort(discovered.begin(), discovered.end(),
                     [](const KeywordNode* a, const KeywordNode* b) {
                         return a->relevance > b->relevance;
                     });
    for (size_t i = 0; i < discovered.size() && i < top_n; ++i)
        stats.top_keywords.push_back({discovered[i]->text, discovered[i]->relevance});
    return stats;
}

}  // namespace Engine
}  // namespace Harvester
