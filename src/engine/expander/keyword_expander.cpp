#include "keyword_expander.hpp"
#include "../../core/logger/logger.hpp"
#include "../../utils/text/string_utils.hpp"

namespace Harvester {
namespace Engine {

using namespace Harvester::Core;
using Harvester::Utils::Text::collapse_whitespace;

KeywordExpander::KeywordExpander(Scheduler& scheduler, ResultAggregator& results, const RunConfig& config)
    : scheduler_(scheduler),
      results_(results),
      config_(config),
      options_(ExpansionOptions::from(config)) {
    scheduler_.on_suggestions(
        [this](const FetchTask& task, const std::vector<Suggest::Suggestion>& suggestions) {
            collect(task, suggestions);
        });
}

void KeywordExpander::collect(const FetchTask& task, const std::vector<Suggest::Suggestion>& suggestions) {
    std::lock_guard<std::mutex> lock(collected_mutex_);
    auto& slot       = collected_[task.target];
    slot.parent      = task.parent.value_or("");
    slot.suggestions = suggestions;
}

KeywordForest KeywordExpander::expand(const std::vector<std::string>& seeds) {
    std::vector<std::string> level;
    for (const auto& seed : seeds) {
        std::string text = collapse_whitespace(seed);
        if (text.empty())
            continue;
        if (!claimed_.try_visit(VisitedKey::of(text, Purpose::Suggest)))
            continue;

        KeywordNode node;
        node.text          = text;
        node.depth         = 0;
        node.discovered_at = SystemClock::now();
        node.source_query  = text;
        node.suggestion_type = "SEED";
        results_.add_keyword(std::move(node));
        level.push_back(text);
    }

    cap_ = config_.keyword_cap(level.size());
    Logger::info("Starting keyword harvest with " + std::to_string(level.size()) + " seeds (max depth "
                 + std::to_string(config_.max_depth) + ", cap " + std::to_string(cap_) + ")");

    for (int depth = 0; depth < config_.max_depth && !level.empty(); ++depth) {
        if (scheduler_.stop_requested() || cap_reached())
            break;

        auto prefixes = submit_level(level, depth);
        Logger::info("Depth " + std::to_string(depth) + ": expanding " + std::to_string(level.size())
                     + " keywords");
        scheduler_.run();

        level = fold_level(level, prefixes, depth);
        Logger::info("Depth " + std::to_string(depth + 1) + ": " + std::to_string(level.size())
                     + " new keywords, " + std::to_string(discovered_) + " total");

        if (cap_reached()) {
            Logger::warn("Reached max keywords limit: " + std::to_string(discovered_));
            scheduler_.request_stop("keyword limit reached");
        }
    }

    Logger::success("Keyword harvest complete: " + std::to_string(discovered_) + " keywords discovered");
    return results_.keyword_forest();
}

std::vector<std::vector<std::string>> KeywordExpander::submit_level(const std::vector<std::string>& level,
                                                                    int                             depth) {
    std::vector<std::vector<std::string>> prefixes;
    prefixes.reserve(level.size());
    for (const auto& keyword : level) {
        prefixes.push_back(expansion_prefixes(keyword, options_));
        for (const auto& prefix : prefixes.back())
            scheduler_.submit(FetchTask::suggest(prefix, depth, keyword));
    }
    return prefixes;
}

std::vector<std::string> KeywordExpander::fold_level(const std::vector<std::string>&              level,
                                                     const std::vector<std::vector<std::string>>& prefixes,
                                                     int                                          depth) {
    std::map<std::string, Collected> collected;
    {
        std::lock_guard<std::mutex> lock(collected_mutex_);
        collected.swap(collected_);
    }

    std::vector<std::string> next;
    for (size_t i = 0; i < level.size(); ++i) {
        const auto& keyword    = level[i];
        const auto  normalized = normalize_keyword(keyword);

        for (const auto& prefix : prefixes[i]) {
            auto it = collected.find(prefix);
            // A prefix shared with an earlier keyword belongs to that keyword.
            if (it == collected.end() || it->second.parent != keyword)
                continue;

            for (const auto& suggestion : it->second.suggestions) {
                if (cap_reached())
                    return next;

                std::string text = collapse_whitespace(suggestion.text);
                if (text.empty() || normalize_keyword(text) == normalized)
                    continue;
                if (!claimed_.try_visit(VisitedKey::of(text, Purpose::Suggest)))
                    continue;

                KeywordNode node;
                node.text            = text;
                node.depth           = depth + 1;
                node.parent          = keyword;
                node.relevance       = suggestion.relevance;
                node.discovered_at   = SystemClock::now();
                node.source_query    = prefix;
                node.suggestion_type = suggestion.type;
                results_.add_keyword(std::move(node));

                ++discovered_;
                next.push_back(text);
            }
        }
    }
    return next;
}

}  // namespace Engine
}  // namespace Harvester
