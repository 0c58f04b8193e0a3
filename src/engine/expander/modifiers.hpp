#pragma once
#include <string>
#include <vector>
#include "../config/run_config.hpp"

namespace Harvester {
namespace Engine {

const std::vector<std::string>& alphabet_modifiers();
const std::vector<std::string>& question_words();
const std::vector<std::string>& prepositions();

struct ExpansionOptions {
    std::vector<Modifier> modifiers;
    bool                  include_base_query = true;

    static ExpansionOptions from(const RunConfig& config) {
        return {config.modifiers, config.include_base_query};
    }
};

/**
 * @brief Suggestion prefixes for one keyword, in submission order.
 *
 * Base query first, then per enabled modifier in configured order: letters
 * as suffixes, question words as prefixes, prepositions as suffixes.
 * Duplicates are dropped.
 */
std::vector<std::string> expansion_prefixes(const std::string& keyword, const ExpansionOptions& options);

}  // namespace Engine
}  // namespace Harvester
