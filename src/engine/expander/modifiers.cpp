#include "modifiers.hpp"
#include <algorithm>

namespace Harvester {
namespace Engine {

const std::vector<std::string>& alphabet_modifiers() {
    static const std::vector<std::string> letters = [] {
        std::vector<std::string> out;
        for (char c = 'a'; c <= 'z'; ++c)
            out.emplace_back(1, c);
        return out;
    }();
    return letters;
}

const std::vector<std::string>& question_words() {
    static const std::vector<std::string> words = {"how", "what", "why", "when", "where", "who",
                                                   "which", "are", "is", "can", "will"};
    return words;
}

const std::vector<std::string>& prepositions() {
    static const std::vector<std::string> words = {"for", "with", "without", "near", "in",
                                                   "at", "to", "from", "vs", "versus"};
    return words;
}

std::vector<std::string> expansion_prefixes(const std::string& keyword, const ExpansionOptions& options) {
    std::vector<std::string> prefixes;
    auto push = [&prefixes](std::string prefix) {
        if (std::find(prefixes.begin(), prefixes.end(), prefix) == prefixes.end())
            prefixes.push_back(std::move(prefix));
    };

    if (options.include_base_query)
        push(keyword);

    for (auto modifier : options.modifiers) {
        switch (modifier) {
            case Modifier::Alphabet:
                for (const auto& letter : alphabet_modifiers())
                    push(keyword + " " + letter);
                break;
            case Modifier::Questions:
                for (const auto& word : question_words())
                    push(word + " " + keyword);
                break;
            case Modifier::Prepositions:
                for (const auto& word : prepositions())
                    push(keyword + " " + word);
                break;
        }
    }
    return prefixes;
}

}  // namespace Engine
}  // namespace Harvester
