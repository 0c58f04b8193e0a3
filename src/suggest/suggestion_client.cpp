#include "suggestion_client.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>
#include "../core/logger/logger.hpp"
#include "../utils/text/string_utils.hpp"

namespace Harvester {
namespace Suggest {

using nlohmann::json;
using Core::Logger;

SuggestionClient::SuggestionClient(Network::Fetch::RequestBuilder builder, int min_relevance)
    : builder_(std::move(builder)), min_relevance_(min_relevance) {
}

std::string SuggestionClient::request_url(const std::string& prefix) const {
    return builder_.suggest_url(prefix);
}

std::vector<Suggestion> SuggestionClient::parse(const std::string& raw) const {
    std::vector<Suggestion> out;

    json data = json::parse(raw, nullptr, false);
    if (data.is_discarded() || !data.is_array() || data.size() < 2 || !data[1].is_array())
        return out;

    json relevance = json::array();
    json types     = json::array();
    if (data.size() > 4 && data[4].is_object()) {
        relevance = data[4].value("google:suggestrelevance", json::array());
        types     = data[4].value("google:suggesttypes", json::array());
    }

    const json& texts = data[1];
    for (size_t i = 0; i < texts.size(); ++i) {
        if (!texts[i].is_string())
            continue;
        std::string text = Utils::Text::collapse_whitespace(texts[i].get<std::string>());
        if (text.empty())
            continue;

        Suggestion suggestion;
        suggestion.text = text;
        // Missing scores count as 0, missing types as plain queries.
        if (relevance.is_array() && i < relevance.size() && relevance[i].is_number_integer())
            suggestion.relevance = relevance[i].get<int>();
        suggestion.type = "QUERY";
        if (types.is_array() && i < types.size() && types[i].is_string())
            suggestion.type = types[i].get<std::string>();

        if (suggestion.relevance < min_relevance_)
            continue;
        out.push_back(std::move(suggestion));
    }

    std::stable_sort(out.begin(), out.end(), [](const Suggestion& a, const Suggestion& b) {
        return a.relevance > b.relevance;
    });
    return out;
}

boost::asio::awaitable<std::vector<Suggestion>>
SuggestionClient::suggest(Network::Http::HttpClient& client, const std::string& prefix) const {
    auto response = co_await client.get(request_url(prefix));
    if (!response.success) {
        Logger::warn("Suggestions for '" + prefix + "' failed: "
                     + (response.error.empty() ? "HTTP " + std::to_string(response.status_code)
                                               : response.error));
        co_return std::vector<Suggestion>{};
    }
    co_return parse(response.body);
}

}  // namespace Suggest
}  // namespace Harvester
