#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <string>
#include <vector>
#include "../network/fetch/request_builder.hpp"
#include "../network/http/http_client.hpp"

namespace Harvester {
namespace Suggest {

struct Suggestion {
    std::string text;
    int         relevance = 0;
    std::string type;  // e.g. QUERY, NAVIGATION
};

/**
 * @brief Chrome-client autocomplete requests and responses.
 *
 * The response is a JSON array:
 *   [query, [suggestions], [descriptions], [],
 *    {"google:suggestrelevance": [...], "google:suggesttypes": [...]}]
 */
class SuggestionClient {
public:
    SuggestionClient(Network::Fetch::RequestBuilder builder, int min_relevance = 0);

    std::string request_url(const std::string& prefix) const;

    // Most relevant first, ties in API order. Empty on malformed input.
    std::vector<Suggestion> parse(const std::string& raw) const;

    // One direct request, outside the scheduler.
    boost::asio::awaitable<std::vector<Suggestion>> suggest(Network::Http::HttpClient& client,
                                                            const std::string&         prefix) const;

    int min_relevance() const {
        return min_relevance_;
    }

private:
    Network::Fetch::RequestBuilder builder_;
    int                            min_relevance_;
};

}  // namespace Suggest
}  // namespace Harvester
