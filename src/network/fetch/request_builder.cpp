#include "request_builder.hpp"
#include "../../utils/url/url.hpp"

namespace Harvester {
namespace Network {
namespace Fetch {

RequestBuilder::RequestBuilder(const Engine::RunConfig& config)
    : search_base_(config.search_endpoint.empty()
                       ? "https://www." + config.google_domain + "/search"
                       : config.search_endpoint),
      suggest_base_(config.suggest_endpoint),
      language_(config.language),
      country_(config.country),
      data_source_(config.data_source),
      results_per_page_(config.results_per_page) {
}

std::string RequestBuilder::url_for(const Engine::FetchTask& task) const {
    if (task.purpose == Engine::Purpose::Scrape)
        return search_url(task.target, task.page);
    return suggest_url(task.target);
}

std::string RequestBuilder::search_url(const std::string& keyword, int page) const {
    int start = (page > 1 ? page - 1 : 0) * results_per_page_;
    return Utils::Url::with_query(search_base_,
                                  {{"q", keyword},
                                   {"start", std::to_string(start)},
                                   {"num", std::to_string(results_per_page_)},
                                   {"hl", language_},
                                   {"gl", country_}});
}

std::string RequestBuilder::suggest_url(const std::string& prefix) const {
    Utils::QueryParams params = {
        {"client", "chrome"}, {"hl", language_}, {"gl", country_}, {"q", prefix}};
    if (!data_source_.empty())
        params.emplace_back("ds", data_source_);
    return Utils::Url::with_query(suggest_base_, params);
}

}  // namespace Fetch
}  // namespace Network
}  // namespace Harvester
