#pragma once
#include <string>
#include "../../engine/config/run_config.hpp"
#include "../../engine/task/fetch_task.hpp"

namespace Harvester {
namespace Network {
namespace Fetch {

// Turns tasks into concrete URLs for the search page and suggestion endpoints.
class RequestBuilder {
public:
    explicit RequestBuilder(const Engine::RunConfig& config);

    std::string url_for(const Engine::FetchTask& task) const;

    // start = (page - 1) * results_per_page
    std::string search_url(const std::string& keyword, int page) const;
    std::string suggest_url(const std::string& prefix) const;

    const std::string& search_base() const {
        return search_base_;
    }

private:
    std::string search_base_;
    std::string suggest_base_;
    std::string language_;
    std::string country_;
    std::string data_source_;
    int         results_per_page_;
};

}  // namespace Fetch
}  // namespace Network
}  // namespace Harvester
