#pragma once
#include <string>
#include "../engine/aggregator/records.hpp"

namespace Harvester {
namespace Extract {

struct ExtractionResult {
    Engine::SerpResult serp;
    size_t             skipped = 0;  // candidate blocks dropped as malformed
};

/**
 * @brief Parses Google result-page HTML into a SerpResult.
 *
 * Works on both browser-rendered and plain-HTTP markup. A candidate block
 * without a usable http(s) link or a title is skipped and counted; the page
 * as a whole fails only when it has neither a results container (#search or
 * #rso) nor any candidate block.
 */
class SerpExtractor {
public:
    /**
     * @throws Core::ParseError when the page is not a result page at all.
     */
    ExtractionResult extract(const std::string& html, const std::string& keyword, int page) const;

    // Resolves Google's "/url?q=<target>&..." redirect links; other links pass through.
    static std::string resolve_result_link(const std::string& href);
};

}  // namespace Extract
}  // namespace Harvester
