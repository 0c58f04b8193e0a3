#include "block_detector.hpp"
#include "../../utils/text/string_utils.hpp"

namespace Harvester {
namespace Network {
namespace Fetch {

const std::vector<std::string>& DefaultBlockDetector::default_markers() {
    static const std::vector<std::string> markers = {
        "our systems have detected unusual traffic",
        "/sorry/index",
        "g-recaptcha",
        "recaptcha/api.js",
        "id=\"captcha-form\"",
        "please show you're not a robot",
    };
    return markers;
}

DefaultBlockDetector::DefaultBlockDetector() : markers_(default_markers()) {
}

DefaultBlockDetector::DefaultBlockDetector(std::vector<std::string> markers) {
    for (auto& marker : markers)
        markers_.push_back(Utils::Text::to_lower(marker));
}

bool DefaultBlockDetector::is_blocked(long               status_code,
                                      const std::string& body,
                                      const std::string& effective_url) const {
    if (status_code == 429)
        return true;
    if (effective_url.find("/sorry/") != std::string::npos)
        return true;
    if (body.empty() || markers_.empty())
        return false;

    std::string lowered = Utils::Text::to_lower(body);
    for (const auto& marker : markers_) {
        if (lowered.find(marker) != std::string::npos)
            return true;
    }
    return false;
}

}  // namespace Fetch
}  // namespace Network
}  // namespace Harvester
