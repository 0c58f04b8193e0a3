#pragma once
#include <string>
#include <vector>

namespace Harvester {
namespace Network {
namespace Fetch {

// Decides whether a received page is an anti-bot challenge rather than content.
class BlockDetector {
public:
    virtual ~BlockDetector() = default;
    virtual bool is_blocked(long               status_code,
                            const std::string& body,
                            const std::string& effective_url) const = 0;
};

/**
 * @brief HTTP 429, a redirect onto Google's /sorry/ interstitial, or a body
 * carrying one of the known CAPTCHA markers.
 */
class DefaultBlockDetector : public BlockDetector {
public:
    DefaultBlockDetector();
    explicit DefaultBlockDetector(std::vector<std::string> markers);

    bool is_blocked(long               status_code,
                    const std::string& body,
                    const std::string& effective_url) const override;

    static const std::vector<std::string>& default_markers();

private:
    std::vector<std::string> markers_;  // lower-case
};

}  // namespace Fetch
}  // namespace Network
}  // namespace Harvester
