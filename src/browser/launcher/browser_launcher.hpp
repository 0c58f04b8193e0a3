#pragma once
#include <chrono>
#include <string>
#include <vector>
#include <sys/types.h>

namespace Harvester {
namespace Browser {
namespace Launcher {

struct LaunchOptions {
    std::string               path;  // empty: search the usual install locations
    int                       port     = 9222;
    bool                      headless = true;
    std::string               user_agent;
    std::chrono::milliseconds ready_timeout{10000};
};

/**
 * @brief Owns one Chromium process with remote debugging enabled.
 *
 * The process and its temporary profile directory go away with the object.
 */
class BrowserLauncher {
public:
    BrowserLauncher() = default;
    ~BrowserLauncher();

    BrowserLauncher(const BrowserLauncher&)            = delete;
    BrowserLauncher& operator=(const BrowserLauncher&) = delete;

    static std::string              find_browser();
    static std::vector<std::string> get_search_paths();

    // Blocks until the DevTools port accepts connections or the timeout passes.
    bool launch(const LaunchOptions& options);
    void stop();

    bool running() const {
        return pid_ > 0;
    }
    const std::string& path() const {
        return path_;
    }

private:
    pid_t       pid_ = -1;
    std::string path_;
    std::string profile_dir_;

    static bool wait_for_port(int port, std::chrono::milliseconds timeout);
};

}  // namespace Launcher
}  // namespace Browser
}  // namespace Harvester
