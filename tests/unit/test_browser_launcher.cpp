#include <algorithm>
#include <gtest/gtest.h>
#include "../../src/browser/launcher/browser_launcher.hpp"
#include "../../src/core/logger/logger.hpp"

using namespace Harvester::Browser::Launcher;

TEST(LauncherTest, SearchPaths) {
    auto paths = BrowserLauncher::get_search_paths();
    EXPECT_FALSE(paths.empty());

    std::string path = BrowserLauncher::find_browser();
    if (!path.empty())
        EXPECT_NE(std::find(paths.begin(), paths.end(), path), paths.end());
}

TEST(LauncherTest, LaunchMissingBinaryFails) {
    Harvester::Core::Logger::set_level(Harvester::Core::LOG_NONE);
    BrowserLauncher launcher;
    LaunchOptions   options;
    options.path = "/non/existent/path";
    options.port = 9999;
    EXPECT_FALSE(launcher.launch(options));
    EXPECT_FALSE(launcher.running());
    launcher.stop();
    Harvester::Core::Logger::set_level(Harvester::Core::LOG_DEFAULT);
}
