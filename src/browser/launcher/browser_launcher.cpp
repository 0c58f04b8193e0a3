#include "browser_launcher.hpp"
#include <utility>
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <signal.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include "../../core/logger/logger.hpp"

namespace Harvester {
namespace Browser {
namespace Launcher {

using Core::Logger;

std::vector<std::string> BrowserLauncher::get_search_paths() {
#ifdef __APPLE__
    return {"/Applications/Google Chrome.app/Contents/MacOS/Google Chrome",
            "/Applications/Chromium.app/Contents/MacOS/Chromium",
            "/opt/homebrew/bin/chromium",
            "/usr/local/bin/chromium"};
#else
    return {"/usr/bin/chromium",
            "/usr/bin/chromium-browser",
            "/usr/bin/google-chrome",
            "/usr/bin/google-chrome-stable",
            "/snap/bin/chromium",
            "/usr/local/bin/chromium"};
#endif
}

std::string BrowserLauncher::find_browser() {
    for (const auto& path : get_search_paths()) {
        std::error_code ec;
        if (std::filesystem::exists(path, ec))
            return path;
    }
    return "";
}

BrowserLauncher::~BrowserLauncher() {
    stop();
}

bool BrowserLauncher::wait_for_port(int port, std::chrono::milliseconds timeout) {
    using boost::asio::ip::tcp;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        boost::asio::io_context   ioc;
        tcp::socket               socket(ioc);
        boost::system::error_code ec;
        socket.connect(tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"),
                                     static_cast<unsigned short>(port)),
                       ec);
        if (!ec)
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    return false;
}

bool BrowserLauncher::launch(const LaunchOptions& options) {
    if (running())
        return true;

    path_ = options.path.empty() ? find_browser() : options.path;
    if (path_.empty()) {
        Logger::error("No Chromium found. Pass --browser-path.");
        return false;
    }
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        Logger::error("Browser path does not exist: " + path_);
        return false;
    }

    profile_dir_ = (std::filesystem::temp_directory_path(ec) / ("harvester_browser_" + std::to_string(getpid())))
                       .string();
    std::filesystem::create_directories(profile_dir_, ec);

    std::vector<std::string> args = {path_,
                                     "--disable-gpu",
                                     "--disable-extensions",
                                     "--disable-background-networking",
                                     "--disable-renderer-backgrounding",
                                     "--disable-notifications",
                                     "--no-first-run",
                                     "--no-default-browser-check",
                                     "--window-size=1920,1080",
                                     "--no-sandbox",
                                     "--remote-debugging-port=" + std::to_string(options.port),
                                     "--remote-allow-origins=*",
                                     "--user-data-dir=" + profile_dir_};
    if (options.headless)
        args.push_back("--headless=new");
    if (!options.user_agent.empty())
        args.push_back("--user-agent=" + options.user_agent);

    pid_ = fork();
    if (pid_ < 0) {
        Logger::error("fork() failed while launching the browser");
        pid_ = -1;
        return false;
    }
    if (pid_ == 0) {
        std::vector<char*> argv;
        for (auto& arg : args)
            argv.push_back(arg.data());
        argv.push_back(nullptr);

        if (freopen("/dev/null", "w", stdout) == nullptr) {
        }
        if (freopen("/dev/null", "w", stderr) == nullptr) {
        }
        execv(path_.c_str(), argv.data());
        _exit(127);
    }

    Logger::info("Launched browser: " + path_ + " (PID " + std::to_string(pid_) + ")");
    if (!wait_for_port(options.port, options.ready_timeout)) {
        Logger::error("Browser did not open DevTools port " + std::to_string(options.port));
        stop();
        return false;
    }
    return true;
}

void BrowserLauncher::stop() {
    if (pid_ > 0) {
        Logger::info("Closing browser (PID " + std::to_string(pid_) + ")...");
        kill(pid_, SIGTERM);
        waitpid(pid_, nullptr, 0);
        pid_ = -1;
    }
    if (!profile_dir_.empty()) {
        std::error_code ec;
        std::filesystem::remove_all(profile_dir_, ec);
        profile_dir_.clear();
    }
}

}  // namespace Launcher
}  // namespace Browser
}  // namespace Harvester
