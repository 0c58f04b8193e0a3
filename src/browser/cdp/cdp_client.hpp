#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace Harvester {
namespace Browser {
namespace CDP {

// A DevTools command came back with an error object, or the session broke.
class CDPError : public std::runtime_error {
public:
    explicit CDPError(const std::string& what) : std::runtime_error(what) {
    }
};

// The whole render ran past its deadline.
class CDPTimeout : public std::runtime_error {
public:
    explicit CDPTimeout(const std::string& what) : std::runtime_error(what) {
    }
};

struct RenderOptions {
    std::string               proxy_server;  // scheme://host:port, empty for direct
    std::string               proxy_username;
    std::string               proxy_password;
    std::string               user_agent;
    std::string               accept_language;
    std::chrono::milliseconds timeout{60000};
};

struct RenderResult {
    std::string html;
    std::string final_url;
    long        status_code = 0;
};

/**
 * @brief Browser-level DevTools connection over a Beast WebSocket.
 *
 * Each render() creates its own browser context (so each page can use its
 * own proxy), attaches to a fresh target with a flattened session, waits
 * for the load event and returns the serialized DOM. The context is
 * disposed before returning.
 */
class CDPClient {
public:
    CDPClient(std::string host, int port);
    ~CDPClient();

    CDPClient(const CDPClient&)            = delete;
    CDPClient& operator=(const CDPClient&) = delete;

    boost::asio::awaitable<RenderResult> render(const std::string& url, const RenderOptions& options);

    boost::asio::awaitable<void> connect();
    boost::asio::awaitable<void> close();

private:
    using WebSocket = boost::beast::websocket::stream<boost::beast::tcp_stream>;

    // Shared with the deadline handler, which may fire after render() returns.
    struct Connection {
        explicit Connection(const boost::asio::any_io_executor& ex) : ws(ex), deadline(ex) {
        }
        WebSocket                 ws;
        boost::asio::steady_timer deadline;
        bool                      timed_out = false;
    };

    std::string                 host_;
    int                         port_;
    std::shared_ptr<Connection> conn_;
    int                         next_id_ = 1;
    std::deque<nlohmann::json>  events_;
    std::map<int, nlohmann::json> replies_;
    const RenderOptions*        active_ = nullptr;  // set while render() runs

    boost::asio::awaitable<std::string> get_web_socket_url();

    void arm_deadline(std::chrono::milliseconds timeout);

    boost::asio::awaitable<nlohmann::json> call(const std::string&    method,
                                                nlohmann::json        params     = nlohmann::json::object(),
                                                const std::string&    session_id = "");
    boost::asio::awaitable<nlohmann::json> read_message();
    boost::asio::awaitable<void>           pump();
    boost::asio::awaitable<nlohmann::json> wait_for_event(const std::string& method,
                                                          const std::string& session_id);
    boost::asio::awaitable<bool>           handle_fetch_event(const nlohmann::json& event);
};

}  // namespace CDP
}  // namespace Browser
}  // namespace Harvester
