#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <chrono>
#include <string>

namespace Harvester {
namespace Network {
namespace Http {

enum class ErrorType { None, Network, Proxy, Timeout, Render, Browser };

inline const char* to_string(ErrorType type) {
    switch (type) {
        case ErrorType::None: return "none";
        case ErrorType::Network: return "network";
        case ErrorType::Proxy: return "proxy";
        case ErrorType::Timeout: return "timeout";
        case ErrorType::Render: return "render";
        case ErrorType::Browser: return "browser";
    }
    return "unknown";
}

// status_code is 0 when no HTTP response was received.
struct Response {
    std::string effective_url;
    long        status_code = 0;
    std::string content_type;
    std::string body;
    std::string error;
    bool        success    = false;
    ErrorType   error_type = ErrorType::None;
};

/**
 * @brief One-request-at-a-time asynchronous client.
 *
 * Settings apply to subsequent calls. Implementations never throw from get();
 * transport problems come back as a Response with error_type set.
 */
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Empty string means a direct connection.
    virtual void set_proxy(const std::string& proxy) = 0;
    virtual void set_connect_timeout(std::chrono::milliseconds /*timeout*/) {
    }
    virtual void set_request_timeout(std::chrono::milliseconds /*timeout*/) {
    }
    virtual void set_user_agent(const std::string& /*user_agent*/) {
    }
    virtual void set_accept_language(const std::string& /*language*/) {
    }

    virtual boost::asio::awaitable<Response> get(const std::string& url) = 0;

    // Aborts an outstanding get(). Must be called on the executor get() runs on.
    virtual void cancel() {
    }
};

}  // namespace Http
}  // namespace Network
}  // namespace Harvester
