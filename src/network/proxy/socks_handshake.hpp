#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <stdexcept>
#include <string>

namespace Harvester::Network::Proxy {

// A proxy refused or broke the tunnel setup.
class ProxyError : public std::runtime_error {
public:
    explicit ProxyError(const std::string& what) : std::runtime_error(what) {
    }
};

struct SocksCredentials {
    std::string username;
    std::string password;

    bool empty() const {
        return username.empty();
    }
};

/**
 * @brief SOCKS4/4a and SOCKS5 client handshakes on an already connected stream.
 *
 * On return the stream is a tunnel to host:port. The stream's own deadline
 * applies to every read and write. Failures throw ProxyError;
 * socket errors propagate as boost::system::system_error.
 */
class SocksHandshake {
public:
    /**
     * @brief SOCKS4 when host is an IPv4 literal, SOCKS4a otherwise.
     * @param user_id Sent as the SOCKS4 USERID field, may be empty.
     */
    static boost::asio::awaitable<void> perform_socks4(boost::beast::tcp_stream&     stream,
                                                       const std::string&            host,
                                                       const std::string&            port,
                                                       const std::string&            user_id = "");

    /**
     * @brief SOCKS5 with remote name resolution.
     *
     * Offers username/password authentication (RFC 1929) when credentials
     * are given, otherwise only "no authentication".
     */
    static boost::asio::awaitable<void> perform_socks5(boost::beast::tcp_stream&     stream,
                                                       const std::string&            host,
                                                       const std::string&            port,
                                                       const SocksCredentials& credentials = {});
};

}  // namespace Harvester::Network::Proxy
