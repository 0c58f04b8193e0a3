#include "socks_handshake.hpp"
#include <cstdint>
#include <vector>

namespace Harvester::Network::Proxy {

namespace net = boost::asio;

namespace {

constexpr uint8_t SOCKS4_VERSION   = 0x04;
constexpr uint8_t SOCKS4_GRANTED   = 0x5A;
constexpr uint8_t SOCKS5_VERSION   = 0x05;
constexpr uint8_t CMD_CONNECT      = 0x01;
constexpr uint8_t AUTH_NONE        = 0x00;
constexpr uint8_t AUTH_USER_PASS   = 0x02;
constexpr uint8_t AUTH_REJECTED    = 0xFF;
constexpr uint8_t ATYP_IPV4        = 0x01;
constexpr uint8_t ATYP_DOMAIN      = 0x03;
constexpr uint8_t ATYP_IPV6        = 0x04;

uint16_t parse_port(const std::string& port) {
    int value = 0;
    try {
        value = std::stoi(port);
    } catch (const std::exception&) {
        throw ProxyError("invalid target port '" + port + "'");
    }
    if (value <= 0 || value > 65535)
        throw ProxyError("invalid target port '" + port + "'");
    return static_cast<uint16_t>(value);
}

void put_u16(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value >> 8));
    out.push_back(static_cast<uint8_t>(value & 0xFF));
}

void put_string(std::vector<uint8_t>& out, const std::string& value) {
    out.insert(out.end(), value.begin(), value.end());
}

const char* socks5_reply_text(uint8_t code) {
    switch (code) {
        case 0x01: return "general failure";
        case 0x02: return "connection not allowed";
        case 0x03: return "network unreachable";
        case 0x04: return "host unreachable";
        case 0x05: return "connection refused";
        case 0x06: return "TTL expired";
        case 0x07: return "command not supported";
        case 0x08: return "address type not supported";
    }
    return "unknown error";
}

}  // namespace

net::awaitable<void> SocksHandshake::perform_socks4(boost::beast::tcp_stream& stream,
                                                    const std::string&    host,
                                                    const std::string&    port,
                                                    const std::string&    user_id) {
    boost::system::error_code ec;
    net::ip::address          addr = net::ip::make_address(host, ec);
    bool                      use_4a = ec || !addr.is_v4();

    std::vector<uint8_t> request;
    request.push_back(SOCKS4_VERSION);
    request.push_back(CMD_CONNECT);
    put_u16(request, parse_port(port));

    if (use_4a) {
        // 0.0.0.x tells a 4a server that a hostname follows the user id.
        request.insert(request.end(), {0x00, 0x00, 0x00, 0x01});
    }
    else {
        auto bytes = addr.to_v4().to_bytes();
        request.insert(request.end(), bytes.begin(), bytes.end());
    }
    put_string(request, user_id);
    request.push_back(0x00);
    if (use_4a) {
        put_string(request, host);
        request.push_back(0x00);
    }

    co_await net::async_write(stream, net::buffer(request), net::use_awaitable);

    std::vector<uint8_t> reply(8);
    co_await             net::async_read(stream, net::buffer(reply), net::use_awaitable);

    if (reply[1] != SOCKS4_GRANTED)
        throw ProxyError("SOCKS4 request rejected (code " + std::to_string(reply[1]) + ")");
    co_return;
}

net::awaitable<void> SocksHandshake::perform_socks5(boost::beast::tcp_stream& stream,
                                                    const std::string&      host,
                                                    const std::string&      port,
                                                    const SocksCredentials& credentials) {
    if (host.size() > 255)
        throw ProxyError("SOCKS5 hostname too long");

    std::vector<uint8_t> greeting{SOCKS5_VERSION};
    if (credentials.empty()) {
        greeting.insert(greeting.end(), {0x01, AUTH_NONE});
    }
    else {
        greeting.insert(greeting.end(), {0x02, AUTH_NONE, AUTH_USER_PASS});
    }
    co_await net::async_write(stream, net::buffer(greeting), net::use_awaitable);

    std::vector<uint8_t> choice(2);
    co_await             net::async_read(stream, net::buffer(choice), net::use_awaitable);

    if (choice[0] != SOCKS5_VERSION || choice[1] == AUTH_REJECTED)
        throw ProxyError("SOCKS5 proxy rejected all authentication methods");

    if (choice[1] == AUTH_USER_PASS) {
        if (credentials.empty() || credentials.username.size() > 255
            || credentials.password.size() > 255)
            throw ProxyError("SOCKS5 proxy requires valid credentials");

        std::vector<uint8_t> auth{0x01, static_cast<uint8_t>(credentials.username.size())};
        put_string(auth, credentials.username);
        auth.push_back(static_cast<uint8_t>(credentials.password.size()));
        put_string(auth, credentials.password);
        co_await net::async_write(stream, net::buffer(auth), net::use_awaitable);

        std::vector<uint8_t> status(2);
        co_await             net::async_read(stream, net::buffer(status), net::use_awaitable);
        if (status[1] != 0x00)
            throw ProxyError("SOCKS5 authentication failed");
    }
    else if (choice[1] != AUTH_NONE) {
        throw ProxyError("SOCKS5 proxy chose an unsupported authentication method");
    }

    std::vector<uint8_t> request{SOCKS5_VERSION, CMD_CONNECT, 0x00, ATYP_DOMAIN,
                                 static_cast<uint8_t>(host.size())};
    put_string(request, host);
    put_u16(request, parse_port(port));
    co_await net::async_write(stream, net::buffer(request), net::use_awaitable);

    std::vector<uint8_t> header(4);
    co_await             net::async_read(stream, net::buffer(header), net::use_awaitable);
    if (header[1] != 0x00)
        throw ProxyError(std::string("SOCKS5 connect failed: ") + socks5_reply_text(header[1]));

    size_t len = 0;
    if (header[3] == ATYP_IPV4) {
        len = 4;
    }
    else if (header[3] == ATYP_DOMAIN) {
        uint8_t  domain_len = 0;
        co_await net::async_read(stream, net::buffer(&domain_len, 1), net::use_awaitable);
        len = domain_len;
    }
    else if (header[3] == ATYP_IPV6) {
        len = 16;
    }

    // Bound address and port, unused.
    std::vector<uint8_t> bound(len + 2);
    co_await             net::async_read(stream, net::buffer(bound), net::use_awaitable);
    co_return;
}

}  // namespace Harvester::Network::Proxy
