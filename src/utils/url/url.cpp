#include "url.hpp"
#include <string_view>
#include "../text/string_utils.hpp"

namespace Harvester {
namespace Utils {

namespace {

void split_authority(const std::string& authority, UrlParsed& parsed) {
    std::string host_port = authority;

    size_t at = authority.find_last_of('@');
    if (at != std::string::npos) {
        std::string userinfo = authority.substr(0, at);
        host_port            = authority.substr(at + 1);
        size_t colon         = userinfo.find(':');
        if (colon != std::string::npos) {
            parsed.username = userinfo.substr(0, colon);
            parsed.password = userinfo.substr(colon + 1);
        }
        else {
            parsed.username = userinfo;
        }
    }

    if (!host_port.empty() && host_port[0] == '[') {
        size_t end_bracket = host_port.find(']');
        if (end_bracket == std::string::npos) {
            parsed.host = host_port;
            return;
        }
        parsed.host    = host_port.substr(0, end_bracket + 1);
        size_t p_colon = host_port.find(':', end_bracket + 1);
        if (p_colon != std::string::npos)
            parsed.port = host_port.substr(p_colon + 1);
        return;
    }

    size_t p_colon = host_port.find_last_of(':');
    if (p_colon != std::string::npos) {
        parsed.host = host_port.substr(0, p_colon);
        parsed.port = host_port.substr(p_colon + 1);
    }
    else {
        parsed.host = host_port;
    }
}

}  // namespace

UrlParsed Url::parse(const std::string& url) {
    UrlParsed parsed;

    if (url.empty()) {
        parsed.path = "/";
        return parsed;
    }

    std::string_view sv = url;

    size_t colon       = sv.find(':');
    size_t first_slash = sv.find('/');
    size_t first_q     = sv.find('?');
    size_t first_h     = sv.find('#');
    bool   has_scheme  = (colon != std::string_view::npos);
    if (has_scheme && first_slash != std::string_view::npos && colon > first_slash)
        has_scheme = false;
    if (has_scheme && first_q != std::string_view::npos && colon > first_q)
        has_scheme = false;
    if (has_scheme && first_h != std::string_view::npos && colon > first_h)
        has_scheme = false;

    if (has_scheme) {
        parsed.scheme = Text::to_lower(std::string(sv.substr(0, colon)));
        sv.remove_prefix(colon + 1);
    }

    if (sv.size() >= 2 && sv[0] == '/' && sv[1] == '/') {
        sv.remove_prefix(2);
        size_t      end_auth  = sv.find_first_of("/?#");
        std::string authority = std::string(sv.substr(0, end_auth));
        if (end_auth != std::string_view::npos)
            sv.remove_prefix(end_auth);
        else
            sv = "";

        if (!authority.empty())
            split_authority(authority, parsed);
    }

    size_t h_pos = sv.find('#');
    if (h_pos != std::string_view::npos) {
        parsed.fragment = std::string(sv.substr(h_pos + 1));
        sv              = sv.substr(0, h_pos);
    }

    size_t q_pos = sv.find('?');
    if (q_pos != std::string_view::npos) {
        parsed.query = std::string(sv.substr(q_pos + 1));
        sv           = sv.substr(0, q_pos);
    }

    parsed.path = std::string(sv);
    if (parsed.path.empty())
        parsed.path = "/";
    return parsed;
}

std::string Url::encode_component(const std::string& value) {
    static const char* hex = "0123456789ABCDEF";
    std::string        out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-'
            || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        }
        else if (c == ' ') {
            out.push_back('+');
        }
        else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

std::string Url::decode_component(const std::string& value) {
    auto hex_value = [](char c) -> int {
        if (c >= '0' && c <= '9')
            return c - '0';
        if (c >= 'a' && c <= 'f')
            return c - 'a' + 10;
        if (c >= 'A' && c <= 'F')
            return c - 'A' + 10;
        return -1;
    };

    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '+') {
            out.push_back(' ');
        }
        else if (c == '%' && i + 2 < value.size()) {
            int hi = hex_value(value[i + 1]);
            int lo = hex_value(value[i + 2]);
            if (hi < 0 || lo < 0) {
                out.push_back(c);
                continue;
            }
            out.push_back(static_cast<char>(hi * 16 + lo));
            i += 2;
        }
        else {
            out.push_back(c);
        }
    }
    return out;
}

QueryParams Url::parse_query(const std::string& query) {
    QueryParams params;
    size_t      start = 0;
    while (start <= query.size()) {
        size_t      end  = query.find('&', start);
        std::string pair = query.substr(start, end == std::string::npos ? std::string::npos : end - start);
        if (!pair.empty()) {
            size_t eq = pair.find('=');
            if (eq == std::string::npos)
                params.emplace_back(decode_component(pair), "");
            else
                params.emplace_back(decode_component(pair.substr(0, eq)),
                                    decode_component(pair.substr(eq + 1)));
        }
        if (end == std::string::npos)
            break;
        start = end + 1;
    }
    return params;
}

std::string Url::build_query(const QueryParams& params) {
    std::string query;
    for (const auto& [key, value] : params) {
        if (!query.empty())
            query += '&';
        query += encode_component(key) + "=" + encode_component(value);
    }
    return query;
}

std::string Url::with_query(const std::string& base, const QueryParams& params) {
    if (params.empty())
        return base;
    char separator = base.find('?') == std::string::npos ? '?' : '&';
    return base + separator + build_query(params);
}

std::string Url::domain(const std::string& url) {
    std::string host = Text::to_lower(parse(url).host);
    if (!host.empty() && host.back() == '.')
        host.pop_back();
    if (Text::starts_with(host, "www."))
        host = host.substr(4);
    return host;
}

bool Url::is_http(const std::string& url) {
    UrlParsed p = parse(url);
    return (p.scheme == "http" || p.scheme == "https") && !p.host.empty();
}

}  // namespace Utils
}  // namespace Harvester
