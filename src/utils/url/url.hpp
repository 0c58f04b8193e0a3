#pragma once
#include <string>
#include <utility>
#include <vector>

namespace Harvester {
namespace Utils {

struct UrlParsed {
    std::string scheme;
    std::string username;
    std::string password;
    std::string host;
    std::string port;
    std::string path;
    std::string query;
    std::string fragment;
};

using QueryParams = std::vector<std::pair<std::string, std::string>>;

class Url {
public:
    static UrlParsed parse(const std::string& url);

    // application/x-www-form-urlencoded, spaces become '+'.
    static std::string encode_component(const std::string& value);
    // Inverse of encode_component; '+' decodes to a space.
    static std::string decode_component(const std::string& value);
    static std::string build_query(const QueryParams& params);
    static QueryParams parse_query(const std::string& query);
    static std::string with_query(const std::string& base, const QueryParams& params);

    // Lower-cased host without a leading "www.".
    static std::string domain(const std::string& url);
    static bool        is_http(const std::string& url);
};

}  // namespace Utils
}  // namespace Harvester
