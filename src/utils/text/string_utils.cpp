#include "string_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace Harvester {
namespace Utils {
namespace Text {

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n\f\v");
    if (std::string::npos == first) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n\f\v");
    return str.substr(first, (last - first + 1));
}

std::string to_lower(const std::string& str) {
    std::string lower = str;
    std::transform(
        lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    return lower;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.rfind(prefix, 0) == 0;
}

bool ends_with(const std::string& str, const std::string& suffix) {
    if (suffix.size() > str.size())
        return false;
    return std::equal(suffix.rbegin(), suffix.rend(), str.rbegin());
}

std::string collapse_whitespace(const std::string& str) {
    std::string out;
    out.reserve(str.size());
    bool pending_space = false;
    for (unsigned char c : str) {
        if (std::isspace(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(static_cast<char>(c));
    }
    return out;
}

std::vector<std::string> split_words(const std::string& str) {
    std::vector<std::string> words;
    std::istringstream       in(str);
    std::string              word;
    while (in >> word)
        words.push_back(word);
    return words;
}

std::string sanitize_filename(const std::string& name, size_t max_length) {
    static const std::string invalid = "<>:\"/\\|?*";
    std::string              out     = name;
    for (char& c : out) {
        if (invalid.find(c) != std::string::npos)
            c = '_';
    }
    if (out.size() > max_length)
        out.resize(max_length);
    return out;
}

std::string base64_encode(const std::string& input) {
    static const char* alphabet =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string out;
    out.reserve(((input.size() + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 2 < input.size(); i += 3) {
        uint32_t n = (static_cast<uint8_t>(input[i]) << 16)
                   | (static_cast<uint8_t>(input[i + 1]) << 8) | static_cast<uint8_t>(input[i + 2]);
        out.push_back(alphabet[(n >> 18) & 0x3F]);
        out.push_back(alphabet[(n >> 12) & 0x3F]);
        out.push_back(alphabet[(n >> 6) & 0x3F]);
        out.push_back(alphabet[n & 0x3F]);
    }
    if (i + 1 == input.size()) {
        uint32_t n = static_cast<uint8_t>(input[i]) << 16;
        out.push_back(alphabet[(n >> 18) & 0x3F]);
        out.push_back(alphabet[(n >> 12) & 0x3F]);
        out += "==";
    }
    else if (i + 2 == input.size()) {
        uint32_t n = (static_cast<uint8_t>(input[i]) << 16) | (static_cast<uint8_t>(input[i + 1]) << 8);
        out.push_back(alphabet[(n >> 18) & 0x3F]);
        out.push_back(alphabet[(n >> 12) & 0x3F]);
        out.push_back(alphabet[(n >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

namespace {
std::string format_local(std::chrono::system_clock::time_point tp, const char* format) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm     local{};
    localtime_r(&t, &local);
    std::ostringstream out;
    out << std::put_time(&local, format);
    return out.str();
}
}  // namespace

std::string to_iso8601(std::chrono::system_clock::time_point tp) {
    return format_local(tp, "%Y-%m-%dT%H:%M:%S");
}

std::string to_file_stamp(std::chrono::system_clock::time_point tp) {
    return format_local(tp, "%Y%m%d_%H%M%S");
}

}  // namespace Text
}  // namespace Utils
}  // namespace Harvester
