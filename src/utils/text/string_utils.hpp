#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace Harvester {
namespace Utils {
namespace Text {

std::string trim(const std::string& str);
std::string to_lower(const std::string& str);
bool        starts_with(const std::string& str, const std::string& prefix);
bool        ends_with(const std::string& str, const std::string& suffix);

// Trims, then replaces every run of whitespace with a single space.
std::string collapse_whitespace(const std::string& str);

std::vector<std::string> split_words(const std::string& str);

// Replaces characters that are invalid in file names and caps the length.
std::string sanitize_filename(const std::string& name, size_t max_length = 200);

std::string base64_encode(const std::string& input);

// Local time, e.g. 2024-05-01T13:45:10
std::string to_iso8601(std::chrono::system_clock::time_point tp);
// Local time, e.g. 20240501_134510
std::string to_file_stamp(std::chrono::system_clock::time_point tp);

}  // namespace Text
}  // namespace Utils
}  // namespace Harvester
