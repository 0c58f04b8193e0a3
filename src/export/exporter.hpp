#pragma once
#include <optional>
#include <string>
#include <vector>

#include "../engine/aggregator/records.hpp"
#include "../storage/storage.hpp"

namespace Harvester {
namespace Export {

enum class SerpFormat { Json, Jsonl, Csv };
enum class KeywordFormat { Json, Csv, Txt };

// Both throw Core::ConfigError on unknown names.
SerpFormat    parse_serp_format(const std::string& name);
KeywordFormat parse_keyword_format(const std::string& name);

const char* extension(SerpFormat format);
const char* extension(KeywordFormat format);

/**
 * @brief Writes HarvestReports to a Storage in the supported formats.
 *
 * Files are named <name>.<ext>; without a name the default is
 * serp_results_<stamp> or keywords_<stamp>. Names are sanitized.
 */
class Exporter {
public:
    explicit Exporter(Storage::Storage& storage);

    // Location written to, or nullopt when there was nothing to write or the write failed.
    std::optional<std::string>
    export_serps(const Engine::HarvestReport& report, SerpFormat format, const std::string& name = "");

    std::optional<std::string> export_keywords(const Engine::HarvestReport& report,
                                               KeywordFormat                format,
                                               const std::string&           name             = "",
                                               bool                         include_metadata = false);

    static std::string serps_to_json(const std::vector<Engine::SerpResult>& serps);
    static std::string serps_to_jsonl(const std::vector<Engine::SerpResult>& serps);
    // Nested lists are JSON-encoded inside their cells.
    static std::string serps_to_csv(const std::vector<Engine::SerpResult>& serps);

    static std::string keywords_to_json(const Engine::HarvestReport& report);
    static std::string keywords_to_csv(const Engine::KeywordForest& forest);
    static std::string keywords_to_txt(const Engine::HarvestReport& report, bool include_metadata);

    static std::string default_name(const std::string& prefix, Engine::SystemClock::time_point when);

    // RFC 4180: quoted only when it contains a comma, quote or line break.
    static std::string csv_escape(const std::string& field);

private:
    Storage::Storage& storage_;

    std::optional<std::string> write(const std::string& name, const char* ext, const std::string& content);
};

}  // namespace Export
}  // namespace Harvester
