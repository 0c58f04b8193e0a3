#include "exporter.hpp"
#include <cmath>
#include <nlohmann/json.hpp>
#include <sstream>
#include "../core/logger/logger.hpp"
#include "../core/types/errors.hpp"
#include "../utils/text/string_utils.hpp"

namespace Harvester {
namespace Export {

using json = nlohmann::json;
using namespace Harvester::Core;
using namespace Harvester::Engine;
using Harvester::Utils::Text::sanitize_filename;
using Harvester::Utils::Text::to_file_stamp;
using Harvester::Utils::Text::to_iso8601;
using Harvester::Utils::Text::to_lower;

namespace {

std::string dump(const json& value, int indent = -1) {
    return value.dump(indent, ' ', false, json::error_handler_t::replace);
}

double round_to(double value, int digits) {
    double scale = std::pow(10.0, digits);
    return std::round(value * scale) / scale;
}

json organic_to_json(const OrganicResult& result) {
    return {{"url", result.url},
            {"title", result.title},
            {"description", result.description},
            {"domain", result.domain},
            {"position", result.position}};
}

json serp_to_json(const SerpResult& serp) {
    json organic = json::array();
    for (const auto& result : serp.organic)
        organic.push_back(organic_to_json(result));

    return {{"keyword", serp.keyword},
            {"page", serp.page},
            {"url", serp.fetched_url},
            {"organic_results", organic},
            {"related_keywords", serp.related_keywords},
            {"people_also_ask", serp.people_also_ask},
            {"total_results", serp.organic.size()},
            {"skipped_results", serp.skipped},
            {"scraped_at", to_iso8601(serp.retrieved_at)}};
}

json statistics_to_json(const KeywordStatistics& stats) {
    json depths = json::object();
    for (const auto& [depth, count] : stats.depth_distribution)
        depths[std::to_string(depth)] = count;

    json top = json::array();
    for (const auto& entry : stats.top_keywords)
        top.push_back({{"keyword", entry.keyword}, {"relevance", entry.relevance}});

    return {{"total_keywords", stats.total_keywords},
            {"average_relevance", round_to(stats.average_relevance, 2)},
            {"average_keyword_length", round_to(stats.average_length, 1)},
            {"average_word_count", round_to(stats.average_word_count, 1)},
            {"depth_distribution", depths},
            {"top_keywords", top},
            {"long_tail_percentage", round_to(stats.long_tail_percentage, 1)}};
}

json node_to_json(const KeywordNode& node) {
    return {{"keyword", node.text},
            {"relevance", node.relevance},
            {"type", node.suggestion_type},
            {"depth", node.depth},
            {"parent_keyword", node.parent ? json(*node.parent) : json(nullptr)},
            {"source_query", node.source_query},
            {"scraped_at", to_iso8601(node.discovered_at)}};
}

}  // namespace

SerpFormat parse_serp_format(const std::string& name) {
    auto lower = to_lower(name);
    if (lower == "json")
        return SerpFormat::Json;
    if (lower == "jsonl")
        return SerpFormat::Jsonl;
    if (lower == "csv")
        return SerpFormat::Csv;
    throw ConfigError("Unknown export format: " + name + " (expected json, jsonl or csv)");
}

KeywordFormat parse_keyword_format(const std::string& name) {
    auto lower = to_lower(name);
    if (lower == "json")
        return KeywordFormat::Json;
    if (lower == "csv")
        return KeywordFormat::Csv;
    if (lower == "txt")
        return KeywordFormat::Txt;
    throw ConfigError("Unknown export format: " + name + " (expected json, csv or txt)");
}

const char* extension(SerpFormat format) {
    switch (format) {
        case SerpFormat::Json: return "json";
        case SerpFormat::Jsonl: return "jsonl";
        case SerpFormat::Csv: return "csv";
    }
    return "json";
}

const char* extension(KeywordFormat format) {
    switch (format) {
        case KeywordFormat::Json: return "json";
        case KeywordFormat::Csv: return "csv";
        case KeywordFormat::Txt: return "txt";
    }
    return "json";
}

Exporter::Exporter(Storage::Storage& storage) : storage_(storage) {
}

std::string Exporter::default_name(const std::string& prefix, SystemClock::time_point when) {
    return prefix + "_" + to_file_stamp(when);
}

std::string Exporter::csv_escape(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos)
        return field;

    std::string out = "\"";
    for (char c : field) {
        if (c == '"')
            out += "\"\"";
        else
            out += c;
    }
    out += '"';
    return out;
}

std::string Exporter::serps_to_json(const std::vector<SerpResult>& serps) {
    json out = json::array();
    for (const auto& serp : serps)
        out.push_back(serp_to_json(serp));
    return dump(out, 2);
}

std::string Exporter::serps_to_jsonl(const std::vector<SerpResult>& serps) {
    std::string out;
    for (const auto& serp : serps)
        out += dump(serp_to_json(serp)) + "\n";
    return out;
}

std::string Exporter::serps_to_csv(const std::vector<SerpResult>& serps) {
    std::ostringstream out;
    out << "keyword,page,url,total_results,scraped_at,organic_results,related_keywords,people_also_ask\r\n";
    for (const auto& serp : serps) {
        json organic = json::array();
        for (const auto& result : serp.organic)
            organic.push_back(organic_to_json(result));

        out << csv_escape(serp.keyword) << ',' << serp.page << ',' << csv_escape(serp.fetched_url) << ','
            << serp.organic.size() << ',' << to_iso8601(serp.retrieved_at) << ','
            << csv_escape(dump(organic)) << ',' << csv_escape(dump(json(serp.related_keywords))) << ','
            << csv_escape(dump(json(serp.people_also_ask))) << "\r\n";
    }
    return out.str();
}

std::string Exporter::keywords_to_json(const HarvestReport& report) {
    const auto& meta = report.metadata;

    json keywords = json::array();
    for (const auto& node : report.keywords.nodes())
        keywords.push_back(node_to_json(node));

    json out = {{"metadata",
                 {{"language", meta.language},
                  {"country", meta.country},
                  {"data_source", meta.data_source.empty() ? json(nullptr) : json(meta.data_source)},
                  {"max_depth", meta.max_depth},
                  {"seed_count", meta.seed_count},
                  {"generated_at", to_iso8601(meta.generated_at)},
                  {"statistics", statistics_to_json(meta.statistics)}}},
                {"keywords", keywords}};
    return dump(out, 2);
}

std::string Exporter::keywords_to_csv(const KeywordForest& forest) {
    std::ostringstream out;
    out << "keyword,relevance,type,depth,parent_keyword,source_query,scraped_at\r\n";
    for (const auto& node : forest.nodes()) {
        out << csv_escape(node.text) << ',' << node.relevance << ',' << csv_escape(node.suggestion_type) << ','
            << node.depth << ',' << csv_escape(node.parent.value_or("")) << ','
            << csv_escape(node.source_query) << ',' << to_iso8601(node.discovered_at) << "\r\n";
    }
    return out.str();
}

std::string Exporter::keywords_to_txt(const HarvestReport& report, bool include_metadata) {
    std::ostringstream out;
    if (include_metadata) {
        out << "# Generated: " << to_iso8601(report.metadata.generated_at) << "\n";
        out << "# Language: " << report.metadata.language << ", Country: " << report.metadata.country << "\n";
        out << "# Total keywords: " << report.keywords.size() << "\n";
        out << "#" << std::string(70, '=') << "\n\n";
    }
    for (const auto& node : report.keywords.nodes()) {
        out << node.text;
        if (include_metadata)
            out << " (relevance: " << node.relevance << ", depth: " << node.depth << ")";
        out << "\n";
    }
    return out.str();
}

std::optional<std::string> Exporter::write(const std::string& name, const char* ext, const std::string& content) {
    std::string key = sanitize_filename(name) + "." + ext;
    if (!storage_.save(key, content)) {
        Logger::error("Export failed: " + storage_.locate(key));
        return std::nullopt;
    }
    auto location = storage_.locate(key);
    Logger::success("Results exported to: " + location);
    return location;
}

std::optional<std::string>
Exporter::export_serps(const HarvestReport& report, SerpFormat format, const std::string& name) {
    if (report.serps.empty()) {
        Logger::warn("No results to export");
        return std::nullopt;
    }

    std::string base = name.empty() ? default_name("serp_results", SystemClock::now()) : name;
    switch (format) {
        case SerpFormat::Json: return write(base, extension(format), serps_to_json(report.serps));
        case SerpFormat::Jsonl: return write(base, extension(format), serps_to_jsonl(report.serps));
        case SerpFormat::Csv: return write(base, extension(format), serps_to_csv(report.serps));
    }
    return std::nullopt;
}

std::optional<std::string> Exporter::export_keywords(const HarvestReport& report,
                                                     KeywordFormat        format,
                                                     const std::string&   name,
                                                     bool                 include_metadata) {
    if (report.keywords.empty()) {
        Logger::warn("No keywords to export");
        return std::nullopt;
    }

    std::string base = name.empty() ? default_name("keywords", SystemClock::now()) : name;
    switch (format) {
        case KeywordFormat::Json: return write(base, extension(format), keywords_to_json(report));
        case KeywordFormat::Csv: return write(base, extension(format), keywords_to_csv(report.keywords));
        case KeywordFormat::Txt: return write(base, extension(format), keywords_to_txt(report, include_metadata));
    }
    return std::nullopt;
}

}  // namespace Export
}  // namespace Harvester
