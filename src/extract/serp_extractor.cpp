#include "serp_extractor.hpp"
#include <algorithm>
#include <cstring>
#include "../core/types/errors.hpp"
#include "../utils/text/string_utils.hpp"
#include "../utils/url/url.hpp"
#include "dom/html_document.hpp"

namespace Harvester {
namespace Extract {

using namespace Dom;

namespace {

const std::vector<std::string> RESULT_BLOCK_CLASSES = {"tF2Cxc", "Ww4FFb"};
const std::vector<std::string> SNIPPET_CLASSES      = {"VwiC3b", "yXK7lf", "lEBKkf"};
const std::vector<std::string> RELATED_CLASSES      = {"dg6jd", "s75CSd"};

constexpr size_t MIN_RELATED_LENGTH = 3;

void add_unique(std::vector<std::string>& list, const std::string& value) {
    if (std::find(list.begin(), list.end(), value) == list.end())
        list.push_back(value);
}

bool is_result_link(const GumboNode* node) {
    if (!is_tag(node, GUMBO_TAG_A) || !has_attribute(node, "href"))
        return false;
    const char* role = attribute(node, "role");
    return !(role && std::strcmp(role, "button") == 0);
}

bool is_snippet(const GumboNode* node) {
    if (has_any_class(node, SNIPPET_CLASSES))
        return true;
    const char* sncf = attribute(node, "data-sncf");
    return sncf && std::strcmp(sncf, "1") == 0;
}

bool is_results_container(const GumboNode* node) {
    const char* id = attribute(node, "id");
    return id && (std::strcmp(id, "search") == 0 || std::strcmp(id, "rso") == 0);
}

// ".AJLUJb .b2Rnsc a", ".dg6jd", ".s75CSd"
void collect_related(const GumboNode* root, std::vector<std::string>& out) {
    std::vector<const GumboNode*> nodes;
    for (const auto* block : find_all(root, [](const GumboNode* n) { return has_class(n, "AJLUJb"); })) {
        for (const auto* inner : find_all(block, [](const GumboNode* n) { return has_class(n, "b2Rnsc"); })) {
            auto links = find_all(inner, [](const GumboNode* n) { return is_tag(n, GUMBO_TAG_A); });
            nodes.insert(nodes.end(), links.begin(), links.end());
        }
    }
    auto others = find_all(root, [](const GumboNode* n) { return has_any_class(n, RELATED_CLASSES); });
    nodes.insert(nodes.end(), others.begin(), others.end());

    for (const auto* node : nodes) {
        std::string text = text_content(node);
        if (text.size() >= MIN_RELATED_LENGTH)
            add_unique(out, text);
    }
}

// ".related-question-pair span", "[data-sgrd] div[role=button]"
void collect_questions(const GumboNode* root, std::vector<std::string>& out) {
    std::vector<const GumboNode*> nodes;
    for (const auto* pair : find_all(root, [](const GumboNode* n) { return has_class(n, "related-question-pair"); })) {
        auto spans = find_all(pair, [](const GumboNode* n) { return is_tag(n, GUMBO_TAG_SPAN); });
        nodes.insert(nodes.end(), spans.begin(), spans.end());
    }
    for (const auto* group : find_all(root, [](const GumboNode* n) { return has_attribute(n, "data-sgrd"); })) {
        auto buttons = find_all(group, [](const GumboNode* n) {
            const char* role = attribute(n, "role");
            return is_tag(n, GUMBO_TAG_DIV) && role && std::strcmp(role, "button") == 0;
        });
        nodes.insert(nodes.end(), buttons.begin(), buttons.end());
    }

    for (const auto* node : nodes) {
        std::string text = text_content(node);
        if (!text.empty() && text.find('?') != std::string::npos)
            add_unique(out, text);
    }
}

}  // namespace

std::string SerpExtractor::resolve_result_link(const std::string& href) {
    if (!Utils::Text::starts_with(href, "/url?"))
        return href;
    for (const auto& [key, value] : Utils::Url::parse_query(href.substr(5))) {
        if (key == "q" || key == "url")
            return value;
    }
    return href;
}

ExtractionResult SerpExtractor::extract(const std::string& html,
                                        const std::string& keyword,
                                        int                page) const {
    ExtractionResult result;
    result.serp.keyword      = keyword;
    result.serp.page         = page;
    result.serp.retrieved_at = Engine::SystemClock::now();

    HtmlDocument     doc(html);
    const GumboNode* root = doc.root();

    auto blocks = find_outermost(root, [](const GumboNode* n) { return has_any_class(n, RESULT_BLOCK_CLASSES); });
    bool has_container = find_first(root, is_results_container) != nullptr;
    if (!has_container && blocks.empty())
        throw Core::ParseError("no search results container for '" + keyword + "' page "
                               + std::to_string(page));

    for (const auto* block : blocks) {
        const GumboNode* link  = find_first(block, is_result_link);
        const GumboNode* title = find_first(block, [](const GumboNode* n) { return is_tag(n, GUMBO_TAG_H3); });

        std::string url        = link ? resolve_result_link(attribute(link, "href")) : "";
        std::string title_text = title ? text_content(title) : "";
        if (!Utils::Url::is_http(url) || title_text.empty()) {
            result.skipped++;
            continue;
        }

        Engine::OrganicResult organic;
        organic.url         = url;
        organic.title       = title_text;
        organic.description = text_content(find_first(block, is_snippet));
        organic.domain      = Utils::Url::domain(url);
        organic.position    = static_cast<int>(result.serp.organic.size()) + 1;
        result.serp.organic.push_back(std::move(organic));
    }

    collect_related(root, result.serp.related_keywords);
    collect_questions(root, result.serp.people_also_ask);
    result.serp.skipped = result.skipped;
    return result;
}

}  // namespace Extract
}  // namespace Harvester
