#pragma once
#include <gumbo.h>
#include <functional>
#include <string>
#include <vector>

namespace Harvester {
namespace Extract {
namespace Dom {

// Owns a gumbo parse tree.
class HtmlDocument {
public:
    explicit HtmlDocument(const std::string& html);
    ~HtmlDocument();

    HtmlDocument(const HtmlDocument&)            = delete;
    HtmlDocument& operator=(const HtmlDocument&) = delete;

    const GumboNode* root() const {
        return output_->root;
    }

private:
    std::string  html_;  // gumbo points into this buffer
    GumboOutput* output_;
};

using NodePredicate = std::function<bool(const GumboNode*)>;

bool        is_element(const GumboNode* node);
bool        is_tag(const GumboNode* node, GumboTag tag);
const char* attribute(const GumboNode* node, const char* name);
bool        has_attribute(const GumboNode* node, const char* name);
bool        has_class(const GumboNode* node, const std::string& class_name);
bool        has_any_class(const GumboNode* node, const std::vector<std::string>& class_names);

// Concatenated descendant text with whitespace collapsed, like textContent().trim().
std::string text_content(const GumboNode* node);

// Pre-order (document order). Does not test the start node itself.
const GumboNode*              find_first(const GumboNode* start, const NodePredicate& predicate);
std::vector<const GumboNode*> find_all(const GumboNode* start, const NodePredicate& predicate);

/**
 * @brief Like find_all, but does not descend into a node that matched.
 *
 * For selector lists whose matches may nest (".a, .b" where a .b sits inside
 * an .a) this keeps only the outermost match.
 */
std::vector<const GumboNode*> find_outermost(const GumboNode* start, const NodePredicate& predicate);

}  // namespace Dom
}  // namespace Extract
}  // namespace Harvester
