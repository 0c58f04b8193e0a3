#include "html_document.hpp"
#include "../../utils/text/string_utils.hpp"

namespace Harvester {
namespace Extract {
namespace Dom {

HtmlDocument::HtmlDocument(const std::string& html)
    : html_(html), output_(gumbo_parse_with_options(&kGumboDefaultOptions, html_.data(), html_.size())) {
}

HtmlDocument::~HtmlDocument() {
    gumbo_destroy_output(&kGumboDefaultOptions, output_);
}

// Template contents are parsed as a separate node type with the same layout.
bool is_element(const GumboNode* node) {
    return node && (node->type == GUMBO_NODE_ELEMENT || node->type == GUMBO_NODE_TEMPLATE);
}

bool is_tag(const GumboNode* node, GumboTag tag) {
    return is_element(node) && node->v.element.tag == tag;
}

const char* attribute(const GumboNode* node, const char* name) {
    if (!is_element(node))
        return nullptr;
    const GumboAttribute* attr = gumbo_get_attribute(&node->v.element.attributes, name);
    return attr ? attr->value : nullptr;
}

bool has_attribute(const GumboNode* node, const char* name) {
    return attribute(node, name) != nullptr;
}

bool has_class(const GumboNode* node, const std::string& class_name) {
    const char* classes = attribute(node, "class");
    if (!classes)
        return false;
    for (const auto& token : Utils::Text::split_words(classes)) {
        if (token == class_name)
            return true;
    }
    return false;
}

bool has_any_class(const GumboNode* node, const std::vector<std::string>& class_names) {
    const char* classes = attribute(node, "class");
    if (!classes)
        return false;
    for (const auto& token : Utils::Text::split_words(classes)) {
        for (const auto& name : class_names) {
            if (token == name)
                return true;
        }
    }
    return false;
}

namespace {

// Traversals keep an explicit stack; nesting depth in fetched markup is unbounded.
void push_children(const GumboNode* node, std::vector<const GumboNode*>& stack) {
    const GumboVector* children = &node->v.element.children;
    for (unsigned int i = children->length; i > 0; --i)
        stack.push_back(static_cast<const GumboNode*>(children->data[i - 1]));
}

void append_text(const GumboNode* root, std::string& out) {
    std::vector<const GumboNode*> stack{root};
    while (!stack.empty()) {
        const GumboNode* node = stack.back();
        stack.pop_back();
        switch (node->type) {
            case GUMBO_NODE_TEXT:
            case GUMBO_NODE_CDATA:
            case GUMBO_NODE_WHITESPACE:
                out += node->v.text.text;
                break;
            case GUMBO_NODE_ELEMENT:
            case GUMBO_NODE_TEMPLATE: {
                // Script and style text is not visible content.
                GumboTag tag = node->v.element.tag;
                if (tag != GUMBO_TAG_SCRIPT && tag != GUMBO_TAG_STYLE)
                    push_children(node, stack);
                break;
            }
            default:
                break;
        }
    }
}

void walk(const GumboNode* start, const NodePredicate& predicate, bool stop_at_match,
          std::vector<const GumboNode*>& out) {
    if (!is_element(start))
        return;
    std::vector<const GumboNode*> stack;
    push_children(start, stack);
    while (!stack.empty()) {
        const GumboNode* node = stack.back();
        stack.pop_back();
        if (!is_element(node))
            continue;
        bool matched = predicate(node);
        if (matched)
            out.push_back(node);
        if (!(matched && stop_at_match))
            push_children(node, stack);
    }
}

const GumboNode* first(const GumboNode* start, const NodePredicate& predicate) {
    if (!is_element(start))
        return nullptr;
    std::vector<const GumboNode*> stack;
    push_children(start, stack);
    while (!stack.empty()) {
        const GumboNode* node = stack.back();
        stack.pop_back();
        if (!is_element(node))
            continue;
        if (predicate(node))
            return node;
        push_children(node, stack);
    }
    return nullptr;
}

}  // namespace

std::string text_content(const GumboNode* node) {
    std::string raw;
    if (node)
        append_text(node, raw);
    return Utils::Text::collapse_whitespace(raw);
}

const GumboNode* find_first(const GumboNode* start, const NodePredicate& predicate) {
    return start ? first(start, predicate) : nullptr;
}

std::vector<const GumboNode*> find_all(const GumboNode* start, const NodePredicate& predicate) {
    std::vector<const GumboNode*> out;
    if (start)
        walk(start, predicate, false, out);
    return out;
}

std::vector<const GumboNode*> find_outermost(const GumboNode* start, const NodePredicate& predicate) {
    std::vector<const GumboNode*> out;
    if (start)
        walk(start, predicate, true, out);
    return out;
}

}  // namespace Dom
}  // namespace Extract
}  // namespace Harvester
