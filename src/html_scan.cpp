#include "html_scan.hpp"
#include "errors.hpp"
#include "url_utils.hpp"

#include <functional>
#include <regex>
#include <stdexcept>
#include <utility>

namespace {

const std::string kClassicStatsTitle = "Measured in the last 900 seconds";

bool is_element(const GumboNode* node) {
    return node && node->type == GUMBO_NODE_ELEMENT;
}

void append_text(const GumboNode* node, std::string& out) {
    switch (node->type) {
        case GUMBO_NODE_TEXT:
        case GUMBO_NODE_WHITESPACE:
        case GUMBO_NODE_CDATA:
            out += node->v.text.text;
            return;
        case GUMBO_NODE_ELEMENT: {
            GumboTag tag = node->v.element.tag;
            if (tag == GUMBO_TAG_SCRIPT || tag == GUMBO_TAG_STYLE) return;
            const GumboVector& children = node->v.element.children;
            for (unsigned int i = 0; i < children.length; ++i) {
                append_text(static_cast<const GumboNode*>(children.data[i]), out);
            }
            return;
        }
        default:
            return;
    }
}

// Depth-first, document order. Stops when visit returns true.
const GumboNode* find_element(const GumboNode* node, const std::function<bool(const GumboNode*)>& visit) {
    if (!is_element(node)) return nullptr;
    if (visit(node)) return node;
    const GumboVector& children = node->v.element.children;
    for (unsigned int i = 0; i < children.length; ++i) {
        if (auto found = find_element(static_cast<const GumboNode*>(children.data[i]), visit)) return found;
    }
    return nullptr;
}

} // namespace

// -------------------- document --------------------
HtmlDocument::HtmlDocument(const std::string& html)
    : output_(gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size())) {
    if (!output_) throw CrawlError("failed to parse HTML");
}

HtmlDocument::~HtmlDocument() {
    gumbo_destroy_output(&kGumboDefaultOptions, output_);
}

// -------------------- node helpers --------------------
std::optional<std::string> attribute(const GumboNode* node, const char* name) {
    if (!is_element(node)) return std::nullopt;
    const GumboAttribute* attr = gumbo_get_attribute(&node->v.element.attributes, name);
    if (!attr) return std::nullopt;
    return std::string(attr->value);
}

bool has_class(const GumboNode* node, const std::string& cls) {
    auto value = attribute(node, "class");
    if (!value) return false;
    static const std::regex space_re(R"(\s+)");
    for (std::sregex_token_iterator it(value->begin(), value->end(), space_re, -1), end; it != end; ++it) {
        if (it->str() == cls) return true;
    }
    return false;
}

bool contains_tag(const GumboNode* node, GumboTag tag) {
    if (!is_element(node)) return false;
    const GumboVector& children = node->v.element.children;
    for (unsigned int i = 0; i < children.length; ++i) {
        const GumboNode* child = static_cast<const GumboNode*>(children.data[i]);
        if (is_element(child) && (child->v.element.tag == tag || contains_tag(child, tag))) return true;
    }
    return false;
}

std::string visible_text(const GumboNode* node) {
    std::string text;
    if (node) append_text(node, text);
    return trim(text);
}

// -------------------- queries --------------------
std::vector<Anchor> extract_anchors(const std::string& html) {
    HtmlDocument doc(html);
    std::vector<Anchor> anchors;
    find_element(doc.root(), [&](const GumboNode* node) {
        if (node->v.element.tag == GUMBO_TAG_A) {
            Anchor a;
            a.href = attribute(node, "href");
            a.text = visible_text(node);
            a.wrapsImage = contains_tag(node, GUMBO_TAG_IMG);
            anchors.push_back(std::move(a));
        }
        return false;
    });
    return anchors;
}

// -------------------- online figure --------------------
std::optional<long long> find_registered_users(const std::string& html) {
    static const std::regex registered_re(R"((\d+)\s+registered)");

    HtmlDocument doc(html);
    const GumboNode* block = find_element(doc.root(), [](const GumboNode* node) {
        return has_class(node, "online-stats");
    });

    // The classic theme has no .online-stats; the figure sits in the block
    // two levels above the "measured" span.
    if (!block) {
        const GumboNode* span = find_element(doc.root(), [](const GumboNode* node) {
            return node->v.element.tag == GUMBO_TAG_SPAN && attribute(node, "title") == kClassicStatsTitle;
        });
        if (!span || !is_element(span->parent) || !is_element(span->parent->parent)) return std::nullopt;
        block = span->parent->parent;
    }

    const std::string text = visible_text(block);
    std::smatch m;
    if (!std::regex_search(text, m, registered_re)) return std::nullopt;
    try {
        return std::stoll(m[1].str());
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}
