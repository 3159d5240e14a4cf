#pragma once

#include <gumbo.h>

#include <optional>
#include <string>
#include <vector>

// Owns one gumbo parse tree.
class HtmlDocument {
public:
    explicit HtmlDocument(const std::string& html);
    ~HtmlDocument();
    HtmlDocument(const HtmlDocument&) = delete;
    HtmlDocument& operator=(const HtmlDocument&) = delete;

    const GumboNode* root() const { return output_->root; }

private:
    GumboOutput* output_;
};

struct Anchor {
    std::optional<std::string> href;  // present even when empty
    std::string text;                 // visible text, trimmed
    bool wrapsImage = false;
};

// <a> elements in document order.
std::vector<Anchor> extract_anchors(const std::string& html);

std::optional<std::string> attribute(const GumboNode* node, const char* name);
bool has_class(const GumboNode* node, const std::string& cls);

// True if any element below node is a `tag`.
bool contains_tag(const GumboNode* node, GumboTag tag);

// Text content with script/style bodies dropped and outer whitespace trimmed.
std::string visible_text(const GumboNode* node);

// The "N registered" online-user figure from the page footer, or nullopt.
std::optional<long long> find_registered_users(const std::string& html);
