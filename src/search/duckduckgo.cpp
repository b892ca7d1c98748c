#include "duckduckgo.hpp"
#include "../errors.hpp"
#include <gumbo.h>
#include <cctype>
#include <sstream>

namespace termai {

namespace {

constexpr const char* kUserAgent =
    "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 "
    "(KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36";

constexpr const char* kContainerClass = "result";
constexpr const char* kTitleClass = "result__title";
constexpr const char* kUrlClass = "result__url";
constexpr const char* kSnippetClass = "result__snippet";

// RAII owner for a gumbo parse tree
struct GumboDocument {
    GumboOutput* output;

    explicit GumboDocument(const std::string& html)
        : output(gumbo_parse_with_options(&kGumboDefaultOptions,
                                          html.data(), html.size())) {}
    ~GumboDocument() {
        if (output) gumbo_destroy_output(&kGumboDefaultOptions, output);
    }
    GumboDocument(const GumboDocument&) = delete;
    GumboDocument& operator=(const GumboDocument&) = delete;
};

bool has_class(const GumboNode* node, const std::string& cls) {
    if (node->type != GUMBO_NODE_ELEMENT) return false;
    const GumboAttribute* attr =
        gumbo_get_attribute(&node->v.element.attributes, "class");
    if (!attr || !attr->value) return false;

    std::istringstream tokens(attr->value);
    std::string token;
    while (tokens >> token) {
        if (token == cls) return true;
    }
    return false;
}

// Collect elements with the class, not descending into matches
void collect_by_class(const GumboNode* node, const std::string& cls,
                      std::vector<const GumboNode*>& out) {
    if (node->type != GUMBO_NODE_ELEMENT) return;
    if (has_class(node, cls)) {
        out.push_back(node);
        return;
    }
    const GumboVector& children = node->v.element.children;
    for (unsigned int i = 0; i < children.length; ++i) {
        collect_by_class(static_cast<const GumboNode*>(children.data[i]), cls, out);
    }
}

const GumboNode* find_by_class(const GumboNode* node, const std::string& cls) {
    if (node->type != GUMBO_NODE_ELEMENT) return nullptr;
    const GumboVector& children = node->v.element.children;
    for (unsigned int i = 0; i < children.length; ++i) {
        auto* child = static_cast<const GumboNode*>(children.data[i]);
        if (has_class(child, cls)) return child;
        if (auto* found = find_by_class(child, cls)) return found;
    }
    return nullptr;
}

void append_text(const GumboNode* node, std::string& out) {
    switch (node->type) {
        case GUMBO_NODE_TEXT:
        case GUMBO_NODE_WHITESPACE:
        case GUMBO_NODE_CDATA:
            out += node->v.text.text;
            return;
        case GUMBO_NODE_ELEMENT: {
            if (node->v.element.tag == GUMBO_TAG_SCRIPT ||
                node->v.element.tag == GUMBO_TAG_STYLE) return;
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

// Element text with whitespace runs collapsed
std::string text_of(const GumboNode* node) {
    if (!node) return "";
    std::string raw;
    append_text(node, raw);

    std::string out;
    out.reserve(raw.size());
    bool in_space = false;
    for (char c : raw) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            in_space = true;
            continue;
        }
        if (in_space && !out.empty()) out += ' ';
        in_space = false;
        out += c;
    }
    return out;
}

} // namespace

std::vector<SearchResult> parse_duckduckgo_html(const std::string& html,
                                                size_t max_results) {
    std::vector<SearchResult> results;
    if (max_results == 0) return results;

    GumboDocument doc(html);
    if (!doc.output || !doc.output->root) return results;

    std::vector<const GumboNode*> containers;
    collect_by_class(doc.output->root, kContainerClass, containers);

    for (const GumboNode* container : containers) {
        SearchResult r;
        r.title = text_of(find_by_class(container, kTitleClass));
        r.url = text_of(find_by_class(container, kUrlClass));
        r.snippet = text_of(find_by_class(container, kSnippetClass));

        if (r.title.empty() || r.url.empty()) continue;
        results.push_back(std::move(r));
        if (results.size() >= max_results) break;
    }
    return results;
}

DuckDuckGoSearch::DuckDuckGoSearch(HttpClient& http, const std::string& base_url,
                                   long timeout_seconds)
    : http_(http), base_url_(base_url), timeout_seconds_(timeout_seconds) {}

std::vector<SearchResult> DuckDuckGoSearch::search(const std::string& query,
                                                   size_t max_results) const {
    std::string sep = base_url_.find('?') == std::string::npos ? "?" : "&";
    std::string url = base_url_ + sep + "q=" + url_encode(query);
    std::vector<Header> headers = {
        {"User-Agent", kUserAgent},
        {"Accept", "text/html"}
    };

    auto response = http_.get(url, headers, timeout_seconds_);

    if (response.timed_out) {
        throw ProviderError(ProviderErrorKind::Timeout,
            "DuckDuckGo timed out after " + std::to_string(timeout_seconds_) + "s");
    }
    if (!response.error.empty()) {
        throw ProviderError(ProviderErrorKind::Http,
            "DuckDuckGo request failed: " + response.error);
    }
    if (!response.ok()) {
        throw ProviderError(ProviderErrorKind::Http,
            "DuckDuckGo returned status " + std::to_string(response.status_code));
    }

    return parse_duckduckgo_html(response.body, max_results);
}

} // namespace termai
