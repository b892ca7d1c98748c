#pragma once
#include "http.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace termai {

struct SearchResult {
    std::string title;
    std::string url;
    std::string snippet;

    bool operator==(const SearchResult& other) const {
        return title == other.title && url == other.url && snippet == other.snippet;
    }
};

// A web search backend. Results are relevance-ranked, at most max_results.
// Throws ProviderError on failure. Implementations hold no mutable state, so
// one instance may be shared read-only across concurrent agent runs.
class SearchProvider {
public:
    virtual ~SearchProvider() = default;
    virtual std::vector<SearchResult> search(const std::string& query,
                                             size_t max_results) const = 0;
    virtual std::string name() const = 0;
};

// Serialized tool payload: pretty JSON array of {title, url, snippet}
std::string results_to_json(const std::vector<SearchResult>& results);

// ── Provider resolution ─────────────────────────────────────────

enum class SearchBackend { DuckDuckGo, Brave };

struct SearchSelection {
    std::optional<std::string> provider;  // explicit choice (--search-provider)
    std::optional<std::string> api_key;   // Brave credential
};

struct SearchOptions {
    long timeout_seconds = 10;
    std::string duckduckgo_url;  // empty = public endpoint
    std::string brave_url;       // empty = public endpoint
};

// Decide which backend a selection refers to. Pure; throws ConfigError.
// explicit duckduckgo/ddg > explicit brave (needs key) > key present > duckduckgo.
SearchBackend resolve_search_backend(const SearchSelection& selection);

// Resolve and construct the provider. Makes no network calls.
std::unique_ptr<SearchProvider> create_search_provider(const SearchSelection& selection,
                                                       HttpClient& http,
                                                       const SearchOptions& options = {});

} // namespace termai
