#include "search.hpp"
#include "errors.hpp"
#include "util.hpp"
#include "search/brave.hpp"
#include "search/duckduckgo.hpp"
#include <nlohmann/json.hpp>

namespace termai {

std::string results_to_json(const std::vector<SearchResult>& results) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& r : results) {
        arr.push_back({
            {"title", r.title},
            {"url", r.url},
            {"snippet", r.snippet}
        });
    }
    return arr.dump(2);
}

static bool has_key(const SearchSelection& selection) {
    return selection.api_key.has_value() && !selection.api_key->empty();
}

SearchBackend resolve_search_backend(const SearchSelection& selection) {
    if (!selection.provider) {
        return has_key(selection) ? SearchBackend::Brave : SearchBackend::DuckDuckGo;
    }

    std::string name = to_lower(trim(*selection.provider));
    if (name == "duckduckgo" || name == "ddg") {
        return SearchBackend::DuckDuckGo;
    }
    if (name == "brave") {
        if (!has_key(selection)) {
            throw ConfigError("credential required for this provider: brave "
                              "(use --brave-api-key or BRAVE_API_KEY)");
        }
        return SearchBackend::Brave;
    }
    throw ConfigError("unknown provider: " + *selection.provider +
                      " (valid options: duckduckgo, brave)");
}

std::unique_ptr<SearchProvider> create_search_provider(const SearchSelection& selection,
                                                       HttpClient& http,
                                                       const SearchOptions& options) {
    switch (resolve_search_backend(selection)) {
        case SearchBackend::Brave: {
            std::string url = options.brave_url.empty()
                ? BraveSearch::kDefaultUrl : options.brave_url;
            return std::make_unique<BraveSearch>(http, *selection.api_key, url,
                                                 options.timeout_seconds);
        }
        case SearchBackend::DuckDuckGo:
            break;
    }
    std::string url = options.duckduckgo_url.empty()
        ? DuckDuckGoSearch::kDefaultUrl : options.duckduckgo_url;
    return std::make_unique<DuckDuckGoSearch>(http, url, options.timeout_seconds);
}

} // namespace termai
