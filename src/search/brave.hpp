#pragma once
#include "../search.hpp"
#include "../http.hpp"
#include <string>
#include <vector>

namespace termai {

// Brave Search JSON API. Requires a subscription token.
class BraveSearch : public SearchProvider {
public:
    static constexpr const char* kDefaultUrl =
        "https://api.search.brave.com/res/v1/web/search";

    BraveSearch(HttpClient& http,
                const std::string& api_key,
                const std::string& base_url = kDefaultUrl,
                long timeout_seconds = 10);

    std::vector<SearchResult> search(const std::string& query,
                                     size_t max_results) const override;
    std::string name() const override { return "brave"; }

private:
    HttpClient& http_;
    std::string api_key_;
    std::string base_url_;
    long timeout_seconds_;
};

// Map a Brave response body to results. Throws ProviderError{Decode} on
// malformed JSON; a body without web.results yields an empty list.
std::vector<SearchResult> parse_brave_json(const std::string& body,
                                           size_t max_results);

} // namespace termai
