#pragma once
#include "../search.hpp"
#include "../http.hpp"
#include <string>
#include <vector>

namespace termai {

// Scrapes the DuckDuckGo HTML endpoint. No credential required.
class DuckDuckGoSearch : public SearchProvider {
public:
    static constexpr const char* kDefaultUrl = "https://html.duckduckgo.com/html/";

    DuckDuckGoSearch(HttpClient& http,
                     const std::string& base_url = kDefaultUrl,
                     long timeout_seconds = 10);

    std::vector<SearchResult> search(const std::string& query,
                                     size_t max_results) const override;
    std::string name() const override { return "duckduckgo"; }

private:
    HttpClient& http_;
    std::string base_url_;
    long timeout_seconds_;
};

// Extract results from a DuckDuckGo HTML page. A page without result
// containers (e.g. a bot challenge) yields an empty list.
std::vector<SearchResult> parse_duckduckgo_html(const std::string& html,
                                                size_t max_results);

} // namespace termai
