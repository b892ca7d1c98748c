#include "brave.hpp"
#include "../errors.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace termai {

static std::string string_field(const json& obj, const char* key) {
    if (obj.contains(key) && obj[key].is_string()) return obj[key].get<std::string>();
    return "";
}

std::vector<SearchResult> parse_brave_json(const std::string& body,
                                           size_t max_results) {
    json resp;
    try {
        resp = json::parse(body);
    } catch (const json::parse_error& e) {
        throw ProviderError(ProviderErrorKind::Decode,
            std::string("Brave returned invalid JSON: ") + e.what());
    }

    std::vector<SearchResult> results;
    if (!resp.is_object() || !resp.contains("web") || !resp["web"].is_object()) {
        return results;
    }
    const auto& web = resp["web"];
    if (!web.contains("results") || !web["results"].is_array()) {
        return results;
    }

    for (const auto& item : web["results"]) {
        if (results.size() >= max_results) break;
        if (!item.is_object()) continue;

        SearchResult r{string_field(item, "title"),
                       string_field(item, "url"),
                       string_field(item, "description")};
        if (r.title.empty() || r.url.empty()) continue;
        results.push_back(std::move(r));
    }
    return results;
}

BraveSearch::BraveSearch(HttpClient& http, const std::string& api_key,
                         const std::string& base_url, long timeout_seconds)
    : http_(http), api_key_(api_key), base_url_(base_url),
      timeout_seconds_(timeout_seconds) {}

std::vector<SearchResult> BraveSearch::search(const std::string& query,
                                              size_t max_results) const {
    std::string url = base_url_ + "?q=" + url_encode(query) +
                      "&count=" + std::to_string(max_results);
    std::vector<Header> headers = {
        {"Accept", "application/json"},
        {"X-Subscription-Token", api_key_}
    };

    auto response = http_.get(url, headers, timeout_seconds_);

    if (response.timed_out) {
        throw ProviderError(ProviderErrorKind::Timeout,
            "Brave timed out after " + std::to_string(timeout_seconds_) + "s");
    }
    if (!response.error.empty()) {
        throw ProviderError(ProviderErrorKind::Http,
            "Brave request failed: " + response.error);
    }
    if (!response.ok()) {
        throw ProviderError(ProviderErrorKind::Http,
            "Brave returned status " + std::to_string(response.status_code));
    }

    return parse_brave_json(response.body, max_results);
}

} // namespace termai
