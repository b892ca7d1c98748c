#include "web_search.hpp"
#include "tool_util.hpp"
#include "../errors.hpp"
#include <iostream>

namespace termai {

WebSearchTool::WebSearchTool(const SearchProvider& provider, size_t max_results,
                             SearchTrace& trace, bool verbose)
    : provider_(provider), max_results_(max_results),
      trace_(trace), verbose_(verbose) {}

std::string WebSearchTool::description() const {
    return "Search the web for current information, latest versions, recent "
           "documentation, or up-to-date facts. Use this when you need "
           "information that may have changed recently or when the user asks "
           "about 'latest' or 'current' versions.";
}

std::string WebSearchTool::parameters_json() const {
    return R"({"type":"object","properties":{"query":{"type":"string","description":"The search query to execute"}},"required":["query"]})";
}

ToolResult WebSearchTool::execute(const std::string& args_json) {
    auto args = parse_tool_json(kName, args_json);
    std::string query = require_string(kName, args, "query");

    if (verbose_) {
        std::cerr << "[search] " << provider_.name() << ": " << query << '\n';
    }

    std::vector<SearchResult> results;
    try {
        results = provider_.search(query, max_results_);
    } catch (const ProviderError& e) {
        trace_.record(query, {}, verbose_);
        if (verbose_) {
            std::cerr << "[search] failed: " << e.what() << '\n';
        }
        return ToolResult{false, e.what()};
    }

    trace_.record(query, results, verbose_);
    return ToolResult{true, results_to_json(results)};
}

} // namespace termai
