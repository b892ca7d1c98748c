#pragma once
#include "../tool.hpp"
#include "../search.hpp"
#include "../trace.hpp"

namespace termai {

// The one tool offered to the model. Bound to a single agent run: it
// records every query into that run's trace.
class WebSearchTool : public Tool {
public:
    static constexpr const char* kName = "web_search";

    WebSearchTool(const SearchProvider& provider, size_t max_results,
                  SearchTrace& trace, bool verbose);

    // Throws EngineError{MalformedToolCall} when the query is missing.
    // Provider failures come back as an unsuccessful result.
    ToolResult execute(const std::string& args_json) override;

    std::string tool_name() const override { return kName; }
    std::string description() const override;
    std::string parameters_json() const override;

private:
    const SearchProvider& provider_;
    size_t max_results_;
    SearchTrace& trace_;
    bool verbose_;
};

} // namespace termai
