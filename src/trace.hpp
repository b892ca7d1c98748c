#pragma once
#include "search.hpp"
#include <string>
#include <vector>

namespace termai {

// Side-channel record of the searches made during one agent run.
// Never shown to the model.
class SearchTrace {
public:
    static constexpr size_t kMaxSummaries = 3;
    static constexpr size_t kMaxSnippetChars = 100;

    // Record one executed search. Summaries of the top results are kept
    // only when keep_summaries is set.
    void record(const std::string& query,
                const std::vector<SearchResult>& results,
                bool keep_summaries);

    const std::vector<std::string>& queries() const { return queries_; }
    const std::vector<std::string>& summaries() const { return summaries_; }
    bool empty() const { return queries_.empty(); }

private:
    std::vector<std::string> queries_;
    std::vector<std::string> summaries_;
};

// "title (url): snippet" with the snippet cut to kMaxSnippetChars
std::string summarize_result(const SearchResult& result);

// Searched-for line and numbered source list
std::string render_trace(const SearchTrace& trace);

// Caller-facing text: the trace block precedes the answer only when verbose
// output was requested and at least one search happened.
std::string format_answer(const std::string& answer,
                          const SearchTrace& trace,
                          bool verbose);

} // namespace termai
