#include "trace.hpp"
#include "util.hpp"
#include <algorithm>
#include <sstream>

namespace termai {

void SearchTrace::record(const std::string& query,
                         const std::vector<SearchResult>& results,
                         bool keep_summaries) {
    queries_.push_back(query);
    if (!keep_summaries) return;

    size_t n = std::min(results.size(), kMaxSummaries);
    for (size_t i = 0; i < n; ++i) {
        summaries_.push_back(summarize_result(results[i]));
    }
}

std::string summarize_result(const SearchResult& result) {
    std::string line = result.title + " (" + result.url + ")";
    if (!result.snippet.empty()) {
        line += ": " + truncate_text(result.snippet, SearchTrace::kMaxSnippetChars);
    }
    return line;
}

std::string render_trace(const SearchTrace& trace) {
    std::ostringstream ss;
    ss << "Searched for: ";
    if (trace.queries().empty()) {
        ss << "no search required";
    } else {
        ss << join(trace.queries(), ", ");
    }
    ss << "\nSources:\n";
    if (trace.summaries().empty()) {
        ss << "  N/A\n";
    } else {
        size_t n = 0;
        for (const auto& s : trace.summaries()) {
            ss << "  " << ++n << ". " << s << "\n";
        }
    }
    return ss.str();
}

std::string format_answer(const std::string& answer,
                          const SearchTrace& trace,
                          bool verbose) {
    if (!verbose || trace.empty()) return answer;
    return render_trace(trace) + "\n" + answer;
}

} // namespace termai
