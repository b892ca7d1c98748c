#include <catch2/catch_test_macros.hpp>
#include "trace.hpp"

using namespace termai;

TEST_CASE("SearchTrace: records queries and top three summaries", "[trace]") {
    SearchTrace trace;
    trace.record("node lts", {{"A", "a.example", "sa"}, {"B", "b.example", "sb"},
                              {"C", "c.example", "sc"}, {"D", "d.example", "sd"}}, true);

    REQUIRE(trace.queries() == std::vector<std::string>{"node lts"});
    REQUIRE(trace.summaries().size() == 3);
    REQUIRE(trace.summaries()[0] == "A (a.example): sa");
    REQUIRE(trace.summaries()[2] == "C (c.example): sc");
}

TEST_CASE("SearchTrace: summaries skipped unless requested", "[trace]") {
    SearchTrace trace;
    trace.record("q", {{"A", "a.example", "sa"}}, false);
    REQUIRE_FALSE(trace.empty());
    REQUIRE(trace.summaries().empty());
}

TEST_CASE("summarize_result: long snippets are cut", "[trace]") {
    std::string snippet(250, 'x');
    auto line = summarize_result({"T", "u", snippet});
    REQUIRE(line == "T (u): " + std::string(100, 'x') + "...");
}

TEST_CASE("summarize_result: empty snippet leaves no separator", "[trace]") {
    REQUIRE(summarize_result({"T", "u", ""}) == "T (u)");
}

TEST_CASE("render_trace: sentinels when nothing was searched", "[trace]") {
    SearchTrace trace;
    REQUIRE(render_trace(trace) ==
            "Searched for: no search required\nSources:\n  N/A\n");
}

TEST_CASE("render_trace: joins queries and numbers sources", "[trace]") {
    SearchTrace trace;
    trace.record("first", {{"A", "a.example", ""}}, true);
    trace.record("second", {{"B", "b.example", ""}}, true);

    REQUIRE(render_trace(trace) ==
            "Searched for: first, second\n"
            "Sources:\n"
            "  1. A (a.example)\n"
            "  2. B (b.example)\n");
}

TEST_CASE("render_trace: query without results renders N/A sources", "[trace]") {
    SearchTrace trace;
    trace.record("obscure", {}, true);
    REQUIRE(render_trace(trace) == "Searched for: obscure\nSources:\n  N/A\n");
}

TEST_CASE("render_trace: idempotent for the same trace", "[trace]") {
    SearchTrace trace;
    trace.record("q", {{"A", "a.example", "s"}}, true);
    REQUIRE(render_trace(trace) == render_trace(trace));
}

TEST_CASE("format_answer: trace only with verbose and a search", "[trace]") {
    SearchTrace empty;
    REQUIRE(format_answer("ls", empty, true) == "ls");
    REQUIRE(format_answer("ls", empty, false) == "ls");

    SearchTrace trace;
    trace.record("q", {{"A", "a.example", ""}}, true);
    REQUIRE(format_answer("ls", trace, false) == "ls");
    REQUIRE(format_answer("ls", trace, true) ==
            "Searched for: q\nSources:\n  1. A (a.example)\n\nls");
}
