#include <catch2/catch_test_macros.hpp>
#include "dispatcher.hpp"
#include "errors.hpp"
#include "tools/web_search.hpp"
#include "stubs.hpp"
#include <nlohmann/json.hpp>

using namespace termai;

static std::vector<std::unique_ptr<Tool>> make_tools(const StubSearch& search,
                                                     SearchTrace& trace) {
    std::vector<std::unique_ptr<Tool>> tools;
    tools.push_back(std::make_unique<WebSearchTool>(search, 5, trace, true));
    return tools;
}

// ── dispatch_tool ────────────────────────────────────────────────

TEST_CASE("dispatch_tool: runs web_search", "[dispatcher]") {
    StubSearch search;
    search.results = {{"Redis", "redis.io", "fast"}};
    SearchTrace trace;
    auto tools = make_tools(search, trace);

    auto result = dispatch_tool(ToolCall{"c1", "web_search", R"({"query":"redis"})"}, tools);
    REQUIRE(result.success);
    REQUIRE(nlohmann::json::parse(result.output)[0]["title"] == "Redis");
    REQUIRE(search.queries == std::vector<std::string>{"redis"});
    REQUIRE(trace.summaries() == std::vector<std::string>{"Redis (redis.io): fast"});
}

TEST_CASE("dispatch_tool: unknown tool is an unsuccessful result", "[dispatcher]") {
    StubSearch search;
    SearchTrace trace;
    auto tools = make_tools(search, trace);

    auto result = dispatch_tool(ToolCall{"c1", "nonexistent", "{}"}, tools);
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output == "Unknown tool: nonexistent");
    REQUIRE(trace.empty());
}

TEST_CASE("dispatch_tool: empty tool list", "[dispatcher]") {
    std::vector<std::unique_ptr<Tool>> tools;
    auto result = dispatch_tool(ToolCall{"c1", "web_search", "{}"}, tools);
    REQUIRE_FALSE(result.success);
}

TEST_CASE("format_tool_output: prefixes failures", "[dispatcher]") {
    REQUIRE(format_tool_output(ToolResult{true, "[]"}) == "[]");
    REQUIRE(format_tool_output(ToolResult{false, "boom"}) == "Error executing tool: boom");
}

// ── WebSearchTool ────────────────────────────────────────────────

TEST_CASE("WebSearchTool: provider error becomes an unsuccessful result", "[dispatcher]") {
    StubSearch search;
    search.should_throw = true;
    SearchTrace trace;
    WebSearchTool tool(search, 5, trace, false);

    auto result = tool.execute(R"({"query":"x"})");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.output == "Brave returned status 429");
    REQUIRE(trace.queries() == std::vector<std::string>{"x"});
}

TEST_CASE("WebSearchTool: malformed arguments throw", "[dispatcher]") {
    StubSearch search;
    SearchTrace trace;
    WebSearchTool tool(search, 5, trace, false);

    for (const char* args : {"not json", "[1,2]", "{}", R"({"query":7})", R"({"query":""})"}) {
        try {
            tool.execute(args);
            FAIL("expected EngineError for " << args);
        } catch (const EngineError& e) {
            REQUIRE(e.kind() == EngineErrorKind::MalformedToolCall);
        }
    }
    REQUIRE(search.queries.empty());
    REQUIRE(trace.empty());
}

TEST_CASE("WebSearchTool: tool definition describes the query parameter", "[dispatcher]") {
    StubSearch search;
    SearchTrace trace;
    WebSearchTool tool(search, 5, trace, false);

    auto spec = tool.spec();
    REQUIRE(spec.name == "web_search");
    REQUIRE(spec.description.find("Search the web") != std::string::npos);
    auto params = nlohmann::json::parse(spec.parameters_json);
    REQUIRE(params["type"] == "object");
    REQUIRE(params["properties"]["query"]["type"] == "string");
    REQUIRE(params["required"][0] == "query");
}
