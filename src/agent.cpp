#include "agent.hpp"
#include "dispatcher.hpp"
#include "errors.hpp"
#include "tools/web_search.hpp"
#include <memory>

namespace termai {

Agent::Agent(ModelServer& server, const SearchProvider& search, AgentOptions options)
    : server_(server)
    , search_(search)
    , options_(std::move(options))
{}

FinalAnswer Agent::run(const std::string& user_request) const {
    FinalAnswer answer;
    Conversation conversation(user_request);

    std::vector<std::unique_ptr<Tool>> tools;
    tools.push_back(std::make_unique<WebSearchTool>(
        search_, options_.max_results, answer.trace, options_.verbose));

    std::vector<ToolSpec> tool_specs;
    tool_specs.reserve(tools.size());
    for (const auto& tool : tools) {
        tool_specs.push_back(tool->spec());
    }

    while (answer.iterations < options_.max_iterations) {
        answer.iterations++;

        ChatResponse response = server_.chat(conversation.messages(), tool_specs,
                                             options_.model);

        // No tool calls: this is the final answer
        if (!response.has_tool_calls()) {
            answer.text = response.content.value_or("");
            conversation.add_assistant_text(answer.text);
            answer.transcript = conversation.messages();
            return answer;
        }

        // Execute tool calls strictly in the order the model emitted them
        conversation.add_tool_calls(response.tool_calls);
        for (const auto& call : response.tool_calls) {
            ToolResult result = dispatch_tool(call, tools);
            conversation.add_tool_result(call.id, call.name, format_tool_output(result));
        }
    }

    throw EngineError(EngineErrorKind::IterationLimitExceeded,
        "maximum iterations (" + std::to_string(options_.max_iterations) +
        ") exceeded; the model may be stuck in a tool-calling loop");
}

} // namespace termai
