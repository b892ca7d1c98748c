#include "dispatcher.hpp"

namespace termai {

ToolResult dispatch_tool(const ToolCall& call,
                         const std::vector<std::unique_ptr<Tool>>& tools) {
    for (const auto& tool : tools) {
        if (tool->tool_name() == call.name) {
            return tool->execute(call.arguments);
        }
    }
    return ToolResult{false, "Unknown tool: " + call.name};
}

std::string format_tool_output(const ToolResult& result) {
    return result.success ? result.output : "Error executing tool: " + result.output;
}

} // namespace termai
