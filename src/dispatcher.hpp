#pragma once
#include "model.hpp"
#include "tool.hpp"
#include <memory>
#include <string>
#include <vector>

namespace termai {

// Execute a single tool call, finding the tool by name.
// An unknown name is an unsuccessful result, not an exception.
ToolResult dispatch_tool(const ToolCall& call,
                         const std::vector<std::unique_ptr<Tool>>& tools);

// Tool output as sent back to the model; failures get an error prefix.
std::string format_tool_output(const ToolResult& result);

} // namespace termai
