#pragma once
#include "tool.hpp"
#include <string>
#include <vector>
#include <optional>

namespace termai {

enum class Role { System, User, Assistant, Tool };

inline const char* role_to_string(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
        case Role::Tool: return "tool";
    }
    return "user";
}

struct ToolCall {
    std::string id;
    std::string name;
    std::string arguments; // raw JSON string
};

// One turn of the conversation. Assistant turns carry either text or
// tool_calls; tool turns carry tool_call_id and the tool's name.
struct ChatMessage {
    Role role;
    std::string content;
    std::vector<ToolCall> tool_calls;
    std::optional<std::string> name;
    std::optional<std::string> tool_call_id;
};

struct ChatResponse {
    std::optional<std::string> content;
    std::vector<ToolCall> tool_calls;

    bool has_tool_calls() const { return !tool_calls.empty(); }
};

// Abstract client for the language-model server
class ModelServer {
public:
    virtual ~ModelServer() = default;

    // Multi-turn chat with tool definitions
    virtual ChatResponse chat(const std::vector<ChatMessage>& messages,
                              const std::vector<ToolSpec>& tools,
                              const std::string& model) = 0;

    // Single-shot completion of a fully built prompt
    virtual std::string generate(const std::string& prompt,
                                 const std::string& model) = 0;
};

} // namespace termai
