#pragma once
#include "model.hpp"
#include <string>
#include <vector>

namespace termai {

// Append-only message log for one engine run.
// Turn 0 is always the fixed system prompt, turn 1 the user request.
// Every tool-call turn must be answered by one tool result per call,
// in call order, before the log is sent to the model again.
class Conversation {
public:
    explicit Conversation(const std::string& user_request);

    void add_assistant_text(const std::string& text);

    // Throws std::invalid_argument on an empty call list and
    // std::logic_error while earlier calls are still unanswered.
    void add_tool_calls(const std::vector<ToolCall>& calls);

    // Throws std::logic_error when call_id is not the next pending call.
    void add_tool_result(const std::string& call_id,
                         const std::string& tool_name,
                         const std::string& payload);

    // True when no tool call is awaiting its result
    bool ready_for_model() const { return pending_.empty(); }

    const std::vector<ChatMessage>& messages() const { return messages_; }
    size_t size() const { return messages_.size(); }

private:
    std::vector<ChatMessage> messages_;
    std::vector<std::string> pending_; // unanswered call ids, in order
};

} // namespace termai
