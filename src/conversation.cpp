#include "conversation.hpp"
#include "prompt.hpp"
#include <stdexcept>

namespace termai {

Conversation::Conversation(const std::string& user_request) {
    messages_.push_back(ChatMessage{Role::System, system_prompt(), {}, {}, {}});
    messages_.push_back(ChatMessage{Role::User, user_request, {}, {}, {}});
}

void Conversation::add_assistant_text(const std::string& text) {
    if (!ready_for_model()) {
        throw std::logic_error("assistant reply appended before all tool results");
    }
    messages_.push_back(ChatMessage{Role::Assistant, text, {}, {}, {}});
}

void Conversation::add_tool_calls(const std::vector<ToolCall>& calls) {
    if (calls.empty()) {
        throw std::invalid_argument("tool-call turn needs at least one call");
    }
    if (!ready_for_model()) {
        throw std::logic_error("tool calls appended before all tool results");
    }
    messages_.push_back(ChatMessage{Role::Assistant, "", calls, {}, {}});
    for (const auto& call : calls) {
        pending_.push_back(call.id);
    }
}

void Conversation::add_tool_result(const std::string& call_id,
                                   const std::string& tool_name,
                                   const std::string& payload) {
    if (pending_.empty() || pending_.front() != call_id) {
        throw std::logic_error("tool result for unexpected call id: " + call_id);
    }
    pending_.erase(pending_.begin());
    messages_.push_back(ChatMessage{Role::Tool, payload, {}, tool_name, call_id});
}

} // namespace termai
