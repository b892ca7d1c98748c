#pragma once
#include <string>

namespace termai {

// Fixed system instruction for the tool-calling conversation.
// Takes no input; user text never reaches it.
const std::string& system_prompt();

// Single-shot prompt for /api/generate: instruction block plus the request.
std::string build_generate_prompt(const std::string& user_request);

} // namespace termai
