#include "prompt.hpp"
#include <sstream>

namespace termai {

static const char* const kInstructions =
    "You are an expert macOS terminal and development environment engineer.\n"
    "\n"
    "Constraints:\n"
    "- Respond ONLY with valid shell commands, one per line.\n"
    "- Do not include explanations, comments, Markdown, or prose.\n"
    "- Prefer Homebrew for package installation where appropriate.\n"
    "- Avoid destructive operations (no rm -rf, no disk formatting, "
    "no sudo unless clearly necessary and safe).\n";

const std::string& system_prompt() {
    static const std::string prompt = std::string(kInstructions) +
        "\n"
        "When you need current information (latest versions, recent releases, "
        "current documentation), use the web_search tool to find up-to-date "
        "information before responding.";
    return prompt;
}

std::string build_generate_prompt(const std::string& user_request) {
    std::ostringstream ss;
    ss << kInstructions << "\n"
       << "User request:\n"
       << user_request;
    return ss.str();
}

} // namespace termai
