#pragma once
#include "conversation.hpp"
#include "model.hpp"
#include "search.hpp"
#include "trace.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace termai {

struct AgentOptions {
    std::string model = "llama3.2";
    size_t max_results = 5;
    uint32_t max_iterations = 10;
    bool verbose = false;
};

struct FinalAnswer {
    std::string text;                    // the model's final reply
    SearchTrace trace;
    std::vector<ChatMessage> transcript; // full conversation, final turn included
    uint32_t iterations = 0;             // model requests made

    // Text for the caller (trace-annotated when verbose)
    std::string render_output(bool verbose) const {
        return format_answer(text, trace, verbose);
    }
};

// Drives the model through web_search calls to a final answer.
// Holds no per-run state: each run() builds its own conversation and trace,
// so one Agent may serve sequential requests.
class Agent {
public:
    Agent(ModelServer& server, const SearchProvider& search, AgentOptions options);

    // Throws EngineError on model-server failure, a malformed tool call,
    // or when max_iterations requests pass without a text-only reply.
    FinalAnswer run(const std::string& user_request) const;

private:
    ModelServer& server_;
    const SearchProvider& search_;
    AgentOptions options_;
};

} // namespace termai
