#include "agent.hpp"
#include "cli.hpp"
#include "config.hpp"
#include "http.hpp"
#include "models/ollama.hpp"
#include "prompt.hpp"
#include "search.hpp"
#include <iostream>
#include <string>

namespace {

// Pairs http_init() with http_cleanup() on every exit path
struct HttpSession {
    HttpSession() { termai::http_init(); }
    ~HttpSession() { termai::http_cleanup(); }
    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;
};

} // namespace

int main(int argc, char* argv[]) try {
    auto options = termai::parse_args(argc, argv);
    if (options.help) {
        termai::print_usage(std::cout);
        return 0;
    }

    std::string prompt = termai::read_prompt(options, std::cin);

    auto config = termai::Config::load();
    termai::apply_overrides(config, options);

    HttpSession session;
    termai::CurlHttpClient http_client;
    termai::OllamaServer server(http_client, config.endpoint,
                                config.agent.timeout_seconds);

    // Single-shot mode
    if (!options.websearch) {
        std::cout << server.generate(termai::build_generate_prompt(prompt), config.model)
                  << '\n';
        return 0;
    }

    termai::SearchSelection selection;
    if (!config.search.provider.empty()) selection.provider = config.search.provider;
    if (!config.search.brave_api_key.empty()) selection.api_key = config.search.brave_api_key;

    termai::SearchOptions search_options;
    search_options.timeout_seconds = config.search.timeout_seconds;

    // Resolved before any network call so configuration errors fail fast
    auto search = termai::create_search_provider(selection, http_client, search_options);

    termai::AgentOptions agent_options;
    agent_options.model = config.model;
    agent_options.max_results = config.search.max_results;
    agent_options.max_iterations = config.agent.max_tool_iterations;
    agent_options.verbose = options.verbose;

    termai::Agent agent(server, *search, agent_options);
    auto answer = agent.run(prompt);
    std::cout << answer.render_output(options.verbose) << '\n';
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
}
