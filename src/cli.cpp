#include "cli.hpp"
#include "util.hpp"
#include <cstdint>
#include <iostream>
#include <iterator>
#include <stdexcept>

namespace termai {

static uint32_t parse_count(const std::string& flag, const std::string& value) {
    unsigned long n = 0;
    size_t used = 0;
    try {
        n = std::stoul(value, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used != value.size() || value.empty() || value[0] == '-' ||
        n == 0 || n > UINT32_MAX) {
        throw std::invalid_argument("invalid value for " + flag + ": '" + value +
                                    "' (expected a positive integer)");
    }
    return static_cast<uint32_t>(n);
}

CliOptions parse_args(int argc, const char* const argv[]) {
    CliOptions opts;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        auto value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument("option " + arg + " requires a value");
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (arg == "-m" || arg == "--model") {
            opts.model = value();
        } else if (arg == "-e" || arg == "--endpoint") {
            opts.endpoint = value();
        } else if (arg == "-w" || arg == "--websearch" || arg == "--ws") {
            opts.websearch = true;
        } else if (arg == "--search-provider") {
            opts.search_provider = value();
        } else if (arg == "--brave-api-key") {
            opts.brave_api_key = value();
        } else if (arg == "--max-results") {
            opts.max_results = parse_count(arg, value());
        } else if (arg == "--max-iterations") {
            opts.max_iterations = parse_count(arg, value());
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw std::invalid_argument("unknown option: " + arg);
        } else if (opts.prompt) {
            throw std::invalid_argument("unexpected extra argument: " + arg +
                                        " (quote the request as one argument)");
        } else {
            opts.prompt = arg;
        }
    }
    return opts;
}

std::string read_prompt(const CliOptions& options, std::istream& in) {
    if (options.prompt && !trim(*options.prompt).empty()) {
        return *options.prompt;
    }
    std::string buffer((std::istreambuf_iterator<char>(in)),
                       std::istreambuf_iterator<char>());
    std::string prompt = trim(buffer);
    if (prompt.empty()) {
        throw std::invalid_argument("no prompt provided via argument or stdin");
    }
    return prompt;
}

void apply_overrides(Config& config, const CliOptions& options) {
    if (options.model) config.model = *options.model;
    if (options.endpoint) config.endpoint = *options.endpoint;
    if (options.search_provider) config.search.provider = *options.search_provider;
    if (options.brave_api_key) config.search.brave_api_key = *options.brave_api_key;
    if (options.max_results) config.search.max_results = *options.max_results;
    if (options.max_iterations) config.agent.max_tool_iterations = *options.max_iterations;
}

void print_usage(std::ostream& out) {
    out << "Usage: termai [options] [PROMPT]\n"
        << "\n"
        << "Turn a natural-language request into shell commands using a local\n"
        << "Ollama server. The prompt is read from stdin when not given.\n"
        << "\n"
        << "Options:\n"
        << "  -m, --model NAME         Model name (default: llama3.2)\n"
        << "  -e, --endpoint URL       Ollama endpoint (default: http://localhost:11434)\n"
        << "  -w, --websearch          Let the model search the web via tool calling\n"
        << "  --search-provider NAME   duckduckgo or brave (default: brave if a key is set)\n"
        << "  --brave-api-key KEY      Brave Search API key\n"
        << "  --max-results N          Search results per query (default: 5)\n"
        << "  --max-iterations N       Model round-trips before giving up (default: 10)\n"
        << "  -v, --verbose            Show searches and sources above the answer\n"
        << "  -h, --help               Show this help\n"
        << "\n"
        << "Environment variables:\n"
        << "  TERM_AI_MODEL            Default model name\n"
        << "  BRAVE_API_KEY            Brave Search API key\n"
        << "\n"
        << "Config file: ~/.termai/config.json\n";
}

} // namespace termai
