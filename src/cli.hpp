#pragma once
#include "config.hpp"
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>

namespace termai {

struct CliOptions {
    std::optional<std::string> prompt;
    std::optional<std::string> model;
    std::optional<std::string> endpoint;
    std::optional<std::string> search_provider;
    std::optional<std::string> brave_api_key;
    std::optional<uint32_t> max_results;
    std::optional<uint32_t> max_iterations;
    bool websearch = false;
    bool verbose = false;
    bool help = false;
};

// Throws std::invalid_argument on unknown options, missing values,
// bad numbers, or more than one prompt argument.
CliOptions parse_args(int argc, const char* const argv[]);

// Positional prompt if given, else trimmed stdin. Throws
// std::invalid_argument when both are empty.
std::string read_prompt(const CliOptions& options, std::istream& in);

// Flags take precedence over the loaded config.
void apply_overrides(Config& config, const CliOptions& options);

void print_usage(std::ostream& out);

} // namespace termai
