#pragma once
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace termai {

struct SearchConfig {
    std::string provider;      // empty = auto-detect
    std::string brave_api_key;
    uint32_t max_results = 5;
    uint32_t timeout_seconds = 10;
};

struct AgentConfig {
    uint32_t max_tool_iterations = 10;
    uint32_t timeout_seconds = 30;
};

// Process-wide settings, read once at startup and never mutated afterwards.
struct Config {
    std::string model = "llama3.2";
    std::string endpoint = "http://localhost:11434";

    SearchConfig search;
    AgentConfig agent;

    // Defaults < ~/.termai/config.json < environment. Never writes.
    static Config load();

    // Parse a config JSON document over the defaults (unknown or
    // mistyped keys are ignored)
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by from_json() and tests)
    static nlohmann::json defaults_json();

    // TERM_AI_MODEL and BRAVE_API_KEY
    void apply_env();
};

} // namespace termai
