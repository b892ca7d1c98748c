#include "config.hpp"
#include "util.hpp"

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>

namespace termai {

nlohmann::json Config::defaults_json() {
    return {
        {"model", "llama3.2"},
        {"endpoint", "http://localhost:11434"},
        {"search", {
            {"provider", ""},
            {"brave_api_key", ""},
            {"max_results", 5},
            {"timeout_seconds", 10}
        }},
        {"agent", {
            {"max_tool_iterations", 10},
            {"timeout_seconds", 30}
        }}
    };
}

static void read_string(const nlohmann::json& obj, const char* key, std::string& out) {
    if (obj.contains(key) && obj[key].is_string())
        out = obj[key].get<std::string>();
}

// Accepts 1..UINT32_MAX; anything else keeps the current value
static void read_positive(const nlohmann::json& obj, const char* key, uint32_t& out) {
    if (!obj.contains(key) || !obj[key].is_number_unsigned()) return;
    uint64_t value = obj[key].get<uint64_t>();
    if (value > 0 && value <= UINT32_MAX)
        out = static_cast<uint32_t>(value);
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                     const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

Config Config::from_json(const nlohmann::json& existing) {
    Config cfg;
    if (!existing.is_object()) return cfg;
    nlohmann::json j = merge_defaults(existing, defaults_json());

    read_string(j, "model", cfg.model);
    read_string(j, "endpoint", cfg.endpoint);

    if (j.contains("search") && j["search"].is_object()) {
        auto& s = j["search"];
        read_string(s, "provider", cfg.search.provider);
        read_string(s, "brave_api_key", cfg.search.brave_api_key);
        read_positive(s, "max_results", cfg.search.max_results);
        read_positive(s, "timeout_seconds", cfg.search.timeout_seconds);
    }

    if (j.contains("agent") && j["agent"].is_object()) {
        auto& a = j["agent"];
        read_positive(a, "max_tool_iterations", cfg.agent.max_tool_iterations);
        read_positive(a, "timeout_seconds", cfg.agent.timeout_seconds);
    }

    return cfg;
}

void Config::apply_env() {
    if (const char* v = std::getenv("TERM_AI_MODEL"); v && *v)
        model = v;
    if (const char* v = std::getenv("BRAVE_API_KEY"); v && *v)
        search.brave_api_key = v;
}

Config Config::load() {
    Config cfg;

    std::string config_path = expand_home("~/.termai/config.json");
    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            cfg = from_json(nlohmann::json::parse(file));
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed " << config_path
                      << ": " << e.what() << "\n";
        }
    }

    cfg.apply_env();
    return cfg;
}

} // namespace termai
