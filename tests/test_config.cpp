#include <catch2/catch_test_macros.hpp>
#include "config.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace termai;

// ── Default values ───────────────────────────────────────────────

TEST_CASE("Config: default values", "[config]") {
    Config cfg;
    REQUIRE(cfg.model == "llama3.2");
    REQUIRE(cfg.endpoint == "http://localhost:11434");
    REQUIRE(cfg.search.provider.empty());
    REQUIRE(cfg.search.brave_api_key.empty());
    REQUIRE(cfg.search.max_results == 5);
    REQUIRE(cfg.search.timeout_seconds == 10);
    REQUIRE(cfg.agent.max_tool_iterations == 10);
    REQUIRE(cfg.agent.timeout_seconds == 30);
}

TEST_CASE("Config::from_json: defaults document matches struct defaults", "[config]") {
    auto cfg = Config::from_json(Config::defaults_json());
    Config def;
    REQUIRE(cfg.model == def.model);
    REQUIRE(cfg.endpoint == def.endpoint);
    REQUIRE(cfg.search.max_results == def.search.max_results);
    REQUIRE(cfg.agent.max_tool_iterations == def.agent.max_tool_iterations);
}

TEST_CASE("Config::from_json: reads all keys", "[config]") {
    auto cfg = Config::from_json(nlohmann::json::parse(R"({
        "model": "qwen2.5-coder",
        "endpoint": "http://gpu:11434",
        "search": {"provider": "brave", "brave_api_key": "k", "max_results": 8, "timeout_seconds": 4},
        "agent": {"max_tool_iterations": 3, "timeout_seconds": 90}
    })"));

    REQUIRE(cfg.model == "qwen2.5-coder");
    REQUIRE(cfg.endpoint == "http://gpu:11434");
    REQUIRE(cfg.search.provider == "brave");
    REQUIRE(cfg.search.brave_api_key == "k");
    REQUIRE(cfg.search.max_results == 8);
    REQUIRE(cfg.search.timeout_seconds == 4);
    REQUIRE(cfg.agent.max_tool_iterations == 3);
    REQUIRE(cfg.agent.timeout_seconds == 90);
}

TEST_CASE("Config::from_json: partial and mistyped values keep defaults", "[config]") {
    auto cfg = Config::from_json(nlohmann::json::parse(R"({
        "model": 42,
        "search": {"max_results": -1},
        "agent": {"max_tool_iterations": 0}
    })"));

    REQUIRE(cfg.model == "llama3.2");
    REQUIRE(cfg.search.max_results == 5);
    REQUIRE(cfg.agent.max_tool_iterations == 10);
    REQUIRE(cfg.endpoint == "http://localhost:11434");
}

TEST_CASE("Config::from_json: counts above 32 bits keep defaults", "[config]") {
    auto cfg = Config::from_json(nlohmann::json::parse(R"({
        "search": {"max_results": 4294967296, "timeout_seconds": 4294967295},
        "agent": {"max_tool_iterations": 4294967297}
    })"));

    REQUIRE(cfg.search.max_results == 5);
    REQUIRE(cfg.search.timeout_seconds == 4294967295u);
    REQUIRE(cfg.agent.max_tool_iterations == 10);
}

// ── Config::load ────────────────────────────────────────────────

static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "termai_cfg_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

// RAII guard: redirects HOME to a temp dir, clears env vars, restores on destruction
struct ConfigTestGuard {
    std::string dir;
    std::string old_home;

    ConfigTestGuard() {
        dir = make_temp_dir();
        old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
        setenv("HOME", dir.c_str(), 1);
        unsetenv("TERM_AI_MODEL");
        unsetenv("BRAVE_API_KEY");
    }

    ~ConfigTestGuard() {
        setenv("HOME", old_home.c_str(), 1);
        unsetenv("TERM_AI_MODEL");
        unsetenv("BRAVE_API_KEY");
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.termai/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.termai");
        std::ofstream f(config_path());
        f << content;
    }
};

TEST_CASE("Config::load: no file gives defaults and writes nothing", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    auto cfg = Config::load();
    REQUIRE(cfg.model == "llama3.2");
    REQUIRE_FALSE(std::filesystem::exists(g.config_path()));
}

TEST_CASE("Config::load: reads config file", "[config]") {
    ConfigTestGuard g;
    g.write_config(R"({"model": "mistral", "search": {"provider": "duckduckgo"}})");

    auto cfg = Config::load();
    REQUIRE(cfg.model == "mistral");
    REQUIRE(cfg.search.provider == "duckduckgo");
}

TEST_CASE("Config::load: environment overrides file", "[config]") {
    ConfigTestGuard g;
    g.write_config(R"({"model": "mistral", "search": {"brave_api_key": "file-key"}})");
    setenv("TERM_AI_MODEL", "phi3", 1);
    setenv("BRAVE_API_KEY", "env-key", 1);

    auto cfg = Config::load();
    REQUIRE(cfg.model == "phi3");
    REQUIRE(cfg.search.brave_api_key == "env-key");
}

TEST_CASE("Config::load: empty env values are ignored", "[config]") {
    ConfigTestGuard g;
    setenv("TERM_AI_MODEL", "", 1);

    auto cfg = Config::load();
    REQUIRE(cfg.model == "llama3.2");
}

TEST_CASE("Config::load: malformed file falls back to defaults", "[config]") {
    ConfigTestGuard g;
    g.write_config("{ not json");

    auto cfg = Config::load();
    REQUIRE(cfg.model == "llama3.2");
    REQUIRE(cfg.endpoint == "http://localhost:11434");
}
