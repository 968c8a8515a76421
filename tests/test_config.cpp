#include <catch2/catch.hpp>
#include "config.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace chorus;

// ── Default values ───────────────────────────────────────────────

TEST_CASE("Config: default values are sensible", "[config]") {
    Config cfg;
    REQUIRE(cfg.engine == "echo");
    REQUIRE(cfg.model.empty());
    REQUIRE(cfg.streaming.enabled);
    REQUIRE(cfg.streaming.tool_result_max_chars == 2000);
    REQUIRE(cfg.queue.dispatch_delay_ms == 100);
    REQUIRE(cfg.echo.model == "echo-1");
    REQUIRE(cfg.echo.context_window == 200000);
}

TEST_CASE("Config::engine_config: carries model and working dir", "[config]") {
    Config cfg;
    cfg.model = "big";
    cfg.working_dir = "/srv/project";
    EngineConfig ec = cfg.engine_config();
    REQUIRE(ec.model == "big");
    REQUIRE(ec.working_dir == "/srv/project");
    REQUIRE_FALSE(ec.run_preflight);
}

// ── from_json / merge_defaults ──────────────────────────────────

TEST_CASE("Config::from_json: wrong types keep defaults", "[config]") {
    nlohmann::json j = {
        {"engine", 5},
        {"streaming", {{"enabled", "yes"}, {"tool_result_max_chars", -1}}},
        {"queue", "fast"}
    };
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.engine == "echo");
    REQUIRE(cfg.streaming.enabled);
    REQUIRE(cfg.streaming.tool_result_max_chars == 2000);
    REQUIRE(cfg.queue.dispatch_delay_ms == 100);
}

TEST_CASE("merge_defaults: adds missing nested keys only", "[config]") {
    nlohmann::json existing = {{"engine", "custom"}, {"streaming", {{"enabled", false}}}};
    nlohmann::json merged = merge_defaults(existing, Config::defaults_json());

    REQUIRE(merged["engine"] == "custom");
    REQUIRE(merged["streaming"]["enabled"] == false);
    REQUIRE(merged["streaming"]["tool_result_max_chars"] == 2000);
    REQUIRE(merged["queue"]["dispatch_delay_ms"] == 100);
}

// ── Config::load ────────────────────────────────────────────────

// Helper: create a temp directory
static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "chorus_cfg_XXXXXX";
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
        unsetenv("CHORUS_ENGINE");
        unsetenv("CHORUS_MODEL");
        unsetenv("CHORUS_WORKDIR");
    }

    ~ConfigTestGuard() {
        setenv("HOME", old_home.c_str(), 1);
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.chorus/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.chorus");
        std::ofstream f(config_path());
        f << content;
    }

    std::string read_config() const {
        std::ifstream f(config_path());
        return std::string(std::istreambuf_iterator<char>(f),
                           std::istreambuf_iterator<char>());
    }
};

TEST_CASE("Config::load: reads config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({
        "engine": "other",
        "model": "echo-2",
        "working_dir": "/tmp/project",
        "streaming": { "enabled": false, "tool_result_max_chars": 500 },
        "queue": { "dispatch_delay_ms": 0 },
        "echo": { "model": "echo-x", "chunk_delay_ms": 1, "context_window": 4096 }
    })");

    Config cfg = Config::load();

    REQUIRE(cfg.engine == "other");
    REQUIRE(cfg.model == "echo-2");
    REQUIRE(cfg.working_dir == "/tmp/project");
    REQUIRE_FALSE(cfg.streaming.enabled);
    REQUIRE(cfg.streaming.tool_result_max_chars == 500);
    REQUIRE(cfg.queue.dispatch_delay_ms == 0);
    REQUIRE(cfg.echo.model == "echo-x");
    REQUIRE(cfg.echo.chunk_delay_ms == 1);
    REQUIRE(cfg.echo.context_window == 4096);
}

TEST_CASE("Config::load: env vars override config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"engine": "from-file", "model": "file-model"})");
    setenv("CHORUS_ENGINE", "from-env", 1);
    setenv("CHORUS_MODEL", "env-model", 1);
    setenv("CHORUS_WORKDIR", "/env/dir", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.engine == "from-env");
    REQUIRE(cfg.model == "env-model");
    REQUIRE(cfg.working_dir == "/env/dir");

    unsetenv("CHORUS_ENGINE");
    unsetenv("CHORUS_MODEL");
    unsetenv("CHORUS_WORKDIR");
}

TEST_CASE("Config::load: malformed JSON falls back to defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config("not valid json {{{");

    Config cfg = Config::load();
    REQUIRE(cfg.engine == "echo");
    REQUIRE(cfg.streaming.enabled);
    // Malformed file is left for the user to fix
    REQUIRE(g.read_config() == "not valid json {{{");
}

TEST_CASE("Config::load: creates default config when missing", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    Config cfg = Config::load();
    REQUIRE(cfg.engine == "echo");
    REQUIRE(std::filesystem::exists(g.config_path()));

    nlohmann::json j = nlohmann::json::parse(g.read_config());
    REQUIRE(j["engine"] == "echo");
    REQUIRE(j["streaming"]["enabled"] == true);
    REQUIRE(j["queue"].contains("dispatch_delay_ms"));
    REQUIRE(j["echo"]["model"] == "echo-1");
}

TEST_CASE("Config::load: migrates existing config with missing keys", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"model": "kept", "streaming": {"enabled": false}})");

    Config cfg = Config::load();
    REQUIRE(cfg.model == "kept");
    REQUIRE_FALSE(cfg.streaming.enabled);

    nlohmann::json j = nlohmann::json::parse(g.read_config());
    REQUIRE(j["model"] == "kept");
    REQUIRE(j["streaming"]["enabled"] == false);
    REQUIRE(j["streaming"]["tool_result_max_chars"] == 2000);
    REQUIRE(j["engine"] == "echo");
}

TEST_CASE("Config::load: does not rewrite complete config", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    nlohmann::json full = Config::defaults_json();
    full["model"] = "custom";
    full["queue"]["dispatch_delay_ms"] = 5;
    g.write_config(full.dump(4) + "\n");

    std::string before = g.read_config();
    Config cfg = Config::load();

    REQUIRE(cfg.model == "custom");
    REQUIRE(cfg.queue.dispatch_delay_ms == 5);
    REQUIRE(g.read_config() == before);
}

TEST_CASE("Config::load_from: explicit path", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    std::string path = g.dir + "/nested/dir/chorus.json";
    Config cfg = Config::load_from(path);
    REQUIRE(cfg.engine == "echo");
    REQUIRE(std::filesystem::exists(path));
    REQUIRE_FALSE(std::filesystem::exists(path + ".tmp"));
}
