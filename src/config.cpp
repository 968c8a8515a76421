#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace chorus {

nlohmann::json Config::defaults_json() {
    return {
        {"engine", "echo"},
        {"model", ""},
        {"working_dir", ""},
        {"streaming", {
            {"enabled", true},
            {"tool_result_max_chars", 2000}
        }},
        {"queue", {
            {"dispatch_delay_ms", 100}
        }},
        {"echo", {
            {"model", "echo-1"},
            {"chunk_delay_ms", 20},
            {"context_window", 200000}
        }}
    };
}

nlohmann::json merge_defaults(const nlohmann::json& existing,
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

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    if (j.contains("engine") && j["engine"].is_string())
        cfg.engine = j["engine"].get<std::string>();
    if (j.contains("model") && j["model"].is_string())
        cfg.model = j["model"].get<std::string>();
    if (j.contains("working_dir") && j["working_dir"].is_string())
        cfg.working_dir = j["working_dir"].get<std::string>();

    if (j.contains("streaming") && j["streaming"].is_object()) {
        auto& s = j["streaming"];
        if (s.contains("enabled") && s["enabled"].is_boolean())
            cfg.streaming.enabled = s["enabled"].get<bool>();
        if (s.contains("tool_result_max_chars") && s["tool_result_max_chars"].is_number_unsigned())
            cfg.streaming.tool_result_max_chars = s["tool_result_max_chars"].get<uint32_t>();
    }

    if (j.contains("queue") && j["queue"].is_object()) {
        auto& q = j["queue"];
        if (q.contains("dispatch_delay_ms") && q["dispatch_delay_ms"].is_number_unsigned())
            cfg.queue.dispatch_delay_ms = q["dispatch_delay_ms"].get<uint32_t>();
    }

    if (j.contains("echo") && j["echo"].is_object()) {
        auto& e = j["echo"];
        if (e.contains("model") && e["model"].is_string())
            cfg.echo.model = e["model"].get<std::string>();
        if (e.contains("chunk_delay_ms") && e["chunk_delay_ms"].is_number_unsigned())
            cfg.echo.chunk_delay_ms = e["chunk_delay_ms"].get<uint32_t>();
        if (e.contains("context_window") && e["context_window"].is_number_unsigned())
            cfg.echo.context_window = e["context_window"].get<uint32_t>();
    }

    return cfg;
}

Config Config::load_from(const std::string& config_path) {
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(config_path, j.dump(4) + "\n");
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed " << config_path
                      << ": " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    return from_json(j);
}

Config Config::load() {
    Config cfg = load_from(expand_home("~/.chorus/config.json"));

    // Environment variables always override config file
    if (const char* v = std::getenv("CHORUS_ENGINE"))
        cfg.engine = v;
    if (const char* v = std::getenv("CHORUS_MODEL"))
        cfg.model = v;
    if (const char* v = std::getenv("CHORUS_WORKDIR"))
        cfg.working_dir = v;

    return cfg;
}

EngineConfig Config::engine_config() const {
    EngineConfig ec;
    ec.working_dir = working_dir;
    ec.model = model;
    return ec;
}

} // namespace chorus
