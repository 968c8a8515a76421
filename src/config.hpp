#pragma once
#include "engine.hpp"
#include <string>
#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>

namespace chorus {

struct StreamingConfig {
    bool enabled = true;
    uint32_t tool_result_max_chars = 2000;
};

struct QueueConfig {
    uint32_t dispatch_delay_ms = 100;  // pause before a queued follow-up
};

struct EchoConfig {
    std::string model = "echo-1";
    uint32_t chunk_delay_ms = 20;
    uint32_t context_window = 200000;
};

struct Config {
    std::string engine = "echo";
    std::string model;        // empty = engine default
    std::string working_dir;  // empty = current directory

    StreamingConfig streaming;
    QueueConfig queue;
    EchoConfig echo;

    // Load from ~/.chorus/config.json + env vars
    static Config load();

    // Load from an explicit path (missing file = defaults, written back)
    static Config load_from(const std::string& path);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Parse an already-merged JSON document
    static Config from_json(const nlohmann::json& j);

    // Engine session settings derived from this config
    EngineConfig engine_config() const;
};

// Add keys from defaults that are missing in existing, recursively
nlohmann::json merge_defaults(const nlohmann::json& existing,
                              const nlohmann::json& defaults);

} // namespace chorus
