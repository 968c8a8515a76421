#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <stdexcept>
#include <cstdint>

namespace chorus {

// Engine-side event hook. Bound once when the session is created and never
// rewired; the engine calls it from whatever thread runs the turn.
using StreamHook = std::function<void(const std::string& event, const nlohmann::json& data)>;

struct EngineConfig {
    std::string working_dir;      // empty = current directory
    std::string model;            // empty = engine default
    bool run_preflight = false;
};

struct ModelInfo {
    std::string model;
    std::string provider;
};

// One engine-side conversation. Owned exclusively by a SessionHandle.
class EngineSession {
public:
    virtual ~EngineSession() = default;

    // Run one turn. Blocks the calling thread until the engine is done and
    // returns the final response text. Throws on failure.
    virtual std::string execute(const std::string& message) = 0;

    virtual std::string session_id() const = 0;

    virtual std::string model() const { return {}; }
    virtual uint32_t context_window() const { return 0; }

    // Returns false if the engine cannot switch models.
    virtual bool set_model(const std::string& /*model*/) { return false; }

    virtual std::vector<ModelInfo> provider_models() const { return {}; }

    // Called before each turn. Clears a cancel left over from the previous
    // turn; execute() itself must not, or a cancel that lands before the
    // turn starts is lost.
    virtual void begin_turn() {}

    // Request early stop of the in-flight turn. Engines without preemption
    // ignore it and run the turn to completion.
    virtual void cancel() {}
};

// Abstract execution engine. create_session must be safe to call
// concurrently; distinct sessions may execute concurrently.
class ExecutionEngine {
public:
    virtual ~ExecutionEngine() = default;

    virtual std::unique_ptr<EngineSession> create_session(const EngineConfig& config,
                                                          StreamHook hook) = 0;

    virtual std::unique_ptr<EngineSession> resume_session(const std::string& session_id,
                                                          const EngineConfig& config,
                                                          StreamHook hook) {
        (void)config;
        (void)hook;
        throw std::runtime_error(engine_name() + " cannot resume session " + session_id);
    }

    // Id of the session most recently created, or empty if the engine does
    // not track one.
    virtual std::string most_recent_session() const { return {}; }

    // Engine-side teardown. The session object is destroyed by its owner
    // afterwards.
    virtual void end_session(EngineSession& /*session*/) {}

    virtual std::string engine_name() const = 0;
};

} // namespace chorus
