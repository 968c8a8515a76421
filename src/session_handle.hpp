#pragma once
#include "engine.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <atomic>
#include <functional>
#include <cstdint>

namespace chorus {

// The eight per-turn callback slots. An empty slot is a no-op.
struct StreamCallbacks {
    std::function<void(const std::string& block_type, int block_index)> on_content_block_start;
    std::function<void(const std::string& block_type, const std::string& delta)> on_content_block_delta;
    std::function<void(const std::string& block_type, const std::string& text)> on_content_block_end;
    std::function<void(const std::string& tool_name, const nlohmann::json& tool_input)> on_tool_pre;
    std::function<void(const std::string& tool_name, const nlohmann::json& tool_input,
                       const std::string& result)> on_tool_post;
    std::function<void()> on_execution_start;
    std::function<void()> on_execution_end;
    std::function<void()> on_usage_update;
};

struct UsageTotals {
    uint64_t input_tokens = 0;
    uint64_t output_tokens = 0;
    std::string model_name;
    uint32_t context_window = 0;
};

constexpr size_t kDefaultToolResultMaxChars = 2000;

// Isolated runtime unit for one conversation: its engine session, its
// callback slots and its token counters. The engine's stream hook is bound
// to this handle's dispatch() when the session is created, so routing is
// structural: events for this session can only ever reach this handle.
class SessionHandle {
    struct Private { explicit Private() = default; };

public:
    SessionHandle(Private, std::string conversation_id, size_t tool_result_max_chars);
    ~SessionHandle();

    static std::shared_ptr<SessionHandle> create(const std::string& conversation_id,
                                                 ExecutionEngine& engine,
                                                 const EngineConfig& config,
                                                 size_t tool_result_max_chars = kDefaultToolResultMaxChars);

    static std::shared_ptr<SessionHandle> resume(const std::string& conversation_id,
                                                 const std::string& session_id,
                                                 ExecutionEngine& engine,
                                                 const EngineConfig& config,
                                                 size_t tool_result_max_chars = kDefaultToolResultMaxChars);

    SessionHandle(const SessionHandle&) = delete;
    SessionHandle& operator=(const SessionHandle&) = delete;

    const std::string& conversation_id() const { return conversation_id_; }
    const std::string& session_id() const { return session_id_; }

    // Null once the session has been torn down
    EngineSession* session() const;
    bool has_session() const { return !ended_.load(); }

    // Replace all eight slots at once. Safe while a dispatch is running:
    // an in-progress dispatch finishes with the slots it started with.
    void set_callbacks(StreamCallbacks callbacks);
    void clear_callbacks();

    // Route one engine event to the matching slot. Unknown events and
    // malformed payloads are ignored; never throws.
    void dispatch(const std::string& event, const nlohmann::json& data);

    // Zero the token counters. Called at turn start, never mid-turn.
    void reset_usage();
    UsageTotals usage() const;

    // Read model name and context window from the engine session
    void extract_model_info();
    bool switch_model(const std::string& model);
    std::vector<ModelInfo> provider_models() const;

    // Run a turn on the engine session (blocking)
    std::string execute(const std::string& message);

    // Clear the engine session's cancel state before a turn
    void begin_turn();

    // Forward a cancellation request to the engine session
    void cancel();

    // Engine-side teardown. Runs at most once; later calls are no-ops.
    // The session object itself lives until the handle is destroyed, so an
    // in-flight execute() on another thread stays valid.
    bool teardown(ExecutionEngine& engine);

private:
    void route(const std::string& event, const nlohmann::json& data,
               const StreamCallbacks& cb);

    std::string conversation_id_;
    std::string session_id_;
    std::atomic<bool> ended_{false};
    size_t tool_result_max_chars_;

    mutable std::mutex callbacks_mutex_;
    std::shared_ptr<const StreamCallbacks> callbacks_;

    mutable std::mutex usage_mutex_;
    UsageTotals usage_;

    // Declared last: the session may still call dispatch() while it is
    // being destroyed, so everything dispatch() touches must outlive it.
    std::unique_ptr<EngineSession> session_;
};

} // namespace chorus
