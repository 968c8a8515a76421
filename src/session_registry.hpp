#pragma once
#include "session_handle.hpp"
#include "engine.hpp"
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <unordered_map>
#include <mutex>
#include <functional>

namespace chorus {

class EventBus; // forward declaration

// Keyed collection of SessionHandles. The key->handle map is the only
// structure shared between conversations.
//
// Locking: create/resume/end/remove serialise on a lifecycle mutex, which
// is held across engine session creation and teardown. Lookups take only a
// short map mutex and never wait on an engine call or an in-flight turn.
class SessionRegistry {
public:
    SessionRegistry(ExecutionEngine& engine,
                    EngineConfig defaults = {},
                    size_t tool_result_max_chars = kDefaultToolResultMaxChars);
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // Create a session. Without an id one is generated and becomes the
    // default conversation. Throws ConfigurationError if the id is live.
    std::shared_ptr<SessionHandle> create_session(
        const std::optional<std::string>& conversation_id = std::nullopt);
    std::shared_ptr<SessionHandle> create_session(
        const std::optional<std::string>& conversation_id,
        const EngineConfig& config);

    // Resume an engine-side session under a fresh handle. Same id rules as
    // create_session.
    std::shared_ptr<SessionHandle> resume_session(
        const std::string& session_id,
        const std::optional<std::string>& conversation_id = std::nullopt);
    std::shared_ptr<SessionHandle> resume_session(
        const std::string& session_id,
        const std::optional<std::string>& conversation_id,
        const EngineConfig& config);

    // Pure lookup; null if absent
    std::shared_ptr<SessionHandle> get_handle(const std::string& conversation_id) const;

    // Run one turn on the conversation's session (blocks the caller).
    // Throws NotFoundError if there is no live handle, EngineFailure if the
    // engine raises.
    std::string send_message(const std::string& conversation_id, const std::string& text);

    // Engine teardown + removal. Unknown ids are a no-op.
    void end_session(const std::string& conversation_id);

    // End every live session
    void end_all();

    // Drop a handle without engine teardown
    void remove_handle(const std::string& conversation_id);

    // Snapshot copy of the map
    std::unordered_map<std::string, std::shared_ptr<SessionHandle>> active_handles() const;

    // Sorted conversation ids
    std::vector<std::string> list_conversations() const;

    size_t size() const;

    // Optional lifecycle notifications (nullptr = disabled)
    void set_event_bus(EventBus* bus) { event_bus_ = bus; }

    // ── Single-session compatibility ────────────────────────────
    // Everything below acts on the default conversation (the one created
    // without an explicit id). Multi-conversation callers use handles.

    std::optional<std::string> default_conversation_id() const;
    EngineSession* session() const;
    std::string session_id() const;
    std::string model_name() const;
    uint64_t total_input_tokens() const;
    uint64_t total_output_tokens() const;
    uint32_t context_window() const;
    void reset_usage();
    bool switch_model(const std::string& model);
    std::vector<ModelInfo> provider_models() const;
    std::string send_to_default(const std::string& text);
    void end_default_session();

private:
    using HandleFactory = std::function<std::shared_ptr<SessionHandle>(const std::string&)>;

    std::shared_ptr<SessionHandle> register_handle(const std::optional<std::string>& conversation_id,
                                                   const HandleFactory& make,
                                                   bool resumed);
    std::shared_ptr<SessionHandle> default_handle() const;
    std::shared_ptr<SessionHandle> detach(const std::string& conversation_id);

    ExecutionEngine& engine_;
    EngineConfig defaults_;
    size_t tool_result_max_chars_;
    EventBus* event_bus_ = nullptr;

    std::mutex lifecycle_mutex_;
    mutable std::mutex map_mutex_;
    std::unordered_map<std::string, std::shared_ptr<SessionHandle>> handles_;
    std::optional<std::string> default_conversation_id_;
};

} // namespace chorus
