#include "session_registry.hpp"
#include "errors.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "util.hpp"
#include <algorithm>

namespace chorus {

SessionRegistry::SessionRegistry(ExecutionEngine& engine,
                                 EngineConfig defaults,
                                 size_t tool_result_max_chars)
    : engine_(engine)
    , defaults_(std::move(defaults))
    , tool_result_max_chars_(tool_result_max_chars)
{}

SessionRegistry::~SessionRegistry() {
    // No notifications here: subscribers may already be gone.
    std::unordered_map<std::string, std::shared_ptr<SessionHandle>> remaining;
    {
        std::lock_guard<std::mutex> lock(map_mutex_);
        remaining.swap(handles_);
        default_conversation_id_.reset();
    }
    for (auto& [id, handle] : remaining) {
        handle->teardown(engine_);
    }
}

// ── Creation ────────────────────────────────────────────────────

std::shared_ptr<SessionHandle> SessionRegistry::register_handle(
    const std::optional<std::string>& conversation_id,
    const HandleFactory& make,
    bool resumed) {
    bool auto_generated = !conversation_id.has_value();
    std::string cid = auto_generated ? generate_id() : *conversation_id;

    std::shared_ptr<SessionHandle> handle;
    {
        std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
        {
            std::lock_guard<std::mutex> lock(map_mutex_);
            if (handles_.count(cid)) throw ConfigurationError(cid);
        }

        // Engine call happens outside the map lock so lookups keep flowing.
        handle = make(cid);

        std::lock_guard<std::mutex> lock(map_mutex_);
        handles_.emplace(cid, handle);
        if (auto_generated) default_conversation_id_ = cid;
    }

    if (event_bus_) {
        SessionCreatedEvent ev;
        ev.conversation_id = cid;
        ev.session_id = handle->session_id();
        ev.resumed = resumed;
        event_bus_->publish(ev);
    }
    return handle;
}

std::shared_ptr<SessionHandle> SessionRegistry::create_session(
    const std::optional<std::string>& conversation_id) {
    return create_session(conversation_id, defaults_);
}

std::shared_ptr<SessionHandle> SessionRegistry::create_session(
    const std::optional<std::string>& conversation_id,
    const EngineConfig& config) {
    return register_handle(conversation_id, [&](const std::string& cid) {
        auto handle = SessionHandle::create(cid, engine_, config, tool_result_max_chars_);
        handle->reset_usage();
        return handle;
    }, false);
}

std::shared_ptr<SessionHandle> SessionRegistry::resume_session(
    const std::string& session_id,
    const std::optional<std::string>& conversation_id) {
    return resume_session(session_id, conversation_id, defaults_);
}

std::shared_ptr<SessionHandle> SessionRegistry::resume_session(
    const std::string& session_id,
    const std::optional<std::string>& conversation_id,
    const EngineConfig& config) {
    return register_handle(conversation_id, [&](const std::string& cid) {
        auto handle = SessionHandle::resume(cid, session_id, engine_, config,
                                            tool_result_max_chars_);
        handle->reset_usage();
        return handle;
    }, true);
}

// ── Lookup ──────────────────────────────────────────────────────

std::shared_ptr<SessionHandle> SessionRegistry::get_handle(const std::string& conversation_id) const {
    std::lock_guard<std::mutex> lock(map_mutex_);
    auto it = handles_.find(conversation_id);
    if (it == handles_.end()) return nullptr;
    return it->second;
}

std::string SessionRegistry::send_message(const std::string& conversation_id,
                                          const std::string& text) {
    auto handle = get_handle(conversation_id);
    if (!handle || !handle->has_session()) throw NotFoundError(conversation_id);

    try {
        return handle->execute(text);
    } catch (const SessionError&) {
        throw;
    } catch (const std::exception& e) {
        throw EngineFailure(conversation_id, e.what());
    }
}

std::unordered_map<std::string, std::shared_ptr<SessionHandle>>
SessionRegistry::active_handles() const {
    std::lock_guard<std::mutex> lock(map_mutex_);
    return handles_;
}

std::vector<std::string> SessionRegistry::list_conversations() const {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(map_mutex_);
        ids.reserve(handles_.size());
        for (const auto& [id, _] : handles_) {
            ids.push_back(id);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(map_mutex_);
    return handles_.size();
}

// ── Teardown ────────────────────────────────────────────────────

std::shared_ptr<SessionHandle> SessionRegistry::detach(const std::string& conversation_id) {
    std::lock_guard<std::mutex> lock(map_mutex_);
    auto it = handles_.find(conversation_id);
    if (it == handles_.end()) return nullptr;
    auto handle = std::move(it->second);
    handles_.erase(it);
    if (default_conversation_id_ == conversation_id) default_conversation_id_.reset();
    return handle;
}

void SessionRegistry::end_session(const std::string& conversation_id) {
    std::shared_ptr<SessionHandle> handle;
    bool torn_down = false;
    {
        std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
        handle = detach(conversation_id);
        if (!handle) return;
        torn_down = handle->teardown(engine_);
    }

    if (torn_down && event_bus_) {
        SessionEndedEvent ev;
        ev.conversation_id = conversation_id;
        ev.session_id = handle->session_id();
        event_bus_->publish(ev);
    }
}

void SessionRegistry::end_all() {
    for (const auto& id : list_conversations()) {
        end_session(id);
    }
}

void SessionRegistry::remove_handle(const std::string& conversation_id) {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    detach(conversation_id);
}

// ── Single-session compatibility ────────────────────────────────

std::shared_ptr<SessionHandle> SessionRegistry::default_handle() const {
    std::lock_guard<std::mutex> lock(map_mutex_);
    if (!default_conversation_id_) return nullptr;
    auto it = handles_.find(*default_conversation_id_);
    if (it == handles_.end()) return nullptr;
    return it->second;
}

std::optional<std::string> SessionRegistry::default_conversation_id() const {
    std::lock_guard<std::mutex> lock(map_mutex_);
    return default_conversation_id_;
}

EngineSession* SessionRegistry::session() const {
    auto h = default_handle();
    return h ? h->session() : nullptr;
}

std::string SessionRegistry::session_id() const {
    auto h = default_handle();
    return h ? h->session_id() : std::string();
}

std::string SessionRegistry::model_name() const {
    auto h = default_handle();
    return h ? h->usage().model_name : std::string();
}

uint64_t SessionRegistry::total_input_tokens() const {
    auto h = default_handle();
    return h ? h->usage().input_tokens : 0;
}

uint64_t SessionRegistry::total_output_tokens() const {
    auto h = default_handle();
    return h ? h->usage().output_tokens : 0;
}

uint32_t SessionRegistry::context_window() const {
    auto h = default_handle();
    return h ? h->usage().context_window : 0;
}

void SessionRegistry::reset_usage() {
    if (auto h = default_handle()) h->reset_usage();
}

bool SessionRegistry::switch_model(const std::string& model) {
    auto h = default_handle();
    return h ? h->switch_model(model) : false;
}

std::vector<ModelInfo> SessionRegistry::provider_models() const {
    auto h = default_handle();
    return h ? h->provider_models() : std::vector<ModelInfo>{};
}

std::string SessionRegistry::send_to_default(const std::string& text) {
    auto id = default_conversation_id();
    if (!id) throw NotFoundError("");
    return send_message(*id, text);
}

void SessionRegistry::end_default_session() {
    auto id = default_conversation_id();
    if (id) end_session(*id);
}

} // namespace chorus
