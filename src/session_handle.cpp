#include "session_handle.hpp"
#include "errors.hpp"
#include "event.hpp"
#include "util.hpp"
#include <iostream>

namespace chorus {

namespace {

std::string string_field(const nlohmann::json& j, const char* key,
                         const std::string& fallback = "") {
    if (!j.is_object()) return fallback;
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

uint64_t count_field(const nlohmann::json& j, const char* key) {
    if (!j.is_object()) return 0;
    auto it = j.find(key);
    if (it == j.end() || !it->is_number_integer()) return 0;
    int64_t v = it->get<int64_t>();
    return v > 0 ? static_cast<uint64_t>(v) : 0;
}

nlohmann::json object_field(const nlohmann::json& j, const char* key) {
    if (!j.is_object()) return nlohmann::json::object();
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return nlohmann::json::object();
    return *it;
}

std::string result_text(const nlohmann::json& data) {
    if (!data.is_object()) return {};
    auto it = data.find("result");
    if (it == data.end() || it->is_null()) return {};
    if (it->is_string()) return it->get<std::string>();
    if (it->is_structured()) return it->dump(2);
    return it->dump();
}

} // namespace

SessionHandle::SessionHandle(Private, std::string conversation_id, size_t tool_result_max_chars)
    : conversation_id_(std::move(conversation_id))
    , tool_result_max_chars_(tool_result_max_chars)
    , callbacks_(std::make_shared<StreamCallbacks>())
{}

SessionHandle::~SessionHandle() {
    // Destroy the engine session while the slots and counters are intact
    session_.reset();
}

std::shared_ptr<SessionHandle> SessionHandle::create(const std::string& conversation_id,
                                                     ExecutionEngine& engine,
                                                     const EngineConfig& config,
                                                     size_t tool_result_max_chars) {
    auto handle = std::make_shared<SessionHandle>(Private{}, conversation_id,
                                                  tool_result_max_chars);

    // The session is owned by the handle and destroyed first, so the raw
    // pointer outlives every call the engine can make through the hook.
    SessionHandle* self = handle.get();
    handle->session_ = engine.create_session(
        config, [self](const std::string& event, const nlohmann::json& data) {
            self->dispatch(event, data);
        });
    if (!handle->session_) {
        throw std::runtime_error(engine.engine_name() + " returned no session");
    }
    handle->session_id_ = handle->session_->session_id();
    handle->extract_model_info();
    return handle;
}

std::shared_ptr<SessionHandle> SessionHandle::resume(const std::string& conversation_id,
                                                     const std::string& session_id,
                                                     ExecutionEngine& engine,
                                                     const EngineConfig& config,
                                                     size_t tool_result_max_chars) {
    auto handle = std::make_shared<SessionHandle>(Private{}, conversation_id,
                                                  tool_result_max_chars);

    SessionHandle* self = handle.get();
    handle->session_ = engine.resume_session(
        session_id, config, [self](const std::string& event, const nlohmann::json& data) {
            self->dispatch(event, data);
        });
    if (!handle->session_) {
        throw std::runtime_error(engine.engine_name() + " could not resume " + session_id);
    }
    handle->session_id_ = handle->session_->session_id();
    handle->extract_model_info();
    return handle;
}

EngineSession* SessionHandle::session() const {
    return ended_.load() ? nullptr : session_.get();
}

void SessionHandle::set_callbacks(StreamCallbacks callbacks) {
    auto fresh = std::make_shared<const StreamCallbacks>(std::move(callbacks));
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    callbacks_ = std::move(fresh);
}

void SessionHandle::clear_callbacks() {
    set_callbacks(StreamCallbacks{});
}

void SessionHandle::dispatch(const std::string& event, const nlohmann::json& data) {
    std::shared_ptr<const StreamCallbacks> cb;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        cb = callbacks_;
    }

    if (!data.is_null() && !data.is_object()) {
        std::cerr << "[dispatch] " << conversation_id_ << ": ignoring " << event
                  << " with non-object payload\n";
        return;
    }

    try {
        route(event, data, *cb);
    } catch (const std::exception& e) {
        // One conversation's bad event or failing callback must not unwind
        // into the engine thread.
        std::cerr << "[dispatch] " << conversation_id_ << ": " << event
                  << " failed: " << e.what() << "\n";
    } catch (...) {
        std::cerr << "[dispatch] " << conversation_id_ << ": " << event
                  << " failed: unknown exception\n";
    }
}

void SessionHandle::route(const std::string& event, const nlohmann::json& data,
                          const StreamCallbacks& cb) {
    if (event == stream_events::ContentBlockStart) {
        if (cb.on_content_block_start) {
            int index = 0;
            if (data.is_object()) {
                auto it = data.find("block_index");
                if (it != data.end() && it->is_number_integer()) index = it->get<int>();
            }
            cb.on_content_block_start(string_field(data, "block_type", "text"), index);
        }
    } else if (event == stream_events::ContentBlockDelta) {
        std::string delta = string_field(data, "delta");
        if (delta.empty()) delta = string_field(data, "text");
        if (delta.empty()) delta = string_field(data, "content");
        if (!delta.empty() && cb.on_content_block_delta) {
            cb.on_content_block_delta(string_field(data, "block_type", "text"), delta);
        }
    } else if (event == stream_events::ContentBlockEnd) {
        nlohmann::json block = object_field(data, "block");
        std::string block_type = string_field(block, "type");
        if (block_type == "text") {
            if (cb.on_content_block_end) {
                cb.on_content_block_end("text", string_field(block, "text"));
            }
        } else if (block_type == "thinking" || block_type == "reasoning") {
            if (cb.on_content_block_end) {
                std::string text = string_field(block, "thinking");
                if (text.empty()) text = string_field(block, "text");
                cb.on_content_block_end("thinking", text);
            }
        }
    } else if (event == stream_events::ToolPre) {
        if (cb.on_tool_pre) {
            cb.on_tool_pre(string_field(data, "tool_name", "unknown"),
                           object_field(data, "tool_input"));
        }
    } else if (event == stream_events::ToolPost) {
        if (cb.on_tool_post) {
            cb.on_tool_post(string_field(data, "tool_name", "unknown"),
                            object_field(data, "tool_input"),
                            truncate_utf8(result_text(data), tool_result_max_chars_));
        }
    } else if (event == stream_events::ExecutionStart) {
        if (cb.on_execution_start) cb.on_execution_start();
    } else if (event == stream_events::ExecutionEnd) {
        if (cb.on_execution_end) cb.on_execution_end();
    } else if (event == stream_events::LlmResponse) {
        nlohmann::json usage = object_field(data, "usage");
        std::string model = string_field(data, "model");
        {
            std::lock_guard<std::mutex> lock(usage_mutex_);
            usage_.input_tokens += count_field(usage, "input");
            usage_.output_tokens += count_field(usage, "output");
            if (!model.empty() && usage_.model_name.empty()) {
                usage_.model_name = model;
            }
        }
        if (cb.on_usage_update) cb.on_usage_update();
    }
    // Anything else is an event kind this core does not know; ignored.
}

void SessionHandle::reset_usage() {
    std::lock_guard<std::mutex> lock(usage_mutex_);
    usage_.input_tokens = 0;
    usage_.output_tokens = 0;
}

UsageTotals SessionHandle::usage() const {
    std::lock_guard<std::mutex> lock(usage_mutex_);
    return usage_;
}

void SessionHandle::extract_model_info() {
    EngineSession* s = session();
    if (!s) return;
    std::string model = s->model();
    uint32_t window = s->context_window();
    std::lock_guard<std::mutex> lock(usage_mutex_);
    if (!model.empty()) usage_.model_name = model;
    usage_.context_window = window;
}

bool SessionHandle::switch_model(const std::string& model) {
    EngineSession* s = session();
    if (!s || model.empty()) return false;
    if (!s->set_model(model)) return false;
    std::lock_guard<std::mutex> lock(usage_mutex_);
    usage_.model_name = model;
    return true;
}

std::vector<ModelInfo> SessionHandle::provider_models() const {
    EngineSession* s = session();
    if (!s) return {};
    return s->provider_models();
}

std::string SessionHandle::execute(const std::string& message) {
    EngineSession* s = session();
    if (!s) throw NotFoundError(conversation_id_);
    return s->execute(message);
}

void SessionHandle::begin_turn() {
    EngineSession* s = session();
    if (s) s->begin_turn();
}

void SessionHandle::cancel() {
    EngineSession* s = session();
    if (s) s->cancel();
}

bool SessionHandle::teardown(ExecutionEngine& engine) {
    if (ended_.exchange(true)) return false;
    try {
        engine.end_session(*session_);
    } catch (const std::exception& e) {
        std::cerr << "[registry] " << conversation_id_ << ": engine teardown failed: "
                  << e.what() << "\n";
    }
    return true;
}

} // namespace chorus
