#include "echo.hpp"
#include "../event.hpp"
#include "../plugin.hpp"
#include "../util.hpp"
#include <chrono>
#include <stdexcept>
#include <thread>

static chorus::EngineRegistrar reg_echo("echo",
    [](const chorus::Config& config) {
        return std::make_unique<chorus::EchoEngine>(config.echo);
    });

namespace chorus {

// ── EchoSession ─────────────────────────────────────────────────

EchoSession::EchoSession(std::string session_id, std::string model,
                         const EchoConfig& config, StreamHook hook)
    : session_id_(std::move(session_id))
    , model_(std::move(model))
    , chunk_delay_ms_(config.chunk_delay_ms)
    , context_window_(config.context_window)
    , hook_(std::move(hook))
{}

void EchoSession::emit(const char* event, const nlohmann::json& data) {
    if (hook_) hook_(event, data);
}

std::string EchoSession::model() const {
    std::lock_guard<std::mutex> lock(model_mutex_);
    return model_;
}

bool EchoSession::set_model(const std::string& model) {
    std::lock_guard<std::mutex> lock(model_mutex_);
    model_ = model;
    return true;
}

std::vector<ModelInfo> EchoSession::provider_models() const {
    return {ModelInfo{model(), "echo"}};
}

std::string EchoSession::execute(const std::string& message) {
    emit(stream_events::ExecutionStart, {{"prompt", message}});

    std::string body = trim(message);
    if (body.rfind("!fail", 0) == 0) {
        std::string reason = trim(body.substr(5));
        throw std::runtime_error(reason.empty() ? "echo engine failure" : reason);
    }

    if (body.rfind("!tool", 0) == 0) {
        body = trim(body.substr(5));
        nlohmann::json input = {{"text", body}};
        emit(stream_events::ToolPre, {{"tool_name", "word_count"}, {"tool_input", input}});
        nlohmann::json result = {{"words", split(body, ' ').size()}};
        emit(stream_events::ToolPost, {{"tool_name", "word_count"},
                                       {"tool_input", input},
                                       {"result", result}});
    }

    std::string reply = "You said: " + body;
    auto words = split(reply, ' ');

    emit(stream_events::ContentBlockStart, {{"block_type", "text"}, {"block_index", 0}});
    std::string streamed;
    for (size_t i = 0; i < words.size(); i++) {
        if (cancelled_.load()) break;
        if (chunk_delay_ms_ > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(chunk_delay_ms_));
        }
        std::string chunk = words[i] + (i + 1 < words.size() ? " " : "");
        streamed += chunk;
        emit(stream_events::ContentBlockDelta,
             {{"block_type", "text"}, {"block_index", 0}, {"delta", chunk}});
    }
    emit(stream_events::ContentBlockEnd,
         {{"block_index", 0}, {"block", {{"type", "text"}, {"text", streamed}}}});

    emit(stream_events::LlmResponse,
         {{"model", model()},
          {"usage", {{"input", estimate_tokens(message)},
                     {"output", estimate_tokens(streamed)}}}});
    emit(stream_events::ExecutionEnd, {{"response", streamed}});
    return streamed;
}

// ── EchoEngine ──────────────────────────────────────────────────

std::unique_ptr<EngineSession> EchoEngine::create_session(const EngineConfig& config,
                                                          StreamHook hook) {
    std::string id = generate_id();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        known_sessions_.insert(id);
        most_recent_ = id;
    }
    std::string model = config.model.empty() ? config_.model : config.model;
    return std::make_unique<EchoSession>(id, model, config_, std::move(hook));
}

std::unique_ptr<EngineSession> EchoEngine::resume_session(const std::string& session_id,
                                                          const EngineConfig& config,
                                                          StreamHook hook) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!known_sessions_.count(session_id)) {
            throw std::runtime_error("echo: unknown session " + session_id);
        }
    }
    std::string model = config.model.empty() ? config_.model : config.model;
    return std::make_unique<EchoSession>(session_id, model, config_, std::move(hook));
}

std::string EchoEngine::most_recent_session() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return most_recent_;
}

void EchoEngine::end_session(EngineSession& session) {
    // Ended sessions stay resumable, like a transcript left on disk
    session.cancel();
}

} // namespace chorus
