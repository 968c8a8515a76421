#pragma once
#include "../engine.hpp"
#include "../config.hpp"
#include <string>
#include <atomic>
#include <mutex>
#include <unordered_set>

namespace chorus {

// Local engine that streams the user's message back word by word.
// "!tool <text>" runs a word_count tool first; "!fail <reason>" raises.
class EchoSession : public EngineSession {
public:
    EchoSession(std::string session_id, std::string model,
                const EchoConfig& config, StreamHook hook);

    std::string execute(const std::string& message) override;
    std::string session_id() const override { return session_id_; }
    std::string model() const override;
    uint32_t context_window() const override { return context_window_; }
    bool set_model(const std::string& model) override;
    std::vector<ModelInfo> provider_models() const override;
    void begin_turn() override { cancelled_.store(false); }
    void cancel() override { cancelled_.store(true); }

private:
    void emit(const char* event, const nlohmann::json& data);

    std::string session_id_;
    mutable std::mutex model_mutex_;
    std::string model_;
    uint32_t chunk_delay_ms_;
    uint32_t context_window_;
    StreamHook hook_;
    std::atomic<bool> cancelled_{false};
};

class EchoEngine : public ExecutionEngine {
public:
    explicit EchoEngine(EchoConfig config) : config_(std::move(config)) {}

    std::unique_ptr<EngineSession> create_session(const EngineConfig& config,
                                                  StreamHook hook) override;
    std::unique_ptr<EngineSession> resume_session(const std::string& session_id,
                                                  const EngineConfig& config,
                                                  StreamHook hook) override;
    void end_session(EngineSession& session) override;
    std::string most_recent_session() const override;
    std::string engine_name() const override { return "echo"; }

private:
    EchoConfig config_;
    mutable std::mutex mutex_;
    std::unordered_set<std::string> known_sessions_;
    std::string most_recent_;
};

} // namespace chorus
