#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace chorus {

// Frontend surface. Streaming methods are called on the conversation's own
// worker thread and always name the conversation; a frontend that renders
// on a single thread marshals them onto its own delivery context.
//
// Simple display methods take an optional conversation id; empty means
// "the currently active conversation".
class Display {
public:
    virtual ~Display() = default;

    virtual void add_system_message(const std::string& text,
                                    const std::string& conversation_id = "") = 0;
    virtual void add_user_message(const std::string& text,
                                  const std::string& conversation_id = "") = 0;
    virtual void add_assistant_message(const std::string& text,
                                       const std::string& conversation_id = "") = 0;
    virtual void show_error(const std::string& text,
                            const std::string& conversation_id = "") = 0;
    virtual void update_status(const std::string& text,
                               const std::string& conversation_id = "") = 0;
    virtual void start_processing(const std::string& label = "Thinking",
                                  const std::string& conversation_id = "") = 0;
    virtual void finish_processing(const std::string& conversation_id = "") = 0;

    // ── Streaming (worker thread) ───────────────────────────────
    virtual void on_stream_block_start(const std::string& conversation_id,
                                       const std::string& block_type) = 0;
    virtual void on_stream_block_delta(const std::string& conversation_id,
                                       const std::string& block_type,
                                       const std::string& accumulated_text) = 0;
    // had_block_start == false means no start event was seen for this block;
    // the frontend shows final_text directly.
    virtual void on_stream_block_end(const std::string& conversation_id,
                                     const std::string& block_type,
                                     const std::string& final_text,
                                     bool had_block_start) = 0;
    virtual void on_stream_tool_start(const std::string& conversation_id,
                                      const std::string& name,
                                      const nlohmann::json& tool_input) = 0;
    virtual void on_stream_tool_end(const std::string& conversation_id,
                                    const std::string& name,
                                    const nlohmann::json& tool_input,
                                    const std::string& result) = 0;
    virtual void on_stream_usage_update(const std::string& conversation_id) = 0;
};

} // namespace chorus
