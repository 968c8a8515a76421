#pragma once
#include "../display.hpp"
#include <iostream>
#include <mutex>
#include <string>
#include <unordered_map>

namespace chorus {

// Line-oriented terminal frontend. Every conversation's output is tagged
// with its id, so background conversations can stream while another one
// is active. Calls arrive on many worker threads; one mutex serialises
// them onto the output stream.
class ConsoleDisplay : public Display {
public:
    explicit ConsoleDisplay(std::ostream& out = std::cout) : out_(out) {}

    void set_active_conversation(const std::string& conversation_id);
    std::string active_conversation() const;

    // Last status line per conversation ("Ready" if never set)
    std::string status(const std::string& conversation_id) const;

    void add_system_message(const std::string& text,
                            const std::string& conversation_id = "") override;
    void add_user_message(const std::string& text,
                          const std::string& conversation_id = "") override;
    void add_assistant_message(const std::string& text,
                               const std::string& conversation_id = "") override;
    void show_error(const std::string& text,
                    const std::string& conversation_id = "") override;
    void update_status(const std::string& text,
                       const std::string& conversation_id = "") override;
    void start_processing(const std::string& label = "Thinking",
                          const std::string& conversation_id = "") override;
    void finish_processing(const std::string& conversation_id = "") override;

    void on_stream_block_start(const std::string& conversation_id,
                               const std::string& block_type) override;
    void on_stream_block_delta(const std::string& conversation_id,
                               const std::string& block_type,
                               const std::string& accumulated_text) override;
    void on_stream_block_end(const std::string& conversation_id,
                             const std::string& block_type,
                             const std::string& final_text,
                             bool had_block_start) override;
    void on_stream_tool_start(const std::string& conversation_id,
                              const std::string& name,
                              const nlohmann::json& tool_input) override;
    void on_stream_tool_end(const std::string& conversation_id,
                            const std::string& name,
                            const nlohmann::json& tool_input,
                            const std::string& result) override;
    void on_stream_usage_update(const std::string& conversation_id) override;

private:
    // Caller holds mutex_
    std::string resolve(const std::string& conversation_id) const;
    void line(const std::string& conversation_id, const std::string& text);

    std::ostream& out_;
    mutable std::mutex mutex_;
    std::string active_;
    std::unordered_map<std::string, std::string> status_;
    // Bytes of the open block already written, per conversation
    std::unordered_map<std::string, size_t> printed_;
};

} // namespace chorus
