#include "console.hpp"

namespace chorus {

void ConsoleDisplay::set_active_conversation(const std::string& conversation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_ = conversation_id;
}

std::string ConsoleDisplay::active_conversation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

std::string ConsoleDisplay::status(const std::string& conversation_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = status_.find(resolve(conversation_id));
    return it == status_.end() ? "Ready" : it->second;
}

std::string ConsoleDisplay::resolve(const std::string& conversation_id) const {
    return conversation_id.empty() ? active_ : conversation_id;
}

void ConsoleDisplay::line(const std::string& conversation_id, const std::string& text) {
    out_ << "[" << conversation_id << "] " << text << "\n" << std::flush;
}

// ── Simple display methods ──────────────────────────────────────

void ConsoleDisplay::add_system_message(const std::string& text,
                                        const std::string& conversation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    line(resolve(conversation_id), "* " + text);
}

void ConsoleDisplay::add_user_message(const std::string& text,
                                      const std::string& conversation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    line(resolve(conversation_id), "> " + text);
}

void ConsoleDisplay::add_assistant_message(const std::string& text,
                                           const std::string& conversation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    line(resolve(conversation_id), text);
}

void ConsoleDisplay::show_error(const std::string& text,
                                const std::string& conversation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    line(resolve(conversation_id), "Error: " + text);
}

void ConsoleDisplay::update_status(const std::string& text,
                                   const std::string& conversation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_[resolve(conversation_id)] = text;
}

void ConsoleDisplay::start_processing(const std::string& label,
                                      const std::string& conversation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_[resolve(conversation_id)] = label + "...";
}

void ConsoleDisplay::finish_processing(const std::string& conversation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string cid = resolve(conversation_id);
    status_[cid] = "Ready";
    printed_.erase(cid);
}

// ── Streaming ───────────────────────────────────────────────────

void ConsoleDisplay::on_stream_block_start(const std::string& conversation_id,
                                           const std::string& block_type) {
    std::lock_guard<std::mutex> lock(mutex_);
    printed_[conversation_id] = 0;
    out_ << "[" << conversation_id << "] ";
    if (block_type == "thinking") out_ << "(thinking) ";
    out_ << std::flush;
}

void ConsoleDisplay::on_stream_block_delta(const std::string& conversation_id,
                                           const std::string& /*block_type*/,
                                           const std::string& accumulated_text) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t& done = printed_[conversation_id];
    if (accumulated_text.size() > done) {
        out_ << accumulated_text.substr(done) << std::flush;
        done = accumulated_text.size();
    }
}

void ConsoleDisplay::on_stream_block_end(const std::string& conversation_id,
                                         const std::string& block_type,
                                         const std::string& final_text,
                                         bool had_block_start) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!had_block_start) {
        line(conversation_id, (block_type == "thinking" ? "(thinking) " : "") + final_text);
        return;
    }
    size_t done = printed_[conversation_id];
    if (final_text.size() > done) out_ << final_text.substr(done);
    out_ << "\n" << std::flush;
    printed_.erase(conversation_id);
}

void ConsoleDisplay::on_stream_tool_start(const std::string& conversation_id,
                                          const std::string& name,
                                          const nlohmann::json& tool_input) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_[conversation_id] = "Running " + name + "...";
    line(conversation_id, "tool " + name + " " + tool_input.dump());
}

void ConsoleDisplay::on_stream_tool_end(const std::string& conversation_id,
                                        const std::string& name,
                                        const nlohmann::json& /*tool_input*/,
                                        const std::string& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_[conversation_id] = "Thinking...";
    std::string first = result.substr(0, result.find('\n'));
    line(conversation_id, "tool " + name + " -> " + first);
}

void ConsoleDisplay::on_stream_usage_update(const std::string& conversation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_[conversation_id] = "Thinking...";
}

} // namespace chorus
