#pragma once
#include <string>
#include <vector>
#include <optional>
#include <atomic>
#include <chrono>

namespace chorus {

enum class TurnState { Idle, Processing, Cancelled };

inline const char* turn_state_to_string(TurnState state) {
    switch (state) {
        case TurnState::Idle: return "idle";
        case TurnState::Processing: return "processing";
        case TurnState::Cancelled: return "cancelled";
    }
    return "idle";
}

// Per-conversation mutable state. Exclusively owned by one conversation.
//
// Threading: is_processing and streaming_cancelled are read from the UI
// thread and so are atomic. The stream fields are written only by the
// conversation's worker (through its wired closures). queued_message is
// guarded by the owning TurnDriver's per-conversation mutex.
struct ConversationState {
    using Clock = std::chrono::steady_clock;

    std::string conversation_id;
    std::string created_at;

    std::atomic<bool> is_processing{false};
    std::atomic<bool> streaming_cancelled{false};

    std::string stream_accumulated_text;
    int tool_count_this_turn = 0;
    bool got_stream_content = false;

    std::optional<std::string> queued_message;
    std::optional<Clock::time_point> processing_start_time;

    // Conversation totals, updated when a turn finishes
    std::string last_assistant_text;
    int tool_call_count = 0;
    std::vector<double> response_times;  // seconds, oldest first

    explicit ConversationState(std::string id);

    ConversationState(const ConversationState&) = delete;
    ConversationState& operator=(const ConversationState&) = delete;

    TurnState turn_state() const;

    // Clear per-turn stream fields and stamp the start time.
    void begin_turn();

    // Reset per-turn stream fields to IDLE defaults. Records and returns the
    // turn's elapsed seconds (0 if no turn was running).
    // is_processing, streaming_cancelled and queued_message are transition
    // state owned by the turn driver and are left alone.
    double finish_turn();
};

} // namespace chorus
