#include "conversation.hpp"
#include "util.hpp"

namespace chorus {

ConversationState::ConversationState(std::string id)
    : conversation_id(std::move(id))
    , created_at(timestamp_now())
{}

TurnState ConversationState::turn_state() const {
    if (!is_processing.load()) return TurnState::Idle;
    return streaming_cancelled.load() ? TurnState::Cancelled : TurnState::Processing;
}

void ConversationState::begin_turn() {
    stream_accumulated_text.clear();
    tool_count_this_turn = 0;
    got_stream_content = false;
    processing_start_time = Clock::now();
}

double ConversationState::finish_turn() {
    double elapsed = 0.0;
    if (processing_start_time) {
        elapsed = std::chrono::duration<double>(Clock::now() - *processing_start_time).count();
        processing_start_time.reset();
        response_times.push_back(elapsed);
    }
    if (!stream_accumulated_text.empty()) last_assistant_text = stream_accumulated_text;
    tool_call_count += tool_count_this_turn;
    stream_accumulated_text.clear();
    tool_count_this_turn = 0;
    got_stream_content = false;
    return elapsed;
}

} // namespace chorus
