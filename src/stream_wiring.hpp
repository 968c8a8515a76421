#pragma once
#include "session_handle.hpp"
#include "conversation.hpp"
#include "display.hpp"

namespace chorus {

// Install a fresh set of closures on all eight of the handle's slots for
// the coming turn. The closures capture this conversation's id and state,
// turn engine events into conversation-addressed Display calls, and stop
// producing UI events once the conversation is cancelled.
//
// Must run at the start of every turn (queued follow-ups included) so no
// closure from a finished turn survives into the next one.
//
// With streaming disabled the slots are cleared instead; the turn driver
// then shows the engine's final response as a whole message.
void wire_stream_callbacks(SessionHandle& handle,
                           ConversationState& state,
                           Display& display,
                           bool streaming_enabled = true);

} // namespace chorus
