#pragma once
#include "conversation.hpp"
#include "config.hpp"
#include "display.hpp"
#include "session_registry.hpp"
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <unordered_map>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <chrono>

namespace chorus {

class EventBus; // forward declaration

// Drives turns for many conversations at once. Each conversation gets its
// own worker thread while it is processing; there is no lock held across a
// turn, so conversations run fully in parallel.
//
// Per conversation:  IDLE -> PROCESSING -> IDLE
//                    PROCESSING -> CANCELLED -> IDLE
// A message submitted while PROCESSING goes to a single-slot queue (last
// write wins) and is dispatched automatically when the turn ends.
class TurnDriver {
public:
    enum class SubmitResult { Started, Queued };

    TurnDriver(SessionRegistry& registry, Display& display, const Config& config);
    ~TurnDriver();

    TurnDriver(const TurnDriver&) = delete;
    TurnDriver& operator=(const TurnDriver&) = delete;

    // Create the conversation's state (idempotent). The engine session is
    // created on the first turn unless the registry already has a handle.
    ConversationState& open_conversation(const std::string& conversation_id);

    // End the session and destroy the state. Returns false and leaves the
    // conversation untouched while it is processing. Unknown ids return true.
    bool close_conversation(const std::string& conversation_id);

    // Replace the conversation's engine session with a resumed one. Returns
    // false while processing. Throws NotFoundError if the conversation is not
    // open; a failed resume propagates and leaves it without a session.
    bool resume_conversation(const std::string& conversation_id, const std::string& session_id);

    // Start a turn, or queue the text if a turn is already running.
    // Throws NotFoundError if the conversation is not open.
    SubmitResult submit(const std::string& conversation_id, const std::string& text);

    // Cooperative cancel of the running turn. Clears any queued message.
    // Returns false (no-op) if idle or already cancelled.
    bool cancel(const std::string& conversation_id);

    bool is_processing(const std::string& conversation_id) const;
    TurnState turn_state(const std::string& conversation_id) const;
    std::optional<std::string> queued_message(const std::string& conversation_id) const;

    // State access for frontends and tests. Stream fields are only stable
    // while the conversation is idle. Null if not open.
    const ConversationState* state(const std::string& conversation_id) const;

    std::vector<std::string> conversations() const;

    // Block until the conversation is idle (queued follow-ups included)
    void wait_idle(const std::string& conversation_id);
    bool wait_idle(const std::string& conversation_id, std::chrono::milliseconds timeout);
    void wait_all_idle();

    // Optional lifecycle notifications (nullptr = disabled)
    void set_event_bus(EventBus* bus) { event_bus_ = bus; }

private:
    struct Conversation {
        explicit Conversation(const std::string& id) : state(id) {}

        ConversationState state;
        std::mutex mutex;               // guards transitions + queued_message
        std::condition_variable idle_cv;
        std::thread worker;
        bool closed = false;            // set under mutex by close_conversation
    };

    std::shared_ptr<Conversation> find(const std::string& conversation_id) const;
    void run_worker(std::shared_ptr<Conversation> conv, std::string text);
    void run_turn(Conversation& conv, const std::string& text, bool from_queue);
    std::shared_ptr<SessionHandle> ensure_handle(const std::string& conversation_id);

    SessionRegistry& registry_;
    Display& display_;
    bool streaming_enabled_;
    std::chrono::milliseconds queue_delay_;
    EventBus* event_bus_ = nullptr;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Conversation>> conversations_;
};

} // namespace chorus
