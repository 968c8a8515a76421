#pragma once
#include <stdexcept>
#include <string>

namespace chorus {

// Base for errors scoped to one conversation. Never carries state of
// any other conversation.
class SessionError : public std::runtime_error {
public:
    SessionError(const std::string& message, const std::string& conversation_id)
        : std::runtime_error(message), conversation_id_(conversation_id) {}

    const std::string& conversation_id() const { return conversation_id_; }

private:
    std::string conversation_id_;
};

// No live handle for the conversation id
class NotFoundError : public SessionError {
public:
    explicit NotFoundError(const std::string& conversation_id)
        : SessionError("No active session for conversation '" + conversation_id + "'",
                       conversation_id) {}
};

// create_session/resume_session for an id that already has a live handle
class ConfigurationError : public SessionError {
public:
    explicit ConfigurationError(const std::string& conversation_id)
        : SessionError("Conversation '" + conversation_id +
                       "' already has a live session; end it first",
                       conversation_id) {}
};

// The execution engine raised while running a turn
class EngineFailure : public SessionError {
public:
    EngineFailure(const std::string& conversation_id, const std::string& reason)
        : SessionError(reason, conversation_id) {}
};

} // namespace chorus
