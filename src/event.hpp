#pragma once
#include <string>
#include <cstdint>

namespace chorus {

// ── Engine stream event names ───────────────────────────────────
// Emitted by an ExecutionEngine through the hook bound at session creation.

namespace stream_events {
    constexpr const char* ContentBlockStart = "content_block:start";
    constexpr const char* ContentBlockDelta = "content_block:delta";
    constexpr const char* ContentBlockEnd   = "content_block:end";
    constexpr const char* ToolPre           = "tool:pre";
    constexpr const char* ToolPost          = "tool:post";
    constexpr const char* ExecutionStart    = "execution:start";
    constexpr const char* ExecutionEnd      = "execution:end";
    constexpr const char* LlmResponse       = "llm:response";
} // namespace stream_events

// Tag-based event dispatch: no RTTI, no dynamic_cast.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

// ── Lifecycle event tags ────────────────────────────────────────

namespace event_tags {
    constexpr const char* SessionCreated = "SessionCreated";
    constexpr const char* SessionEnded   = "SessionEnded";
    constexpr const char* TurnStarted    = "TurnStarted";
    constexpr const char* TurnFinished   = "TurnFinished";
    constexpr const char* MessageQueued  = "MessageQueued";
} // namespace event_tags

// ── Event structs ───────────────────────────────────────────────

struct SessionCreatedEvent : Event {
    static constexpr const char* TAG = event_tags::SessionCreated;
    std::string conversation_id;
    std::string session_id;
    bool resumed = false;

    SessionCreatedEvent() { type_tag = TAG; }
};

struct SessionEndedEvent : Event {
    static constexpr const char* TAG = event_tags::SessionEnded;
    std::string conversation_id;
    std::string session_id;

    SessionEndedEvent() { type_tag = TAG; }
};

struct TurnStartedEvent : Event {
    static constexpr const char* TAG = event_tags::TurnStarted;
    std::string conversation_id;
    std::string message;
    bool from_queue = false;

    TurnStartedEvent() { type_tag = TAG; }
};

struct TurnFinishedEvent : Event {
    static constexpr const char* TAG = event_tags::TurnFinished;
    std::string conversation_id;
    bool cancelled = false;
    bool failed = false;
    double elapsed_seconds = 0.0;

    TurnFinishedEvent() { type_tag = TAG; }
};

struct MessageQueuedEvent : Event {
    static constexpr const char* TAG = event_tags::MessageQueued;
    std::string conversation_id;
    std::string message;
    bool replaced = false; // an earlier queued message was overwritten

    MessageQueuedEvent() { type_tag = TAG; }
};

} // namespace chorus
