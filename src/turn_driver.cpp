#include "turn_driver.hpp"
#include "errors.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "stream_wiring.hpp"
#include "util.hpp"
#include <algorithm>
#include <iostream>

namespace chorus {

TurnDriver::TurnDriver(SessionRegistry& registry, Display& display, const Config& config)
    : registry_(registry)
    , display_(display)
    , streaming_enabled_(config.streaming.enabled)
    , queue_delay_(config.queue.dispatch_delay_ms)
{}

TurnDriver::~TurnDriver() {
    std::vector<std::shared_ptr<Conversation>> all;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, conv] : conversations_) all.push_back(conv);
        conversations_.clear();
    }

    // Stop what can be stopped, then wait for every worker.
    for (auto& conv : all) {
        std::thread worker;
        bool was_processing = false;
        {
            std::lock_guard<std::mutex> lock(conv->mutex);
            conv->state.queued_message.reset();
            if (conv->state.is_processing.load()) {
                conv->state.streaming_cancelled.store(true);
                was_processing = true;
            }
            worker = std::move(conv->worker);
        }
        if (was_processing) {
            if (auto handle = registry_.get_handle(conv->state.conversation_id)) handle->cancel();
        }
        if (worker.joinable()) worker.join();
    }
}

// ── Conversation lifecycle ──────────────────────────────────────

ConversationState& TurnDriver::open_conversation(const std::string& conversation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = conversations_.find(conversation_id);
    if (it == conversations_.end()) {
        it = conversations_.emplace(conversation_id,
                                    std::make_shared<Conversation>(conversation_id)).first;
    }
    return it->second->state;
}

bool TurnDriver::close_conversation(const std::string& conversation_id) {
    std::shared_ptr<Conversation> conv;
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = conversations_.find(conversation_id);
        if (it == conversations_.end()) return true;
        conv = it->second;

        std::lock_guard<std::mutex> conv_lock(conv->mutex);
        if (conv->state.is_processing.load()) return false;
        conv->closed = true;
        worker = std::move(conv->worker);
        conversations_.erase(it);
    }

    if (worker.joinable()) worker.join();
    registry_.end_session(conversation_id);
    return true;
}

bool TurnDriver::resume_conversation(const std::string& conversation_id,
                                     const std::string& session_id) {
    auto conv = find(conversation_id);
    if (!conv) throw NotFoundError(conversation_id);
    {
        // Held across the swap so no turn can start on the old session
        std::lock_guard<std::mutex> lock(conv->mutex);
        if (conv->closed) throw NotFoundError(conversation_id);
        if (conv->state.is_processing.load()) return false;
        display_.update_status("Loading session...", conversation_id);
        registry_.end_session(conversation_id);
        registry_.resume_session(session_id, conversation_id);
    }
    display_.update_status("Ready (resumed)", conversation_id);
    display_.add_system_message("Resumed session " + session_id, conversation_id);
    return true;
}

std::shared_ptr<TurnDriver::Conversation> TurnDriver::find(const std::string& conversation_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = conversations_.find(conversation_id);
    if (it == conversations_.end()) return nullptr;
    return it->second;
}

// ── Submit / queue / cancel ─────────────────────────────────────

TurnDriver::SubmitResult TurnDriver::submit(const std::string& conversation_id,
                                            const std::string& text) {
    auto conv = find(conversation_id);
    if (!conv) throw NotFoundError(conversation_id);

    std::thread previous;
    bool queued = false;
    bool replaced = false;
    {
        std::lock_guard<std::mutex> lock(conv->mutex);
        // Closed between find() and here
        if (conv->closed) throw NotFoundError(conversation_id);
        if (conv->state.is_processing.load()) {
            queued = true;
            replaced = conv->state.queued_message.has_value();
            conv->state.queued_message = text;
        } else {
            conv->state.is_processing.store(true);
            conv->state.streaming_cancelled.store(false);
            // The previous worker has already gone idle; it only needs joining.
            previous = std::move(conv->worker);
            conv->worker = std::thread(&TurnDriver::run_worker, this, conv, text);
        }
    }
    if (previous.joinable()) previous.join();

    if (!queued) return SubmitResult::Started;

    display_.add_system_message("Queued (will send after current response): " +
                                truncate_utf8(text, 80), conversation_id);
    if (event_bus_) {
        MessageQueuedEvent ev;
        ev.conversation_id = conversation_id;
        ev.message = text;
        ev.replaced = replaced;
        event_bus_->publish(ev);
    }
    return SubmitResult::Queued;
}

bool TurnDriver::cancel(const std::string& conversation_id) {
    auto conv = find(conversation_id);
    if (!conv) return false;
    {
        std::lock_guard<std::mutex> lock(conv->mutex);
        if (!conv->state.is_processing.load()) return false;
        if (conv->state.streaming_cancelled.exchange(true)) return false;
        conv->state.queued_message.reset();
    }

    display_.add_system_message("Generation cancelled.", conversation_id);
    if (auto handle = registry_.get_handle(conversation_id)) handle->cancel();
    return true;
}

bool TurnDriver::is_processing(const std::string& conversation_id) const {
    auto conv = find(conversation_id);
    return conv && conv->state.is_processing.load();
}

TurnState TurnDriver::turn_state(const std::string& conversation_id) const {
    auto conv = find(conversation_id);
    return conv ? conv->state.turn_state() : TurnState::Idle;
}

std::optional<std::string> TurnDriver::queued_message(const std::string& conversation_id) const {
    auto conv = find(conversation_id);
    if (!conv) return std::nullopt;
    std::lock_guard<std::mutex> lock(conv->mutex);
    return conv->state.queued_message;
}

const ConversationState* TurnDriver::state(const std::string& conversation_id) const {
    auto conv = find(conversation_id);
    return conv ? &conv->state : nullptr;
}

std::vector<std::string> TurnDriver::conversations() const {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ids.reserve(conversations_.size());
        for (const auto& [id, _] : conversations_) ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

void TurnDriver::wait_idle(const std::string& conversation_id) {
    auto conv = find(conversation_id);
    if (!conv) return;
    std::unique_lock<std::mutex> lock(conv->mutex);
    conv->idle_cv.wait(lock, [&]() { return !conv->state.is_processing.load(); });
}

bool TurnDriver::wait_idle(const std::string& conversation_id, std::chrono::milliseconds timeout) {
    auto conv = find(conversation_id);
    if (!conv) return true;
    std::unique_lock<std::mutex> lock(conv->mutex);
    return conv->idle_cv.wait_for(lock, timeout,
                                  [&]() { return !conv->state.is_processing.load(); });
}

void TurnDriver::wait_all_idle() {
    for (const auto& id : conversations()) {
        wait_idle(id);
    }
}

// ── Worker ──────────────────────────────────────────────────────

void TurnDriver::run_worker(std::shared_ptr<Conversation> conv, std::string text) {
    bool from_queue = false;
    for (;;) {
        run_turn(*conv, text, from_queue);

        std::unique_lock<std::mutex> lock(conv->mutex);
        conv->state.streaming_cancelled.store(false);
        if (conv->state.queued_message) {
            text = std::move(*conv->state.queued_message);
            conv->state.queued_message.reset();
            from_queue = true;
            lock.unlock();
            if (queue_delay_.count() > 0) std::this_thread::sleep_for(queue_delay_);
            continue;
        }
        conv->state.is_processing.store(false);
        conv->idle_cv.notify_all();
        return;
    }
}

std::shared_ptr<SessionHandle> TurnDriver::ensure_handle(const std::string& conversation_id) {
    if (auto handle = registry_.get_handle(conversation_id)) return handle;
    display_.update_status("Starting session...", conversation_id);
    try {
        return registry_.create_session(conversation_id);
    } catch (const ConfigurationError&) {
        // Created by someone else between lookup and create
        auto handle = registry_.get_handle(conversation_id);
        if (!handle) throw;
        return handle;
    }
}

void TurnDriver::run_turn(Conversation& conv, const std::string& text, bool from_queue) {
    ConversationState& state = conv.state;
    const std::string& cid = state.conversation_id;

    state.begin_turn();
    if (event_bus_) {
        TurnStartedEvent ev;
        ev.conversation_id = cid;
        ev.message = text;
        ev.from_queue = from_queue;
        event_bus_->publish(ev);
    }
    if (from_queue) display_.add_user_message(text, cid);
    display_.start_processing("Thinking", cid);

    bool failed = false;
    try {
        auto handle = ensure_handle(cid);
        handle->reset_usage();
        wire_stream_callbacks(*handle, state, display_, streaming_enabled_);

        // A cancel after begin_turn() finds the handle and reaches the engine
        // after the reset. One that landed earlier (during session creation
        // or the queue delay) skips the engine turn.
        handle->begin_turn();
        if (!state.streaming_cancelled.load()) {
            std::string response = registry_.send_message(cid, text);

            if (!state.streaming_cancelled.load() && !state.got_stream_content && !response.empty()) {
                state.last_assistant_text = response;
                display_.add_assistant_message(response, cid);
            }
        }
    } catch (const std::exception& e) {
        failed = true;
        std::cerr << "[turn] " << cid << ": " << e.what() << "\n";
        if (!state.streaming_cancelled.load()) display_.show_error(e.what(), cid);
    }

    bool cancelled = state.streaming_cancelled.load();
    double elapsed = state.finish_turn();
    display_.finish_processing(cid);

    if (event_bus_) {
        TurnFinishedEvent ev;
        ev.conversation_id = cid;
        ev.cancelled = cancelled;
        ev.failed = failed;
        ev.elapsed_seconds = elapsed;
        event_bus_->publish(ev);
    }
}

} // namespace chorus
