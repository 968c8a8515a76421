#include <catch2/catch.hpp>
#include "mock_engine.hpp"
#include "recording_display.hpp"
#include "stream_wiring.hpp"
#include "session_handle.hpp"
#include "conversation.hpp"
#include "event.hpp"

using namespace chorus;

namespace {

struct Fixture {
    MockEngine engine;
    std::shared_ptr<SessionHandle> handle = SessionHandle::create("c1", engine, {});
    ConversationState state{"c1"};
    RecordingDisplay display;

    void delta(const std::string& text) {
        handle->dispatch(stream_events::ContentBlockDelta, {{"delta", text}});
    }
    void start(const std::string& type = "text") {
        handle->dispatch(stream_events::ContentBlockStart, {{"block_type", type}});
    }
    void end(const std::string& text, const std::string& type = "text") {
        handle->dispatch(stream_events::ContentBlockEnd,
                         {{"block", {{"type", type}, {"text", text}}}});
    }
};

} // namespace

TEST_CASE("StreamWiring: deltas accumulate into conversation state", "[stream_wiring]") {
    Fixture f;
    wire_stream_callbacks(*f.handle, f.state, f.display);

    f.start();
    f.delta("Hel");
    f.delta("lo");

    REQUIRE(f.state.stream_accumulated_text == "Hello");
    REQUIRE(f.state.got_stream_content);

    auto calls = f.display.calls_for("c1");
    REQUIRE(calls.size() == 3);
    REQUIRE(calls[0].method == "block_start");
    REQUIRE(calls[1].method == "block_delta");
    REQUIRE(calls[1].text == "Hel");
    REQUIRE(calls[2].text == "Hello");
}

TEST_CASE("StreamWiring: block end after start", "[stream_wiring]") {
    Fixture f;
    wire_stream_callbacks(*f.handle, f.state, f.display);

    f.start();
    f.delta("abc");
    f.end("abc!");

    auto calls = f.display.calls_for("c1");
    REQUIRE(calls.back().method == "block_end");
    REQUIRE(calls.back().text == "abc!");
    REQUIRE(calls.back().had_block_start);
    REQUIRE(f.state.stream_accumulated_text == "abc!");
}

TEST_CASE("StreamWiring: block end without start", "[stream_wiring]") {
    Fixture f;
    wire_stream_callbacks(*f.handle, f.state, f.display);

    f.end("whole answer");

    auto calls = f.display.calls_for("c1");
    REQUIRE(calls.size() == 1);
    REQUIRE(calls[0].method == "block_end");
    REQUIRE_FALSE(calls[0].had_block_start);
    REQUIRE(calls[0].text == "whole answer");
    REQUIRE(f.state.got_stream_content);
}

TEST_CASE("StreamWiring: empty end text uses accumulated text", "[stream_wiring]") {
    Fixture f;
    wire_stream_callbacks(*f.handle, f.state, f.display);

    f.start();
    f.delta("partial");
    f.end("");

    REQUIRE(f.display.calls_for("c1").back().text == "partial");
}

TEST_CASE("StreamWiring: new block clears accumulated text", "[stream_wiring]") {
    Fixture f;
    wire_stream_callbacks(*f.handle, f.state, f.display);

    f.start("thinking");
    f.delta("pondering");
    f.handle->dispatch(stream_events::ContentBlockEnd,
                       {{"block", {{"type", "thinking"}, {"thinking", "pondering"}}}});
    f.start();
    f.delta("answer");

    REQUIRE(f.state.stream_accumulated_text == "answer");
    auto calls = f.display.calls_for("c1");
    REQUIRE(calls[2].block_type == "thinking");
}

TEST_CASE("StreamWiring: tool calls", "[stream_wiring]") {
    Fixture f;
    wire_stream_callbacks(*f.handle, f.state, f.display);

    f.handle->dispatch(stream_events::ToolPre,
                       {{"tool_name", "grep"}, {"tool_input", {{"pattern", "x"}}}});
    f.handle->dispatch(stream_events::ToolPost,
                       {{"tool_name", "grep"}, {"result", "found"}});
    f.handle->dispatch(stream_events::ToolPre, {{"tool_name", "ls"}});

    REQUIRE(f.state.tool_count_this_turn == 2);
    REQUIRE(f.display.count("tool_start", "c1") == 2);
    REQUIRE(f.display.count("tool_end", "c1") == 1);
    auto calls = f.display.calls_for("c1");
    REQUIRE(calls[1].text == "found");
}

TEST_CASE("StreamWiring: execution and usage events", "[stream_wiring]") {
    Fixture f;
    wire_stream_callbacks(*f.handle, f.state, f.display);

    f.handle->dispatch(stream_events::ExecutionStart, nlohmann::json::object());
    f.handle->dispatch(stream_events::LlmResponse, {{"usage", {{"input", 3}}}});

    auto calls = f.display.calls_for("c1");
    REQUIRE(calls.size() == 2);
    REQUIRE(calls[0].method == "status");
    REQUIRE(calls[0].text == "Thinking...");
    REQUIRE(calls[1].method == "usage");
}

TEST_CASE("StreamWiring: execution end closes an open block", "[stream_wiring]") {
    Fixture f;
    wire_stream_callbacks(*f.handle, f.state, f.display);

    f.start();
    f.delta("cut off");
    f.handle->dispatch(stream_events::ExecutionEnd, nlohmann::json::object());
    f.handle->dispatch(stream_events::ExecutionEnd, nlohmann::json::object());

    REQUIRE(f.display.count("block_end", "c1") == 1);
    auto last = f.display.calls_for("c1").back();
    REQUIRE(last.text == "cut off");
    REQUIRE(last.had_block_start);
}

TEST_CASE("StreamWiring: cancellation drops further events", "[stream_wiring]") {
    Fixture f;
    wire_stream_callbacks(*f.handle, f.state, f.display);

    f.start();
    f.delta("before");
    f.state.streaming_cancelled.store(true);
    f.delta(" after");
    f.handle->dispatch(stream_events::ToolPre, {{"tool_name", "ls"}});
    f.end("before after");
    f.handle->dispatch(stream_events::ExecutionEnd, nlohmann::json::object());

    REQUIRE(f.state.stream_accumulated_text == "before");
    REQUIRE(f.state.tool_count_this_turn == 0);
    REQUIRE(f.display.calls_for("c1").size() == 2);
}

TEST_CASE("StreamWiring: streaming disabled installs empty slots", "[stream_wiring]") {
    Fixture f;
    wire_stream_callbacks(*f.handle, f.state, f.display);
    wire_stream_callbacks(*f.handle, f.state, f.display, false);

    f.start();
    f.delta("ignored");
    f.end("ignored");

    REQUIRE(f.display.calls().empty());
    REQUIRE(f.state.stream_accumulated_text.empty());
    REQUIRE_FALSE(f.state.got_stream_content);
}

TEST_CASE("StreamWiring: rewiring replaces stale closures", "[stream_wiring]") {
    Fixture f;
    ConversationState other("c2");
    wire_stream_callbacks(*f.handle, f.state, f.display);
    f.start();
    f.delta("old");

    // Next turn is wired to a different state object
    wire_stream_callbacks(*f.handle, other, f.display);
    f.start();
    f.delta("new");

    REQUIRE(f.state.stream_accumulated_text == "old");
    REQUIRE(other.stream_accumulated_text == "new");
    REQUIRE(f.display.count("block_delta", "c2") == 1);
}

TEST_CASE("StreamWiring: rewiring resets block tracking", "[stream_wiring]") {
    Fixture f;
    wire_stream_callbacks(*f.handle, f.state, f.display);
    f.start();
    f.delta("dangling");

    wire_stream_callbacks(*f.handle, f.state, f.display);
    f.end("fresh");

    REQUIRE_FALSE(f.display.calls_for("c1").back().had_block_start);
}

TEST_CASE("StreamWiring: ends never precede starts per conversation", "[stream_wiring]") {
    Fixture f;
    wire_stream_callbacks(*f.handle, f.state, f.display);

    for (int i = 0; i < 5; i++) {
        f.start();
        f.delta("x");
        f.end("x");
    }

    int open = 0;
    for (const auto& c : f.display.calls_for("c1")) {
        if (c.method == "block_start") open++;
        if (c.method == "block_end") {
            REQUIRE(open == 1);
            open--;
        }
    }
    REQUIRE(open == 0);
}
