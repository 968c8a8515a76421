#include "stream_wiring.hpp"
#include <memory>
#include <string>

namespace chorus {

namespace {

// Block bookkeeping private to one wiring (one turn)
struct BlockTracker {
    std::string block_type;
    bool open = false;
};

} // namespace

void wire_stream_callbacks(SessionHandle& handle,
                           ConversationState& state,
                           Display& display,
                           bool streaming_enabled) {
    if (!streaming_enabled) {
        handle.clear_callbacks();
        return;
    }

    const std::string cid = state.conversation_id;
    auto block = std::make_shared<BlockTracker>();
    ConversationState* conv = &state;
    Display* ui = &display;

    StreamCallbacks cb;

    cb.on_content_block_start = [cid, conv, ui, block](const std::string& block_type, int /*index*/) {
        if (conv->streaming_cancelled.load()) return;
        block->block_type = block_type;
        block->open = true;
        conv->stream_accumulated_text.clear();
        ui->on_stream_block_start(cid, block_type);
    };

    cb.on_content_block_delta = [cid, conv, ui](const std::string& block_type,
                                                const std::string& delta) {
        if (conv->streaming_cancelled.load()) return;
        conv->stream_accumulated_text += delta;
        conv->got_stream_content = true;
        ui->on_stream_block_delta(cid, block_type, conv->stream_accumulated_text);
    };

    cb.on_content_block_end = [cid, conv, ui, block](const std::string& block_type,
                                                     const std::string& text) {
        if (conv->streaming_cancelled.load()) return;
        bool had_start = block->open;
        block->open = false;
        std::string final_text = text.empty() ? conv->stream_accumulated_text : text;
        conv->stream_accumulated_text = final_text;
        conv->got_stream_content = true;
        ui->on_stream_block_end(cid, block_type, final_text, had_start);
    };

    cb.on_tool_pre = [cid, conv, ui](const std::string& name, const nlohmann::json& input) {
        if (conv->streaming_cancelled.load()) return;
        conv->tool_count_this_turn++;
        ui->on_stream_tool_start(cid, name, input);
    };

    cb.on_tool_post = [cid, conv, ui](const std::string& name, const nlohmann::json& input,
                                      const std::string& result) {
        if (conv->streaming_cancelled.load()) return;
        ui->on_stream_tool_end(cid, name, input, result);
    };

    cb.on_execution_start = [cid, conv, ui]() {
        if (conv->streaming_cancelled.load()) return;
        ui->update_status("Thinking...", cid);
    };

    // A block that streamed but never got its end event is closed here so
    // the frontend is not left with a dangling block.
    cb.on_execution_end = [cid, conv, ui, block]() {
        if (conv->streaming_cancelled.load()) return;
        if (!block->open) return;
        block->open = false;
        ui->on_stream_block_end(cid, block->block_type, conv->stream_accumulated_text, true);
    };

    cb.on_usage_update = [cid, conv, ui]() {
        if (conv->streaming_cancelled.load()) return;
        ui->on_stream_usage_update(cid);
    };

    handle.set_callbacks(std::move(cb));
}

} // namespace chorus
