#include "config.hpp"
#include "plugin.hpp"
#include "event_bus.hpp"
#include "event.hpp"
#include "session_registry.hpp"
#include "turn_driver.hpp"
#include "displays/console.hpp"
#include "util.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <memory>

static void print_usage() {
    std::cout << "Usage: chorus [options]\n"
              << "\n"
              << "Options:\n"
              << "  -m, --message MSG    Send a single message and exit\n"
              << "  --engine NAME        Use a specific execution engine\n"
              << "  --model NAME         Use a specific model\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Interactive commands:\n"
              << "  /open ID             Open a conversation and make it active\n"
              << "  /switch ID           Make an open conversation active\n"
              << "  /close ID            Close a conversation (refused while processing)\n"
              << "  /cancel              Cancel the active conversation's turn\n"
              << "  /list                List open conversations\n"
              << "  /status              Show the active conversation's session info\n"
              << "  /model NAME          Switch the active conversation's model\n"
              << "  /resume [ID]         Resume a session into the active conversation\n"
              << "                       (default: most recent session)\n"
              << "  /help                Show available commands\n"
              << "  /quit, /exit         Exit the REPL\n"
              << "\n"
              << "Environment variables:\n"
              << "  CHORUS_ENGINE        Execution engine (default: echo)\n"
              << "  CHORUS_MODEL         Model name\n"
              << "  CHORUS_WORKDIR       Working directory for engine sessions\n";
}

// Lifecycle events go to the diagnostic log
static void log_lifecycle(chorus::EventBus& bus) {
    chorus::subscribe<chorus::SessionCreatedEvent>(bus,
        [](const chorus::SessionCreatedEvent& ev) {
            std::cerr << "[registry] " << (ev.resumed ? "Resumed" : "Created")
                      << " session " << ev.session_id
                      << " for " << ev.conversation_id << "\n";
        });
    chorus::subscribe<chorus::SessionEndedEvent>(bus,
        [](const chorus::SessionEndedEvent& ev) {
            std::cerr << "[registry] Ended session " << ev.session_id
                      << " for " << ev.conversation_id << "\n";
        });
    chorus::subscribe<chorus::TurnFinishedEvent>(bus,
        [](const chorus::TurnFinishedEvent& ev) {
            if (ev.failed || ev.cancelled) {
                std::cerr << "[turn] " << ev.conversation_id
                          << (ev.failed ? " failed" : " cancelled")
                          << " after " << ev.elapsed_seconds << "s\n";
            }
        });
}

static void print_status(chorus::TurnDriver& driver,
                         chorus::SessionRegistry& registry,
                         chorus::ConsoleDisplay& display,
                         const std::string& cid) {
    std::cout << "Conversation: " << cid << "\n"
              << "State: " << chorus::turn_state_to_string(driver.turn_state(cid)) << "\n"
              << "Status: " << display.status(cid) << "\n";
    auto handle = registry.get_handle(cid);
    if (!handle) {
        std::cout << "Session: (not started)\n";
        return;
    }
    auto usage = handle->usage();
    std::cout << "Session: " << handle->session_id() << "\n"
              << "Model: " << usage.model_name << "\n"
              << "Context window: " << usage.context_window << "\n"
              << "Last turn tokens: " << usage.input_tokens << " in, "
              << usage.output_tokens << " out\n";
    if (const auto* state = driver.state(cid)) {
        if (!driver.is_processing(cid)) {
            std::cout << "Tool calls: " << state->tool_call_count << "\n"
                      << "Turns: " << state->response_times.size() << "\n";
        }
    }
}

int main(int argc, char* argv[]) try {
    // Parse arguments
    std::string message;
    std::string engine_name;
    std::string model_name;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if ((std::strcmp(argv[i], "-m") == 0 || std::strcmp(argv[i], "--message") == 0) && i + 1 < argc) {
            message = argv[++i];
        } else if (std::strcmp(argv[i], "--engine") == 0 && i + 1 < argc) {
            engine_name = argv[++i];
        } else if (std::strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
            model_name = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = chorus::Config::load();

    // Override config with CLI args
    if (!engine_name.empty()) {
        config.engine = engine_name;
    }
    if (!model_name.empty()) {
        config.model = model_name;
    }

    std::unique_ptr<chorus::ExecutionEngine> engine;
    try {
        engine = chorus::PluginRegistry::instance().create_engine(config.engine, config);
    } catch (const std::exception& e) {
        std::cerr << "Error creating engine: " << e.what() << "\n";
        return 1;
    }

    chorus::EventBus bus;
    log_lifecycle(bus);

    chorus::ConsoleDisplay display;
    chorus::SessionRegistry registry(*engine, config.engine_config(),
                                     config.streaming.tool_result_max_chars);
    registry.set_event_bus(&bus);
    chorus::TurnDriver driver(registry, display, config);
    driver.set_event_bus(&bus);

    // Single message mode
    if (!message.empty()) {
        const std::string cid = "main";
        display.set_active_conversation(cid);
        driver.open_conversation(cid);
        driver.submit(cid, message);
        driver.wait_idle(cid);
        driver.close_conversation(cid);
        return 0;
    }

    std::string active = "main";
    driver.open_conversation(active);
    display.set_active_conversation(active);

    // Interactive REPL
    std::cout << "Chorus multi-conversation shell\n"
              << "Engine: " << engine->engine_name()
              << " | Conversation: " << active << "\n"
              << "Type /help for commands, /quit to exit.\n\n";

    std::string line;
    while (true) {
        std::cout << "chorus[" << active << "]> " << std::flush;

        if (!std::getline(std::cin, line)) {
            // EOF (Ctrl+D)
            std::cout << "\n";
            break;
        }

        line = chorus::trim(line);
        if (line.empty()) continue;

        // Handle slash commands
        if (line[0] == '/') {
            if (line == "/quit" || line == "/exit") {
                break;
            } else if (line.substr(0, 6) == "/open ") {
                std::string cid = chorus::trim(line.substr(6));
                if (cid.empty()) {
                    std::cout << "Usage: /open ID\n";
                    continue;
                }
                driver.open_conversation(cid);
                active = cid;
                display.set_active_conversation(active);
                std::cout << "Opened " << cid << "\n";
            } else if (line.substr(0, 8) == "/switch ") {
                std::string cid = chorus::trim(line.substr(8));
                if (!driver.state(cid)) {
                    std::cout << "No open conversation: " << cid << "\n";
                    continue;
                }
                active = cid;
                display.set_active_conversation(active);
            } else if (line.substr(0, 7) == "/close ") {
                std::string cid = chorus::trim(line.substr(7));
                if (!driver.state(cid)) {
                    std::cout << "No open conversation: " << cid << "\n";
                    continue;
                }
                if (!driver.close_conversation(cid)) {
                    std::cout << "Cannot close " << cid
                              << " while it is processing. Use /cancel first.\n";
                    continue;
                }
                std::cout << "Closed " << cid << "\n";
                if (cid == active) {
                    auto remaining = driver.conversations();
                    active = remaining.empty() ? "main" : remaining.front();
                    driver.open_conversation(active);
                    display.set_active_conversation(active);
                }
            } else if (line == "/cancel") {
                if (!driver.cancel(active)) {
                    std::cout << "Nothing to cancel.\n";
                }
            } else if (line == "/list") {
                for (const auto& cid : driver.conversations()) {
                    std::cout << (cid == active ? "* " : "  ") << cid
                              << "  " << chorus::turn_state_to_string(driver.turn_state(cid))
                              << "  " << display.status(cid);
                    if (auto queued = driver.queued_message(cid)) {
                        std::cout << "  (queued: " << chorus::truncate_utf8(*queued, 40) << ")";
                    }
                    std::cout << "\n";
                }
            } else if (line == "/status") {
                print_status(driver, registry, display, active);
            } else if (line.substr(0, 7) == "/model ") {
                std::string new_model = chorus::trim(line.substr(7));
                auto handle = registry.get_handle(active);
                if (!handle) {
                    std::cout << "No session yet for " << active
                              << "; send a message first.\n";
                } else if (handle->switch_model(new_model)) {
                    std::cout << "Model set to: " << new_model << "\n";
                } else {
                    std::cout << "Engine does not support switching models.\n";
                }
            } else if (line == "/resume" || line.substr(0, 8) == "/resume ") {
                std::string session_id = chorus::trim(line.substr(7));
                if (session_id.empty()) session_id = engine->most_recent_session();
                if (session_id.empty()) {
                    std::cout << "No session to resume.\n";
                    continue;
                }
                try {
                    if (!driver.resume_conversation(active, session_id)) {
                        std::cout << "Cannot resume into " << active
                                  << " while it is processing. Use /cancel first.\n";
                    }
                } catch (const std::exception& e) {
                    std::cout << "Resume failed: " << e.what() << "\n";
                }
            } else if (line == "/help") {
                print_usage();
            } else {
                std::cout << "Unknown command: " << line << "\n";
            }
            continue;
        }

        driver.submit(active, line);
    }

    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
