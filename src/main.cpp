#include "config.hpp"
#include "errors.hpp"
#include "event_bus.hpp"
#include "formatter.hpp"
#include "http.hpp"
#include "prompt.hpp"
#include "providers/ollama.hpp"
#include "session.hpp"
#include "stats.hpp"
#include "tool_registry.hpp"
#include "tools/command.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>

static std::atomic<bool> g_interrupted{false};

static void interrupt_handler(int /*sig*/) {
    g_interrupted.store(true);
}

static const char* kCliSession = "cli";

static void print_usage() {
    std::cout << "Usage: tooledchat [options]\n"
              << "\n"
              << "Options:\n"
              << "  -m, --message MSG      Send a single message and exit\n"
              << "  --host HOST            Ollama host (default: localhost)\n"
              << "  --port PORT            Ollama port (default: 11434)\n"
              << "  --model NAME           Use specific model\n"
              << "  --system-prompt TEXT   Replace the base system prompt\n"
              << "  --config PATH          Config file (default: ~/.tooledchat/config.json)\n"
              << "  --list-models          List models installed on the server and exit\n"
              << "  --check                Check that the server is reachable and exit\n"
              << "  -v, --verbose          Trace conversation events to stderr\n"
              << "  -h, --help             Show this help\n"
              << "\n"
              << "Interactive commands:\n"
              << "  /status              Show model, server and history info\n"
              << "  /tools               List available tools\n"
              << "  /stats               Show request statistics\n"
              << "  /model NAME          Switch model\n"
              << "  /clear               Clear conversation history\n"
              << "  /help                Show available commands\n"
              << "  /quit, /exit         Exit the REPL\n"
              << "\n"
              << "Environment variables:\n"
              << "  OLLAMA_HOST               Ollama host\n"
              << "  OLLAMA_PORT               Ollama port\n"
              << "  OLLAMA_MODEL              Model name\n"
              << "  TOOLEDCHAT_SYSTEM_PROMPT  System prompt override\n";
}

// Runs one turn; Ctrl+C while it runs cancels the turn instead of exiting.
static tooledchat::TurnOutcome run_interruptible(tooledchat::SessionManager& sessions,
                                                 const std::string& text) {
    tooledchat::TurnOptions options;
    tooledchat::CancellationToken token = options.cancel;

    g_interrupted.store(false);
    std::atomic<bool> done{false};
    std::signal(SIGINT, interrupt_handler);
    std::thread watcher([&]() {
        while (!done.load()) {
            if (g_interrupted.exchange(false)) {
                token.cancel();
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });

    tooledchat::TurnOutcome outcome = sessions.run_turn(kCliSession, text, options);

    done.store(true);
    watcher.join();
    std::signal(SIGINT, SIG_DFL);
    return outcome;
}

static void print_status(tooledchat::SessionManager& sessions,
                         const tooledchat::ToolRegistry& registry) {
    auto session = sessions.get_session(kCliSession);
    const auto& cfg = sessions.config();
    std::cout << "Server: " << cfg.ollama.base_url() << "\n"
              << "Model: " << session->loop->model() << "\n"
              << "Tools: " << registry.size() << "\n"
              << "History: " << session->loop->history_size() << " messages\n";
}

static void print_tools(const tooledchat::ToolRegistry& registry) {
    auto tools = registry.snapshot();
    if (tools->empty()) {
        std::cout << "No tools configured.\n";
        return;
    }
    for (const auto& tool : tools->tools()) {
        std::cout << "  " << tool->tool_name() << ": " << tool->description() << "\n";
        for (const auto& p : tool->parameters()) {
            std::cout << "      " << p.name << " (" << tooledchat::param_type_name(p.type)
                      << (p.required ? ", required" : "") << ")\n";
        }
    }
}

int main(int argc, char* argv[]) try {
    // Parse arguments
    std::string message;
    std::string host;
    std::string port;
    std::string model_name;
    std::string system_prompt;
    std::string config_path;
    bool list_models = false;
    bool check = false;
    bool verbose = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if ((std::strcmp(argv[i], "-m") == 0 || std::strcmp(argv[i], "--message") == 0) && i + 1 < argc) {
            message = argv[++i];
        } else if (std::strcmp(argv[i], "--host") == 0 && i + 1 < argc) {
            host = argv[++i];
        } else if (std::strcmp(argv[i], "--port") == 0 && i + 1 < argc) {
            port = argv[++i];
        } else if (std::strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
            model_name = argv[++i];
        } else if (std::strcmp(argv[i], "--system-prompt") == 0 && i + 1 < argc) {
            system_prompt = argv[++i];
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--list-models") == 0) {
            list_models = true;
        } else if (std::strcmp(argv[i], "--check") == 0) {
            check = true;
        } else if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    // Initialize
    std::signal(SIGPIPE, SIG_IGN);
    tooledchat::http_init();
    auto config = config_path.empty() ? tooledchat::Config::load()
                                      : tooledchat::Config::load_from(config_path);

    // Override config with CLI args
    if (!host.empty()) {
        config.ollama.host = host;
    }
    if (!port.empty()) {
        char* end = nullptr;
        unsigned long p = std::strtoul(port.c_str(), &end, 10);
        if (*end != '\0' || p == 0 || p > 65535) {
            std::cerr << "Invalid port: " << port << "\n";
            tooledchat::http_cleanup();
            return 1;
        }
        config.ollama.port = static_cast<uint16_t>(p);
    }
    if (!model_name.empty()) {
        config.ollama.model = model_name;
    }
    if (!system_prompt.empty()) {
        config.prompts.system_prompt = system_prompt;
    }

    tooledchat::CurlHttpClient http_client;

    // Server probes
    if (check || list_models) {
        tooledchat::OllamaProvider probe(http_client, config.ollama.base_url(),
                                         static_cast<long>(config.ollama.request_timeout),
                                         static_cast<long>(config.ollama.health_check_timeout));
        int rc = 0;
        try {
            if (check) {
                std::cout << "Ollama " << probe.health_check() << " at "
                          << probe.base_url() << "\n";
            }
            if (list_models) {
                for (const auto& name : probe.list_models()) {
                    std::cout << name << "\n";
                }
            }
        } catch (const tooledchat::Error& e) {
            std::cerr << "Error (" << tooledchat::error_kind_name(e.kind()) << "): "
                      << e.what() << "\n";
            rc = 1;
        }
        tooledchat::http_cleanup();
        return rc;
    }

    // Templates and tools are session setup; defects here abort startup
    tooledchat::PromptTemplates templates;
    tooledchat::ToolRegistry registry;
    try {
        templates = tooledchat::load_prompt_templates(config.prompts.dir, config.prompts.language);
        registry.register_tools(tooledchat::create_command_tools(config.tools));
    } catch (const tooledchat::Error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        tooledchat::http_cleanup();
        return 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error in tool configuration: " << e.what() << "\n";
        tooledchat::http_cleanup();
        return 1;
    }

    tooledchat::EventBus bus;
    tooledchat::TurnStats stats(bus);
    tooledchat::SessionManager sessions(config, http_client, registry, templates);
    sessions.set_event_bus(&bus);
    if (verbose) {
        bus.subscribe_all([](const tooledchat::Event& e) {
            std::cerr << "[event] " << e.type_tag << "\n";
        });
    }

    // Single message mode
    if (!message.empty()) {
        auto outcome = run_interruptible(sessions, message);
        std::cout << tooledchat::format_response(outcome, templates) << '\n';
        tooledchat::http_cleanup();
        return outcome.succeeded() ? 0 : 1;
    }

    // Interactive REPL
    std::cout << "tooledchat\n"
              << "Server: " << config.ollama.base_url()
              << " | Model: " << config.ollama.model
              << " | Tools: " << registry.size() << "\n"
              << "Type /help for commands, /quit to exit. Ctrl+C cancels a running request.\n\n";

    std::string line;
    while (true) {
        std::cout << "tooledchat> " << std::flush;

        if (!std::getline(std::cin, line)) {
            // EOF (Ctrl+D)
            std::cout << "\n";
            break;
        }

        // Skip empty lines
        if (line.empty()) continue;

        // Handle slash commands
        if (line[0] == '/') {
            if (line == "/quit" || line == "/exit") {
                break;
            } else if (line == "/status") {
                print_status(sessions, registry);
            } else if (line == "/tools") {
                print_tools(registry);
            } else if (line == "/stats") {
                std::cout << sessions.diagnostics_json(&stats).dump(2) << "\n";
            } else if (line == "/clear") {
                auto session = sessions.get_session(kCliSession);
                session->loop->clear_history();
                std::cout << "History cleared.\n";
            } else if (line.substr(0, 7) == "/model ") {
                std::string new_model = line.substr(7);
                auto session = sessions.get_session(kCliSession);
                session->loop->set_model(new_model);
                std::cout << "Model set to: " << new_model << "\n";
            } else if (line == "/help") {
                std::cout << "Commands:\n"
                          << "  /status   Show current status\n"
                          << "  /tools    List available tools\n"
                          << "  /stats    Show request statistics\n"
                          << "  /model X  Switch to model X\n"
                          << "  /clear    Clear conversation history\n"
                          << "  /quit     Exit\n"
                          << "  /exit     Exit\n"
                          << "  /help     Show this help\n";
            } else {
                std::cout << "Unknown command: " << line << "\n";
            }
            continue;
        }

        // Process user message
        auto outcome = run_interruptible(sessions, line);
        std::cout << "\n" << tooledchat::format_response(outcome, templates) << "\n\n";
    }

    tooledchat::http_cleanup();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
