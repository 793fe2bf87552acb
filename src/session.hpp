#pragma once
#include "config.hpp"
#include "conversation.hpp"
#include "http.hpp"
#include "prompt.hpp"
#include "tool_registry.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace tooledchat {

class EventBus; // forward declaration
class TurnStats;

struct Session {
    std::string id;
    std::unique_ptr<ConversationLoop> loop;
    std::mutex turn_mutex; // held for the duration of a turn
    std::atomic<uint64_t> last_active{0};
};

// Creates the model backend for a new session
using ProviderFactory = std::function<std::unique_ptr<Provider>()>;

class SessionManager {
public:
    SessionManager(const Config& config, HttpClient& http,
                   const ToolRegistry& registry, PromptTemplates templates);

    // Get or create a session
    std::shared_ptr<Session> get_session(const std::string& session_id);

    // Run one turn on a session. Turns on the same session run one at a
    // time; different sessions run concurrently. History is pruned after
    // the turn. Uses the configured system prompt unless the options
    // carry an override.
    TurnOutcome run_turn(const std::string& session_id, const std::string& text,
                         TurnOptions options = TurnOptions());

    // run_turn() rendered through the response formatter
    std::string process(const std::string& session_id, const std::string& text,
                        TurnOptions options = TurnOptions());

    // Remove a session. Returns true if it existed.
    bool remove_session(const std::string& session_id);

    // Evict sessions idle longer than max_idle_seconds (config idle_timeout
    // when omitted). Sessions mid-turn are kept. Returns the number evicted.
    size_t evict_idle();
    size_t evict_idle(uint64_t max_idle_seconds);

    // List active session IDs
    std::vector<std::string> list_sessions() const;

    size_t session_count() const;

    // Host, port, model, sessions with history sizes, stats when given
    nlohmann::json diagnostics_json(const TurnStats* stats = nullptr) const;

    // Optional event bus, propagated to new sessions
    void set_event_bus(EventBus* bus) { event_bus_ = bus; }

    // Replaces the Ollama backend for sessions created afterwards
    void set_provider_factory(ProviderFactory factory) { provider_factory_ = std::move(factory); }

    const Config& config() const { return config_; }

private:
    std::unique_ptr<Provider> make_provider() const;

    Config config_;
    HttpClient& http_;
    const ToolRegistry& registry_;
    PromptTemplates templates_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
    mutable std::mutex mutex_;
    EventBus* event_bus_ = nullptr;
    ProviderFactory provider_factory_;
};

} // namespace tooledchat
