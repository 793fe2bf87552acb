#pragma once
#include "cancel.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "prompt.hpp"
#include "provider.hpp"
#include "tool.hpp"
#include "tool_registry.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tooledchat {

class EventBus; // forward declaration

// Forward-only per-turn state. FinalAnswerReady and Failed are terminal.
enum class TurnState {
    AwaitingModelReply,
    ToolCallDetected,
    ToolExecuting,
    FinalAnswerReady,
    Failed
};

const char* turn_state_name(TurnState state);

inline bool is_terminal(TurnState state) {
    return state == TurnState::FinalAnswerReady || state == TurnState::Failed;
}

struct TurnOutcome {
    TurnState state = TurnState::AwaitingModelReply;
    std::string answer;                   // raw model reply when FinalAnswerReady
    std::optional<ErrorKind> error_kind;  // set when Failed
    std::string error_detail;
    uint32_t tool_calls = 0;
    std::optional<ToolResult> last_tool_result;
    bool tool_only = false; // answer is the last tool result, not model text

    bool succeeded() const { return state == TurnState::FinalAnswerReady; }
};

struct TurnOptions {
    CancellationToken cancel;
    std::optional<std::string> system_prompt_override;
};

// One conversation: the message history plus the turn state machine that
// drives model calls and tool invocations. Not thread-safe; callers
// serialize turns (see SessionManager).
class ConversationLoop {
public:
    ConversationLoop(std::unique_ptr<Provider> provider,
                     const ToolRegistry& registry,
                     PromptTemplates templates,
                     const AgentConfig& agent,
                     std::string model,
                     double temperature = 0.7);

    // Run one user turn to a terminal state. Never throws.
    TurnOutcome run_turn(const std::string& user_text,
                         const TurnOptions& options = TurnOptions());

    // run_turn() rendered through the response formatter
    std::string process(const std::string& user_text,
                        const TurnOptions& options = TurnOptions());

    const std::vector<ChatMessage>& history() const { return history_; }
    size_t history_size() const { return history_.size(); }
    void clear_history() { history_.clear(); }

    // Drop the oldest messages until at most keep remain. A tool result is
    // never left at the front without the reply that requested it.
    // Returns the number of messages removed.
    size_t prune_history(size_t keep);

    void set_model(const std::string& model) { model_ = model; }
    const std::string& model() const { return model_; }
    void set_temperature(double temperature) { temperature_ = temperature; }

    std::string provider_name() const { return provider_->provider_name(); }
    const PromptTemplates& templates() const { return templates_; }

    // Optional event bus integration (nullptr = disabled)
    void set_event_bus(EventBus* bus) { event_bus_ = bus; }
    void set_session_id(const std::string& id) { session_id_ = id; }

private:
    std::unique_ptr<Provider> provider_;
    const ToolRegistry& registry_;
    PromptTemplates templates_;
    AgentConfig agent_;
    std::string model_;
    double temperature_;
    std::vector<ChatMessage> history_;
    EventBus* event_bus_ = nullptr;
    std::string session_id_;
};

} // namespace tooledchat
