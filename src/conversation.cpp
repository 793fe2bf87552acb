#include "conversation.hpp"
#include "directive.hpp"
#include "dispatcher.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "formatter.hpp"
#include "util.hpp"
#include <chrono>
#include <iostream>

namespace tooledchat {

const char* turn_state_name(TurnState state) {
    switch (state) {
        case TurnState::AwaitingModelReply: return "awaiting_model_reply";
        case TurnState::ToolCallDetected: return "tool_call_detected";
        case TurnState::ToolExecuting: return "tool_executing";
        case TurnState::FinalAnswerReady: return "final_answer_ready";
        case TurnState::Failed: return "failed";
    }
    return "failed";
}

static uint64_t elapsed_ms(std::chrono::steady_clock::time_point since) {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - since).count());
}

ConversationLoop::ConversationLoop(std::unique_ptr<Provider> provider,
                                   const ToolRegistry& registry,
                                   PromptTemplates templates,
                                   const AgentConfig& agent,
                                   std::string model,
                                   double temperature)
    : provider_(std::move(provider))
    , registry_(registry)
    , templates_(std::move(templates))
    , agent_(agent)
    , model_(std::move(model))
    , temperature_(temperature)
{}

TurnOutcome ConversationLoop::run_turn(const std::string& user_text,
                                       const TurnOptions& options) {
    auto turn_start = std::chrono::steady_clock::now();
    // The whole turn sees one tool set even if the registry changes meanwhile
    std::shared_ptr<const ToolSnapshot> tools = registry_.snapshot();

    if (event_bus_) {
        TurnStartedEvent ev;
        ev.session_id = session_id_;
        ev.user_text = user_text;
        ev.tool_count = tools->size();
        event_bus_->publish(ev);
    }

    history_.push_back(ChatMessage{Role::User, user_text, std::nullopt});

    TurnOutcome outcome;
    TurnState state = TurnState::AwaitingModelReply;
    std::optional<ToolInvocationRequest> pending;
    uint32_t iterations = 0;

    try {
        while (!is_terminal(state)) {
            switch (state) {
                case TurnState::AwaitingModelReply: {
                    options.cancel.throw_if_cancelled("waiting for the model");

                    std::vector<ChatMessage> messages;
                    messages.reserve(history_.size() + 1);
                    messages.push_back(ChatMessage{
                        Role::System,
                        build_system_prompt(templates_, *tools, options.system_prompt_override),
                        std::nullopt});
                    messages.insert(messages.end(), history_.begin(), history_.end());

                    if (event_bus_) {
                        ModelRequestEvent ev;
                        ev.session_id = session_id_;
                        ev.model = model_;
                        ev.message_count = messages.size();
                        ev.iteration = iterations;
                        event_bus_->publish(ev);
                    }

                    auto call_start = std::chrono::steady_clock::now();
                    ChatResponse response = provider_->chat(messages, model_, temperature_,
                                                            options.cancel);
                    history_.push_back(ChatMessage{Role::Assistant, response.content, std::nullopt});

                    // With no tools there is nothing to call; any directive text is plain text
                    DirectiveScan scan;
                    if (!tools->empty()) {
                        scan = scan_for_directive(response.content);
                    }

                    if (event_bus_) {
                        ModelResponseEvent ev;
                        ev.session_id = session_id_;
                        ev.model = response.model.empty() ? model_ : response.model;
                        ev.has_directive = scan.found();
                        ev.usage = response.usage;
                        ev.latency_ms = elapsed_ms(call_start);
                        event_bus_->publish(ev);
                    }

                    if (scan.found()) {
                        pending = std::move(scan.request);
                        state = TurnState::ToolCallDetected;
                        break;
                    }

                    outcome.answer = response.content;
                    if (trim(response.content).empty() && outcome.last_tool_result &&
                        outcome.last_tool_result->success) {
                        outcome.tool_only = true;
                    }
                    state = TurnState::FinalAnswerReady;
                    break;
                }

                case TurnState::ToolCallDetected:
                    if (iterations >= agent_.max_tool_iterations) {
                        std::cerr << "[turn] Tool iteration limit reached ("
                                  << agent_.max_tool_iterations << ")\n";
                        throw Error(ErrorKind::IterationLimitExceeded,
                                    "Stopped after " + std::to_string(iterations) +
                                    " tool calls without a final answer");
                    }
                    state = TurnState::ToolExecuting;
                    break;

                case TurnState::ToolExecuting: {
                    std::cerr << "[tool] " << pending->tool_name << '\n';
                    if (event_bus_) {
                        ToolCallRequestEvent ev;
                        ev.session_id = session_id_;
                        ev.tool_name = pending->tool_name;
                        ev.raw_parameters = pending->raw_parameters;
                        event_bus_->publish(ev);
                    }

                    auto tool_start = std::chrono::steady_clock::now();
                    ToolResult result = dispatch_tool(*pending, *tools, options.cancel);
                    iterations++;

                    if (event_bus_) {
                        ToolCallResultEvent ev;
                        ev.session_id = session_id_;
                        ev.tool_name = result.tool_name;
                        ev.success = result.success;
                        if (result.error_kind) ev.error_kind = *result.error_kind;
                        ev.duration_ms = elapsed_ms(tool_start);
                        event_bus_->publish(ev);
                    }

                    history_.push_back(format_tool_result_message(result, templates_.tool_response));
                    outcome.tool_calls = iterations;
                    pending.reset();

                    bool direct = result.success && agent_.return_tool_results_directly;
                    outcome.last_tool_result = std::move(result);
                    if (direct) {
                        outcome.tool_only = true;
                        state = TurnState::FinalAnswerReady;
                    } else {
                        state = TurnState::AwaitingModelReply;
                    }
                    break;
                }

                case TurnState::FinalAnswerReady:
                case TurnState::Failed:
                    break;
            }
        }
    } catch (const Error& e) {
        state = TurnState::Failed;
        outcome.error_kind = e.kind();
        outcome.error_detail = e.what();
        std::cerr << "[turn] Failed (" << error_kind_name(e.kind()) << "): "
                  << e.what() << '\n';
    } catch (const std::exception& e) {
        state = TurnState::Failed;
        outcome.error_kind = ErrorKind::Unknown;
        outcome.error_detail = e.what();
        std::cerr << "[turn] Unexpected error: " << e.what() << '\n';
    } catch (...) {
        state = TurnState::Failed;
        outcome.error_kind = ErrorKind::Unknown;
        outcome.error_detail = "non-standard exception";
        std::cerr << "[turn] Unexpected non-standard exception\n";
    }

    outcome.state = state;
    outcome.tool_calls = iterations;

    if (event_bus_) {
        TurnCompletedEvent ev;
        ev.session_id = session_id_;
        ev.success = outcome.succeeded();
        if (outcome.error_kind) ev.error_kind = *outcome.error_kind;
        ev.tool_calls = iterations;
        ev.duration_ms = elapsed_ms(turn_start);
        event_bus_->publish(ev);
    }

    return outcome;
}

std::string ConversationLoop::process(const std::string& user_text,
                                      const TurnOptions& options) {
    return format_response(run_turn(user_text, options), templates_);
}

size_t ConversationLoop::prune_history(size_t keep) {
    if (history_.size() <= keep) return 0;

    size_t drop = history_.size() - keep;
    while (drop < history_.size() && history_[drop].role == Role::Tool) {
        drop++;
    }
    history_.erase(history_.begin(), history_.begin() + static_cast<std::ptrdiff_t>(drop));
    return drop;
}

} // namespace tooledchat
