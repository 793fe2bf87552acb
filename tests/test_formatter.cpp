#include <catch2/catch_test_macros.hpp>
#include "formatter.hpp"

using namespace tooledchat;

namespace {

TurnOutcome answered(const std::string& text) {
    TurnOutcome outcome;
    outcome.state = TurnState::FinalAnswerReady;
    outcome.answer = text;
    return outcome;
}

TurnOutcome failed(ErrorKind kind, const std::string& detail) {
    TurnOutcome outcome;
    outcome.state = TurnState::Failed;
    outcome.error_kind = kind;
    outcome.error_detail = detail;
    return outcome;
}

} // namespace

TEST_CASE("format_response: final answer is returned unchanged", "[formatter]") {
    auto t = PromptTemplates::defaults();
    REQUIRE(format_response(answered("It is 21 degrees in Paris."), t) ==
            "It is 21 degrees in Paris.");
}

TEST_CASE("format_response: prefix and suffix wrap answers", "[formatter]") {
    auto t = PromptTemplates::defaults();
    t.output_prefix = "[bot]";
    t.output_suffix = "-- end";
    REQUIRE(format_response(answered("Hello"), t) == "[bot]\nHello\n-- end");

    t.output_suffix.clear();
    REQUIRE(format_response(answered("Hello"), t) == "[bot]\nHello");
}

TEST_CASE("apply_output_wrapping: no wrapping leaves whitespace alone", "[formatter]") {
    auto t = PromptTemplates::defaults();
    REQUIRE(apply_output_wrapping("  spaced  ", t) == "  spaced  ");
}

TEST_CASE("format_response: tool-only outcome uses success acknowledgment", "[formatter]") {
    auto t = PromptTemplates::defaults();
    t.success_acknowledgment = "Done with {tool_name}: {result}";

    TurnOutcome outcome = answered("");
    outcome.tool_only = true;
    ToolResult result;
    result.tool_name = "lights.on";
    result.success = true;
    result.value = "kitchen lights on";
    outcome.last_tool_result = result;

    REQUIRE(format_response(outcome, t) == "Done with lights.on: kitchen lights on");
}

TEST_CASE("format_response: default acknowledgment text", "[formatter]") {
    auto t = PromptTemplates::defaults();
    TurnOutcome outcome = answered("");
    outcome.tool_only = true;
    REQUIRE(format_response(outcome, t) == "I've completed that action successfully.");
}

TEST_CASE("format_response: acknowledgments are not wrapped", "[formatter]") {
    auto t = PromptTemplates::defaults();
    t.output_prefix = "[bot]";
    t.output_suffix = "-- end";
    TurnOutcome outcome = answered("");
    outcome.tool_only = true;
    REQUIRE(format_response(outcome, t) == "I've completed that action successfully.");
}

TEST_CASE("format_response: generic error format", "[formatter]") {
    auto t = PromptTemplates::defaults();
    auto text = format_response(failed(ErrorKind::Connection,
                                       "Failed to connect to Ollama at http://localhost:11434"), t);
    REQUIRE(text == "I encountered an error while trying to help: "
                    "Failed to connect to Ollama at http://localhost:11434");
}

TEST_CASE("format_response: per-kind template wins over generic format", "[formatter]") {
    auto t = PromptTemplates::defaults();
    t.error_templates["connection"] = "Server unreachable ({error})";
    REQUIRE(format_response(failed(ErrorKind::Connection, "refused"), t) ==
            "Server unreachable (refused)");
    REQUIRE(format_response(failed(ErrorKind::IterationLimitExceeded, "5 calls"), t) ==
            t.error_templates["iteration_limit_exceeded"]);
}

TEST_CASE("format_response: unknown errors hide their detail", "[formatter]") {
    auto t = PromptTemplates::defaults();
    t.error_templates.erase("unknown");
    auto text = format_response(failed(ErrorKind::Unknown, "std::bad_alloc at 0xdeadbeef"), t);
    REQUIRE(text.find("0xdeadbeef") == std::string::npos);
    REQUIRE(text == "I encountered an error while trying to help: "
                    "an unexpected internal error occurred");
}

TEST_CASE("format_response: errors are not wrapped", "[formatter]") {
    auto t = PromptTemplates::defaults();
    t.output_prefix = "[bot]";
    auto text = format_response(failed(ErrorKind::Auth, "HTTP 401"), t);
    REQUIRE(text == "I encountered an error while trying to help: HTTP 401");
}

TEST_CASE("format_response: non-terminal outcome reports unknown", "[formatter]") {
    auto t = PromptTemplates::defaults();
    TurnOutcome outcome;
    outcome.state = TurnState::ToolExecuting;
    REQUIRE(format_response(outcome, t) == t.error_templates["unknown"]);
}

TEST_CASE("user_facing_error: detail or kind name", "[formatter]") {
    REQUIRE(user_facing_error(ErrorKind::Model, "model 'x' not found") == "model 'x' not found");
    REQUIRE(user_facing_error(ErrorKind::Model, "") == "model");
    REQUIRE(user_facing_error(ErrorKind::Cancelled, "Cancelled while calling the model") ==
            "the request was cancelled");
}
