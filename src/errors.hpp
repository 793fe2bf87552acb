#pragma once
#include <stdexcept>
#include <string>

namespace tooledchat {

// Failure taxonomy for a conversation turn. Each kind selects exactly one
// user-facing template in the formatter.
enum class ErrorKind {
    Connection,              // model server unreachable / timed out
    Auth,                    // model server rejected the request (401/403)
    Model,                   // model server answered with an error or garbage
    Parse,                   // malformed directive or parameter list
    UnknownTool,
    UnknownParameter,
    MissingParameter,
    TypeMismatch,
    ToolExecution,           // tool implementation failed
    IterationLimitExceeded,
    Cancelled,
    Template,                // prompt template defect (setup-time)
    Unknown
};

// Stable snake_case key ("connection", "iteration_limit_exceeded", ...)
const char* error_kind_name(ErrorKind kind);

// True for the tool-call data errors that are fed back to the model
// instead of ending the turn.
bool is_tool_call_error(ErrorKind kind);

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace tooledchat
