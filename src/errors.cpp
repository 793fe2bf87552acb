#include "errors.hpp"

namespace tooledchat {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Connection: return "connection";
        case ErrorKind::Auth: return "auth";
        case ErrorKind::Model: return "model";
        case ErrorKind::Parse: return "parse";
        case ErrorKind::UnknownTool: return "unknown_tool";
        case ErrorKind::UnknownParameter: return "unknown_parameter";
        case ErrorKind::MissingParameter: return "missing_parameter";
        case ErrorKind::TypeMismatch: return "type_mismatch";
        case ErrorKind::ToolExecution: return "tool_execution";
        case ErrorKind::IterationLimitExceeded: return "iteration_limit_exceeded";
        case ErrorKind::Cancelled: return "cancelled";
        case ErrorKind::Template: return "template";
        case ErrorKind::Unknown: return "unknown";
    }
    return "unknown";
}

bool is_tool_call_error(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Parse:
        case ErrorKind::UnknownTool:
        case ErrorKind::UnknownParameter:
        case ErrorKind::MissingParameter:
        case ErrorKind::TypeMismatch:
        case ErrorKind::ToolExecution:
            return true;
        default:
            return false;
    }
}

} // namespace tooledchat
