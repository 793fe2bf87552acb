#pragma once
#include "directive.hpp"
#include "provider.hpp"
#include "tool.hpp"
#include "tool_registry.hpp"
#include <string>

namespace tooledchat {

// Run a tool with already-bound arguments. Failures thrown by the tool come
// back as ToolResult{success=false, error_kind=ToolExecution}.
// Re-throws Error{Cancelled}.
ToolResult execute_tool(Tool& tool, const BoundArguments& args,
                        const CancellationToken& cancel);

// Bind then execute. Binding errors (UnknownTool, Parse, UnknownParameter,
// MissingParameter, TypeMismatch) become failed results so the model can
// correct itself. Re-throws Error{Cancelled}.
ToolResult dispatch_tool(const ToolInvocationRequest& request,
                         const ToolSnapshot& tools,
                         const CancellationToken& cancel);

// Context message that feeds a tool result back to the model.
// guidance is appended after a blank line when non-empty.
ChatMessage format_tool_result_message(const ToolResult& result,
                                       const std::string& guidance);

} // namespace tooledchat
