#include "dispatcher.hpp"
#include "binder.hpp"
#include "errors.hpp"
#include <iostream>

namespace tooledchat {

static ToolResult failed_result(const std::string& tool_name, ErrorKind kind,
                                const std::string& message) {
    ToolResult result;
    result.tool_name = tool_name;
    result.success = false;
    result.error = message;
    result.error_kind = kind;
    return result;
}

ToolResult execute_tool(Tool& tool, const BoundArguments& args,
                        const CancellationToken& cancel) {
    std::string name = tool.tool_name();
    cancel.throw_if_cancelled("executing tool");

    try {
        ToolResult result;
        result.tool_name = name;
        result.value = tool.execute(args, cancel);
        result.success = true;
        return result;
    } catch (const Error& e) {
        if (e.kind() == ErrorKind::Cancelled) throw;
        std::cerr << "[tool] " << name << " failed: " << e.what() << '\n';
        return failed_result(name, ErrorKind::ToolExecution, e.what());
    } catch (const std::exception& e) {
        std::cerr << "[tool] " << name << " failed: " << e.what() << '\n';
        return failed_result(name, ErrorKind::ToolExecution, e.what());
    } catch (...) {
        std::cerr << "[tool] " << name << " failed with a non-standard exception\n";
        return failed_result(name, ErrorKind::ToolExecution, "unknown failure");
    }
}

ToolResult dispatch_tool(const ToolInvocationRequest& request,
                         const ToolSnapshot& tools,
                         const CancellationToken& cancel) {
    BoundArguments args;
    try {
        args = bind_arguments(request, tools);
    } catch (const Error& e) {
        if (!is_tool_call_error(e.kind())) throw;
        std::cerr << "[tool] " << request.tool_name << " rejected ("
                  << error_kind_name(e.kind()) << "): " << e.what() << '\n';
        return failed_result(request.tool_name, e.kind(), e.what());
    }

    Tool* tool = tools.find(request.tool_name);
    if (!tool) {
        return failed_result(request.tool_name, ErrorKind::UnknownTool,
                             "Unknown tool: " + request.tool_name);
    }
    return execute_tool(*tool, args, cancel);
}

ChatMessage format_tool_result_message(const ToolResult& result,
                                       const std::string& guidance) {
    std::string content = result.success
        ? "Tool result from " + result.tool_name + ": " + result.value_text()
        : "Tool error from " + result.tool_name + ": " + result.error;
    if (!guidance.empty()) {
        content += "\n\n" + guidance;
    }
    return ChatMessage{Role::Tool, content, result.tool_name};
}

} // namespace tooledchat
