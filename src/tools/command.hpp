#pragma once
#include "../config.hpp"
#include "../tool.hpp"
#include <memory>
#include <string>
#include <vector>

namespace tooledchat {

// Tool backed by a shell command from the config file.
// Arguments reach the command two ways: as TOOL_ARG_<NAME> environment
// variables and as a JSON object on stdin. Stdout is the result, parsed as
// JSON when it is valid JSON. A non-zero exit, a timeout or a failure to
// start throws; cancellation kills the process group and throws
// Error{Cancelled}.
class CommandTool : public Tool {
public:
    explicit CommandTool(ToolDefinition definition);

    nlohmann::json execute(const BoundArguments& args,
                           const CancellationToken& cancel) override;
    std::string tool_name() const override { return def_.name; }
    std::string description() const override { return def_.description; }
    std::vector<ParamSpec> parameters() const override { return def_.parameters; }

    // "unit.system" -> "TOOL_ARG_UNIT_SYSTEM"
    static std::string env_var_name(const std::string& param);

private:
    static constexpr size_t kMaxOutput = 10000;
    static constexpr int kPollIntervalMs = 100;

    ToolDefinition def_;
};

// One CommandTool per definition
std::vector<std::shared_ptr<Tool>> create_command_tools(const std::vector<ToolDefinition>& defs);

} // namespace tooledchat
