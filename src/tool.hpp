#pragma once
#include "cancel.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <optional>
#include <string>
#include <memory>
#include <vector>

namespace tooledchat {

enum class ParamType { String, Number, Integer, Boolean };

const char* param_type_name(ParamType type);

// Parses "string" / "number" / "integer" / "boolean". Returns nullopt otherwise.
std::optional<ParamType> param_type_from_string(const std::string& name);

struct ParamSpec {
    std::string name;
    ParamType type = ParamType::String;
    bool required = false;
    std::optional<nlohmann::json> default_value;
    std::string description;
};

// Parameter name -> typed value, validated against a tool's schema
using BoundArguments = nlohmann::json;

struct ToolResult {
    std::string tool_name;
    bool success = false;
    nlohmann::json value;  // set on success
    std::string error;     // set on failure
    std::optional<ErrorKind> error_kind;

    // Value rendered as text (strings unquoted, everything else as JSON)
    std::string value_text() const;
};

class Tool {
public:
    virtual ~Tool() = default;

    // Throws on failure; the executor turns that into a failed ToolResult.
    virtual nlohmann::json execute(const BoundArguments& args,
                                   const CancellationToken& cancel) = 0;

    virtual std::string tool_name() const = 0;
    virtual std::string description() const = 0;
    virtual std::vector<ParamSpec> parameters() const = 0;

    // Parameter schema as a JSON object, in declaration order
    std::string parameters_json(int indent = 2) const;
};

// Tool backed by a callable; the usual way for host code to register a
// capability without subclassing.
class FunctionTool : public Tool {
public:
    using Handler = std::function<nlohmann::json(const BoundArguments&,
                                                 const CancellationToken&)>;

    FunctionTool(std::string name, std::string description,
                 std::vector<ParamSpec> parameters, Handler handler);

    nlohmann::json execute(const BoundArguments& args,
                           const CancellationToken& cancel) override;
    std::string tool_name() const override { return name_; }
    std::string description() const override { return description_; }
    std::vector<ParamSpec> parameters() const override { return parameters_; }

private:
    std::string name_;
    std::string description_;
    std::vector<ParamSpec> parameters_;
    Handler handler_;
};

// [a-zA-Z_][a-zA-Z0-9_.]*
bool is_valid_tool_name(const std::string& name);

// Parse a parameter list from config JSON:
// [{"name": "...", "type": "string", "required": true, "default": ..., "description": "..."}]
// Throws std::invalid_argument on malformed entries.
std::vector<ParamSpec> parse_param_specs(const nlohmann::json& j);

} // namespace tooledchat
