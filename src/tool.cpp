#include "tool.hpp"
#include <cctype>
#include <stdexcept>

namespace tooledchat {

const char* param_type_name(ParamType type) {
    switch (type) {
        case ParamType::String: return "string";
        case ParamType::Number: return "number";
        case ParamType::Integer: return "integer";
        case ParamType::Boolean: return "boolean";
    }
    return "string";
}

std::optional<ParamType> param_type_from_string(const std::string& name) {
    if (name == "string") return ParamType::String;
    if (name == "number") return ParamType::Number;
    if (name == "integer") return ParamType::Integer;
    if (name == "boolean") return ParamType::Boolean;
    return std::nullopt;
}

std::string ToolResult::value_text() const {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_null()) return "";
    return value.dump();
}

std::string Tool::parameters_json(int indent) const {
    nlohmann::ordered_json schema = nlohmann::ordered_json::object();
    for (const auto& p : parameters()) {
        nlohmann::ordered_json entry;
        entry["type"] = param_type_name(p.type);
        entry["required"] = p.required;
        if (p.default_value) {
            entry["default"] = *p.default_value;
        }
        if (!p.description.empty()) {
            entry["description"] = p.description;
        }
        schema[p.name] = std::move(entry);
    }
    return schema.dump(indent);
}

FunctionTool::FunctionTool(std::string name, std::string description,
                           std::vector<ParamSpec> parameters, Handler handler)
    : name_(std::move(name))
    , description_(std::move(description))
    , parameters_(std::move(parameters))
    , handler_(std::move(handler)) {
    if (!handler_) {
        throw std::invalid_argument("FunctionTool " + name_ + " has no handler");
    }
}

nlohmann::json FunctionTool::execute(const BoundArguments& args,
                                     const CancellationToken& cancel) {
    return handler_(args, cancel);
}

bool is_valid_tool_name(const std::string& name) {
    if (name.empty()) return false;
    auto first = static_cast<unsigned char>(name[0]);
    if (!std::isalpha(first) && first != '_') return false;
    for (size_t i = 1; i < name.size(); ++i) {
        auto c = static_cast<unsigned char>(name[i]);
        if (!std::isalnum(c) && c != '_' && c != '.') return false;
    }
    return true;
}

std::vector<ParamSpec> parse_param_specs(const nlohmann::json& j) {
    std::vector<ParamSpec> specs;
    if (j.is_null()) return specs;
    if (!j.is_array()) {
        throw std::invalid_argument("parameters must be an array");
    }
    for (const auto& entry : j) {
        if (!entry.is_object() || !entry.contains("name") || !entry["name"].is_string()) {
            throw std::invalid_argument("parameter entry needs a string \"name\"");
        }
        ParamSpec spec;
        spec.name = entry["name"].get<std::string>();
        for (const char* key : {"type", "description"}) {
            if (entry.contains(key) && !entry[key].is_string()) {
                throw std::invalid_argument("parameter " + spec.name + ": \"" +
                                            key + "\" must be a string");
            }
        }
        if (entry.contains("required") && !entry["required"].is_boolean()) {
            throw std::invalid_argument("parameter " + spec.name +
                                        ": \"required\" must be a boolean");
        }
        std::string type_name = entry.value("type", "string");
        auto type = param_type_from_string(type_name);
        if (!type) {
            throw std::invalid_argument("parameter " + spec.name +
                                        " has unknown type: " + type_name);
        }
        spec.type = *type;
        spec.required = entry.value("required", false);
        if (entry.contains("default") && !entry["default"].is_null()) {
            spec.default_value = entry["default"];
        }
        spec.description = entry.value("description", "");
        specs.push_back(std::move(spec));
    }
    return specs;
}

} // namespace tooledchat
