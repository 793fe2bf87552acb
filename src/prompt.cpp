#include "prompt.hpp"
#include "directive.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace tooledchat {

PromptTemplates PromptTemplates::defaults() {
    PromptTemplates t;
    t.no_tools =
        "You are a helpful assistant. Provide clear, concise responses that are "
        "accurate and relevant to the user's requests.";
    t.with_tools =
        "You are a helpful assistant with access to tools. Use these tools when "
        "appropriate to help users accomplish their tasks.";

    t.intro = "You have access to the following tools:";
    t.tool_list_header = "Available Tools:";
    t.list_format = "{name}: {description}";
    t.usage_instructions =
        "To use a tool, respond with: 'Using tool: <tool_name>(<parameter>=<value>, ...)'";
    t.tool_response =
        "After using tools, provide a natural response incorporating the results.";
    t.parameters_format = "Parameters: {params}";

    t.error_format = "I encountered an error while trying to help: {error}";
    t.success_acknowledgment = "I've completed that action successfully.";
    t.error_templates["iteration_limit_exceeded"] =
        "I'm sorry, I couldn't finish that request. It needed more tool calls "
        "than I'm allowed to make in one turn.";
    t.error_templates["cancelled"] = "Okay, I've stopped working on that request.";
    t.error_templates["unknown"] =
        "I'm sorry, something went wrong while handling your request.";
    return t;
}

// ── JSON loading ────────────────────────────────────────────────

static const nlohmann::json& require_group(const nlohmann::json& j, const char* group) {
    if (!j.contains(group) || !j[group].is_object()) {
        throw Error(ErrorKind::Template,
                    std::string("Prompt templates missing \"") + group + "\" section");
    }
    return j[group];
}

static std::string require_string(const nlohmann::json& group, const char* group_name,
                                   const char* key) {
    if (!group.contains(key) || !group[key].is_string()) {
        throw Error(ErrorKind::Template,
                    std::string("Prompt templates missing ") + group_name + "." + key);
    }
    return group[key].get<std::string>();
}

static void read_optional(const nlohmann::json& group, const char* key, std::string& out) {
    if (!group.contains(key)) return;
    if (!group[key].is_string()) {
        throw Error(ErrorKind::Template,
                    std::string("Prompt template formatting.") + key + " must be a string");
    }
    out = group[key].get<std::string>();
}

static bool is_error_kind_name(const std::string& name) {
    static const ErrorKind kinds[] = {
        ErrorKind::Connection, ErrorKind::Auth, ErrorKind::Model, ErrorKind::Parse,
        ErrorKind::UnknownTool, ErrorKind::UnknownParameter, ErrorKind::MissingParameter,
        ErrorKind::TypeMismatch, ErrorKind::ToolExecution,
        ErrorKind::IterationLimitExceeded, ErrorKind::Cancelled, ErrorKind::Template,
        ErrorKind::Unknown,
    };
    for (auto kind : kinds) {
        if (name == error_kind_name(kind)) return true;
    }
    return false;
}

PromptTemplates PromptTemplates::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw Error(ErrorKind::Template, "Prompt templates must be a JSON object");
    }

    PromptTemplates t = defaults();

    const auto& prompts = require_group(j, "default_prompts");
    t.no_tools = require_string(prompts, "default_prompts", "no_tools");
    t.with_tools = require_string(prompts, "default_prompts", "with_tools");

    const auto& tc = require_group(j, "tool_configuration");
    t.intro = require_string(tc, "tool_configuration", "intro");
    t.tool_list_header = require_string(tc, "tool_configuration", "tool_list_header");
    t.list_format = require_string(tc, "tool_configuration", "list_format");
    t.usage_instructions = require_string(tc, "tool_configuration", "usage_instructions");
    t.tool_response = require_string(tc, "tool_configuration", "tool_response");
    t.parameters_format = require_string(tc, "tool_configuration", "parameters_format");

    if (t.usage_instructions.find(kDirectiveKeyword) == std::string::npos) {
        throw Error(ErrorKind::Template,
                    std::string("usage_instructions must show the \"") +
                    kDirectiveKeyword + "\" directive");
    }

    if (j.contains("formatting")) {
        const auto& fmt = j["formatting"];
        if (!fmt.is_object()) {
            throw Error(ErrorKind::Template, "Prompt templates \"formatting\" must be an object");
        }
        read_optional(fmt, "error_format", t.error_format);
        read_optional(fmt, "success_acknowledgment", t.success_acknowledgment);
        read_optional(fmt, "output_prefix", t.output_prefix);
        read_optional(fmt, "output_suffix", t.output_suffix);

        if (fmt.contains("errors")) {
            if (!fmt["errors"].is_object()) {
                throw Error(ErrorKind::Template, "formatting.errors must be an object");
            }
            for (const auto& [kind, tmpl] : fmt["errors"].items()) {
                if (!is_error_kind_name(kind)) {
                    throw Error(ErrorKind::Template, "Unknown error kind in formatting.errors: " + kind);
                }
                if (!tmpl.is_string()) {
                    throw Error(ErrorKind::Template, "formatting.errors." + kind + " must be a string");
                }
                t.error_templates[kind] = tmpl.get<std::string>();
            }
        }
    }

    return t;
}

nlohmann::json PromptTemplates::to_json() const {
    nlohmann::json j;
    j["default_prompts"] = {{"no_tools", no_tools}, {"with_tools", with_tools}};
    j["tool_configuration"] = {
        {"intro", intro},
        {"tool_list_header", tool_list_header},
        {"list_format", list_format},
        {"usage_instructions", usage_instructions},
        {"tool_response", tool_response},
        {"parameters_format", parameters_format},
    };
    j["formatting"] = {
        {"error_format", error_format},
        {"success_acknowledgment", success_acknowledgment},
        {"output_prefix", output_prefix},
        {"output_suffix", output_suffix},
        {"errors", error_templates},
    };
    return j;
}

PromptTemplates load_prompt_templates(const std::string& dir,
                                      const std::string& language) {
    std::filesystem::path base(expand_home(dir));
    std::vector<std::filesystem::path> candidates;
    candidates.push_back(base / (language + ".json"));
    if (language != "en") {
        candidates.push_back(base / "en.json");
    }

    for (const auto& path : candidates) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) continue;

        std::ifstream file(path);
        if (!file) {
            throw Error(ErrorKind::Template, "Cannot read prompt file " + path.string());
        }
        std::stringstream ss;
        ss << file.rdbuf();

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(ss.str());
        } catch (const nlohmann::json::parse_error& e) {
            throw Error(ErrorKind::Template,
                        "Malformed prompt file " + path.string() + ": " + e.what());
        }
        if (path != candidates.front()) {
            std::cerr << "[prompt] No prompts for '" << language << "', using "
                      << path.string() << '\n';
        }
        return PromptTemplates::from_json(j);
    }

    std::cerr << "[prompt] No prompt files in " << base.string()
              << ", using built-in defaults\n";
    return PromptTemplates::defaults();
}

// ── Rendering ───────────────────────────────────────────────────

std::string build_tool_section(const PromptTemplates& templates,
                               const ToolSnapshot& tools) {
    if (tools.empty()) return "";

    std::ostringstream ss;
    ss << templates.intro << "\n\n";
    ss << templates.tool_list_header << "\n";
    for (const auto& tool : tools.tools()) {
        ss << format_placeholders(templates.list_format,
                                  {{"name", tool->tool_name()},
                                   {"description", tool->description()}})
           << "\n";
        ss << format_placeholders(templates.parameters_format,
                                  {{"params", tool->parameters_json()}})
           << "\n";
    }
    ss << "\n" << templates.usage_instructions << "\n";
    ss << templates.tool_response;
    return ss.str();
}

std::string build_system_prompt(const PromptTemplates& templates,
                                const ToolSnapshot& tools,
                                const std::optional<std::string>& override_prompt) {
    bool has_override = override_prompt && !override_prompt->empty();

    if (tools.empty()) {
        return has_override ? *override_prompt : templates.no_tools;
    }

    const std::string& base = has_override ? *override_prompt : templates.with_tools;
    return base + "\n\n" + build_tool_section(templates, tools);
}

} // namespace tooledchat
