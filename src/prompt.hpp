#pragma once
#include "tool_registry.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>

namespace tooledchat {

// Prompt and reply templates, one set per language.
// JSON layout:
//   default_prompts:    no_tools, with_tools
//   tool_configuration: intro, tool_list_header, list_format,
//                       usage_instructions, tool_response, parameters_format
//   formatting:         error_format, success_acknowledgment,
//                       output_prefix, output_suffix, errors.{<kind>}
struct PromptTemplates {
    // ── default_prompts ─────────────────────────────────────────
    std::string no_tools;
    std::string with_tools;

    // ── tool_configuration ──────────────────────────────────────
    std::string intro;
    std::string tool_list_header;
    std::string list_format;        // {name}, {description}
    std::string usage_instructions; // must document "Using tool:"
    std::string tool_response;
    std::string parameters_format;  // {params}

    // ── formatting ──────────────────────────────────────────────
    std::string error_format;            // {error}
    std::string success_acknowledgment;  // {tool_name}, {result}
    std::string output_prefix;
    std::string output_suffix;
    std::map<std::string, std::string> error_templates; // error_kind_name -> template

    // Built-in English templates
    static PromptTemplates defaults();

    // Throws Error{Template} on a missing required key or an
    // unusable template. The formatting group is optional.
    static PromptTemplates from_json(const nlohmann::json& j);

    nlohmann::json to_json() const;
};

// Load <dir>/<language>.json, falling back to <dir>/en.json and then to
// the built-in defaults. A file that exists but is malformed throws
// Error{Template}.
PromptTemplates load_prompt_templates(const std::string& dir,
                                      const std::string& language);

// Tool list and directive instructions, without the base prompt.
// Empty when the snapshot has no tools.
std::string build_tool_section(const PromptTemplates& templates,
                               const ToolSnapshot& tools);

// System prompt for one model call. An override replaces the base prompt
// but the tool section is still appended when tools exist.
std::string build_system_prompt(const PromptTemplates& templates,
                                const ToolSnapshot& tools,
                                const std::optional<std::string>& override_prompt = std::nullopt);

} // namespace tooledchat
