#include "formatter.hpp"
#include "util.hpp"

namespace tooledchat {

std::string apply_output_wrapping(const std::string& text, const PromptTemplates& templates) {
    if (templates.output_prefix.empty() && templates.output_suffix.empty()) {
        return text;
    }

    std::string out;
    for (const std::string* part : {&templates.output_prefix, &text, &templates.output_suffix}) {
        if (part->empty()) continue;
        if (!out.empty()) out += '\n';
        out += *part;
    }
    return trim(out);
}

std::string user_facing_error(ErrorKind kind, const std::string& detail) {
    switch (kind) {
        case ErrorKind::Unknown:
            return "an unexpected internal error occurred";
        case ErrorKind::Cancelled:
            return "the request was cancelled";
        default:
            return detail.empty() ? std::string(error_kind_name(kind)) : detail;
    }
}

std::string format_response(const TurnOutcome& outcome, const PromptTemplates& templates) {
    if (outcome.state == TurnState::FinalAnswerReady) {
        if (!outcome.tool_only) {
            return apply_output_wrapping(outcome.answer, templates);
        }
        std::string tool_name;
        std::string result;
        if (outcome.last_tool_result) {
            tool_name = outcome.last_tool_result->tool_name;
            result = outcome.last_tool_result->value_text();
        }
        return format_placeholders(templates.success_acknowledgment,
                                   {{"tool_name", tool_name}, {"result", result}});
    }

    // A non-terminal outcome here is a loop defect; report it as unknown
    ErrorKind kind = outcome.state == TurnState::Failed
        ? outcome.error_kind.value_or(ErrorKind::Unknown)
        : ErrorKind::Unknown;
    std::string description = user_facing_error(kind, outcome.error_detail);

    auto it = templates.error_templates.find(error_kind_name(kind));
    const std::string& tmpl = it != templates.error_templates.end()
        ? it->second
        : templates.error_format;
    return format_placeholders(tmpl, {{"error", description}});
}

} // namespace tooledchat
