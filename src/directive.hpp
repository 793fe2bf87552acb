#pragma once
#include <optional>
#include <string>

namespace tooledchat {

// Keyword the model must emit: Using tool: name(key=value, ...)
constexpr const char* kDirectiveKeyword = "Using tool:";

struct ToolInvocationRequest {
    std::string tool_name;
    std::string raw_parameters;
};

struct DirectiveScan {
    std::optional<ToolInvocationRequest> request;
    // Text outside the directive; the whole input when no request was made
    std::string plain_text;
    // Set when the keyword is present but the directive is malformed
    std::string error;

    bool found() const { return request.has_value(); }
    bool malformed() const { return !error.empty(); }
};

// Find and parse the first tool directive in a model reply.
// Never throws: malformed syntax fails open with the original text in
// plain_text and a diagnostic in error.
DirectiveScan scan_for_directive(const std::string& text);

// Parse the directive whose keyword starts at keyword_pos.
// Returns the request and sets end_pos past the closing parenthesis.
// Throws Error{Parse} on malformed syntax.
ToolInvocationRequest parse_directive_at(const std::string& text, size_t keyword_pos,
                                         size_t& end_pos);

} // namespace tooledchat
