#pragma once
#include "directive.hpp"
#include "tool.hpp"
#include "tool_registry.hpp"
#include <string>
#include <utility>
#include <vector>

namespace tooledchat {

// Split raw parameter text on top-level commas. Commas inside quotes or
// nested parentheses stay in their segment. Blank segments are dropped.
std::vector<std::string> split_arguments(const std::string& raw);

// Split "key=value" (or "key: value" when there is no '=') on the first
// unquoted separator into a trimmed pair. Throws Error{Parse} when neither
// separator is present or the key is empty.
std::pair<std::string, std::string> split_key_value(const std::string& segment);

// Strip one level of matching ' or " quotes and resolve backslash escapes.
// Unquoted text is returned trimmed.
std::string unquote(const std::string& text);

// Convert a raw value to the declared type.
// Throws Error{TypeMismatch} when the text does not fit.
nlohmann::json coerce_value(const std::string& text, const ParamSpec& spec);

// Validate and type a directive's parameters against the named tool.
// Throws Error with kind UnknownTool, Parse, UnknownParameter,
// MissingParameter or TypeMismatch.
BoundArguments bind_arguments(const ToolInvocationRequest& request,
                              const ToolSnapshot& tools);

} // namespace tooledchat
