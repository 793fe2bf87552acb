#pragma once
#include "conversation.hpp"
#include "prompt.hpp"
#include <string>

namespace tooledchat {

// Render a finished turn as the text the user sees.
std::string format_response(const TurnOutcome& outcome, const PromptTemplates& templates);

// Wrap text in output_prefix / output_suffix (newline-joined, trimmed).
// Returns text unchanged when both are empty.
std::string apply_output_wrapping(const std::string& text, const PromptTemplates& templates);

// Description substituted for {error}. Unknown errors never expose detail.
std::string user_facing_error(ErrorKind kind, const std::string& detail);

} // namespace tooledchat
