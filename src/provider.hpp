#pragma once
#include "cancel.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace tooledchat {

enum class Role { System, User, Assistant, Tool };

inline const char* role_to_string(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
        case Role::Tool: return "tool";
    }
    return "user";
}

struct ChatMessage {
    Role role;
    std::string content;
    std::optional<std::string> name; // tool name for Role::Tool
};

struct TokenUsage {
    uint32_t prompt_tokens = 0;
    uint32_t completion_tokens = 0;
    uint32_t total_tokens = 0;
};

struct ChatResponse {
    std::string content;
    TokenUsage usage;
    std::string model;
};

// Abstract base class for chat model backends.
// chat() throws Error with kind Connection, Auth, Model or Cancelled.
class Provider {
public:
    virtual ~Provider() = default;

    virtual ChatResponse chat(const std::vector<ChatMessage>& messages,
                              const std::string& model,
                              double temperature,
                              const CancellationToken& cancel) = 0;

    virtual std::string provider_name() const = 0;
};

} // namespace tooledchat
