#pragma once
#include "tool.hpp"
#include <string>
#include <vector>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace tooledchat {

struct OllamaConfig {
    std::string host = "localhost";
    uint16_t port = 11434;
    std::string model = "llama2";
    double temperature = 0.7;
    uint32_t request_timeout = 30;      // seconds
    uint32_t health_check_timeout = 10; // seconds

    // http://host:port
    std::string base_url() const;
};

struct PromptConfig {
    std::string language = "en";
    std::string dir = "~/.tooledchat/prompts";
    std::string system_prompt; // empty = use the language templates
};

struct AgentConfig {
    uint32_t max_tool_iterations = 5;
    bool return_tool_results_directly = false;
};

struct SessionConfig {
    uint32_t max_history_messages = 100;
    uint32_t history_prune_threshold = 80;
    uint32_t idle_timeout = 3600; // seconds
};

// A tool backed by a shell command (see tools/command.hpp)
struct ToolDefinition {
    std::string name;
    std::string description;
    std::string command;
    uint32_t timeout = 30; // seconds
    std::vector<ParamSpec> parameters;
};

struct Config {
    OllamaConfig ollama;
    PromptConfig prompts;
    AgentConfig agent;
    SessionConfig session;
    std::vector<ToolDefinition> tools;

    // Load from ~/.tooledchat/config.json + env vars
    static Config load();

    // Load from an explicit path + env vars. A missing file is created with
    // defaults; an existing one gains any new default keys.
    static Config load_from(const std::string& path);

    // Parse an already-merged JSON document. Ignores env vars.
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // OLLAMA_HOST, OLLAMA_PORT, OLLAMA_MODEL, TOOLEDCHAT_SYSTEM_PROMPT
    void apply_env_overrides();
};

// Path of the user config file (~/.tooledchat/config.json)
std::string default_config_path();

} // namespace tooledchat
