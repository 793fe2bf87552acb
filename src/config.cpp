#include "config.hpp"
#include "util.hpp"

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace tooledchat {

std::string OllamaConfig::base_url() const {
    return "http://" + host + ":" + std::to_string(port);
}

std::string default_config_path() {
    return expand_home("~/.tooledchat/config.json");
}

nlohmann::json Config::defaults_json() {
    return {
        {"ollama", {
            {"host", "localhost"},
            {"port", 11434},
            {"model", "llama2"},
            {"temperature", 0.7},
            {"request_timeout", 30},
            {"health_check_timeout", 10}
        }},
        {"prompts", {
            {"language", "en"},
            {"dir", "~/.tooledchat/prompts"},
            {"system_prompt", ""}
        }},
        {"agent", {
            {"max_tool_iterations", 5},
            {"return_tool_results_directly", false}
        }},
        {"session", {
            {"max_history_messages", 100},
            {"history_prune_threshold", 80},
            {"idle_timeout", 3600}
        }},
        {"tools", nlohmann::json::array()}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

// Non-negative integer that fits in uint32_t; anything else leaves out untouched
static bool read_uint(const nlohmann::json& obj, const char* key, uint32_t& out) {
    if (!obj.contains(key) || !obj[key].is_number_integer()) return false;
    int64_t v = obj[key].get<int64_t>();
    if (v < 0 || v > static_cast<int64_t>(UINT32_MAX)) return false;
    out = static_cast<uint32_t>(v);
    return true;
}

static ToolDefinition parse_tool_definition(const nlohmann::json& t) {
    if (!t.is_object())
        throw std::invalid_argument("tool entry must be an object");
    if (!t.contains("name") || !t["name"].is_string())
        throw std::invalid_argument("tool entry needs a string \"name\"");

    ToolDefinition def;
    def.name = t["name"].get<std::string>();
    if (!is_valid_tool_name(def.name))
        throw std::invalid_argument("invalid tool name: " + def.name);
    if (!t.contains("command") || !t["command"].is_string() ||
        t["command"].get<std::string>().empty())
        throw std::invalid_argument("tool " + def.name + " needs a \"command\"");

    def.command = t["command"].get<std::string>();
    if (t.contains("description") && t["description"].is_string())
        def.description = t["description"].get<std::string>();
    read_uint(t, "timeout", def.timeout);
    if (t.contains("parameters"))
        def.parameters = parse_param_specs(t["parameters"]);
    return def;
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    if (j.contains("ollama") && j["ollama"].is_object()) {
        auto& o = j["ollama"];
        if (o.contains("host") && o["host"].is_string())
            cfg.ollama.host = o["host"].get<std::string>();
        uint32_t port = 0;
        if (read_uint(o, "port", port) && port > 0 && port <= 65535)
            cfg.ollama.port = static_cast<uint16_t>(port);
        if (o.contains("model") && o["model"].is_string())
            cfg.ollama.model = o["model"].get<std::string>();
        if (o.contains("temperature") && o["temperature"].is_number())
            cfg.ollama.temperature = o["temperature"].get<double>();
        read_uint(o, "request_timeout", cfg.ollama.request_timeout);
        read_uint(o, "health_check_timeout", cfg.ollama.health_check_timeout);
    }

    if (j.contains("prompts") && j["prompts"].is_object()) {
        auto& p = j["prompts"];
        if (p.contains("language") && p["language"].is_string())
            cfg.prompts.language = p["language"].get<std::string>();
        if (p.contains("dir") && p["dir"].is_string())
            cfg.prompts.dir = p["dir"].get<std::string>();
        if (p.contains("system_prompt") && p["system_prompt"].is_string())
            cfg.prompts.system_prompt = p["system_prompt"].get<std::string>();
    }

    if (j.contains("agent") && j["agent"].is_object()) {
        auto& a = j["agent"];
        read_uint(a, "max_tool_iterations", cfg.agent.max_tool_iterations);
        if (a.contains("return_tool_results_directly") &&
            a["return_tool_results_directly"].is_boolean())
            cfg.agent.return_tool_results_directly =
                a["return_tool_results_directly"].get<bool>();
    }

    if (j.contains("session") && j["session"].is_object()) {
        auto& s = j["session"];
        read_uint(s, "max_history_messages", cfg.session.max_history_messages);
        read_uint(s, "history_prune_threshold", cfg.session.history_prune_threshold);
        read_uint(s, "idle_timeout", cfg.session.idle_timeout);
    }
    if (cfg.session.history_prune_threshold > cfg.session.max_history_messages) {
        std::cerr << "[config] history_prune_threshold exceeds max_history_messages, clamping\n";
        cfg.session.history_prune_threshold = cfg.session.max_history_messages;
    }

    // A bad tool entry is skipped, not fatal
    if (j.contains("tools") && j["tools"].is_array()) {
        for (const auto& t : j["tools"]) {
            try {
                cfg.tools.push_back(parse_tool_definition(t));
            } catch (const std::invalid_argument& e) {
                std::cerr << "[config] Skipping tool: " << e.what() << "\n";
            }
        }
    }

    return cfg;
}

void Config::apply_env_overrides() {
    if (const char* v = std::getenv("OLLAMA_HOST"))
        ollama.host = v;
    if (const char* v = std::getenv("OLLAMA_PORT")) {
        char* end = nullptr;
        unsigned long port = std::strtoul(v, &end, 10);
        if (end != v && *end == '\0' && port > 0 && port <= 65535)
            ollama.port = static_cast<uint16_t>(port);
        else
            std::cerr << "[config] Ignoring invalid OLLAMA_PORT: " << v << "\n";
    }
    if (const char* v = std::getenv("OLLAMA_MODEL"))
        ollama.model = v;
    if (const char* v = std::getenv("TOOLEDCHAT_SYSTEM_PROMPT"))
        prompts.system_prompt = v;
}

Config Config::load_from(const std::string& config_path) {
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            if (original.is_object()) {
                j = merge_defaults(original, defaults_json());
                if (j != original) {
                    if (atomic_write_file(config_path, j.dump(4) + "\n"))
                        std::cerr << "[config] Migrated config with new defaults: "
                                  << config_path << "\n";
                    else
                        std::cerr << "[config] Could not update " << config_path << "\n";
                }
            } else {
                std::cerr << "[config] " << config_path
                          << " is not a JSON object, using defaults\n";
                j = defaults_json();
            }
        } catch (const nlohmann::json::parse_error& e) {
            std::cerr << "[config] Malformed " << config_path << ", using defaults: "
                      << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n"))
            std::cerr << "[config] Created default config: " << config_path << "\n";
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    cfg.apply_env_overrides();
    return cfg;
}

Config Config::load() {
    return load_from(default_config_path());
}

} // namespace tooledchat
