#include "ollama.hpp"
#include "../errors.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

using json = nlohmann::json;

namespace tooledchat {

OllamaProvider::OllamaProvider(HttpClient& http, const std::string& base_url,
                               long request_timeout, long health_check_timeout)
    : http_(http)
    , base_url_(base_url)
    , request_timeout_(request_timeout)
    , health_check_timeout_(health_check_timeout) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

// Ollama reports failures as {"error": "..."}; fall back to the raw body.
static std::string error_detail(const std::string& body) {
    try {
        auto j = json::parse(body);
        if (j.is_object() && j.contains("error") && j["error"].is_string())
            return j["error"].get<std::string>();
    } catch (const json::parse_error&) { // NOLINT(bugprone-empty-catch)
        // not JSON; use the body as-is
    }
    return body.size() > 200 ? body.substr(0, 200) + "..." : body;
}

void OllamaProvider::check_response(const HttpResponse& response,
                                    const CancellationToken& cancel,
                                    const std::string& what) const {
    if (response.aborted || cancel.cancelled()) {
        throw Error(ErrorKind::Cancelled, "Cancelled while waiting for " + what);
    }
    if (response.status_code == 0) {
        std::cerr << "[ollama] " << what << " failed: " << response.error << '\n';
        throw Error(ErrorKind::Connection,
                    "Failed to connect to Ollama at " + base_url_ +
                    (response.error.empty() ? "" : ": " + response.error));
    }
    if (response.status_code == 401 || response.status_code == 403) {
        throw Error(ErrorKind::Auth,
                    "Ollama rejected the request (HTTP " +
                    std::to_string(response.status_code) + ")");
    }
    if (!response.ok()) {
        std::cerr << "[ollama] " << what << " returned HTTP " << response.status_code << '\n';
        throw Error(ErrorKind::Model,
                    "Ollama API error (HTTP " + std::to_string(response.status_code) +
                    "): " + error_detail(response.body));
    }
}

ChatResponse OllamaProvider::chat(const std::vector<ChatMessage>& messages,
                                  const std::string& model,
                                  double temperature,
                                  const CancellationToken& cancel) {
    cancel.throw_if_cancelled("calling the model");

    json request;
    request["model"] = model;
    request["stream"] = false;
    request["options"] = {{"temperature", temperature}};

    json msgs = json::array();
    for (const auto& msg : messages) {
        json m;
        // Ollama models without native tool support expect results as user turns
        m["role"] = (msg.role == Role::Tool) ? "user" : role_to_string(msg.role);
        m["content"] = msg.content;
        msgs.push_back(m);
    }
    request["messages"] = msgs;

    std::vector<Header> headers = {
        {"Content-Type", "application/json"}
    };

    auto response = http_.post(base_url_ + "/api/chat", request.dump(), headers,
                               request_timeout_,
                               [&cancel]() { return cancel.cancelled(); });
    check_response(response, cancel, "the model");

    json resp;
    try {
        resp = json::parse(response.body);
    } catch (const json::parse_error& e) {
        throw Error(ErrorKind::Model, std::string("Malformed response from Ollama: ") + e.what());
    }
    if (!resp.is_object() || !resp.contains("message") || !resp["message"].is_object() ||
        !resp["message"].contains("content") || !resp["message"]["content"].is_string()) {
        throw Error(ErrorKind::Model, "Ollama response has no message content");
    }

    ChatResponse result;
    result.model = resp.value("model", model);
    result.content = resp["message"]["content"].get<std::string>();

    if (resp.contains("prompt_eval_count") && resp["prompt_eval_count"].is_number_unsigned()) {
        result.usage.prompt_tokens = resp["prompt_eval_count"].get<uint32_t>();
    }
    if (resp.contains("eval_count") && resp["eval_count"].is_number_unsigned()) {
        result.usage.completion_tokens = resp["eval_count"].get<uint32_t>();
    }
    result.usage.total_tokens = result.usage.prompt_tokens + result.usage.completion_tokens;

    return result;
}

std::string OllamaProvider::health_check(const CancellationToken& cancel) {
    auto response = http_.get(base_url_ + "/api/version", {}, health_check_timeout_,
                              [&cancel]() { return cancel.cancelled(); });
    check_response(response, cancel, "the health check");

    try {
        auto j = json::parse(response.body);
        return j.value("version", "unknown");
    } catch (const json::exception& e) {
        throw Error(ErrorKind::Model, std::string("Malformed version response: ") + e.what());
    }
}

std::vector<std::string> OllamaProvider::list_models(const CancellationToken& cancel) {
    auto response = http_.get(base_url_ + "/api/tags", {}, health_check_timeout_,
                              [&cancel]() { return cancel.cancelled(); });
    check_response(response, cancel, "the model list");

    json j;
    try {
        j = json::parse(response.body);
    } catch (const json::parse_error& e) {
        throw Error(ErrorKind::Model, std::string("Malformed model list: ") + e.what());
    }
    if (!j.is_object() || !j.contains("models") || !j["models"].is_array()) {
        throw Error(ErrorKind::Model, "Invalid response from Ollama server");
    }

    std::vector<std::string> names;
    for (const auto& m : j["models"]) {
        if (m.is_object() && m.contains("name") && m["name"].is_string()) {
            names.push_back(m["name"].get<std::string>());
        }
    }
    return names;
}

} // namespace tooledchat
