#pragma once
#include "../provider.hpp"
#include "../http.hpp"
#include <string>
#include <vector>

namespace tooledchat {

// Ollama /api/chat client (non-streaming).
// Errors: Connection (unreachable, timeout), Auth (401/403), Model (any
// other failure status or a malformed body), Cancelled.
class OllamaProvider : public Provider {
public:
    OllamaProvider(HttpClient& http,
                   const std::string& base_url = "http://localhost:11434",
                   long request_timeout = 30,
                   long health_check_timeout = 10);

    ChatResponse chat(const std::vector<ChatMessage>& messages,
                      const std::string& model,
                      double temperature,
                      const CancellationToken& cancel) override;

    std::string provider_name() const override { return "ollama"; }

    // GET /api/version. Returns the server version string.
    std::string health_check(const CancellationToken& cancel = CancellationToken());

    // GET /api/tags. Returns installed model names.
    std::vector<std::string> list_models(const CancellationToken& cancel = CancellationToken());

    const std::string& base_url() const { return base_url_; }

private:
    void check_response(const HttpResponse& response, const CancellationToken& cancel,
                        const std::string& what) const;

    HttpClient& http_;
    std::string base_url_;
    long request_timeout_;
    long health_check_timeout_;
};

} // namespace tooledchat
