#pragma once
#include <string>
#include <vector>
#include <functional>
#include <utility>

namespace tooledchat {

// Initialize HTTP subsystem (call once at startup).
void http_init();

// Cleanup HTTP subsystem (call once at shutdown).
void http_cleanup();

using Header = std::pair<std::string, std::string>;

struct HttpResponse {
    long status_code = 0;  // 0 = transport failure
    std::string body;
    std::string error;     // transport error description
    bool aborted = false;  // stopped by the AbortCheck

    bool ok() const { return status_code >= 200 && status_code < 300; }
};

// Polled while a transfer is in flight (~1s granularity).
// Return true to abort the transfer.
using AbortCheck = std::function<bool()>;

// Abstract HTTP client interface (injectable for testing)
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const std::vector<Header>& headers,
                              long timeout_seconds = 120,
                              const AbortCheck& abort = nullptr) = 0;

    virtual HttpResponse get(const std::string& url,
                             const std::vector<Header>& headers,
                             long timeout_seconds = 30,
                             const AbortCheck& abort = nullptr) = 0;
};

// libcurl-backed client
class CurlHttpClient : public HttpClient {
public:
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 120,
                      const AbortCheck& abort = nullptr) override;

    HttpResponse get(const std::string& url,
                     const std::vector<Header>& headers,
                     long timeout_seconds = 30,
                     const AbortCheck& abort = nullptr) override;
};

// HTTP POST with JSON body
HttpResponse http_post(const std::string& url,
                       const std::string& body,
                       const std::vector<Header>& headers,
                       long timeout_seconds = 120,
                       const AbortCheck& abort = nullptr);

// HTTP GET
HttpResponse http_get(const std::string& url,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 30,
                      const AbortCheck& abort = nullptr);

} // namespace tooledchat
