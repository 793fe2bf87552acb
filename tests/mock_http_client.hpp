#pragma once
#include "http.hpp"

namespace tooledchat {

class MockHttpClient : public HttpClient {
public:
    HttpResponse next_response;
    std::vector<HttpResponse> response_queue;
    std::string last_method;
    std::string last_url;
    std::string last_body;
    std::vector<Header> last_headers;
    long last_timeout = 0;
    bool had_abort_check = false;
    int call_count = 0;

    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds,
                      const AbortCheck& abort) override {
        last_method = "POST";
        last_body = body;
        return respond(url, headers, timeout_seconds, abort);
    }

    HttpResponse get(const std::string& url,
                     const std::vector<Header>& headers,
                     long timeout_seconds,
                     const AbortCheck& abort) override {
        last_method = "GET";
        last_body.clear();
        return respond(url, headers, timeout_seconds, abort);
    }

private:
    HttpResponse respond(const std::string& url, const std::vector<Header>& headers,
                         long timeout_seconds, const AbortCheck& abort) {
        call_count++;
        last_url = url;
        last_headers = headers;
        last_timeout = timeout_seconds;
        had_abort_check = static_cast<bool>(abort);
        if (!response_queue.empty()) {
            auto resp = response_queue.front();
            response_queue.erase(response_queue.begin());
            return resp;
        }
        return next_response;
    }
};

} // namespace tooledchat
