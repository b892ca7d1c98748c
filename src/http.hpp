#pragma once
#include <string>
#include <vector>
#include <utility>

namespace termai {

// Initialize HTTP subsystem (call once at startup).
void http_init();

// Cleanup HTTP subsystem (call once at shutdown).
void http_cleanup();

using Header = std::pair<std::string, std::string>;

struct HttpResponse {
    long status_code = 0;
    std::string body;
    std::string error;      // transport failure description; empty on success
    bool timed_out = false;

    bool ok() const { return status_code >= 200 && status_code < 300; }
};

// Abstract HTTP client interface (injectable for testing)
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const std::vector<Header>& headers,
                              long timeout_seconds = 30) = 0;

    virtual HttpResponse get(const std::string& url,
                             const std::vector<Header>& headers,
                             long timeout_seconds = 10) = 0;
};

class CurlHttpClient : public HttpClient {
public:
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 30) override;

    HttpResponse get(const std::string& url,
                     const std::vector<Header>& headers,
                     long timeout_seconds = 10) override;
};

// HTTP POST with JSON body
HttpResponse http_post(const std::string& url,
                       const std::string& body,
                       const std::vector<Header>& headers,
                       long timeout_seconds = 30);

// HTTP GET
HttpResponse http_get(const std::string& url,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 10);

// Percent-encode a query component
std::string url_encode(const std::string& value);

} // namespace termai
