#pragma once
#include <string>
#include <vector>
#include <utility>
#include <cstddef>

namespace toolgate {

// Initialize HTTP subsystem (call once at startup).
void http_init();

// Cleanup HTTP subsystem (call once at shutdown).
void http_cleanup();

using Header = std::pair<std::string, std::string>;

struct HttpResponse {
    long status_code = 0;   // 0 when the transfer itself failed
    std::string body;
    std::string error;      // transport error text when status_code == 0
    bool truncated = false; // body exceeded the caller's byte ceiling

    bool ok() const { return status_code >= 200 && status_code < 300; }
};

// Abstract HTTP client interface (injectable for testing)
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // max_body_bytes == 0 means unlimited. When the limit is exceeded the
    // transfer is aborted and the response is marked truncated.
    virtual HttpResponse get(const std::string& url,
                             const std::vector<Header>& headers,
                             long timeout_seconds = 10,
                             size_t max_body_bytes = 0) = 0;
};

// libcurl-backed client. Follows redirects; no retries.
class CurlHttpClient : public HttpClient {
public:
    HttpResponse get(const std::string& url,
                     const std::vector<Header>& headers,
                     long timeout_seconds = 10,
                     size_t max_body_bytes = 0) override;
};

// HTTP GET
HttpResponse http_get(const std::string& url,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 10,
                      size_t max_body_bytes = 0);

} // namespace toolgate
