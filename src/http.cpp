#include "http.hpp"

#include <curl/curl.h>
#include <string>

namespace toolgate {

void http_init() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void http_cleanup() {
    curl_global_cleanup();
}

struct BodySink {
    std::string* body;
    size_t limit;
    bool truncated = false;
};

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    auto* sink = static_cast<BodySink*>(userdata);
    if (sink->limit > 0 && sink->body->size() + total > sink->limit) {
        sink->truncated = true;
        return 0; // abort transfer
    }
    sink->body->append(ptr, total);
    return total;
}

static curl_slist* build_headers(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string entry = h.first + ": " + h.second;
        list = curl_slist_append(list, entry.c_str());
    }
    return list;
}

// ── RAII curl handle with common setup ────────────────────────

struct CurlRequest {
    CURL* curl = curl_easy_init();
    curl_slist* hlist = nullptr;

    CurlRequest() = default;
    ~CurlRequest() {
        curl_slist_free_all(hlist);
        if (curl) curl_easy_cleanup(curl);
    }
    CurlRequest(const CurlRequest&) = delete;
    CurlRequest& operator=(const CurlRequest&) = delete;

    explicit operator bool() const { return curl != nullptr; }
};

static void setup_request(CurlRequest& req, const std::string& url,
                           const std::vector<Header>& headers, long timeout) {
    req.hlist = build_headers(headers);
    curl_easy_setopt(req.curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(req.curl, CURLOPT_HTTPHEADER, req.hlist);
    curl_easy_setopt(req.curl, CURLOPT_TIMEOUT, timeout);
    curl_easy_setopt(req.curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(req.curl, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(req.curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(req.curl, CURLOPT_ACCEPT_ENCODING, "");
}

// ── Public API ────────────────────────────────────────────────

HttpResponse CurlHttpClient::get(const std::string& url,
                                 const std::vector<Header>& headers,
                                 long timeout_seconds,
                                 size_t max_body_bytes) {
    return http_get(url, headers, timeout_seconds, max_body_bytes);
}

HttpResponse http_get(const std::string& url,
                      const std::vector<Header>& headers,
                      long timeout_seconds,
                      size_t max_body_bytes) {
    HttpResponse response;
    CurlRequest req;
    if (!req) {
        response.error = "failed to initialise curl handle";
        return response;
    }
    setup_request(req, url, headers, timeout_seconds);
    curl_easy_setopt(req.curl, CURLOPT_HTTPGET, 1L);

    BodySink sink{&response.body, max_body_bytes};
    curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &sink);

    CURLcode res = curl_easy_perform(req.curl);
    response.truncated = sink.truncated;
    if (res == CURLE_OK) {
        curl_easy_getinfo(req.curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    } else if (sink.truncated) {
        // Ceiling hit: the status line was already received.
        curl_easy_getinfo(req.curl, CURLINFO_RESPONSE_CODE, &response.status_code);
        response.error = "response body exceeds " + std::to_string(max_body_bytes) + " bytes";
    } else {
        response.error = curl_easy_strerror(res);
    }
    return response;
}

} // namespace toolgate
