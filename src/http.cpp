#include "http.hpp"

#include <curl/curl.h>
#include <algorithm>
#include <string>

namespace wacast {

static const std::atomic<bool>* g_http_abort_flag = nullptr;

void http_init() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void http_cleanup() {
    curl_global_cleanup();
}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_http_abort_flag = flag;
}

// Called by curl ~once per second; return non-zero to abort the transfer.
static int abort_progress_cb(void* /*clientp*/,
                              curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                              curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    if (g_http_abort_flag && g_http_abort_flag->load(std::memory_order_relaxed))
        return 1;
    return 0;
}

static void apply_abort_hook(CURL* curl) {
    if (g_http_abort_flag) {
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, abort_progress_cb);
    }
}

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, total);
    return total;
}

// An empty "Expect:" keeps curl from waiting on 100-continue before
// sending a large media body.
static curl_slist* build_headers(const std::vector<Header>& headers) {
    curl_slist* list = curl_slist_append(nullptr, "Expect:");
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

static constexpr long CONNECT_TIMEOUT_SECONDS = 10;

static HttpResponse send_request(const std::string& url,
                                 const std::string* post_body,
                                 const std::vector<Header>& headers,
                                 long timeout_seconds) {
    HttpResponse response;
    CurlRequest req;
    if (!req) {
        response.body = "curl_easy_init failed";
        return response;
    }

    req.hlist = build_headers(headers);
    curl_easy_setopt(req.curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(req.curl, CURLOPT_HTTPHEADER, req.hlist);
    curl_easy_setopt(req.curl, CURLOPT_TIMEOUT, timeout_seconds);
    curl_easy_setopt(req.curl, CURLOPT_CONNECTTIMEOUT,
                     std::min(timeout_seconds, CONNECT_TIMEOUT_SECONDS));
    curl_easy_setopt(req.curl, CURLOPT_USERAGENT, "wacast/0.1");
    // The dispatcher thread must not receive SIGALRM from the resolver.
    curl_easy_setopt(req.curl, CURLOPT_NOSIGNAL, 1L);
    apply_abort_hook(req.curl);

    if (post_body) {
        curl_easy_setopt(req.curl, CURLOPT_POST, 1L);
        curl_easy_setopt(req.curl, CURLOPT_POSTFIELDS, post_body->c_str());
        curl_easy_setopt(req.curl, CURLOPT_POSTFIELDSIZE_LARGE,
                         static_cast<curl_off_t>(post_body->size()));
    } else {
        curl_easy_setopt(req.curl, CURLOPT_HTTPGET, 1L);
    }

    curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &response.body);

    CURLcode res = curl_easy_perform(req.curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(req.curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    } else {
        response.status_code = 0;
        response.body = curl_easy_strerror(res);
    }
    return response;
}

// ── Public API ────────────────────────────────────────────────

HttpResponse CurlHttpClient::post(const std::string& url,
                                   const std::string& body,
                                   const std::vector<Header>& headers,
                                   long timeout_seconds) {
    return send_request(url, &body, headers, timeout_seconds);
}

HttpResponse CurlHttpClient::get(const std::string& url,
                                  const std::vector<Header>& headers,
                                  long timeout_seconds) {
    return send_request(url, nullptr, headers, timeout_seconds);
}

} // namespace wacast
