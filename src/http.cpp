#include "http.hpp"

#include <curl/curl.h>
#include <algorithm>
#include <memory>
#include <string>

namespace genstream {

static const std::atomic<bool>* g_curl_abort_flag = nullptr;

void http_init() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void http_cleanup() {
    curl_global_cleanup();
}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_curl_abort_flag = flag;
}

// Transfer info hook; a non-zero return aborts the request at shutdown.
static int on_progress(void*, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    return g_curl_abort_flag && g_curl_abort_flag->load(std::memory_order_relaxed) ? 1 : 0;
}

static size_t on_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    static_cast<std::string*>(userdata)->append(ptr, size * nmemb);
    return size * nmemb;
}

struct EasyDeleter {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
};
struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};

// Requests run on loop worker threads, so signals are off and the connect
// phase gets at most a third of the budget.
static HttpResponse do_request(const char* method,
                               const std::string& url,
                               const std::string* body,
                               const std::vector<Header>& headers,
                               long timeout_seconds) {
    std::unique_ptr<CURL, EasyDeleter> curl(curl_easy_init());
    if (!curl) return {};

    std::unique_ptr<curl_slist, SlistDeleter> header_list;
    for (const auto& h : headers) {
        std::string line = h.first + ": " + h.second;
        curl_slist* next = curl_slist_append(header_list.get(), line.c_str());
        if (!next) return {};
        header_list.release();
        header_list.reset(next);
    }

    CURL* c = curl.get();
    curl_easy_setopt(c, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c, CURLOPT_CUSTOMREQUEST, method);
    curl_easy_setopt(c, CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(c, CURLOPT_TIMEOUT, timeout_seconds);
    curl_easy_setopt(c, CURLOPT_CONNECTTIMEOUT, std::max(1L, timeout_seconds / 3));
    if (body) {
        curl_easy_setopt(c, CURLOPT_POSTFIELDS, body->data());
        curl_easy_setopt(c, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body->size()));
    } else {
        curl_easy_setopt(c, CURLOPT_HTTPGET, 1L);
    }
    if (g_curl_abort_flag) {
        curl_easy_setopt(c, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(c, CURLOPT_XFERINFOFUNCTION, on_progress);
    }

    HttpResponse response;
    curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, on_body);
    curl_easy_setopt(c, CURLOPT_WRITEDATA, &response.body);
    if (curl_easy_perform(c) != CURLE_OK) return {};
    curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &response.status_code);
    return response;
}

HttpResponse CurlHttpClient::post(const std::string& url,
                                  const std::string& body,
                                  const std::vector<Header>& headers,
                                  long timeout_seconds) {
    return do_request("POST", url, &body, headers, timeout_seconds);
}

HttpResponse CurlHttpClient::get(const std::string& url,
                                 const std::vector<Header>& headers,
                                 long timeout_seconds) {
    return do_request("GET", url, nullptr, headers, timeout_seconds);
}

} // namespace genstream
