#include "../include/http.hpp"
#include "../include/errors.hpp"
#include <curl/curl.h>
#include <mutex>

static size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    std::string* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), total);
    return total;
}

static int progress_cb(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const Deadline* dl = static_cast<const Deadline*>(clientp);
    return dl->cancelled() ? 1 : 0;
}

namespace {
struct CurlHandle {
    CURL* h{nullptr};
    struct curl_slist* headers{nullptr};
    CurlHandle() {
        static std::once_flag global_init;
        std::call_once(global_init, []{ curl_global_init(CURL_GLOBAL_DEFAULT); });
        h = curl_easy_init();
        if (!h) throw ProviderError("curl_easy_init failed");
    }
    ~CurlHandle() {
        if (headers) curl_slist_free_all(headers);
        if (h) curl_easy_cleanup(h);
    }
};
}

HttpResponse http_post_json(const HttpRequest& req, const Deadline& deadline) {
    deadline.check("POST " + req.url);
    long timeout_ms = deadline.remaining_ms(req.timeout_ms);
    if (timeout_ms <= 0) throw DeadlineExceeded("POST " + req.url + ": deadline exceeded");

    CurlHandle c;
    c.headers = curl_slist_append(c.headers, "Content-Type: application/json");
    for (const auto& h : req.headers) c.headers = curl_slist_append(c.headers, h.c_str());

    std::string buf;
    curl_easy_setopt(c.h, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(c.h, CURLOPT_HTTPHEADER, c.headers);
    curl_easy_setopt(c.h, CURLOPT_POSTFIELDS, req.json_body.c_str());
    curl_easy_setopt(c.h, CURLOPT_POSTFIELDSIZE, (long)req.json_body.size());
    curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(c.h, CURLOPT_WRITEDATA, &buf);
    curl_easy_setopt(c.h, CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(c.h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(c.h, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(c.h, CURLOPT_XFERINFOFUNCTION, progress_cb);
    curl_easy_setopt(c.h, CURLOPT_XFERINFODATA, &deadline);

    CURLcode code = curl_easy_perform(c.h);
    if (code == CURLE_ABORTED_BY_CALLBACK) {
        throw DeadlineExceeded("POST " + req.url + ": cancelled");
    }
    if (code == CURLE_OPERATION_TIMEDOUT && deadline.expired()) {
        throw DeadlineExceeded("POST " + req.url + ": deadline exceeded");
    }
    if (code != CURLE_OK) {
        throw ProviderError(std::string("curl_easy_perform failed: ") + curl_easy_strerror(code));
    }
    HttpResponse resp;
    curl_easy_getinfo(c.h, CURLINFO_RESPONSE_CODE, &resp.status);
    resp.body = std::move(buf);
    return resp;
}

HttpTransport default_http_transport() {
    return [](const HttpRequest& req, const Deadline& deadline) {
        return http_post_json(req, deadline);
    };
}
