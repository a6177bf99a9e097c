#include "../include/http.hpp"
#include <curl/curl.h>

static size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    std::string* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), total);
    return total;
}

HttpResponse http_post_json(const std::string& url, const std::string& json_body, long timeout_ms,
                            const std::vector<std::string>& extra_headers) {
    CURL* curl = curl_easy_init();
    if (!curl) throw HttpError(HttpError::Kind::Transport, "curl_easy_init failed");

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    for (const auto& h : extra_headers) headers = curl_slist_append(headers, h.c_str());

    HttpResponse resp;
    std::string buf;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, json_body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, (long)json_body.size());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &buf);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms);
    // called from several request threads; timeouts must not rely on SIGALRM
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode code = curl_easy_perform(curl);
    if (code != CURLE_OK) {
        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);
        std::string msg = std::string("curl_easy_perform failed: ") + curl_easy_strerror(code);
        if (code == CURLE_OPERATION_TIMEDOUT) throw HttpError(HttpError::Kind::Timeout, msg);
        throw HttpError(HttpError::Kind::Transport, msg);
    }
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    resp.status = status;
    resp.body = std::move(buf);
    return resp;
}
