#include "../include/performer_client.hpp"
#include "../include/wire.hpp"
#include <curl/curl.h>
#include <stdexcept>

namespace {
static size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    std::string* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), total);
    return total;
}

struct CurlHandle {
    CURL* h{nullptr};
    CurlHandle() { h = curl_easy_init(); if (!h) throw std::runtime_error("curl_easy_init failed"); }
    ~CurlHandle() { if (h) curl_easy_cleanup(h); }
};
}

PerformerClient::PerformerClient(std::string base_url, long timeout_ms)
    : base_(std::move(base_url)), timeout_ms_(timeout_ms) {
    if (!base_.empty() && base_.back() == '/') base_.pop_back();
}

SubmitResult PerformerClient::submit(const Task& t) {
    CurlHandle c;
    std::string url = base_ + "/task";
    std::string body_str = encode_task_request(t);

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    std::string buf;
    curl_easy_setopt(c.h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c.h, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(c.h, CURLOPT_POSTFIELDS, body_str.c_str());
    curl_easy_setopt(c.h, CURLOPT_POSTFIELDSIZE, (long)body_str.size());
    curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(c.h, CURLOPT_WRITEDATA, &buf);
    curl_easy_setopt(c.h, CURLOPT_TIMEOUT_MS, timeout_ms_);
    CURLcode code = curl_easy_perform(c.h);
    curl_slist_free_all(headers);
    if (code != CURLE_OK) {
        return SubmitError{0, std::string("request failed: ") + curl_easy_strerror(code), std::nullopt};
    }
    long status = 0; curl_easy_getinfo(c.h, CURLINFO_RESPONSE_CODE, &status);

    if (status >= 200 && status < 300) {
        try {
            return decode_task_response(buf);
        } catch (const std::invalid_argument& e) {
            return SubmitError{status, std::string("bad response body: ") + e.what(), std::nullopt};
        }
    }
    SubmitError err{status, "performer returned status " + std::to_string(status), std::nullopt};
    try {
        err.pipeline = decode_error(buf);
        err.message = err.pipeline->message;
    } catch (const std::invalid_argument&) {
        // not a pipeline error body (e.g. 404 or 413); keep the status message
    }
    return err;
}

bool PerformerClient::healthy() {
    CurlHandle c;
    std::string url = base_ + "/health";
    std::string buf;
    curl_easy_setopt(c.h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(c.h, CURLOPT_WRITEDATA, &buf);
    curl_easy_setopt(c.h, CURLOPT_TIMEOUT_MS, timeout_ms_);
    CURLcode code = curl_easy_perform(c.h);
    if (code != CURLE_OK) return false;
    long status = 0; curl_easy_getinfo(c.h, CURLINFO_RESPONSE_CODE, &status);
    return status >= 200 && status < 300;
}
