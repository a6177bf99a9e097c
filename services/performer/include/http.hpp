#pragma once
#include <stdexcept>
#include <string>
#include <vector>

struct HttpResponse {
    long status{0};
    std::string body;
};

// Thrown when no HTTP response was received at all.
class HttpError : public std::runtime_error {
public:
    enum class Kind { Timeout, Transport };
    HttpError(Kind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {}
    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

// POSTs a JSON body; extra headers are "Name: value" lines. No redirects are followed.
HttpResponse http_post_json(const std::string& url, const std::string& json_body, long timeout_ms = 30000,
                            const std::vector<std::string>& headers = {});
