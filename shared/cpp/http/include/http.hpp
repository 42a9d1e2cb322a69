#pragma once
#include <string>

struct HttpResponse {
    long status{0};
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

// Throw std::runtime_error on transport failure; any HTTP status is returned.
HttpResponse http_post_json(const std::string& url, const std::string& json_body, long timeout_ms = 30000);
HttpResponse http_get(const std::string& url, long timeout_ms = 30000);

// Percent-encodes a query parameter value.
std::string url_escape(const std::string& s);
