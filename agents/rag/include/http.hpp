#pragma once
#include "deadline.hpp"
#include <functional>
#include <string>
#include <vector>

struct HttpResponse {
    long status{0};
    std::string body;
};

struct HttpRequest {
    std::string url;
    std::string json_body;
    std::vector<std::string> headers; // "Name: value"
    long timeout_ms{30000};
};

// Honours `deadline` for both the timeout and mid-transfer cancellation.
HttpResponse http_post_json(const HttpRequest& req, const Deadline& deadline);

// Injection point for providers; tests substitute canned responses.
using HttpTransport = std::function<HttpResponse(const HttpRequest&, const Deadline&)>;

HttpTransport default_http_transport();
