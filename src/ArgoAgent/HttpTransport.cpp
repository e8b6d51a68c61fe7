// =================================================================
// src/ArgoAgent/HttpTransport.cpp
// =================================================================
// cpp-httplib implementation of the HTTP transport.

#include "ArgoAgent/HttpTransport.hpp"
#include "ArgoAgent/Logger.hpp"
#include "httplib.h"
#include <cmath>
#include <ctime>

namespace ArgoAgent {

static void splitSeconds(double seconds, time_t& sec, time_t& usec) {
    double whole = std::floor(seconds);
    sec = static_cast<time_t>(whole);
    usec = static_cast<time_t>((seconds - whole) * 1000000.0);
}

bool HttplibTransport::splitUrl(const std::string& url, std::string& base, std::string& path) {
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return false;
    }

    size_t path_start = url.find('/', scheme_end + 3);
    if (path_start == scheme_end + 3) {
        return false;
    }

    if (path_start == std::string::npos) {
        // Query string directly after the host
        size_t query_start = url.find('?', scheme_end + 3);
        base = url.substr(0, query_start);
        path = query_start == std::string::npos ? "/" : "/" + url.substr(query_start);
    } else {
        base = url.substr(0, path_start);
        path = url.substr(path_start);
    }
    return base.size() > scheme_end + 3;
}

HttpResponse HttplibTransport::post(const std::string& url,
                                    const std::string& body,
                                    const HttpHeaders& headers,
                                    const HttpTimeouts& timeouts) {
    HttpResponse response;

    std::string base;
    std::string path;
    if (!splitUrl(url, base, path)) {
        response.error = "Malformed URL: " + url;
        response.retryable = false;
        return response;
    }

    // The httplib constructor handles scheme, host and port parsing.
    httplib::Client client(base);
    if (!client.is_valid()) {
        response.error = "Unsupported URL (https needs OpenSSL support): " + base;
        response.retryable = false;
        return response;
    }

    time_t sec = 0;
    time_t usec = 0;
    splitSeconds(timeouts.connect_seconds, sec, usec);
    client.set_connection_timeout(sec, usec);
    splitSeconds(timeouts.read_seconds, sec, usec);
    client.set_read_timeout(sec, usec);

    httplib::Headers http_headers;
    std::string content_type = "application/json";
    for (const auto& [name, value] : headers) {
        if (name == "Content-Type") {
            content_type = value;
            continue;
        }
        http_headers.emplace(name, value);
    }

    LOG_DEBUG("HttpTransport", "POST " + base + path + " (" + std::to_string(body.size()) + " bytes)");
    auto res = client.Post(path, http_headers, body, content_type);

    if (!res) {
        response.error = "Connection to " + base + " failed (httplib error " +
                         std::to_string(static_cast<int>(res.error())) + ")";
        return response;
    }

    response.connected = true;
    response.status = res->status;
    response.body = res->body;
    return response;
}

} // namespace ArgoAgent
