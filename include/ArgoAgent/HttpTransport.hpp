// =================================================================
// include/ArgoAgent/HttpTransport.hpp
// =================================================================
// Single HTTP POST seam between the request dispatcher and the network.

#pragma once

#include <string>
#include <vector>
#include <utility>

namespace ArgoAgent {

struct HttpTimeouts {
    double connect_seconds = 30.0;
    double read_seconds = 300.0;
};

/**
 * @brief Result of one POST attempt
 *
 * `connected` is false when no HTTP response was received (DNS failure,
 * refused connection, timeout); `status` and `body` are then meaningless.
 */
struct HttpResponse {
    bool connected = false;
    int status = 0;
    std::string body;
    std::string error;
    bool retryable = true;  ///< Whether a failure to connect may succeed on a later attempt
};

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Performs one HTTP POST, without retries
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * @brief POST a body to a URL
     * @param url Absolute URL (http:// or https://)
     * @param body Request body
     * @param headers Request headers
     * @param timeouts Connect and read timeouts
     * @return The response, or a not-connected result; never throws for network errors
     */
    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const HttpHeaders& headers,
                              const HttpTimeouts& timeouts) = 0;
};

/**
 * @brief HttpTransport backed by cpp-httplib
 *
 * https URLs need cpp-httplib built with CPPHTTPLIB_OPENSSL_SUPPORT.
 */
class HttplibTransport : public HttpTransport {
public:
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const HttpHeaders& headers,
                      const HttpTimeouts& timeouts) override;

    /**
     * @brief Split "scheme://host[:port]/path?query" into base and path
     * @return false when the URL has no scheme or host
     */
    static bool splitUrl(const std::string& url, std::string& base, std::string& path);
};

} // namespace ArgoAgent
