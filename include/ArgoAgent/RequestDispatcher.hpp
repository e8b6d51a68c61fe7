// =================================================================
// include/ArgoAgent/RequestDispatcher.hpp
// =================================================================
// Request validation, shaping and resilient delivery to the endpoint.

#pragma once

#include "ArgoAgent/HttpTransport.hpp"
#include "ArgoAgent/ModelCatalog.hpp"
#include "nlohmann/json.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ArgoAgent {

/**
 * @brief When and how often a failed POST is repeated
 */
struct RetryPolicy {
    unsigned int max_attempts = 3;                     ///< Total attempts, first one included
    double backoff_factor = 0.3;                       ///< Seconds
    std::vector<int> retry_statuses = {500, 502, 503, 504};

    /**
     * @brief Delay before the given retry (1-based): backoff_factor * 2^(retry-1)
     */
    double delayBeforeRetry(unsigned int retry) const;

    bool isRetryableStatus(int status) const;
};

/**
 * @brief Sampling parameters requested by the user
 */
struct SamplingParameters {
    double temperature = 0.7;
    double top_p = 0.9;
    size_t max_tokens = 100000;
};

/**
 * @brief The JSON request body sent to the endpoint
 *
 * Standard-parameter models carry temperature, top_p and max_tokens; the
 * others carry only max_completion_tokens.
 */
struct PromptRequest {
    std::string user;
    std::string model;
    std::string system;
    std::vector<std::string> prompt;
    std::vector<std::string> stop;

    std::optional<double> temperature;
    std::optional<double> top_p;
    std::optional<size_t> max_tokens;
    std::optional<size_t> max_completion_tokens;

    nlohmann::ordered_json toJson() const;
};

/**
 * @brief Text returned by a successful dispatch
 */
struct DispatchResult {
    std::string text;
    double elapsed_seconds = 0.0;  ///< From before the first attempt to the final response
    unsigned int attempts = 0;
};

/**
 * @brief Waits between attempts; replaced by a no-op in tests
 */
using Sleeper = std::function<void(double seconds)>;

/**
 * @brief Sends a PromptRequest and returns the endpoint's text
 *
 * Retries connection failures and 500/502/503/504 with exponential backoff.
 * Any other non-2xx status fails at once.
 */
class RequestDispatcher {
public:
    RequestDispatcher(std::shared_ptr<HttpTransport> transport,
                      RetryPolicy policy = RetryPolicy(),
                      HttpTimeouts timeouts = HttpTimeouts());

    void setSleeper(Sleeper sleeper);

    /**
     * @brief Check sampling parameters before anything is sent
     * @throws InvalidParameter for temperature outside [0,2], top_p outside
     *         [0,1] or max_tokens of 0
     */
    static void validateParameters(const SamplingParameters& params);

    /**
     * @brief Build the request body for a model
     *
     * The requested max_tokens is capped at the model's limit.
     */
    static PromptRequest buildRequest(const std::string& prompt,
                                      const std::string& user,
                                      const std::string& system,
                                      const ModelConfig& model,
                                      const SamplingParameters& params);

    /**
     * @brief POST a request, retrying transient failures
     * @throws TransportError when attempts are exhausted or a status is not retryable
     * @throws ResponseParseError when the 2xx body is not a JSON object
     */
    DispatchResult dispatch(const std::string& endpoint, const PromptRequest& request) const;

    /**
     * @brief Extract the `response` field of a success body
     *
     * A missing or null field gives an empty string; a non-string value is
     * returned as its JSON text.
     * @throws ResponseParseError when the body is not a JSON object
     */
    static std::string parseResponseBody(const std::string& body);

private:
    std::shared_ptr<HttpTransport> m_transport;
    RetryPolicy m_policy;
    HttpTimeouts m_timeouts;
    Sleeper m_sleeper;
};

} // namespace ArgoAgent
