// =================================================================
// src/ArgoAgent/RequestDispatcher.cpp
// =================================================================
// Implementation for request shaping and retrying dispatch.

#include "ArgoAgent/RequestDispatcher.hpp"
#include "ArgoAgent/Errors.hpp"
#include "ArgoAgent/Logger.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <sstream>
#include <thread>

namespace ArgoAgent {

static std::string formatNumber(double value) {
    std::ostringstream out;
    out << value;
    return out.str();
}

double RetryPolicy::delayBeforeRetry(unsigned int retry) const {
    if (retry == 0) {
        return 0.0;
    }
    return backoff_factor * std::pow(2.0, static_cast<double>(retry - 1));
}

bool RetryPolicy::isRetryableStatus(int status) const {
    return std::find(retry_statuses.begin(), retry_statuses.end(), status) != retry_statuses.end();
}

nlohmann::ordered_json PromptRequest::toJson() const {
    nlohmann::ordered_json body = {
        {"user", user},
        {"model", model},
        {"system", system},
        {"prompt", prompt},
        {"stop", stop}
    };
    if (temperature) {
        body["temperature"] = *temperature;
    }
    if (top_p) {
        body["top_p"] = *top_p;
    }
    if (max_tokens) {
        body["max_tokens"] = *max_tokens;
    }
    if (max_completion_tokens) {
        body["max_completion_tokens"] = *max_completion_tokens;
    }
    return body;
}

RequestDispatcher::RequestDispatcher(std::shared_ptr<HttpTransport> transport,
                                     RetryPolicy policy,
                                     HttpTimeouts timeouts)
    : m_transport(std::move(transport)),
      m_policy(std::move(policy)),
      m_timeouts(timeouts),
      m_sleeper([](double seconds) {
          std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
      }) {}

void RequestDispatcher::setSleeper(Sleeper sleeper) {
    m_sleeper = std::move(sleeper);
}

void RequestDispatcher::validateParameters(const SamplingParameters& params) {
    if (!(params.temperature >= 0.0 && params.temperature <= 2.0)) {
        throw InvalidParameter("temperature", params.temperature,
                               "Temperature must be between 0 and 2, got " + formatNumber(params.temperature));
    }
    if (!(params.top_p >= 0.0 && params.top_p <= 1.0)) {
        throw InvalidParameter("top_p", params.top_p,
                               "Top-p must be between 0 and 1, got " + formatNumber(params.top_p));
    }
    if (params.max_tokens == 0) {
        throw InvalidParameter("max_tokens", 0.0, "Max tokens must be positive, got 0");
    }
}

PromptRequest RequestDispatcher::buildRequest(const std::string& prompt,
                                              const std::string& user,
                                              const std::string& system,
                                              const ModelConfig& model,
                                              const SamplingParameters& params) {
    PromptRequest request;
    request.user = user;
    request.model = model.name;
    request.system = system;
    request.prompt = {prompt};

    size_t capped = std::min(params.max_tokens, model.max_tokens);
    if (model.supports_standard_params) {
        request.temperature = params.temperature;
        request.top_p = params.top_p;
        request.max_tokens = capped;
    } else {
        request.max_completion_tokens = capped;
    }

    if (capped < params.max_tokens) {
        LOG_DEBUG("RequestDispatcher", "max_tokens capped to " + std::to_string(capped) +
                  " for model " + model.name);
    }
    return request;
}

DispatchResult RequestDispatcher::dispatch(const std::string& endpoint, const PromptRequest& request) const {
    // Invalid UTF-8 in the prompt becomes U+FFFD
    const std::string payload =
        request.toJson().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    const HttpHeaders headers = {{"Content-Type", "application/json"}};
    const unsigned int max_attempts = std::max(1u, m_policy.max_attempts);

    DispatchResult result;
    auto start_time = std::chrono::steady_clock::now();

    for (unsigned int attempt = 1; ; ++attempt) {
        result.attempts = attempt;
        HttpResponse response = m_transport->post(endpoint, payload, headers, m_timeouts);

        if (response.connected && response.status >= 200 && response.status < 300) {
            auto end_time = std::chrono::steady_clock::now();
            result.elapsed_seconds = std::chrono::duration<double>(end_time - start_time).count();

            try {
                result.text = parseResponseBody(response.body);
            } catch (const ResponseParseError& e) {
                LOG_ERROR("RequestDispatcher", "Error parsing response: " + std::string(e.what()));
                LOG_DEBUG("RequestDispatcher", "Response content: " + response.body);
                throw;
            }
            return result;
        }

        bool retryable = response.connected ? m_policy.isRetryableStatus(response.status)
                                            : response.retryable;
        std::string failure = response.connected
            ? "HTTP " + std::to_string(response.status)
            : response.error;

        if (!retryable) {
            LOG_ERROR("RequestDispatcher", "Request failed with " + failure);
            LOG_DEBUG("RequestDispatcher", "Response content: " + response.body);
            throw TransportError(response.status, "Request to " + endpoint + " failed: " + failure);
        }

        if (attempt >= max_attempts) {
            LOG_ERROR("RequestDispatcher", "Giving up after " + std::to_string(attempt) +
                      " attempt(s): " + failure);
            throw TransportError(response.connected ? response.status : 0,
                                 "Request to " + endpoint + " failed after " + std::to_string(attempt) +
                                 " attempt(s): " + failure);
        }

        double delay = m_policy.delayBeforeRetry(attempt);
        LOG_WARNING("RequestDispatcher", "Attempt " + std::to_string(attempt) + " failed (" + failure +
                    "), retrying in " + formatNumber(delay) + "s");
        m_sleeper(delay);
    }
}

std::string RequestDispatcher::parseResponseBody(const std::string& body) {
    nlohmann::json parsed = nlohmann::json::parse(body, nullptr, false);
    if (parsed.is_discarded()) {
        throw ResponseParseError("Response body is not valid JSON");
    }
    if (!parsed.is_object()) {
        throw ResponseParseError("Response body is not a JSON object");
    }

    auto it = parsed.find("response");
    if (it == parsed.end() || it->is_null()) {
        return "";
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return it->dump();
}

} // namespace ArgoAgent
