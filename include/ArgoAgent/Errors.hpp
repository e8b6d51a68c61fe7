// =================================================================
// include/ArgoAgent/Errors.hpp
// =================================================================
// Exception types for the terminal failures of a request.

#pragma once

#include <stdexcept>
#include <string>
#include <cstddef>

namespace ArgoAgent {

/**
 * @brief Base class of every error that ends an invocation
 */
class ArgoError : public std::runtime_error {
public:
    explicit ArgoError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Missing or malformed configuration (endpoint, user, config file)
 */
class ConfigurationError : public ArgoError {
public:
    explicit ConfigurationError(const std::string& message) : ArgoError(message) {}
};

/**
 * @brief Cumulative context tokens went over the caller's budget
 */
class TokenBudgetExceeded : public ArgoError {
public:
    TokenBudgetExceeded(size_t total_so_far, size_t limit)
        : ArgoError("Total tokens (" + std::to_string(total_so_far) +
                    ") exceed max_tokens (" + std::to_string(limit) + ")"),
          m_total(total_so_far), m_limit(limit) {}

    size_t total() const { return m_total; }
    size_t limit() const { return m_limit; }

private:
    size_t m_total;
    size_t m_limit;
};

/**
 * @brief Model name not present in the model catalog
 */
class InvalidModel : public ArgoError {
public:
    InvalidModel(const std::string& model_name, const std::string& message)
        : ArgoError(message), m_model_name(model_name) {}

    const std::string& modelName() const { return m_model_name; }

private:
    std::string m_model_name;
};

/**
 * @brief Sampling parameter outside its accepted range
 */
class InvalidParameter : public ArgoError {
public:
    InvalidParameter(const std::string& name, double value, const std::string& message)
        : ArgoError(message), m_name(name), m_value(value) {}

    const std::string& name() const { return m_name; }
    double value() const { return m_value; }

private:
    std::string m_name;
    double m_value;
};

/**
 * @brief The endpoint could not be reached or kept failing
 *
 * status() is 0 when no HTTP response was received at all.
 */
class TransportError : public ArgoError {
public:
    TransportError(int status, const std::string& message)
        : ArgoError(message), m_status(status) {}

    int status() const { return m_status; }

private:
    int m_status;
};

/**
 * @brief A 2xx body that is not the expected JSON envelope
 */
class ResponseParseError : public ArgoError {
public:
    explicit ResponseParseError(const std::string& message) : ArgoError(message) {}
};

} // namespace ArgoAgent
