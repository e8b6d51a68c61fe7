// =================================================================
// include/ArgoAgent/AppConfig.hpp
// =================================================================
// Application settings: built-in defaults, config file, environment
// and command-line overrides, applied in that order.

#pragma once

#include <string>

namespace ArgoAgent {

struct Commands;

/**
 * @brief Network settings for one request
 */
struct RequestSettings {
    double connect_timeout_seconds = 30.0;
    double read_timeout_seconds = 300.0;
    unsigned int max_attempts = 3;     ///< Total attempts, first one included
    double backoff_factor = 0.3;       ///< Seconds; delay is factor * 2^(retry-1)
};

/**
 * @brief Configuration settings for a run
 */
struct AppConfig {
    // Endpoint
    std::string argo_url;
    std::string argo_user;

    // Request defaults
    std::string model = "gpt4olatest";
    double temperature = 0.7;
    double top_p = 0.9;
    size_t max_tokens = 100000;

    // Interaction records
    bool record_interactions = true;
    std::string interactions_dir = "interactions";

    // Context
    std::string token_model_hint = "gpt-4";

    // Registries and logs
    std::string tasks_dir = ".argoagent/tasks";
    std::string models_file = ".argoagent/models.yml";
    std::string log_dir = ".argoagent/logs";

    RequestSettings request;

    /**
     * @brief Load settings from a YAML file
     *
     * A missing file leaves the defaults untouched.
     * @throws ConfigurationError when the file exists but cannot be parsed
     */
    void loadFromFile(const std::string& path);

    /**
     * @brief Same as loadFromFile() for YAML text already in memory
     * @throws ConfigurationError on malformed YAML or wrongly typed values
     */
    void loadFromString(const std::string& yaml_text);

    /**
     * @brief Apply ARGO_URL and ARGO_USER from the environment when set
     */
    void applyEnvironment();

    /**
     * @brief Apply command-line overrides
     * @param commands Parsed command-line options
     */
    void applyCommandOverrides(const Commands& commands);

    /**
     * @brief Validate configuration settings
     * @return True if configuration is valid; problems are logged
     */
    bool validate() const;

    /**
     * @brief Commented configuration file written by `--init`
     */
    static std::string defaultConfigText();
};

} // namespace ArgoAgent
