// =================================================================
// include/ArgoAgent/Core.hpp
// =================================================================
// Defines the core application orchestrator.

#pragma once

#include "ArgoAgent/CliParser.hpp"
#include "ArgoAgent/AppConfig.hpp"
#include <memory>
#include <optional>
#include <string>

// Forward declarations to reduce header dependencies
namespace ArgoAgent {
    class ModelCatalog;
    class PromptRegistry;
    class ExtractorRegistry;
    class TokenCounter;
    class HttpTransport;
    class SysInteraction;
}

namespace ArgoAgent {

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     *
     * Loads the configuration file, the environment overrides and the
     * registries it names.
     * @param commands The parsed command-line arguments.
     * @throws ConfigurationError when the configuration file is malformed
     */
    explicit Core(const Commands& commands);

    /**
     * @brief Destructor must be declared here and defined in the .cpp file.
     * This is required because we are using unique_ptr with forward-declared types.
     */
    ~Core();

    /**
     * @brief Replace the HTTP transport used for requests.
     */
    void setTransport(std::shared_ptr<HttpTransport> transport);

    /**
     * @brief Runs the main application logic based on parsed commands.
     * @return An integer exit code (0 for success).
     */
    int run();

    const AppConfig& getConfig() const { return m_config; }

private:
    // Command Handlers
    int handleInit();
    int handleListings();
    int handlePrompt();

    /**
     * @brief The user prompt from the positional argument or --prompt-file
     * @return std::nullopt when neither was given; throws ArgoError when the
     *         prompt file cannot be read
     */
    std::optional<std::string> readUserPrompt() const;

    void printResponse(const std::string& response, const std::string& user_prompt,
                       std::optional<size_t> token_count, const std::string& template_label) const;

    const Commands& m_commands;
    AppConfig m_config;
    std::shared_ptr<ModelCatalog> m_models;
    std::shared_ptr<PromptRegistry> m_prompts;
    std::shared_ptr<ExtractorRegistry> m_extractors;
    std::shared_ptr<TokenCounter> m_token_counter;
    std::shared_ptr<HttpTransport> m_transport;
    std::unique_ptr<SysInteraction> m_sys;
};

} // namespace ArgoAgent
