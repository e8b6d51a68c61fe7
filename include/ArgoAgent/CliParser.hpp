// =================================================================
// include/ArgoAgent/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ArgoAgent {

class ModelCatalog;
class PromptRegistry;

// Parsed command-line options. Unset optionals fall back to the config file.
struct Commands {
    // Prompt input
    std::string prompt;
    std::string prompt_file;
    std::vector<std::string> context;
    std::string system_prompt;
    std::string task;

    // Endpoint
    std::string argo_url;
    std::string argo_user;
    std::string model;

    // Sampling
    std::optional<double> temperature;
    std::optional<double> top_p;
    std::optional<size_t> max_tokens;

    bool count_tokens_only = false;
    bool no_record = false;
    std::optional<double> timeout_seconds;
    std::string config_path = ".argoagent/config.yml";

    // Listings and setup
    bool list_prompts = false;
    bool list_tasks = false;
    bool list_models = false;
    bool init = false;

    bool verbose = false;
    bool quiet = false;
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI options and flags.
     * @param models Catalog whose help text is appended to the --model help.
     * @param prompts Registry whose names are listed in the --system and --task help.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli(const ModelCatalog& models, const PromptRegistry& prompts);

    /**
     * @brief Retrieves the parsed command data.
     */
    const Commands& getCommands() const;

private:
    void setupPromptOptions(CLI::App& app, const PromptRegistry& prompts);
    void setupEndpointOptions(CLI::App& app, const ModelCatalog& models);
    void setupSamplingOptions(CLI::App& app);
    void setupUtilityOptions(CLI::App& app);

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;

    // Raw values for options that map to optionals
    double m_temperature = 0.0;
    double m_top_p = 0.0;
    size_t m_max_tokens = 0;
    double m_timeout = 0.0;
    CLI::Option* m_temperature_opt = nullptr;
    CLI::Option* m_top_p_opt = nullptr;
    CLI::Option* m_max_tokens_opt = nullptr;
    CLI::Option* m_timeout_opt = nullptr;
};

} // namespace ArgoAgent
