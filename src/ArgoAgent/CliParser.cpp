// =================================================================
// src/ArgoAgent/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "ArgoAgent/CliParser.hpp"
#include "ArgoAgent/ModelCatalog.hpp"
#include "ArgoAgent/PromptRegistry.hpp"

namespace ArgoAgent {

std::shared_ptr<CLI::App> CliParser::setupCli(const ModelCatalog& models, const PromptRegistry& prompts) {
    m_app = std::make_shared<CLI::App>("ArgoAgent: send a prompt, with file context, to the Argo API.");

    // Copy values of the sampling options only when they were given
    m_app->callback([this]() {
        if (m_temperature_opt->count() > 0) {
            m_commands.temperature = m_temperature;
        }
        if (m_top_p_opt->count() > 0) {
            m_commands.top_p = m_top_p;
        }
        if (m_max_tokens_opt->count() > 0) {
            m_commands.max_tokens = m_max_tokens;
        }
        if (m_timeout_opt->count() > 0) {
            m_commands.timeout_seconds = m_timeout;
        }
    });

    setupPromptOptions(*m_app, prompts);
    setupEndpointOptions(*m_app, models);
    setupSamplingOptions(*m_app);
    setupUtilityOptions(*m_app);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::setupPromptOptions(CLI::App& app, const PromptRegistry& prompts) {
    auto* prompt = app.add_option("prompt", m_commands.prompt, "The prompt to send to the model.");
    auto* prompt_file = app.add_option("-p,--prompt-file", m_commands.prompt_file,
                                       "Path to a file containing the prompt to send to the model.")
                            ->check(CLI::ExistingFile);
    prompt->excludes(prompt_file);

    app.add_option("-c,--context", m_commands.context,
                   "Path(s) to file(s), directory(ies), or wildcard pattern(s) containing context "
                   "to be included in the prompt.")
        ->expected(1, -1);

    auto* system = app.add_option("-s,--system", m_commands.system_prompt,
                                  "System prompt to use. Available options:\n" +
                                  prompts.formatSystemPromptList());

    std::string task_help = "Task template to use (system prompt plus default user prompt).";
    if (!prompts.listTasks().empty()) {
        task_help += " Available tasks:\n" + prompts.formatTaskList();
    }
    auto* task = app.add_option("-T,--task", m_commands.task, task_help);
    task->excludes(system);
}

void CliParser::setupEndpointOptions(CLI::App& app, const ModelCatalog& models) {
    app.add_option("-u,--argo-url", m_commands.argo_url, "ARGO API endpoint URL (default: $ARGO_URL).");
    app.add_option("-a,--argo-user", m_commands.argo_user, "User for the Argo API request (default: $ARGO_USER).");
    app.add_option("-m,--model", m_commands.model,
                   "Model to use for the prompt (default: gpt4olatest).\n" + models.helpText());
}

void CliParser::setupSamplingOptions(CLI::App& app) {
    m_temperature_opt = app.add_option("-t,--temperature", m_temperature,
                                       "Sampling temperature (0-2). Not supported by some models.");
    m_top_p_opt = app.add_option("-o,--top-p", m_top_p,
                                 "Top-p sampling (0-1). Not supported by some models.");
    m_max_tokens_opt = app.add_option("-x,--max-tokens", m_max_tokens,
                                      "Maximum number of tokens in the response and token budget for "
                                      "the context (default: 100000). Capped to the model limit.");
    app.add_flag("-n,--number-of-tokens", m_commands.count_tokens_only,
                 "Only count and display the number of tokens in the prompt, without a request.");
}

void CliParser::setupUtilityOptions(CLI::App& app) {
    app.add_flag("--no-record", m_commands.no_record, "Do not save the interaction to the interactions directory.");
    m_timeout_opt = app.add_option("--timeout", m_timeout, "Read timeout for the request in seconds.")
                        ->check(CLI::PositiveNumber);
    app.add_option("--config", m_commands.config_path, "Configuration file (default: .argoagent/config.yml).");

    app.add_flag("--list-prompts", m_commands.list_prompts, "List the available system prompts and exit.");
    app.add_flag("--list-tasks", m_commands.list_tasks, "List the available tasks and exit.");
    app.add_flag("--list-models", m_commands.list_models, "List the available models and exit.");
    app.add_flag("--init", m_commands.init, "Write a default configuration file and exit.");

    auto* verbose = app.add_flag("-v,--verbose", m_commands.verbose, "Enable verbose logging.");
    auto* quiet = app.add_flag("-q,--quiet", m_commands.quiet, "Only log errors.");
    verbose->excludes(quiet);
}

} // namespace ArgoAgent
