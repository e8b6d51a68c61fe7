// =================================================================
// src/ArgoAgent/Core.cpp
// =================================================================
// Implementation for the core application logic.

#include "ArgoAgent/Core.hpp"
#include "ArgoAgent/ArgoClient.hpp"
#include "ArgoAgent/ContextAggregator.hpp"
#include "ArgoAgent/Errors.hpp"
#include "ArgoAgent/HttpTransport.hpp"
#include "ArgoAgent/InteractionRecorder.hpp"
#include "ArgoAgent/Logger.hpp"
#include "ArgoAgent/ModelCatalog.hpp"
#include "ArgoAgent/PromptComposer.hpp"
#include "ArgoAgent/PromptRegistry.hpp"
#include "ArgoAgent/RequestDispatcher.hpp"
#include "ArgoAgent/SysInteraction.hpp"
#include "ArgoAgent/TextExtractor.hpp"
#include "ArgoAgent/TokenCounter.hpp"
#include <chrono>
#include <filesystem>
#include <iostream>

namespace ArgoAgent {

static constexpr size_t kPromptPreviewLength = 100;

Core::Core(const Commands& commands)
    : m_commands(commands),
      m_models(std::make_shared<ModelCatalog>(ModelCatalog::createDefault())),
      m_prompts(std::make_shared<PromptRegistry>()),
      m_extractors(ExtractorRegistry::createDefault()),
      m_token_counter(std::make_shared<EstimatingTokenCounter>()),
      m_transport(std::make_shared<HttplibTransport>()),
      m_sys(std::make_unique<SysInteraction>())
{
    // Defaults < config file < environment < command line
    if (!m_commands.init) {
        m_config.loadFromFile(m_commands.config_path);
    }
    m_config.applyEnvironment();
    m_config.applyCommandOverrides(m_commands);

    if (!m_commands.init) {
        Logger::getInstance().initialize(m_config.log_dir);
    }

    if (m_sys->fileExists(m_config.models_file)) {
        m_models->loadFromFile(m_config.models_file);
    }
    m_prompts->loadTasks(m_config.tasks_dir);
}

Core::~Core() = default;

void Core::setTransport(std::shared_ptr<HttpTransport> transport) {
    m_transport = std::move(transport);
}

int Core::run() {
    if (m_commands.init) {
        return handleInit();
    }
    if (m_commands.list_prompts || m_commands.list_tasks || m_commands.list_models) {
        return handleListings();
    }
    return handlePrompt();
}

int Core::handleInit() {
    const std::string& config_file = m_commands.config_path;
    std::cout << "Initializing ArgoAgent configuration..." << std::endl;

    std::string config_dir = std::filesystem::path(config_file).parent_path().string();
    if (!config_dir.empty() && !m_sys->directoryExists(config_dir)) {
        if (!m_sys->createDirectories(config_dir)) {
            std::cerr << "Error: Failed to create configuration directory '" << config_dir << "'." << std::endl;
            return 1;
        }
        std::cout << "Created configuration directory: " << config_dir << std::endl;
    }

    if (m_sys->fileExists(config_file)) {
        std::cout << "Configuration file '" << config_file << "' already exists. Skipping." << std::endl;
        return 0;
    }

    if (!m_sys->writeFile(config_file, AppConfig::defaultConfigText())) {
        std::cerr << "Error: Failed to write configuration file '" << config_file << "'." << std::endl;
        return 1;
    }
    std::cout << "Created default configuration file: " << config_file << std::endl;
    std::cout << "\nIMPORTANT: Please edit " << config_file
              << " to set `argo_url` and `argo_user`, or export ARGO_URL and ARGO_USER." << std::endl;
    return 0;
}

int Core::handleListings() {
    if (m_commands.list_prompts) {
        std::cout << "Available system prompts:\n" << m_prompts->formatSystemPromptList();
    }
    if (m_commands.list_tasks) {
        if (m_prompts->listTasks().empty()) {
            std::cout << "No tasks found in " << m_config.tasks_dir << "\n";
        } else {
            std::cout << "Available tasks:\n" << m_prompts->formatTaskList();
        }
    }
    if (m_commands.list_models) {
        std::cout << m_models->helpText();
    }
    std::cout.flush();
    return 0;
}

int Core::handlePrompt() {
    auto session_start = std::chrono::steady_clock::now();
    auto finish = [&session_start](int exit_code) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - session_start);
        Logger::getInstance().logSessionEnd(exit_code, static_cast<long>(elapsed.count()));
        return exit_code;
    };

    if (!m_config.validate()) {
        LOG_ERROR("Core", "Invalid configuration in " + m_commands.config_path);
        return 1;
    }

    std::optional<std::string> user_prompt = readUserPrompt();

    // System prompt or task template
    PromptComposer composer;
    std::optional<Task> task;
    std::optional<std::string> system_instruction;
    std::string template_label;

    if (!m_commands.task.empty()) {
        task = m_prompts->getTask(m_commands.task);
        if (!task) {
            LOG_ERROR("Core", "Unknown task: " + m_commands.task + ". Available tasks:\n" +
                      m_prompts->formatTaskList());
            return 1;
        }
        template_label = "Task: " + m_commands.task;
        if (!user_prompt && task->user_prompt.empty()) {
            LOG_ERROR("Core", "Task '" + m_commands.task + "' has no default prompt; give one explicitly");
            return 1;
        }
    } else if (!m_commands.system_prompt.empty()) {
        system_instruction = m_prompts->getSystemPrompt(m_commands.system_prompt);
        if (!system_instruction) {
            LOG_ERROR("Core", "Invalid system prompt: " + m_commands.system_prompt + ". Available options:\n" +
                      m_prompts->formatSystemPromptList());
            return 1;
        }
        template_label = "System Prompt: " + m_commands.system_prompt;
    }

    if (!user_prompt && !task) {
        LOG_ERROR("Core", "A prompt is required (positional argument, --prompt-file or --task)");
        return 1;
    }

    std::string display_prompt = user_prompt ? *user_prompt : task->user_prompt;
    Logger::getInstance().logSessionStart(m_config.model, display_prompt);

    // Context
    std::optional<std::string> context;
    if (!m_commands.context.empty()) {
        ContextAggregator aggregator(m_extractors, m_token_counter, m_config.token_model_hint);
        try {
            AggregationResult aggregated = aggregator.aggregate(m_commands.context, m_config.max_tokens);
            if (aggregated.total_tokens > 0) {
                LOG_INFO("Core", "Context contains " + std::to_string(aggregated.total_tokens) + " tokens");
            }
            context = ContextAggregator::serializeContext(aggregated);
        } catch (const TokenBudgetExceeded& e) {
            LOG_ERROR("Core", e.what());
            return finish(1);
        }
    }

    std::string prompt = task ? composer.composeTask(*task, user_prompt, context)
                              : composer.compose(*user_prompt, context, system_instruction);

    std::optional<size_t> token_count = m_token_counter->count(prompt, m_config.token_model_hint);
    if (token_count) {
        LOG_INFO("Core", "Prompt contains " + std::to_string(*token_count) + " tokens");
    }

    if (m_commands.count_tokens_only) {
        if (token_count) {
            std::cout << "Tokens: " << *token_count << std::endl;
        } else {
            std::cout << "Tokens: unknown" << std::endl;
        }
        return finish(0);
    }

    RetryPolicy policy;
    policy.max_attempts = m_config.request.max_attempts;
    policy.backoff_factor = m_config.request.backoff_factor;

    HttpTimeouts timeouts;
    timeouts.connect_seconds = m_config.request.connect_timeout_seconds;
    timeouts.read_seconds = m_config.request.read_timeout_seconds;

    ArgoClient client(m_models,
                      std::make_shared<RequestDispatcher>(m_transport, policy, timeouts),
                      std::make_shared<InteractionRecorder>(m_config.interactions_dir));

    AskOptions options;
    options.argo_url = m_config.argo_url;
    options.argo_user = m_config.argo_user;
    options.model = m_config.model;
    options.sampling.temperature = m_config.temperature;
    options.sampling.top_p = m_config.top_p;
    options.sampling.max_tokens = m_config.max_tokens;
    options.record = m_config.record_interactions;

    LOG_INFO("Core", "Waiting for response from " + m_config.model + "...");
    AskResult answer;
    try {
        answer = client.ask(prompt, options);
    } catch (const ArgoError&) {
        finish(1);
        throw;
    }

    printResponse(answer.text, display_prompt, token_count, template_label);
    return finish(0);
}

std::optional<std::string> Core::readUserPrompt() const {
    if (!m_commands.prompt_file.empty()) {
        ExtractionResult extracted = m_extractors->extract(m_commands.prompt_file);
        if (!extracted.success) {
            throw ArgoError("Cannot read prompt file '" + m_commands.prompt_file + "': " + extracted.reason);
        }
        return extracted.text;
    }
    if (!m_commands.prompt.empty()) {
        return m_commands.prompt;
    }
    return std::nullopt;
}

void Core::printResponse(const std::string& response, const std::string& user_prompt,
                         std::optional<size_t> token_count, const std::string& template_label) const {
    std::string preview = user_prompt.size() > kPromptPreviewLength
        ? user_prompt.substr(0, kPromptPreviewLength) + "..."
        : user_prompt;

    std::cout << "================ ArgoAgent ================\n";
    std::cout << "Model: " << m_config.model << "\n";
    if (!template_label.empty()) {
        std::cout << template_label << "\n";
    }
    if (token_count) {
        std::cout << "Tokens: " << *token_count << "\n";
    }
    std::cout << "Prompt: " << preview << "\n";
    std::cout << "===========================================\n\n";
    std::cout << response << std::endl;
}

} // namespace ArgoAgent
