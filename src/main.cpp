#include "ArgoAgent/CliParser.hpp"
#include "ArgoAgent/Core.hpp"
#include "ArgoAgent/AppConfig.hpp"
#include "ArgoAgent/Errors.hpp"
#include "ArgoAgent/Logger.hpp"
#include "ArgoAgent/ModelCatalog.hpp"
#include "ArgoAgent/PromptRegistry.hpp"
#include <filesystem>
#include <iostream>

int main(int argc, char** argv) {
    ArgoAgent::Logger& logger = ArgoAgent::Logger::getInstance();

    // Registries shown in --help use the default locations
    ArgoAgent::AppConfig defaults;
    ArgoAgent::ModelCatalog help_models = ArgoAgent::ModelCatalog::createDefault();
    ArgoAgent::PromptRegistry help_prompts;
    logger.setConsoleLogLevel(ArgoAgent::LogLevel::ERROR);
    if (std::filesystem::exists(defaults.models_file)) {
        help_models.loadFromFile(defaults.models_file);
    }
    help_prompts.loadTasks(defaults.tasks_dir);
    logger.setConsoleLogLevel(ArgoAgent::LogLevel::INFO);

    // CliParser is responsible for defining and parsing all command-line
    // arguments using the CLI11 library.
    ArgoAgent::CliParser parser;
    auto app = parser.setupCli(help_models, help_prompts);

    try {
        app->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app->exit(e);
    }

    const ArgoAgent::Commands& commands = parser.getCommands();
    if (commands.verbose) {
        logger.setConsoleLogLevel(ArgoAgent::LogLevel::DEBUG);
    } else if (commands.quiet) {
        logger.setConsoleLogLevel(ArgoAgent::LogLevel::ERROR);
    }

    try {
        // The Core class contains the main application logic.
        ArgoAgent::Core core(commands);
        return core.run();
    } catch (const ArgoAgent::ArgoError& e) {
        LOG_ERROR("Main", e.what());
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error during execution: " << e.what() << std::endl;
        return 1;
    }
}
