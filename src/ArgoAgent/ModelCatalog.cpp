// =================================================================
// src/ArgoAgent/ModelCatalog.cpp
// =================================================================
// Implementation for the model catalog.

#include "ArgoAgent/ModelCatalog.hpp"
#include "ArgoAgent/Errors.hpp"
#include "ArgoAgent/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <sstream>

namespace ArgoAgent {

static RegistryLoadResult applyModelsNode(const YAML::Node& root, ModelCatalog& catalog) {
    RegistryLoadResult result;

    if (!root["models"]) {
        Logger::getInstance().warning("ModelCatalog", "No 'models' section in model file");
        result.success = true;
        return result;
    }

    YAML::Node models = root["models"];
    if (!models.IsMap()) {
        result.error_message = "'models' must be a mapping of model name to settings";
        return result;
    }

    for (YAML::const_iterator it = models.begin(); it != models.end(); ++it) {
        std::string name = it->first.as<std::string>();
        YAML::Node model_node = it->second;

        ModelConfig config = catalog.lookup(name).value_or(ModelConfig{});
        config.name = name;

        if (model_node["max_tokens"]) {
            config.max_tokens = model_node["max_tokens"].as<size_t>();
        }
        if (model_node["supports_standard_params"]) {
            config.supports_standard_params = model_node["supports_standard_params"].as<bool>();
        }
        if (model_node["notes"]) {
            config.notes.clear();
            if (model_node["notes"].IsSequence()) {
                for (const auto& note : model_node["notes"]) {
                    config.notes.push_back(note.as<std::string>());
                }
            } else {
                config.notes.push_back(model_node["notes"].as<std::string>());
            }
        }

        if (config.max_tokens == 0) {
            Logger::getInstance().warning("ModelCatalog", "Model '" + name + "' has no max_tokens, ignored");
            continue;
        }

        catalog.addModel(config);
        result.loaded++;
    }

    result.success = true;
    return result;
}

ModelCatalog ModelCatalog::createDefault() {
    ModelCatalog catalog;
    catalog.addModel({"gpt35", 4096, true, {}});
    catalog.addModel({"gpt35large", 16384, true, {}});
    catalog.addModel({"gpt4", 8192, true, {}});
    catalog.addModel({"gpt4large", 32768, true, {}});
    catalog.addModel({"gpt4turbo", 4096, true, {"This model responds much slower than GPT-3.5"}});
    catalog.addModel({"gpt4o", 16384, true, {}});
    catalog.addModel({"gpt4olatest", 16384, true, {}});
    catalog.addModel({"gpto1preview", 16384, false,
                      {"Will be retired on April 1, 2025",
                       "Only uses 'user prompt' and 'max_completion_tokens' fields"}});
    catalog.addModel({"gpto1mini", 65536, false, {"Only available in dev environment"}});
    catalog.addModel({"gpto3mini", 100000, false, {"Only available in dev environment"}});
    catalog.addModel({"gpto1", 200000, false, {}});
    return catalog;
}

void ModelCatalog::addModel(const ModelConfig& config) {
    if (ModelConfig* existing = findMutable(config.name)) {
        *existing = config;
        return;
    }
    m_models.push_back(config);
}

std::optional<ModelConfig> ModelCatalog::lookup(const std::string& name) const {
    for (const auto& model : m_models) {
        if (model.name == name) {
            return model;
        }
    }
    return std::nullopt;
}

ModelConfig ModelCatalog::require(const std::string& name) const {
    auto config = lookup(name);
    if (!config) {
        std::string message = "Invalid model name: " + name + ". Valid models are:";
        for (const auto& model : m_models) {
            message += "\n- " + model.name;
        }
        throw InvalidModel(name, message);
    }
    return *config;
}

RegistryLoadResult ModelCatalog::loadFromFile(const std::string& path) {
    RegistryLoadResult result;
    try {
        YAML::Node root = YAML::LoadFile(path);
        result = applyModelsNode(root, *this);
    } catch (const YAML::Exception& e) {
        result.success = false;
        result.error_message = "Failed to parse model file '" + path + "': " + e.what();
    }

    if (result.success) {
        LOG_INFO("ModelCatalog", "Loaded " + std::to_string(result.loaded) + " model(s) from " + path);
    } else {
        LOG_ERROR("ModelCatalog", result.error_message);
    }
    return result;
}

RegistryLoadResult ModelCatalog::loadFromString(const std::string& yaml_text) {
    RegistryLoadResult result;
    try {
        YAML::Node root = YAML::Load(yaml_text);
        result = applyModelsNode(root, *this);
    } catch (const YAML::Exception& e) {
        result.success = false;
        result.error_message = std::string("Failed to parse model definitions: ") + e.what();
        LOG_ERROR("ModelCatalog", result.error_message);
    }
    return result;
}

std::vector<std::string> ModelCatalog::getModelNames() const {
    std::vector<std::string> names;
    names.reserve(m_models.size());
    for (const auto& model : m_models) {
        names.push_back(model.name);
    }
    return names;
}

std::string ModelCatalog::helpText() const {
    std::ostringstream text;
    text << "Available models and their specifications:\n";

    for (const auto& model : m_models) {
        text << "\n" << model.name << "\n" << std::string(model.name.size(), '=') << "\n";
        text << "  - Max tokens: " << model.max_tokens << "\n";
        text << "  - Supports standard parameters (temperature, top_p): "
             << (model.supports_standard_params ? "True" : "False") << "\n";
        for (const auto& note : model.notes) {
            text << "  - Note: " << note << "\n";
        }
    }
    return text.str();
}

ModelConfig* ModelCatalog::findMutable(const std::string& name) {
    for (auto& model : m_models) {
        if (model.name == name) {
            return &model;
        }
    }
    return nullptr;
}

} // namespace ArgoAgent
