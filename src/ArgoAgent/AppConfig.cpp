// =================================================================
// src/ArgoAgent/AppConfig.cpp
// =================================================================
// Implementation for application configuration management.

#include "ArgoAgent/AppConfig.hpp"
#include "ArgoAgent/CliParser.hpp"
#include "ArgoAgent/Errors.hpp"
#include "ArgoAgent/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <filesystem>

namespace ArgoAgent {

template <typename T>
static void readValue(const YAML::Node& node, const char* key, T& target) {
    if (node[key] && !node[key].IsNull()) {
        target = node[key].as<T>();
    }
}

static void applyNode(const YAML::Node& root, AppConfig& config) {
    if (!root || root.IsNull()) {
        return;
    }
    if (!root.IsMap()) {
        throw ConfigurationError("Configuration must be a YAML mapping");
    }

    readValue(root, "argo_url", config.argo_url);
    readValue(root, "argo_user", config.argo_user);
    readValue(root, "model", config.model);
    readValue(root, "temperature", config.temperature);
    readValue(root, "top_p", config.top_p);
    readValue(root, "max_tokens", config.max_tokens);
    readValue(root, "record_interactions", config.record_interactions);
    readValue(root, "interactions_dir", config.interactions_dir);
    readValue(root, "token_model_hint", config.token_model_hint);
    readValue(root, "tasks_dir", config.tasks_dir);
    readValue(root, "models_file", config.models_file);
    readValue(root, "log_dir", config.log_dir);

    if (root["request"]) {
        YAML::Node request = root["request"];
        readValue(request, "connect_timeout_seconds", config.request.connect_timeout_seconds);
        readValue(request, "read_timeout_seconds", config.request.read_timeout_seconds);
        readValue(request, "max_attempts", config.request.max_attempts);
        readValue(request, "backoff_factor", config.request.backoff_factor);
    }
}

void AppConfig::loadFromFile(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        // Fine before `--init` has been run
        LOG_DEBUG("AppConfig", "No configuration file at " + path + ", using defaults");
        return;
    }

    try {
        applyNode(YAML::LoadFile(path), *this);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Invalid configuration file '" + path + "': " + e.what());
    }
    LOG_DEBUG("AppConfig", "Loaded configuration from " + path);
}

void AppConfig::loadFromString(const std::string& yaml_text) {
    try {
        applyNode(YAML::Load(yaml_text), *this);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(std::string("Invalid configuration: ") + e.what());
    }
}

void AppConfig::applyEnvironment() {
    if (const char* url = std::getenv("ARGO_URL"); url && *url) {
        argo_url = url;
    }
    if (const char* user = std::getenv("ARGO_USER"); user && *user) {
        argo_user = user;
    }
}

void AppConfig::applyCommandOverrides(const Commands& commands) {
    if (!commands.argo_url.empty()) {
        argo_url = commands.argo_url;
    }
    if (!commands.argo_user.empty()) {
        argo_user = commands.argo_user;
    }
    if (!commands.model.empty()) {
        model = commands.model;
    }
    if (commands.temperature) {
        temperature = *commands.temperature;
    }
    if (commands.top_p) {
        top_p = *commands.top_p;
    }
    if (commands.max_tokens) {
        max_tokens = *commands.max_tokens;
    }
    if (commands.timeout_seconds) {
        request.read_timeout_seconds = *commands.timeout_seconds;
    }
    if (commands.no_record) {
        record_interactions = false;
    }
}

bool AppConfig::validate() const {
    bool valid = true;

    if (model.empty()) {
        LOG_ERROR("AppConfig", "model cannot be empty");
        valid = false;
    }

    if (request.connect_timeout_seconds <= 0.0) {
        LOG_ERROR("AppConfig", "request.connect_timeout_seconds must be greater than 0");
        valid = false;
    }

    if (request.read_timeout_seconds <= 0.0) {
        LOG_ERROR("AppConfig", "request.read_timeout_seconds must be greater than 0");
        valid = false;
    }

    if (request.max_attempts == 0) {
        LOG_ERROR("AppConfig", "request.max_attempts must be at least 1");
        valid = false;
    }

    if (request.backoff_factor < 0.0) {
        LOG_ERROR("AppConfig", "request.backoff_factor cannot be negative");
        valid = false;
    }

    if (record_interactions && interactions_dir.empty()) {
        LOG_ERROR("AppConfig", "interactions_dir cannot be empty when recording is enabled");
        valid = false;
    }

    return valid;
}

std::string AppConfig::defaultConfigText() {
    return R"(# ArgoAgent Configuration v1.0
# Endpoint and user; ARGO_URL / ARGO_USER override these, command-line flags override both
argo_url: ''
argo_user: ''

# Request defaults
model: gpt4olatest
temperature: 0.7
top_p: 0.9
max_tokens: 100000       # Response limit and context token budget

# Save each successful request/response pair as JSON
record_interactions: true
interactions_dir: interactions

# Model family used to count context tokens
token_model_hint: gpt-4

# Task templates (*.yaml) and extra model definitions
tasks_dir: .argoagent/tasks
models_file: .argoagent/models.yml

log_dir: .argoagent/logs

request:
  connect_timeout_seconds: 30
  read_timeout_seconds: 300
  max_attempts: 3          # Retries on 500/502/503/504 and connection failures
  backoff_factor: 0.3      # Delay before retry n is backoff_factor * 2^(n-1) seconds
)";
}

} // namespace ArgoAgent
