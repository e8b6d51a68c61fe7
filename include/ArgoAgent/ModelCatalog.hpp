// =================================================================
// include/ArgoAgent/ModelCatalog.hpp
// =================================================================
// Read-only table of the models the endpoint accepts.

#pragma once

#include <string>
#include <vector>
#include <optional>

namespace ArgoAgent {

/**
 * @brief Per-model request shaping information
 */
struct ModelConfig {
    std::string name;                      ///< Model identifier sent to the endpoint
    size_t max_tokens = 0;                 ///< Upper bound for the completion length
    bool supports_standard_params = true;  ///< Accepts temperature/top_p/max_tokens
    std::vector<std::string> notes;        ///< Free-text remarks shown in help output
};

/**
 * @brief Outcome of loading a registry file
 */
struct RegistryLoadResult {
    bool success = false;       ///< Whether the file was read and parsed
    size_t loaded = 0;          ///< Entries added or updated
    std::string error_message;  ///< Error message if failed
};

/**
 * @brief Model name to ModelConfig table
 *
 * Built once at startup from the built-in table, optionally extended by a
 * YAML file, and then only read.
 *
 * YAML layout:
 * @code
 * models:
 *   gpt4o:
 *     max_tokens: 16384
 *     supports_standard_params: true
 *     notes: ["Fast general-purpose model"]
 * @endcode
 */
class ModelCatalog {
public:
    /**
     * @brief Create an empty catalog
     */
    ModelCatalog() = default;

    /**
     * @brief Create the catalog with the built-in model table
     */
    static ModelCatalog createDefault();

    /**
     * @brief Add a model, replacing any entry with the same name
     */
    void addModel(const ModelConfig& config);

    /**
     * @brief Look up a model by exact name
     */
    std::optional<ModelConfig> lookup(const std::string& name) const;

    /**
     * @brief Look up a model, failing when it is not in the catalog
     * @throws InvalidModel listing the valid names
     */
    ModelConfig require(const std::string& name) const;

    /**
     * @brief Add or override models from a YAML file
     *
     * Fields missing from an entry keep their current value for known models.
     */
    RegistryLoadResult loadFromFile(const std::string& path);

    /**
     * @brief Same as loadFromFile() for YAML text already in memory
     */
    RegistryLoadResult loadFromString(const std::string& yaml_text);

    /**
     * @brief Model names in registration order
     */
    std::vector<std::string> getModelNames() const;

    size_t size() const { return m_models.size(); }

    /**
     * @brief Human-readable description of every model
     */
    std::string helpText() const;

private:
    std::vector<ModelConfig> m_models;

    ModelConfig* findMutable(const std::string& name);
};

} // namespace ArgoAgent
