// =================================================================
// include/ArgoAgent/PromptRegistry.hpp
// =================================================================
// Named system prompts and task templates.

#pragma once

#include "ArgoAgent/PromptComposer.hpp"
#include "ArgoAgent/ModelCatalog.hpp"
#include <string>
#include <vector>
#include <map>
#include <optional>

namespace ArgoAgent {

/**
 * @brief Registry of system prompts and tasks
 *
 * System prompts are built in. Tasks are read from `*.yaml` files in a
 * directory, one task per file, keyed by the file stem:
 * @code
 * name: Review
 * description: Review a change
 * goal: Find defects
 * system_prompt: You are a careful reviewer.
 * user_prompt: Review the following code.
 * @endcode
 */
class PromptRegistry {
public:
    /**
     * @brief Create a registry holding the built-in system prompts and no tasks
     */
    PromptRegistry();

    /**
     * @brief Load every `*.yaml` task file of a directory
     *
     * Files that fail to parse are logged and skipped. A missing directory
     * loads nothing and is not an error.
     */
    RegistryLoadResult loadTasks(const std::string& tasks_dir);

    /**
     * @brief Add a task from YAML text under the given name
     * @return false when the text is not a YAML mapping
     */
    bool addTaskFromString(const std::string& task_name, const std::string& yaml_text);

    void addTask(const std::string& task_name, const Task& task);
    void addSystemPrompt(const std::string& name, const std::string& text);

    std::optional<std::string> getSystemPrompt(const std::string& name) const;
    std::optional<Task> getTask(const std::string& name) const;

    /**
     * @brief Sorted system prompt names
     */
    std::vector<std::string> listSystemPrompts() const;

    /**
     * @brief Sorted task names
     */
    std::vector<std::string> listTasks() const;

    /**
     * @brief "- name" lines for every system prompt
     */
    std::string formatSystemPromptList() const;

    /**
     * @brief "- name: description" lines for every task
     */
    std::string formatTaskList() const;

private:
    std::map<std::string, std::string> m_system_prompts;
    std::map<std::string, Task> m_tasks;

    void initializeBuiltinPrompts();
};

} // namespace ArgoAgent
