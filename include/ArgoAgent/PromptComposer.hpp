// =================================================================
// include/ArgoAgent/PromptComposer.hpp
// =================================================================
// Header for merging system instruction, user prompt and context.

#pragma once

#include <string>
#include <optional>

namespace ArgoAgent {

/**
 * @brief A reusable prompt template: system instruction plus default user prompt
 */
struct Task {
    std::string name;
    std::string description;
    std::string goal;
    std::string system_prompt;
    std::string user_prompt;
};

/**
 * @brief Builds the final prompt string sent to the model
 *
 * Composition order:
 *   1. a system instruction, when present, is prepended followed by a blank line;
 *   2. context, when present, replaces every "{context}" placeholder, or is
 *      appended after "\nreply based on the content here:" if there is none.
 *
 * Composition is pure: no I/O, same inputs give the same output.
 */
class PromptComposer {
public:
    static constexpr const char* kContextPlaceholder = "{context}";
    static constexpr const char* kContextLeadIn = "\nreply based on the content here:";

    /**
     * @brief Compose a prompt
     * @param user_prompt Prompt typed or loaded by the user
     * @param context Serialized context, if any was requested
     * @param system_instruction System instruction to prepend, if any
     */
    std::string compose(const std::string& user_prompt,
                        const std::optional<std::string>& context = std::nullopt,
                        const std::optional<std::string>& system_instruction = std::nullopt) const;

    /**
     * @brief Compose a prompt from a task template
     *
     * The task's system prompt is always used. The explicit user prompt wins
     * over the task's default user prompt when given.
     */
    std::string composeTask(const Task& task,
                            const std::optional<std::string>& user_prompt,
                            const std::optional<std::string>& context = std::nullopt) const;
};

} // namespace ArgoAgent
