// =================================================================
// src/ArgoAgent/PromptComposer.cpp
// =================================================================
// Implementation for prompt composition.

#include "ArgoAgent/PromptComposer.hpp"

namespace ArgoAgent {

static std::string replaceAll(std::string text, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
    return text;
}

std::string PromptComposer::compose(const std::string& user_prompt,
                                    const std::optional<std::string>& context,
                                    const std::optional<std::string>& system_instruction) const {
    std::string prompt = user_prompt;

    if (system_instruction && !system_instruction->empty()) {
        prompt = *system_instruction + "\n\n" + prompt;
    }

    if (context) {
        if (prompt.find(kContextPlaceholder) != std::string::npos) {
            prompt = replaceAll(std::move(prompt), kContextPlaceholder, *context);
        } else {
            prompt += kContextLeadIn + *context;
        }
    }

    return prompt;
}

std::string PromptComposer::composeTask(const Task& task,
                                        const std::optional<std::string>& user_prompt,
                                        const std::optional<std::string>& context) const {
    const std::string& prompt = user_prompt ? *user_prompt : task.user_prompt;
    return compose(prompt, context, task.system_prompt);
}

} // namespace ArgoAgent
