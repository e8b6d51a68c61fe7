// =================================================================
// include/ArgoAgent/InteractionRecorder.hpp
// =================================================================
// Saves each successful request/response pair as a JSON file.

#pragma once

#include "ArgoAgent/RequestDispatcher.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace ArgoAgent {

/**
 * @brief Writes interaction records to `<dir>/{user}_{model}_{YYYYmmdd_HHMMSS}.json`
 *
 * Recording is best effort: failures are logged and never reach the caller.
 */
class InteractionRecorder {
public:
    explicit InteractionRecorder(std::string interactions_dir = "interactions");

    /**
     * @brief Persist one interaction
     * @return Path of the written file, or std::nullopt if writing failed
     */
    std::optional<std::string> record(const PromptRequest& request,
                                      const DispatchResult& result) const;

    /**
     * @brief Build the JSON document for an interaction
     *
     * `parameters` always holds temperature, top_p, max_tokens and
     * max_completion_tokens; the ones not sent are null.
     */
    static nlohmann::ordered_json buildRecord(const PromptRequest& request,
                                              const DispatchResult& result,
                                              std::chrono::system_clock::time_point when);

    /**
     * @brief File name for an interaction at a given time
     *
     * '/' and '\\' in the user or model name become '_'. A non-zero
     * `sequence` is appended as "_N" before the extension.
     */
    static std::string buildFilename(const std::string& user, const std::string& model,
                                     std::chrono::system_clock::time_point when,
                                     unsigned int sequence = 0);

private:
    std::string m_interactions_dir;
};

} // namespace ArgoAgent
