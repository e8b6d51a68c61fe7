// =================================================================
// include/ArgoAgent/ArgoClient.hpp
// =================================================================
// One-call facade: validate, shape, dispatch and record a prompt.

#pragma once

#include "ArgoAgent/RequestDispatcher.hpp"
#include <memory>
#include <optional>
#include <string>

namespace ArgoAgent {

class ModelCatalog;
class InteractionRecorder;

struct AskOptions {
    std::string argo_url;
    std::string argo_user;
    std::string model = "gpt4olatest";
    std::string system = "You are a helpful AI assistant.";
    SamplingParameters sampling;
    bool record = true;
};

struct AskResult {
    std::string text;
    PromptRequest request;
    DispatchResult dispatch;
    std::optional<std::string> record_path;
};

class ArgoClient {
public:
    /**
     * @brief Constructs the client.
     * @param models Catalog used to validate the model and cap max_tokens.
     * @param dispatcher Sends the request.
     * @param recorder Writes interaction records; may be null to never record.
     */
    ArgoClient(std::shared_ptr<const ModelCatalog> models,
               std::shared_ptr<const RequestDispatcher> dispatcher,
               std::shared_ptr<const InteractionRecorder> recorder);

    /**
     * @brief Send a composed prompt and return the model's answer.
     *
     * Nothing goes over the network unless the endpoint, user, model and
     * sampling parameters are all valid.
     * @throws ConfigurationError when the endpoint URL or user is missing
     * @throws InvalidModel, InvalidParameter, TransportError, ResponseParseError
     */
    AskResult ask(const std::string& prompt, const AskOptions& options) const;

private:
    std::shared_ptr<const ModelCatalog> m_models;
    std::shared_ptr<const RequestDispatcher> m_dispatcher;
    std::shared_ptr<const InteractionRecorder> m_recorder;
};

} // namespace ArgoAgent
