// =================================================================
// src/ArgoAgent/ArgoClient.cpp
// =================================================================
// Implementation for the request facade.

#include "ArgoAgent/ArgoClient.hpp"
#include "ArgoAgent/InteractionRecorder.hpp"
#include "ArgoAgent/ModelCatalog.hpp"
#include "ArgoAgent/Errors.hpp"
#include "ArgoAgent/Logger.hpp"
#include <iomanip>
#include <sstream>

namespace ArgoAgent {

ArgoClient::ArgoClient(std::shared_ptr<const ModelCatalog> models,
                       std::shared_ptr<const RequestDispatcher> dispatcher,
                       std::shared_ptr<const InteractionRecorder> recorder)
    : m_models(std::move(models)),
      m_dispatcher(std::move(dispatcher)),
      m_recorder(std::move(recorder)) {}

AskResult ArgoClient::ask(const std::string& prompt, const AskOptions& options) const {
    if (options.argo_url.empty() || options.argo_user.empty()) {
        throw ConfigurationError(
            "ARGO_URL and ARGO_USER must be set either as environment variables, "
            "in the configuration file or on the command line");
    }

    ModelConfig model = m_models->require(options.model);
    RequestDispatcher::validateParameters(options.sampling);

    AskResult result;
    result.request = RequestDispatcher::buildRequest(prompt, options.argo_user, options.system,
                                                     model, options.sampling);

    try {
        result.dispatch = m_dispatcher->dispatch(options.argo_url, result.request);
    } catch (const ArgoError&) {
        Logger::getInstance().logLlmInteraction(model.name, 0, 0, 0, false);
        throw;
    }
    result.text = result.dispatch.text;

    std::ostringstream elapsed;
    elapsed << std::fixed << std::setprecision(2) << result.dispatch.elapsed_seconds;
    LOG_INFO("ArgoClient", "Response received in " + elapsed.str() + " seconds");
    Logger::getInstance().logLlmInteraction(model.name, result.text.size(),
                                            static_cast<long>(result.dispatch.elapsed_seconds * 1000.0),
                                            static_cast<int>(result.dispatch.attempts), true);

    if (options.record && m_recorder) {
        result.record_path = m_recorder->record(result.request, result.dispatch);
    }

    return result;
}

} // namespace ArgoAgent
