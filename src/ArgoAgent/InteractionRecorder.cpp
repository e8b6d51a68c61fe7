// =================================================================
// src/ArgoAgent/InteractionRecorder.cpp
// =================================================================
// Implementation for interaction persistence.

#include "ArgoAgent/InteractionRecorder.hpp"
#include "ArgoAgent/SysInteraction.hpp"
#include "ArgoAgent/Logger.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace ArgoAgent {

static std::tm toLocalTime(std::chrono::system_clock::time_point when) {
    std::time_t time = std::chrono::system_clock::to_time_t(when);
    std::tm local{};
    localtime_r(&time, &local);
    return local;
}

// ISO 8601 local time with microseconds, e.g. 2025-01-31T14:05:09.123456
static std::string isoTimestamp(std::chrono::system_clock::time_point when) {
    std::tm local = toLocalTime(when);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        when.time_since_epoch()).count() % 1000000;

    std::ostringstream out;
    out << std::put_time(&local, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(6) << micros;
    return out.str();
}

InteractionRecorder::InteractionRecorder(std::string interactions_dir)
    : m_interactions_dir(std::move(interactions_dir)) {}

nlohmann::ordered_json InteractionRecorder::buildRecord(const PromptRequest& request,
                                                        const DispatchResult& result,
                                                        std::chrono::system_clock::time_point when) {
    auto optionalValue = [](const auto& value) {
        return value ? nlohmann::ordered_json(*value) : nlohmann::ordered_json(nullptr);
    };

    nlohmann::ordered_json parameters;
    parameters["temperature"] = optionalValue(request.temperature);
    parameters["top_p"] = optionalValue(request.top_p);
    parameters["max_tokens"] = optionalValue(request.max_tokens);
    parameters["max_completion_tokens"] = optionalValue(request.max_completion_tokens);

    nlohmann::ordered_json record;
    record["timestamp"] = isoTimestamp(when);
    record["request"]["prompt"] = request.prompt.empty() ? std::string() : request.prompt.front();
    record["request"]["model"] = request.model;
    record["request"]["parameters"] = parameters;
    record["request"]["system"] = request.system;
    record["response"]["content"] = result.text;
    record["response"]["time_taken"] = result.elapsed_seconds;
    return record;
}

// Path separators in user or model names would leave the directory
static std::string fileNamePart(std::string part) {
    for (char& c : part) {
        if (c == '/' || c == '\\') {
            c = '_';
        }
    }
    return part;
}

std::string InteractionRecorder::buildFilename(const std::string& user, const std::string& model,
                                               std::chrono::system_clock::time_point when,
                                               unsigned int sequence) {
    std::tm local = toLocalTime(when);
    std::ostringstream name;
    name << fileNamePart(user) << "_" << fileNamePart(model) << "_"
         << std::put_time(&local, "%Y%m%d_%H%M%S");
    if (sequence > 0) {
        name << "_" << sequence;
    }
    name << ".json";
    return name.str();
}

std::optional<std::string> InteractionRecorder::record(const PromptRequest& request,
                                                       const DispatchResult& result) const {
    SysInteraction sys;
    if (!sys.createDirectories(m_interactions_dir)) {
        LOG_ERROR("InteractionRecorder", "Cannot create interactions directory: " + m_interactions_dir);
        return std::nullopt;
    }

    // Records are never overwritten; a second one in the same second gets a suffix
    auto now = std::chrono::system_clock::now();
    std::string path;
    for (unsigned int sequence = 0; ; ++sequence) {
        path = m_interactions_dir + "/" + buildFilename(request.user, request.model, now, sequence);
        if (!sys.fileExists(path)) {
            break;
        }
    }
    std::string content = buildRecord(request, result, now)
                              .dump(2, ' ', false, nlohmann::ordered_json::error_handler_t::replace);

    if (!sys.writeFile(path, content + "\n")) {
        LOG_ERROR("InteractionRecorder", "Error saving interaction to " + path);
        return std::nullopt;
    }

    LOG_INFO("InteractionRecorder", "Interaction saved to: " + path);
    return path;
}

} // namespace ArgoAgent
