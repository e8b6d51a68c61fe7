// =================================================================
// src/ArgoAgent/TokenCounter.cpp
// =================================================================
// Implementation for the estimating token counter.

#include "ArgoAgent/TokenCounter.hpp"
#include "ArgoAgent/Logger.hpp"
#include <cctype>
#include <cmath>

namespace ArgoAgent {

static std::string normalizeHint(const std::string& hint) {
    std::string normalized;
    for (unsigned char c : hint) {
        if (c == '-' || c == '.' || c == '_' || std::isspace(c)) {
            continue;
        }
        normalized += static_cast<char>(std::tolower(c));
    }
    return normalized;
}

static bool startsWith(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

std::optional<std::string> EstimatingTokenCounter::encodingFor(const std::string& model_hint) {
    std::string hint = normalizeHint(model_hint);

    // Matches "gpt4o..." before the plain "gpt4" family
    for (const char* prefix : {"gpt4o", "gpto", "o1", "o3", "o4", "o200k"}) {
        if (startsWith(hint, prefix)) {
            return std::string("o200k_base");
        }
    }
    for (const char* prefix : {"gpt4", "gpt35", "gpt3", "textembedding", "cl100k"}) {
        if (startsWith(hint, prefix)) {
            return std::string("cl100k_base");
        }
    }
    return std::nullopt;
}

std::optional<size_t> EstimatingTokenCounter::count(const std::string& text,
                                                    const std::string& model_hint) const {
    auto encoding = encodingFor(model_hint);
    if (!encoding) {
        LOG_WARNING("TokenCounter", "No token encoding known for model '" + model_hint + "'");
        return std::nullopt;
    }

    if (text.empty()) {
        return 0;
    }

    double chars_per_token = (*encoding == "o200k_base") ? 4.5 : 4.0;
    return static_cast<size_t>(std::ceil(static_cast<double>(text.size()) / chars_per_token));
}

} // namespace ArgoAgent
