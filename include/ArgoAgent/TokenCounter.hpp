// =================================================================
// include/ArgoAgent/TokenCounter.hpp
// =================================================================
// Token counting seam used by context aggregation and `-n`.

#pragma once

#include <string>
#include <optional>

namespace ArgoAgent {

/**
 * @brief Counts tokens in a text for a given model family
 */
class TokenCounter {
public:
    virtual ~TokenCounter() = default;

    /**
     * @brief Count the tokens of a text
     * @param text Text to measure
     * @param model_hint Model or encoding family name (e.g., "gpt-4")
     * @return Token count, or std::nullopt when the hint has no known encoding
     */
    virtual std::optional<size_t> count(const std::string& text, const std::string& model_hint) const = 0;
};

/**
 * @brief Character-ratio estimator for the GPT encodings
 *
 * cl100k_base models (gpt-4, gpt-3.5) average about 4 characters per token,
 * o200k_base models (gpt-4o, o1, o3) about 4.5. Counts are rounded up, so
 * any non-empty text costs at least one token.
 *
 * Known limitation: these are estimates, not BPE token counts. Code, dense
 * punctuation and non-Latin scripts tokenize worse than the ratio assumes,
 * so the estimate can be low and a context near the budget may still be
 * too large for the model. Plug an exact tokenizer in behind TokenCounter
 * when the budget must be exact.
 */
class EstimatingTokenCounter : public TokenCounter {
public:
    std::optional<size_t> count(const std::string& text, const std::string& model_hint) const override;

    /**
     * @brief Encoding used for a model hint
     * @return "cl100k_base", "o200k_base", or std::nullopt if unknown
     */
    static std::optional<std::string> encodingFor(const std::string& model_hint);
};

} // namespace ArgoAgent
