// =================================================================
// include/ArgoAgent/ContextAggregator.hpp
// =================================================================
// Header for gathering file contents into a token-budgeted context.

#pragma once

#include "ArgoAgent/PathResolver.hpp"
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <unordered_map>

namespace ArgoAgent {

class ExtractorRegistry;
class TokenCounter;

/**
 * @brief Text extracted from one file
 */
struct ContextEntry {
    std::string source_path;
    std::string text;
    std::optional<size_t> token_count;  ///< std::nullopt when not counted or unknown
};

/**
 * @brief Ordered context gathered from all path specifications
 */
struct AggregationResult {
    std::vector<ContextEntry> entries;  ///< Discovery order
    size_t total_tokens = 0;            ///< Sum of the known token counts

    /**
     * @brief Find the entry for a path
     * @return Pointer into entries, or nullptr
     */
    const ContextEntry* find(const std::string& source_path) const;

    bool empty() const { return entries.empty(); }
};

/**
 * @brief Resolves path specifications, extracts their text and enforces a token budget
 *
 * Each file is extracted once, in the order the specifications were given
 * and then in discovery order within each specification. Files that cannot
 * be read are logged and skipped. When a budget is given every entry is
 * counted and the run aborts with TokenBudgetExceeded as soon as the running
 * total goes past it; nothing is returned in that case.
 */
class ContextAggregator {
public:
    /**
     * @brief Construct an aggregator
     * @param extractors Per-format text extraction
     * @param token_counter Counter used when a budget is given
     * @param model_hint Model family passed to the counter (default: "gpt-4")
     */
    ContextAggregator(std::shared_ptr<const ExtractorRegistry> extractors,
                      std::shared_ptr<const TokenCounter> token_counter,
                      std::string model_hint = "gpt-4");

    /**
     * @brief Replace the path resolver (e.g., to change the extension allow-list)
     */
    void setPathResolver(PathResolver resolver);

    /**
     * @brief Aggregate the text of every file named by the specifications
     * @param specs File paths, directories or glob patterns, in priority order
     * @param max_tokens Budget; std::nullopt disables counting
     * @return Entries in discovery order with the counted total
     * @throws TokenBudgetExceeded when the running total exceeds max_tokens
     */
    AggregationResult aggregate(const std::vector<std::string>& specs,
                                std::optional<size_t> max_tokens = std::nullopt);

    /**
     * @brief Statistics of the last aggregate() call
     * @return specs_total, files_resolved, files_included, files_skipped,
     *         tokens_counted, tokens_unknown
     */
    std::unordered_map<std::string, size_t> getLastStats() const;

    /**
     * @brief Render entries as a pretty-printed JSON object of path to text
     *
     * Keys keep discovery order. This is the context string handed to the
     * prompt composer.
     */
    static std::string serializeContext(const AggregationResult& result);

private:
    std::shared_ptr<const ExtractorRegistry> m_extractors;
    std::shared_ptr<const TokenCounter> m_token_counter;
    std::string m_model_hint;
    PathResolver m_resolver;
    std::unordered_map<std::string, size_t> m_last_stats;

    void finishStats();
};

} // namespace ArgoAgent
