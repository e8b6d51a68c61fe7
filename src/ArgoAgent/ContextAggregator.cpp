// =================================================================
// src/ArgoAgent/ContextAggregator.cpp
// =================================================================
// Implementation for token-budgeted context aggregation.

#include "ArgoAgent/ContextAggregator.hpp"
#include "ArgoAgent/TextExtractor.hpp"
#include "ArgoAgent/TokenCounter.hpp"
#include "ArgoAgent/Errors.hpp"
#include "ArgoAgent/Logger.hpp"
#include "nlohmann/json.hpp"
#include <unordered_set>

namespace ArgoAgent {

const ContextEntry* AggregationResult::find(const std::string& source_path) const {
    for (const auto& entry : entries) {
        if (entry.source_path == source_path) {
            return &entry;
        }
    }
    return nullptr;
}

ContextAggregator::ContextAggregator(std::shared_ptr<const ExtractorRegistry> extractors,
                                     std::shared_ptr<const TokenCounter> token_counter,
                                     std::string model_hint)
    : m_extractors(std::move(extractors)),
      m_token_counter(std::move(token_counter)),
      m_model_hint(std::move(model_hint)) {}

void ContextAggregator::setPathResolver(PathResolver resolver) {
    m_resolver = std::move(resolver);
}

AggregationResult ContextAggregator::aggregate(const std::vector<std::string>& specs,
                                               std::optional<size_t> max_tokens) {
    // Reset statistics
    m_last_stats.clear();
    m_last_stats["specs_total"] = specs.size();
    m_last_stats["files_resolved"] = 0;
    m_last_stats["files_included"] = 0;
    m_last_stats["files_skipped"] = 0;
    m_last_stats["tokens_counted"] = 0;
    m_last_stats["tokens_unknown"] = 0;

    LOG_INFO("ContextAggregator", "Aggregating context from " + std::to_string(specs.size()) +
             " path specification(s)");
    if (max_tokens) {
        LOG_DEBUG("ContextAggregator", "Token budget: " + std::to_string(*max_tokens) +
                  " (" + m_model_hint + ")");
    }

    AggregationResult result;
    std::unordered_set<std::string> seen;

    for (const auto& spec : specs) {
        ResolvedPath resolved = m_resolver.resolve(spec);

        for (const auto& file : resolved.files) {
            if (!seen.insert(file).second) {
                LOG_DEBUG("ContextAggregator", "Already included, skipping: " + file);
                continue;
            }
            m_last_stats["files_resolved"]++;

            ExtractionResult extracted = m_extractors->extract(file);
            if (!extracted.success) {
                m_last_stats["files_skipped"]++;
                continue;
            }

            ContextEntry entry;
            entry.source_path = file;
            entry.text = std::move(extracted.text);

            if (max_tokens) {
                entry.token_count = m_token_counter->count(entry.text, m_model_hint);
                if (entry.token_count) {
                    result.total_tokens += *entry.token_count;
                    m_last_stats["tokens_counted"] = result.total_tokens;
                    LOG_DEBUG("ContextAggregator", file + ": " + std::to_string(*entry.token_count) +
                              " tokens (total " + std::to_string(result.total_tokens) + ")");

                    if (result.total_tokens > *max_tokens) {
                        finishStats();
                        LOG_ERROR("ContextAggregator", "Token budget exceeded while adding " + file);
                        throw TokenBudgetExceeded(result.total_tokens, *max_tokens);
                    }
                } else {
                    m_last_stats["tokens_unknown"]++;
                    LOG_WARNING("ContextAggregator", "Token count unknown for " + file +
                                "; included without counting");
                }
            }

            result.entries.push_back(std::move(entry));
            m_last_stats["files_included"]++;
        }
    }

    finishStats();
    return result;
}

std::unordered_map<std::string, size_t> ContextAggregator::getLastStats() const {
    return m_last_stats;
}

std::string ContextAggregator::serializeContext(const AggregationResult& result) {
    nlohmann::ordered_json context = nlohmann::ordered_json::object();
    for (const auto& entry : result.entries) {
        context[entry.source_path] = entry.text;
    }
    return context.dump(2, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

void ContextAggregator::finishStats() {
    Logger::getInstance().logContextAggregation(m_last_stats["files_resolved"],
                                                m_last_stats["files_included"],
                                                m_last_stats["files_skipped"],
                                                m_last_stats["tokens_counted"],
                                                m_last_stats["tokens_unknown"]);
}

} // namespace ArgoAgent
