// =================================================================
// include/ArgoAgent/TextExtractor.hpp
// =================================================================
// Per-format text extraction behind a single extract(path) contract.

#pragma once

#include <string>
#include <memory>
#include <unordered_map>

namespace ArgoAgent {

/**
 * @brief Outcome of extracting text from one file
 *
 * A failed extraction is not an error for the caller: the file is skipped
 * and `reason` is logged.
 */
struct ExtractionResult {
    bool success = false;   ///< Whether text was extracted
    std::string text;       ///< Extracted text, trimmed
    std::string reason;     ///< Why the file was skipped

    static ExtractionResult ok(std::string text);
    static ExtractionResult skip(std::string reason);
};

/**
 * @brief Reads one document format and returns its plain text
 */
class TextExtractor {
public:
    virtual ~TextExtractor() = default;

    /**
     * @brief Extract plain text from a file
     * @param file_path Path to the file
     * @return Text on success, a skip reason otherwise; never throws
     */
    virtual ExtractionResult extract(const std::string& file_path) const = 0;

    /**
     * @brief Short format name used in log messages
     */
    virtual std::string getName() const = 0;
};

/**
 * @brief Plain text reader with a Latin-1 fallback for non-UTF-8 input
 */
class PlainTextExtractor : public TextExtractor {
public:
    ExtractionResult extract(const std::string& file_path) const override;
    std::string getName() const override { return "text"; }

    /**
     * @brief Check whether bytes form well-formed UTF-8
     */
    static bool isValidUtf8(const std::string& bytes);

    /**
     * @brief Reinterpret bytes as ISO-8859-1 and re-encode them as UTF-8
     */
    static std::string latin1ToUtf8(const std::string& bytes);
};

/**
 * @brief Markdown reader that drops markup and keeps the readable text
 */
class MarkdownExtractor : public TextExtractor {
public:
    ExtractionResult extract(const std::string& file_path) const override;
    std::string getName() const override { return "markdown"; }

    /**
     * @brief Convert Markdown source to plain text
     */
    static std::string toPlainText(const std::string& markdown);
};

/**
 * @brief Chooses an extractor by file extension
 *
 * Extensions are matched case-insensitively; files with no registered
 * extension are read as plain text.
 */
class ExtractorRegistry {
public:
    /**
     * @brief Create an empty registry that reads everything as plain text
     */
    ExtractorRegistry();

    /**
     * @brief Create the registry used by the application
     *
     * Markdown, PDF and OOXML formats get their dedicated readers; legacy
     * binary Office formats report that no reader is available.
     */
    static std::shared_ptr<ExtractorRegistry> createDefault();

    /**
     * @brief Register or replace the extractor for an extension
     * @param extension Extension including the dot, any case
     */
    void registerExtractor(const std::string& extension, std::shared_ptr<TextExtractor> extractor);

    /**
     * @brief Extract text from a file with the extractor for its extension
     *
     * An exception thrown by an extractor is reported as a skip.
     */
    ExtractionResult extract(const std::string& file_path) const;

private:
    std::unordered_map<std::string, std::shared_ptr<TextExtractor>> m_extractors;
    std::shared_ptr<TextExtractor> m_fallback;
};

/**
 * @brief Trim ASCII whitespace from both ends
 */
std::string trimWhitespace(const std::string& text);

} // namespace ArgoAgent
