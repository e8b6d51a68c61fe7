// =================================================================
// include/ArgoAgent/DocumentExtractors.hpp
// =================================================================
// Extractors for binary document formats. PDF goes through pdftotext
// (poppler-utils), OOXML packages through unzip.

#pragma once

#include "ArgoAgent/TextExtractor.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ArgoAgent {

/**
 * @brief PDF text via `pdftotext -layout -enc UTF-8 <file> -`
 */
class PdfExtractor : public TextExtractor {
public:
    ExtractionResult extract(const std::string& file_path) const override;
    std::string getName() const override { return "pdf"; }
};

enum class OfficeFormat {
    Docx,
    Pptx,
    Xlsx
};

/**
 * @brief Text from Office Open XML packages
 *
 * Word documents yield one line per paragraph, presentations one block per
 * slide headed "Slide N:", workbooks one block per sheet headed
 * "Sheet: <name>" with cells joined by " | ".
 */
class OfficeDocumentExtractor : public TextExtractor {
public:
    explicit OfficeDocumentExtractor(OfficeFormat format);

    ExtractionResult extract(const std::string& file_path) const override;
    std::string getName() const override;

    /**
     * @brief Drop markup from an XML fragment and decode its entities
     *
     * Paragraph and row ends become newlines, tabs become '\t'.
     */
    static std::string xmlToText(const std::string& xml);

    /**
     * @brief Decode the predefined XML entities and numeric references
     */
    static std::string decodeEntities(const std::string& text);

    /**
     * @brief Number N of a member named prefix + N + ".xml"
     * @return nullopt when the name does not match or N does not fit
     */
    static std::optional<unsigned long long> memberNumber(const std::string& member,
                                                          const std::string& prefix);

private:
    OfficeFormat m_format;

    ExtractionResult extractDocx(const std::string& file_path) const;
    ExtractionResult extractPptx(const std::string& file_path) const;
    ExtractionResult extractXlsx(const std::string& file_path) const;

    /**
     * @brief Read one member of the package with `unzip -p`
     * @return Exit code of unzip and the member content
     */
    std::pair<int, std::string> readMember(const std::string& file_path, const std::string& member) const;
    std::vector<std::string> listMembers(const std::string& file_path) const;
};

/**
 * @brief Placeholder for formats with no reader available
 */
class UnavailableExtractor : public TextExtractor {
public:
    explicit UnavailableExtractor(std::string format) : m_format(std::move(format)) {}

    ExtractionResult extract(const std::string& file_path) const override;
    std::string getName() const override { return m_format; }

private:
    std::string m_format;
};

/**
 * @brief File argument for pdftotext and unzip
 *
 * A relative path starting with '-' becomes "./-name" so the tool does not
 * read it as an option.
 */
std::string toolPathArgument(const std::string& file_path);

} // namespace ArgoAgent
