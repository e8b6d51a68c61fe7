// =================================================================
// src/ArgoAgent/DocumentExtractors.cpp
// =================================================================
// Implementation for PDF and Office Open XML text extraction.

#include "ArgoAgent/DocumentExtractors.hpp"
#include "ArgoAgent/SysInteraction.hpp"
#include "ArgoAgent/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <tuple>

namespace ArgoAgent {

namespace {

constexpr int kCommandNotFound = 127;

struct XmlElement {
    std::string open_tag;   // "<c r="A1" t="s">"
    std::string inner;      // content between the open and close tags
};

// Non-nested occurrences of <tag ...>...</tag> or <tag .../>
std::vector<XmlElement> findElements(const std::string& xml, const std::string& tag) {
    std::vector<XmlElement> elements;
    const std::string open = "<" + tag;
    const std::string close = "</" + tag + ">";

    size_t pos = 0;
    while ((pos = xml.find(open, pos)) != std::string::npos) {
        size_t after = pos + open.size();
        if (after >= xml.size()) {
            break;
        }
        char next = xml[after];
        if (next != ' ' && next != '>' && next != '/' && next != '\t' && next != '\n' && next != '\r') {
            pos = after;
            continue;
        }

        size_t tag_end = xml.find('>', after);
        if (tag_end == std::string::npos) {
            break;
        }

        XmlElement element;
        element.open_tag = xml.substr(pos, tag_end - pos + 1);
        if (xml[tag_end - 1] == '/') {
            elements.push_back(std::move(element));
            pos = tag_end + 1;
            continue;
        }

        size_t close_pos = xml.find(close, tag_end + 1);
        if (close_pos == std::string::npos) {
            break;
        }
        element.inner = xml.substr(tag_end + 1, close_pos - tag_end - 1);
        elements.push_back(std::move(element));
        pos = close_pos + close.size();
    }
    return elements;
}

std::string attributeValue(const std::string& open_tag, const std::string& name) {
    const std::string key = " " + name + "=\"";
    size_t start = open_tag.find(key);
    if (start == std::string::npos) {
        return "";
    }
    start += key.size();
    size_t end = open_tag.find('"', start);
    if (end == std::string::npos) {
        return "";
    }
    return open_tag.substr(start, end - start);
}

std::string appendUtf8(std::string out, unsigned long code_point) {
    if (code_point < 0x80) {
        out += static_cast<char>(code_point);
    } else if (code_point < 0x800) {
        out += static_cast<char>(0xC0 | (code_point >> 6));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    } else if (code_point < 0x10000) {
        out += static_cast<char>(0xE0 | (code_point >> 12));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    } else if (code_point <= 0x10FFFF) {
        out += static_cast<char>(0xF0 | (code_point >> 18));
        out += static_cast<char>(0x80 | ((code_point >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    }
    return out;
}

// Members such as "ppt/slides/slide12.xml" matching prefix + N + ".xml", by N
std::vector<std::pair<unsigned long long, std::string>> numberedMembers(const std::vector<std::string>& members,
                                                                        const std::string& prefix) {
    std::vector<std::pair<unsigned long long, std::string>> numbered;
    for (const auto& member : members) {
        if (auto number = OfficeDocumentExtractor::memberNumber(member, prefix)) {
            numbered.emplace_back(*number, member);
        }
    }
    std::sort(numbered.begin(), numbered.end());
    return numbered;
}

std::string unzipFailure(const std::string& format, int exit_code) {
    if (exit_code == kCommandNotFound) {
        return "unzip is not installed; cannot read ." + format + " files";
    }
    return "Not a readable ." + format + " package (unzip exit code " + std::to_string(exit_code) + ")";
}

} // namespace

// ---- PdfExtractor ----

ExtractionResult PdfExtractor::extract(const std::string& file_path) const {
    SysInteraction sys;
    std::string output;
    int exit_code = 0;
    try {
        std::tie(output, exit_code) = sys.executeCommand(
            "pdftotext", {"-layout", "-enc", "UTF-8", toolPathArgument(file_path), "-"}, false);
    } catch (const std::runtime_error& e) {
        return ExtractionResult::skip(std::string("Could not run pdftotext: ") + e.what());
    }
    if (exit_code == kCommandNotFound) {
        return ExtractionResult::skip("pdftotext is not installed; cannot read PDF files");
    }
    if (exit_code != 0) {
        return ExtractionResult::skip("pdftotext failed with exit code " + std::to_string(exit_code));
    }

    LOG_DEBUG("TextExtractor", "Extracted " + std::to_string(output.size()) + " bytes from PDF " + file_path);
    return ExtractionResult::ok(trimWhitespace(output));
}

// ---- OfficeDocumentExtractor ----

OfficeDocumentExtractor::OfficeDocumentExtractor(OfficeFormat format)
    : m_format(format) {}

std::string OfficeDocumentExtractor::getName() const {
    switch (m_format) {
        case OfficeFormat::Docx: return "docx";
        case OfficeFormat::Pptx: return "pptx";
        case OfficeFormat::Xlsx: return "xlsx";
        default: return "office";
    }
}

ExtractionResult OfficeDocumentExtractor::extract(const std::string& file_path) const {
    switch (m_format) {
        case OfficeFormat::Docx: return extractDocx(file_path);
        case OfficeFormat::Pptx: return extractPptx(file_path);
        case OfficeFormat::Xlsx: return extractXlsx(file_path);
        default: return ExtractionResult::skip("Unknown Office format");
    }
}

ExtractionResult OfficeDocumentExtractor::extractDocx(const std::string& file_path) const {
    auto [exit_code, xml] = readMember(file_path, "word/document.xml");
    if (exit_code != 0) {
        return ExtractionResult::skip(unzipFailure("docx", exit_code));
    }
    return ExtractionResult::ok(trimWhitespace(xmlToText(xml)));
}

ExtractionResult OfficeDocumentExtractor::extractPptx(const std::string& file_path) const {
    std::vector<std::string> members = listMembers(file_path);
    auto slides = numberedMembers(members, "ppt/slides/slide");
    if (slides.empty()) {
        return ExtractionResult::skip("No slides found in .pptx package");
    }

    std::ostringstream text;
    bool first = true;
    for (const auto& [number, member] : slides) {
        auto [exit_code, xml] = readMember(file_path, member);
        if (exit_code != 0) {
            return ExtractionResult::skip(unzipFailure("pptx", exit_code));
        }
        if (!first) {
            text << "\n\n";
        }
        first = false;
        text << "Slide " << number << ":\n" << trimWhitespace(xmlToText(xml));
    }
    return ExtractionResult::ok(trimWhitespace(text.str()));
}

ExtractionResult OfficeDocumentExtractor::extractXlsx(const std::string& file_path) const {
    std::vector<std::string> members = listMembers(file_path);
    auto sheets = numberedMembers(members, "xl/worksheets/sheet");
    if (sheets.empty()) {
        return ExtractionResult::skip("No worksheets found in .xlsx package");
    }

    // Shared string table; absent when the workbook has no text cells
    std::vector<std::string> shared_strings;
    if (std::find(members.begin(), members.end(), "xl/sharedStrings.xml") != members.end()) {
        auto [exit_code, xml] = readMember(file_path, "xl/sharedStrings.xml");
        if (exit_code != 0) {
            return ExtractionResult::skip(unzipFailure("xlsx", exit_code));
        }
        for (const auto& item : findElements(xml, "si")) {
            std::string value;
            for (const auto& run : findElements(item.inner, "t")) {
                value += decodeEntities(run.inner);
            }
            shared_strings.push_back(value);
        }
    }

    std::vector<std::string> sheet_names;
    {
        auto [exit_code, xml] = readMember(file_path, "xl/workbook.xml");
        if (exit_code == 0) {
            for (const auto& sheet : findElements(xml, "sheet")) {
                sheet_names.push_back(decodeEntities(attributeValue(sheet.open_tag, "name")));
            }
        }
    }

    std::ostringstream text;
    for (size_t i = 0; i < sheets.size(); ++i) {
        const auto& [number, member] = sheets[i];
        auto [exit_code, xml] = readMember(file_path, member);
        if (exit_code != 0) {
            return ExtractionResult::skip(unzipFailure("xlsx", exit_code));
        }

        std::string name = i < sheet_names.size() ? sheet_names[i] : "Sheet" + std::to_string(number);
        if (i > 0) {
            text << "\n\n";
        }
        text << "Sheet: " << name;

        for (const auto& row : findElements(xml, "row")) {
            std::vector<std::string> values;
            for (const auto& cell : findElements(row.inner, "c")) {
                std::string type = attributeValue(cell.open_tag, "t");
                std::string value;
                if (type == "inlineStr") {
                    for (const auto& run : findElements(cell.inner, "t")) {
                        value += decodeEntities(run.inner);
                    }
                } else {
                    auto raw = findElements(cell.inner, "v");
                    if (!raw.empty()) {
                        value = decodeEntities(raw.front().inner);
                        if (type == "s") {
                            try {
                                size_t index = std::stoul(value);
                                value = index < shared_strings.size() ? shared_strings[index] : "";
                            } catch (const std::exception&) {
                                value.clear();
                            }
                        }
                    }
                }
                if (!value.empty()) {
                    values.push_back(value);
                }
            }
            if (values.empty()) {
                continue;
            }
            text << '\n';
            for (size_t v = 0; v < values.size(); ++v) {
                text << (v ? " | " : "") << values[v];
            }
        }
    }
    return ExtractionResult::ok(trimWhitespace(text.str()));
}

std::pair<int, std::string> OfficeDocumentExtractor::readMember(const std::string& file_path,
                                                                const std::string& member) const {
    SysInteraction sys;
    try {
        auto [output, exit_code] = sys.executeCommand("unzip", {"-p", toolPathArgument(file_path), member}, false);
        return {exit_code, output};
    } catch (const std::runtime_error& e) {
        LOG_WARNING("TextExtractor", std::string("Could not run unzip: ") + e.what());
        return {-1, ""};
    }
}

std::vector<std::string> OfficeDocumentExtractor::listMembers(const std::string& file_path) const {
    SysInteraction sys;
    std::vector<std::string> members;
    std::string output;
    int exit_code = 0;
    try {
        std::tie(output, exit_code) = sys.executeCommand("unzip", {"-Z1", toolPathArgument(file_path)}, false);
    } catch (const std::runtime_error& e) {
        LOG_WARNING("TextExtractor", std::string("Could not run unzip: ") + e.what());
        return members;
    }
    if (exit_code != 0) {
        LOG_DEBUG("TextExtractor", "unzip -Z1 failed for " + file_path + " (exit " +
                  std::to_string(exit_code) + ")");
        return members;
    }

    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            members.push_back(line);
        }
    }
    return members;
}

std::optional<unsigned long long> OfficeDocumentExtractor::memberNumber(const std::string& member,
                                                                      const std::string& prefix) {
    if (member.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }
    std::string rest = member.substr(prefix.size());
    if (rest.size() <= 4 || rest.compare(rest.size() - 4, 4, ".xml") != 0) {
        return std::nullopt;
    }
    std::string digits = rest.substr(0, rest.size() - 4);
    if (!std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }

    errno = 0;
    unsigned long long number = std::strtoull(digits.c_str(), nullptr, 10);
    if (errno == ERANGE) {
        LOG_DEBUG("TextExtractor", "Ignoring package member with an out-of-range number: " + member);
        return std::nullopt;
    }
    return number;
}

std::string OfficeDocumentExtractor::xmlToText(const std::string& xml) {
    std::string text;
    size_t pos = 0;
    while (pos < xml.size()) {
        size_t open = xml.find('<', pos);
        if (open == std::string::npos) {
            text += xml.substr(pos);
            break;
        }
        text += xml.substr(pos, open - pos);

        size_t close = xml.find('>', open);
        if (close == std::string::npos) {
            break;
        }

        std::string tag = xml.substr(open + 1, close - open - 1);
        size_t name_end = tag.find_first_of(" \t\r\n/");
        std::string name = tag.substr(0, name_end);
        if (name == "/w:p" || name == "/a:p" || name == "/row" || name == "w:br" || name == "a:br") {
            text += '\n';
        } else if (name == "w:tab" || name == "a:tab") {
            text += '\t';
        }
        pos = close + 1;
    }
    return decodeEntities(text);
}

std::string OfficeDocumentExtractor::decodeEntities(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        size_t amp = text.find('&', pos);
        if (amp == std::string::npos) {
            out += text.substr(pos);
            break;
        }
        out += text.substr(pos, amp - pos);

        size_t semi = text.find(';', amp);
        if (semi == std::string::npos || semi - amp > 10) {
            out += '&';
            pos = amp + 1;
            continue;
        }

        std::string entity = text.substr(amp + 1, semi - amp - 1);
        if (entity == "lt") {
            out += '<';
        } else if (entity == "gt") {
            out += '>';
        } else if (entity == "amp") {
            out += '&';
        } else if (entity == "quot") {
            out += '"';
        } else if (entity == "apos") {
            out += '\'';
        } else if (entity.size() > 1 && entity[0] == '#') {
            try {
                unsigned long code_point = (entity[1] == 'x' || entity[1] == 'X')
                    ? std::stoul(entity.substr(2), nullptr, 16)
                    : std::stoul(entity.substr(1), nullptr, 10);
                out = appendUtf8(std::move(out), code_point);
            } catch (const std::exception&) {
                out += text.substr(amp, semi - amp + 1);
            }
        } else {
            out += text.substr(amp, semi - amp + 1);
        }
        pos = semi + 1;
    }
    return out;
}

std::string toolPathArgument(const std::string& file_path) {
    if (!file_path.empty() && file_path[0] == '-') {
        return "./" + file_path;
    }
    return file_path;
}

// ---- UnavailableExtractor ----

ExtractionResult UnavailableExtractor::extract(const std::string& file_path) const {
    (void)file_path;
    return ExtractionResult::skip("No reader available for legacy ." + m_format + " files");
}

} // namespace ArgoAgent
