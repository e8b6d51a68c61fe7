// =================================================================
// src/ArgoAgent/TextExtractor.cpp
// =================================================================
// Implementation for plain text and Markdown extraction and the
// extension-based extractor registry.

#include "ArgoAgent/TextExtractor.hpp"
#include "ArgoAgent/DocumentExtractors.hpp"
#include "ArgoAgent/SysInteraction.hpp"
#include "ArgoAgent/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <functional>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace ArgoAgent {

ExtractionResult ExtractionResult::ok(std::string text) {
    ExtractionResult result;
    result.success = true;
    result.text = std::move(text);
    return result;
}

ExtractionResult ExtractionResult::skip(std::string reason) {
    ExtractionResult result;
    result.success = false;
    result.reason = std::move(reason);
    return result;
}

std::string trimWhitespace(const std::string& text) {
    size_t first = text.find_first_not_of(" \t\n\r\f\v");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = text.find_last_not_of(" \t\n\r\f\v");
    return text.substr(first, last - first + 1);
}

// ---- PlainTextExtractor ----

ExtractionResult PlainTextExtractor::extract(const std::string& file_path) const {
    SysInteraction sys;
    std::string bytes;
    try {
        bytes = sys.readFile(file_path);
    } catch (const std::runtime_error& e) {
        return ExtractionResult::skip(std::string("Error reading text file: ") + e.what());
    }

    if (isValidUtf8(bytes)) {
        return ExtractionResult::ok(trimWhitespace(bytes));
    }

    LOG_DEBUG("TextExtractor", "Not valid UTF-8, decoding as Latin-1: " + file_path);
    return ExtractionResult::ok(trimWhitespace(latin1ToUtf8(bytes)));
}

bool PlainTextExtractor::isValidUtf8(const std::string& bytes) {
    size_t i = 0;
    const size_t n = bytes.size();
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(bytes[i]);
        size_t extra = 0;
        unsigned int code_point = 0;

        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            code_point = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            code_point = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            code_point = c & 0x07;
        } else {
            return false;
        }

        if (i + extra >= n) {
            return false;
        }
        for (size_t k = 1; k <= extra; ++k) {
            unsigned char cc = static_cast<unsigned char>(bytes[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (cc & 0x3F);
        }

        // Overlong forms, surrogates and values past U+10FFFF
        if ((extra == 1 && code_point < 0x80) ||
            (extra == 2 && code_point < 0x800) ||
            (extra == 3 && code_point < 0x10000) ||
            (code_point >= 0xD800 && code_point <= 0xDFFF) ||
            code_point > 0x10FFFF) {
            return false;
        }

        i += extra + 1;
    }
    return true;
}

std::string PlainTextExtractor::latin1ToUtf8(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size() + bytes.size() / 4);
    for (char ch : bytes) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (c < 0x80) {
            out += static_cast<char>(c);
        } else {
            out += static_cast<char>(0xC0 | (c >> 6));
            out += static_cast<char>(0x80 | (c & 0x3F));
        }
    }
    return out;
}

// ---- MarkdownExtractor ----

ExtractionResult MarkdownExtractor::extract(const std::string& file_path) const {
    SysInteraction sys;
    std::string source;
    try {
        source = sys.readFile(file_path);
    } catch (const std::runtime_error& e) {
        return ExtractionResult::skip(std::string("Error reading Markdown file: ") + e.what());
    }

    if (!PlainTextExtractor::isValidUtf8(source)) {
        return ExtractionResult::skip("Markdown file is not valid UTF-8");
    }

    return ExtractionResult::ok(trimWhitespace(toPlainText(source)));
}

namespace {

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Index just past up to three leading whitespace characters
size_t skipIndent(const std::string& line) {
    size_t i = 0;
    while (i < line.size() && i < 3 && isSpace(line[i])) {
        ++i;
    }
    return i;
}

// next[k] is the first index >= k where `at` holds, or npos
std::vector<size_t> nextWhere(const std::string& line, const std::function<bool(size_t)>& at) {
    std::vector<size_t> next(line.size() + 1, std::string::npos);
    for (size_t k = line.size(); k-- > 0;) {
        next[k] = at(k) ? k : next[k + 1];
    }
    return next;
}

size_t lookup(const std::vector<size_t>& next, size_t k) {
    return k < next.size() ? next[k] : std::string::npos;
}

bool isFence(const std::string& line) {
    size_t i = skipIndent(line);
    return line.compare(i, 3, "```") == 0 || line.compare(i, 3, "~~~") == 0;
}

bool isRule(const std::string& line) {
    size_t i = skipIndent(line);
    if (i >= line.size() || (line[i] != '-' && line[i] != '*' && line[i] != '_')) {
        return false;
    }
    const char mark = line[i];
    int marks = 0;
    for (; i < line.size(); ++i) {
        if (line[i] == mark) {
            ++marks;
        } else if (!isSpace(line[i])) {
            return false;
        }
    }
    return marks >= 3;
}

// Returns true and sets `title` when the line is an ATX heading
bool parseHeading(const std::string& line, std::string& title) {
    size_t i = skipIndent(line);
    size_t hashes = 0;
    while (i + hashes < line.size() && line[i + hashes] == '#') {
        ++hashes;
    }
    if (hashes == 0 || hashes > 6 || i + hashes >= line.size() || !isSpace(line[i + hashes])) {
        return false;
    }

    size_t begin = i + hashes;
    size_t end = line.size();
    while (begin < end && isSpace(line[begin])) {
        ++begin;
    }
    while (end > begin && isSpace(line[end - 1])) {
        --end;
    }
    while (end > begin && line[end - 1] == '#') {
        --end;
    }
    while (end > begin && isSpace(line[end - 1])) {
        --end;
    }
    title = line.substr(begin, end - begin);
    return true;
}

std::string stripBlockPrefix(const std::string& line) {
    std::string out = line;

    size_t i = skipIndent(out);
    if (i < out.size() && out[i] == '>') {
        size_t cut = i + 1;
        if (cut < out.size() && isSpace(out[cut])) {
            ++cut;
        }
        out.erase(0, cut);
    }

    size_t indent = 0;
    while (indent < out.size() && isSpace(out[indent])) {
        ++indent;
    }
    size_t marker = indent;
    if (marker < out.size() && (out[marker] == '-' || out[marker] == '*' || out[marker] == '+')) {
        ++marker;
    } else {
        while (marker < out.size() && std::isdigit(static_cast<unsigned char>(out[marker]))) {
            ++marker;
        }
        if (marker == indent || marker >= out.size() || (out[marker] != '.' && out[marker] != ')')) {
            return out;
        }
        ++marker;
    }
    size_t text = marker;
    while (text < out.size() && isSpace(out[text])) {
        ++text;
    }
    if (text == marker) {
        return out;
    }
    out.erase(indent, text - indent);
    return out;
}

// `![alt](target)` and `[text](target)` keep only their label
std::string stripLinks(const std::string& line, bool images) {
    auto close_bracket = nextWhere(line, [&](size_t k) { return line[k] == ']'; });
    auto close_paren = nextWhere(line, [&](size_t k) { return line[k] == ')'; });

    std::string out;
    out.reserve(line.size());
    size_t i = 0;
    while (i < line.size()) {
        size_t open = images ? i + 1 : i;
        bool starts = images ? (line[i] == '!' && open < line.size() && line[open] == '[')
                             : line[i] == '[';
        if (starts) {
            size_t label_end = lookup(close_bracket, open + 1);
            bool has_label = images || (label_end != std::string::npos && label_end > open + 1);
            if (label_end != std::string::npos && has_label &&
                label_end + 1 < line.size() && line[label_end + 1] == '(') {
                size_t target_end = lookup(close_paren, label_end + 2);
                if (target_end != std::string::npos) {
                    out.append(line, open + 1, label_end - open - 1);
                    i = target_end + 1;
                    continue;
                }
            }
        }
        out += line[i++];
    }
    return out;
}

// `**text**` and `__text__`
std::string stripStrong(const std::string& line) {
    auto pair_at = [&](size_t k, char mark) {
        return k + 1 < line.size() && line[k] == mark && line[k + 1] == mark;
    };
    auto next_stars = nextWhere(line, [&](size_t k) { return pair_at(k, '*'); });
    auto next_unders = nextWhere(line, [&](size_t k) { return pair_at(k, '_'); });

    std::string out;
    out.reserve(line.size());
    size_t i = 0;
    while (i < line.size()) {
        if (pair_at(i, '*') || pair_at(i, '_')) {
            const auto& next = line[i] == '*' ? next_stars : next_unders;
            size_t close = lookup(next, i + 3);
            if (close != std::string::npos) {
                out.append(line, i + 2, close - i - 2);
                i = close + 2;
                continue;
            }
        }
        out += line[i++];
    }
    return out;
}

// `*text*` and `_text_`, where the text neither starts nor ends with
// whitespace or another emphasis mark
std::string stripEmphasis(const std::string& line) {
    auto edge = [](char c) { return isSpace(c) || c == '*' || c == '_'; };
    auto closes = [&](size_t k, char mark) { return k > 0 && line[k] == mark && !edge(line[k - 1]); };
    auto next_star = nextWhere(line, [&](size_t k) { return closes(k, '*'); });
    auto next_under = nextWhere(line, [&](size_t k) { return closes(k, '_'); });

    std::string out;
    out.reserve(line.size());
    size_t i = 0;
    while (i < line.size()) {
        char mark = line[i];
        if ((mark == '*' || mark == '_') && i + 1 < line.size() && !edge(line[i + 1])) {
            size_t close = lookup(mark == '*' ? next_star : next_under, i + 2);
            if (close != std::string::npos) {
                out.append(line, i + 1, close - i - 1);
                i = close + 1;
                continue;
            }
        }
        out += line[i++];
    }
    return out;
}

// Removes the delimiters `open` and `close` around a span. With
// `drop_body` the whole span goes, which is how HTML tags are removed.
std::string stripDelimited(const std::string& line, char open, char close, bool drop_body) {
    auto next_close = nextWhere(line, [&](size_t k) { return line[k] == close; });

    std::string out;
    out.reserve(line.size());
    size_t i = 0;
    while (i < line.size()) {
        if (line[i] == open) {
            size_t end = lookup(next_close, i + 1);
            if (end != std::string::npos && (!drop_body || end > i + 1)) {
                if (!drop_body) {
                    out.append(line, i + 1, end - i - 1);
                }
                i = end + 1;
                continue;
            }
        }
        out += line[i++];
    }
    return out;
}

} // namespace

std::string MarkdownExtractor::toPlainText(const std::string& markdown) {
    std::istringstream input(markdown);
    std::ostringstream output;
    std::string line;
    bool in_code_block = false;

    while (std::getline(input, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (isFence(line)) {
            in_code_block = !in_code_block;
            continue;
        }
        if (in_code_block) {
            output << line << '\n';
            continue;
        }
        if (isRule(line)) {
            output << '\n';
            continue;
        }

        std::string title;
        if (parseHeading(line, title)) {
            output << stripStrong(title) << "\n\n";
            continue;
        }

        line = stripBlockPrefix(line);
        line = stripLinks(line, true);
        line = stripLinks(line, false);
        line = stripStrong(line);
        line = stripEmphasis(line);
        line = stripDelimited(line, '`', '`', false);
        line = stripDelimited(line, '<', '>', true);

        output << line << '\n';
    }

    return output.str();
}

// ---- ExtractorRegistry ----

ExtractorRegistry::ExtractorRegistry()
    : m_fallback(std::make_shared<PlainTextExtractor>()) {}

std::shared_ptr<ExtractorRegistry> ExtractorRegistry::createDefault() {
    auto registry = std::make_shared<ExtractorRegistry>();

    auto markdown = std::make_shared<MarkdownExtractor>();
    registry->registerExtractor(".md", markdown);
    registry->registerExtractor(".markdown", markdown);

    registry->registerExtractor(".pdf", std::make_shared<PdfExtractor>());
    registry->registerExtractor(".docx", std::make_shared<OfficeDocumentExtractor>(OfficeFormat::Docx));
    registry->registerExtractor(".pptx", std::make_shared<OfficeDocumentExtractor>(OfficeFormat::Pptx));
    registry->registerExtractor(".xlsx", std::make_shared<OfficeDocumentExtractor>(OfficeFormat::Xlsx));

    registry->registerExtractor(".xls", std::make_shared<UnavailableExtractor>("xls"));
    registry->registerExtractor(".ppt", std::make_shared<UnavailableExtractor>("ppt"));

    return registry;
}

void ExtractorRegistry::registerExtractor(const std::string& extension,
                                          std::shared_ptr<TextExtractor> extractor) {
    std::string key = extension;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    m_extractors[key] = std::move(extractor);
}

ExtractionResult ExtractorRegistry::extract(const std::string& file_path) const {
    std::error_code ec;
    if (!std::filesystem::exists(file_path, ec)) {
        return ExtractionResult::skip("File does not exist: " + file_path);
    }

    std::string extension = std::filesystem::path(file_path).extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = m_extractors.find(extension);
    const auto& extractor = (it != m_extractors.end()) ? it->second : m_fallback;

    ExtractionResult result;
    try {
        result = extractor->extract(file_path);
    } catch (const std::exception& e) {
        result = ExtractionResult::skip(std::string("Extractor failed: ") + e.what());
    }
    if (!result.success) {
        LOG_ERROR("TextExtractor", "Skipping '" + file_path + "' (" + extractor->getName() + "): " +
                  result.reason);
    }
    return result;
}

} // namespace ArgoAgent
