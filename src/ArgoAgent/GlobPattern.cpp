// =================================================================
// src/ArgoAgent/GlobPattern.cpp
// =================================================================
// Implementation for shell-style glob matching and expansion.

#include "ArgoAgent/GlobPattern.hpp"
#include "ArgoAgent/Logger.hpp"
#include <filesystem>
#include <algorithm>
#include <sstream>
#include <system_error>

namespace ArgoAgent {

GlobPattern::GlobPattern(const std::string& pattern)
    : m_original_pattern(pattern)
{
    processPattern(pattern);
}

bool GlobPattern::hasWildcard(const std::string& spec) {
    return spec.find('*') != std::string::npos || spec.find('?') != std::string::npos;
}

bool GlobPattern::matches(const std::string& path) const {
    bool path_absolute = !path.empty() && path[0] == '/';
    if (path_absolute != m_is_absolute) {
        return false;
    }

    std::vector<std::string> components;
    std::istringstream stream(path);
    std::string component;
    while (std::getline(stream, component, '/')) {
        if (!component.empty()) {
            components.push_back(component);
        }
    }

    if (components.size() != m_segments.size()) {
        return false;
    }

    for (size_t i = 0; i < components.size(); ++i) {
        if (!segmentMatches(m_segments[i], components[i])) {
            return false;
        }
    }
    return true;
}

std::vector<std::string> GlobPattern::expand() const {
    std::vector<std::string> current;
    current.push_back(m_is_absolute ? "/" : "");

    for (size_t i = 0; i < m_segments.size() && !current.empty(); ++i) {
        const Segment& segment = m_segments[i];
        bool is_last = (i + 1 == m_segments.size());
        std::vector<std::string> next;

        for (const auto& parent : current) {
            if (!segment.has_magic) {
                std::string candidate = joinPath(parent, segment.text);
                std::error_code ec;
                bool keep = is_last ? std::filesystem::exists(candidate, ec)
                                    : std::filesystem::is_directory(candidate, ec);
                if (keep) {
                    next.push_back(candidate);
                }
                continue;
            }

            std::string dir = parent.empty() ? "." : parent;
            std::error_code ec;
            std::filesystem::directory_iterator it(dir, ec);
            if (ec) {
                continue;
            }

            std::vector<std::string> matched;
            for (std::filesystem::directory_iterator end; it != end; it.increment(ec)) {
                if (ec) {
                    LOG_WARNING("GlobPattern", "Error while listing " + dir + ": " + ec.message());
                    break;
                }
                std::string name = it->path().filename().string();
                if (!segmentMatches(segment, name)) {
                    continue;
                }
                std::error_code type_ec;
                if (!is_last && !it->is_directory(type_ec)) {
                    continue;
                }
                matched.push_back(joinPath(parent, name));
            }
            std::sort(matched.begin(), matched.end());
            next.insert(next.end(), matched.begin(), matched.end());
        }

        current = std::move(next);
    }

    if (m_segments.empty()) {
        return {};
    }

    std::sort(current.begin(), current.end());
    current.erase(std::unique(current.begin(), current.end()), current.end());
    return current;
}

void GlobPattern::processPattern(const std::string& pattern) {
    m_is_absolute = !pattern.empty() && pattern[0] == '/';

    std::istringstream stream(pattern);
    std::string component;
    while (std::getline(stream, component, '/')) {
        if (component.empty()) {
            continue;
        }

        Segment segment;
        segment.text = component;
        segment.has_magic = component.find_first_of("*?[") != std::string::npos;

        if (segment.has_magic) {
            try {
                segment.regex = std::regex(globToRegex(component), std::regex_constants::ECMAScript);
            } catch (const std::regex_error& e) {
                LOG_WARNING("GlobPattern", "Failed to compile pattern component '" + component +
                            "': " + e.what());
                segment.has_magic = false;
            }
        }

        m_segments.push_back(std::move(segment));
    }
}

std::string GlobPattern::globToRegex(const std::string& glob_segment) const {
    std::string regex_pattern = "^";

    for (size_t i = 0; i < glob_segment.length(); ++i) {
        char c = glob_segment[i];

        switch (c) {
            case '*':
                regex_pattern += "[^/]*";
                break;

            case '?':
                regex_pattern += "[^/]";
                break;

            case '[': {
                size_t close = glob_segment.find(']', i + 1);
                // "[]abc]" and "[!]abc]" treat the first ']' as a literal member
                if (close == i + 1 || (close == i + 2 && glob_segment[i + 1] == '!')) {
                    close = glob_segment.find(']', close + 1);
                }
                if (close == std::string::npos) {
                    regex_pattern += "\\[";
                    break;
                }

                std::string members = glob_segment.substr(i + 1, close - i - 1);
                regex_pattern += '[';
                size_t start = 0;
                if (!members.empty() && members[0] == '!') {
                    regex_pattern += '^';
                    start = 1;
                }
                for (size_t j = start; j < members.size(); ++j) {
                    char m = members[j];
                    if (m == '\\' || m == '^' || m == '[' || m == ']') {
                        regex_pattern += '\\';
                    }
                    regex_pattern += m;
                }
                regex_pattern += ']';
                i = close;
                break;
            }

            default:
                if (c == '.' || c == '^' || c == '$' || c == '+' || c == '{' || c == '}' ||
                    c == '|' || c == '(' || c == ')' || c == '\\' || c == ']') {
                    regex_pattern += '\\';
                }
                regex_pattern += c;
                break;
        }
    }

    regex_pattern += "$";
    return regex_pattern;
}

bool GlobPattern::segmentMatches(const Segment& segment, const std::string& name) const {
    if (!segment.has_magic) {
        return name == segment.text;
    }

    // Hidden entries need an explicit leading dot
    if (!name.empty() && name[0] == '.' && segment.text[0] != '.') {
        return false;
    }

    return std::regex_match(name, segment.regex);
}

std::string GlobPattern::joinPath(const std::string& parent, const std::string& name) {
    if (parent.empty()) {
        return name;
    }
    if (parent.back() == '/') {
        return parent + name;
    }
    return parent + "/" + name;
}

} // namespace ArgoAgent
