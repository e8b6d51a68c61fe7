// =================================================================
// include/ArgoAgent/GlobPattern.hpp
// =================================================================
// Header for shell-style glob matching and expansion.

#pragma once

#include <string>
#include <vector>
#include <regex>

namespace ArgoAgent {

/**
 * @brief Shell-style glob pattern
 *
 * Supports the usual shell wildcard syntax, one path component at a time:
 * - `*` matches any run of characters except `/`
 * - `?` matches one character except `/`
 * - `[abc]`, `[a-z]`, `[!abc]` character classes
 *
 * As in the shell, a component that starts with `.` is only matched by a
 * pattern component that also starts with `.`.
 */
class GlobPattern {
public:
    /**
     * @brief Compile a glob pattern
     * @param pattern Pattern such as "docs/*.md" or "/tmp/run-??/log.txt"
     */
    explicit GlobPattern(const std::string& pattern);

    /**
     * @brief Check whether a path specification should be treated as a glob
     * @param spec User-supplied path specification
     * @return true if spec contains `*` or `?`
     */
    static bool hasWildcard(const std::string& spec);

    /**
     * @brief Check if a path matches the whole pattern
     * @param path Path written the same way as the pattern (relative or absolute)
     */
    bool matches(const std::string& path) const;

    /**
     * @brief Expand the pattern against the filesystem
     * @return Matching existing paths (files and directories), sorted
     */
    std::vector<std::string> expand() const;

    /**
     * @brief Get the original pattern string
     */
    const std::string& getPattern() const { return m_original_pattern; }

private:
    struct Segment {
        std::string text;
        bool has_magic = false;
        std::regex regex;
    };

    std::string m_original_pattern;
    bool m_is_absolute = false;
    std::vector<Segment> m_segments;

    void processPattern(const std::string& pattern);

    /**
     * @brief Convert one glob component to an anchored regex
     */
    std::string globToRegex(const std::string& glob_segment) const;

    bool segmentMatches(const Segment& segment, const std::string& name) const;

    static std::string joinPath(const std::string& parent, const std::string& name);
};

} // namespace ArgoAgent
