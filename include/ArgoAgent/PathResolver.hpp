// =================================================================
// include/ArgoAgent/PathResolver.hpp
// =================================================================
// Header for turning user path specifications into candidate files.

#pragma once

#include <string>
#include <vector>
#include <unordered_set>
#include <filesystem>

namespace ArgoAgent {

/**
 * @brief How a path specification was interpreted
 */
enum class PathKind {
    Pattern,    ///< Contains a wildcard, expanded as a glob
    Directory,  ///< Existing directory, walked recursively
    File,       ///< Existing file, taken as is
    Missing     ///< None of the above
};

/**
 * @brief Files denoted by one path specification
 */
struct ResolvedPath {
    std::string spec;
    PathKind kind = PathKind::Missing;
    std::vector<std::string> files;
};

/**
 * @brief Expands path specifications into ordered lists of regular files
 *
 * A specification is handled, in this order, as a wildcard pattern, an
 * existing directory or an existing file. Directory walks only keep files
 * whose extension is in the supported set; a file named directly is always
 * kept. Unresolvable specifications are logged and yield no files.
 */
class PathResolver {
public:
    /**
     * @brief Construct a resolver with the default supported extensions
     */
    PathResolver();

    /**
     * @brief Resolve a single path specification
     * @param spec File path, directory path or glob pattern
     * @return Resolution with the ordered, duplicate-free list of files
     */
    ResolvedPath resolve(const std::string& spec) const;

    /**
     * @brief Resolve several specifications, preserving their order
     */
    std::vector<ResolvedPath> resolveAll(const std::vector<std::string>& specs) const;

    /**
     * @brief Add a file extension to the directory-walk allow-list
     * @param extension Extension including the dot (e.g., ".cpp"), any case
     */
    void addSupportedExtension(const std::string& extension);

    /**
     * @brief Check whether a file name has a supported extension (case-insensitive)
     */
    bool isSupported(const std::filesystem::path& file_path) const;

    /**
     * @brief The built-in allow-list used for directory walks
     */
    static std::vector<std::string> getDefaultExtensions();

    static std::string kindToString(PathKind kind);

private:
    std::unordered_set<std::string> m_supported_extensions;

    std::vector<std::string> resolvePattern(const std::string& spec) const;
    std::vector<std::string> resolveDirectory(const std::string& spec) const;
};

} // namespace ArgoAgent
