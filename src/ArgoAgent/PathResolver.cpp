// =================================================================
// src/ArgoAgent/PathResolver.cpp
// =================================================================
// Implementation for path specification resolution.

#include "ArgoAgent/PathResolver.hpp"
#include "ArgoAgent/GlobPattern.hpp"
#include "ArgoAgent/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <system_error>

namespace ArgoAgent {

static std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

static bool endsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

PathResolver::PathResolver() {
    for (const auto& extension : getDefaultExtensions()) {
        m_supported_extensions.insert(extension);
    }
}

ResolvedPath PathResolver::resolve(const std::string& spec) const {
    ResolvedPath resolved;
    resolved.spec = spec;

    std::error_code ec;
    if (GlobPattern::hasWildcard(spec)) {
        resolved.kind = PathKind::Pattern;
        resolved.files = resolvePattern(spec);
        if (resolved.files.empty()) {
            LOG_WARNING("PathResolver", "No files match pattern '" + spec + "'");
        }
    } else if (std::filesystem::is_directory(spec, ec)) {
        resolved.kind = PathKind::Directory;
        resolved.files = resolveDirectory(spec);
    } else if (std::filesystem::is_regular_file(spec, ec)) {
        resolved.kind = PathKind::File;
        resolved.files.push_back(spec);
    } else {
        resolved.kind = PathKind::Missing;
        LOG_WARNING("PathResolver", "Path '" + spec + "' does not exist");
    }

    Logger::getInstance().logPathResolution(spec, kindToString(resolved.kind), resolved.files);
    return resolved;
}

std::vector<ResolvedPath> PathResolver::resolveAll(const std::vector<std::string>& specs) const {
    std::vector<ResolvedPath> resolved;
    resolved.reserve(specs.size());
    for (const auto& spec : specs) {
        resolved.push_back(resolve(spec));
    }
    return resolved;
}

void PathResolver::addSupportedExtension(const std::string& extension) {
    m_supported_extensions.insert(toLower(extension));
}

bool PathResolver::isSupported(const std::filesystem::path& file_path) const {
    std::string name = toLower(file_path.filename().string());
    for (const auto& extension : m_supported_extensions) {
        if (endsWith(name, extension)) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> PathResolver::getDefaultExtensions() {
    return {
        ".txt", ".csv", ".json", ".xml", ".html", ".htm",
        ".py", ".js", ".java", ".c", ".cpp", ".h", ".hpp", ".cs",
        ".rb", ".php", ".go", ".rs", ".swift", ".kt", ".scala",
        ".sh", ".bash", ".zsh", ".fish",
        ".md", ".markdown", ".rst",
        ".ini", ".cfg", ".conf", ".yaml", ".yml", ".toml", ".env", ".gitignore",
        ".pdf", ".docx", ".xlsx", ".xls", ".pptx", ".ppt"
    };
}

std::string PathResolver::kindToString(PathKind kind) {
    switch (kind) {
        case PathKind::Pattern: return "pattern";
        case PathKind::Directory: return "directory";
        case PathKind::File: return "file";
        case PathKind::Missing: return "missing";
        default: return "unknown";
    }
}

std::vector<std::string> PathResolver::resolvePattern(const std::string& spec) const {
    std::vector<std::string> files;
    GlobPattern pattern(spec);

    for (const auto& match : pattern.expand()) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(match, ec)) {
            files.push_back(match);
        }
    }
    return files;
}

std::vector<std::string> PathResolver::resolveDirectory(const std::string& spec) const {
    std::vector<std::string> files;

    std::error_code ec;
    std::filesystem::recursive_directory_iterator it(
        spec, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        LOG_WARNING("PathResolver", "Cannot walk directory '" + spec + "': " + ec.message());
        return files;
    }

    for (std::filesystem::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            LOG_WARNING("PathResolver", "Filesystem error while walking '" + spec + "': " + ec.message());
            break;
        }

        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) {
            continue;
        }
        if (!isSupported(it->path())) {
            continue;
        }
        files.push_back(it->path().string());
    }

    // Sort files for a stable discovery order
    std::sort(files.begin(), files.end());
    return files;
}

} // namespace ArgoAgent
