// =================================================================
// include/ArgoAgent/SysInteraction.hpp
// =================================================================
// Defines the interface for system-level operations like file I/O
// and running external processes.

#pragma once

#include <string>
#include <vector>
#include <utility> // For std::pair

namespace ArgoAgent {

class SysInteraction {
public:
    /**
     * @brief Reads the entire content of a file into a string, byte for byte.
     * @param file_path The path to the file.
     * @return The content of the file. Throws std::runtime_error on failure.
     */
    std::string readFile(const std::string& file_path) const;

    /**
     * @brief Writes content to a file, overwriting it.
     * @return True on success, false on failure.
     */
    bool writeFile(const std::string& file_path, const std::string& content) const;

    /**
     * @brief Checks if a regular file exists.
     */
    bool fileExists(const std::string& file_path) const;

    /**
     * @brief Checks if a directory exists.
     */
    bool directoryExists(const std::string& dir_path) const;

    /**
     * @brief Creates a directory and any missing parents.
     * @return True if the directory exists afterwards.
     */
    bool createDirectories(const std::string& dir_path) const;

    /**
     * @brief Executes an external command and captures its output.
     * @param command The command to execute.
     * @param args Arguments, each passed to the shell single-quoted.
     * @param merge_stderr Capture stderr together with stdout; when false
     *        stderr is discarded.
     * @return A pair containing the captured output and the exit code
     *         (127 when the command is not installed).
     */
    std::pair<std::string, int> executeCommand(const std::string& command,
                                               const std::vector<std::string>& args,
                                               bool merge_stderr = true) const;
};

} // namespace ArgoAgent
