// =================================================================
// src/ArgoAgent/SysInteraction.cpp
// =================================================================
// Implementation for system-level operations.

#include "ArgoAgent/SysInteraction.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <filesystem>
#include <system_error>
#include <cstdio>
#include <memory>
#include <array>

#if defined(_WIN32)
#define popen _popen
#define pclose _pclose
#else
#include <sys/wait.h>
#endif

namespace ArgoAgent {

// Wraps an argument in single quotes so the shell passes it through verbatim.
static std::string shellQuote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string SysInteraction::readFile(const std::string& file_path) const {
    std::ifstream file_stream(file_path, std::ios::binary);
    if (!file_stream) {
        throw std::runtime_error("Failed to open file: " + file_path);
    }
    std::stringstream buffer;
    buffer << file_stream.rdbuf();
    if (file_stream.bad()) {
        throw std::runtime_error("Failed to read file: " + file_path);
    }
    return buffer.str();
}

bool SysInteraction::writeFile(const std::string& file_path, const std::string& content) const {
    std::ofstream file_stream(file_path, std::ios::binary | std::ios::trunc);
    if (!file_stream) {
        return false;
    }
    file_stream << content;
    return file_stream.good();
}

bool SysInteraction::fileExists(const std::string& file_path) const {
    std::error_code ec;
    return std::filesystem::is_regular_file(file_path, ec);
}

bool SysInteraction::directoryExists(const std::string& dir_path) const {
    std::error_code ec;
    return std::filesystem::is_directory(dir_path, ec);
}

bool SysInteraction::createDirectories(const std::string& dir_path) const {
    std::error_code ec;
    std::filesystem::create_directories(dir_path, ec);
    return !ec && directoryExists(dir_path);
}

std::pair<std::string, int> SysInteraction::executeCommand(const std::string& command,
                                                           const std::vector<std::string>& args,
                                                           bool merge_stderr) const {
    std::string full_command = command;
    for (const auto& arg : args) {
        full_command += " " + shellQuote(arg);
    }

#if defined(_WIN32)
    full_command += merge_stderr ? " 2>&1" : " 2>NUL";
#else
    full_command += merge_stderr ? " 2>&1" : " 2>/dev/null";
#endif

    std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(full_command.c_str(), "r"), pclose);
    if (!pipe) {
        throw std::runtime_error("Failed to execute command: " + full_command);
    }

    std::array<char, 4096> buffer;
    std::string result;
    size_t bytes_read = 0;
    while ((bytes_read = fread(buffer.data(), 1, buffer.size(), pipe.get())) > 0) {
        result.append(buffer.data(), bytes_read);
    }

    int exit_status = pclose(pipe.release());

#if !defined(_WIN32)
    if (WIFEXITED(exit_status)) {
        exit_status = WEXITSTATUS(exit_status);
    } else {
        exit_status = -1;
    }
#endif

    return {result, exit_status};
}

} // namespace ArgoAgent
