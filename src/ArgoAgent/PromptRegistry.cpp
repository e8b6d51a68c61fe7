// =================================================================
// src/ArgoAgent/PromptRegistry.cpp
// =================================================================
// Implementation for the system prompt and task registry.

#include "ArgoAgent/PromptRegistry.hpp"
#include "ArgoAgent/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <filesystem>
#include <sstream>

namespace ArgoAgent {

static std::string stringField(const YAML::Node& node, const char* key) {
    if (!node[key] || node[key].IsNull()) {
        return "";
    }
    return node[key].as<std::string>();
}

static Task taskFromNode(const YAML::Node& node) {
    Task task;
    task.name = stringField(node, "name");
    task.description = stringField(node, "description");
    task.goal = stringField(node, "goal");
    task.system_prompt = stringField(node, "system_prompt");
    task.user_prompt = stringField(node, "user_prompt");
    return task;
}

PromptRegistry::PromptRegistry() {
    initializeBuiltinPrompts();
}

RegistryLoadResult PromptRegistry::loadTasks(const std::string& tasks_dir) {
    RegistryLoadResult result;

    std::error_code ec;
    if (!std::filesystem::is_directory(tasks_dir, ec)) {
        LOG_DEBUG("PromptRegistry", "No task directory at " + tasks_dir);
        result.success = true;
        return result;
    }

    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(tasks_dir, ec)) {
        std::error_code type_ec;
        if (entry.is_regular_file(type_ec) && entry.path().extension() == ".yaml") {
            files.push_back(entry.path());
        }
    }
    if (ec) {
        result.error_message = "Cannot list task directory '" + tasks_dir + "': " + ec.message();
        LOG_ERROR("PromptRegistry", result.error_message);
        return result;
    }
    std::sort(files.begin(), files.end());

    for (const auto& file : files) {
        std::string task_name = file.stem().string();
        try {
            YAML::Node root = YAML::LoadFile(file.string());
            if (!root.IsMap()) {
                LOG_ERROR("PromptRegistry", "Task file is not a mapping, skipped: " + file.string());
                continue;
            }
            m_tasks[task_name] = taskFromNode(root);
            result.loaded++;
        } catch (const YAML::Exception& e) {
            LOG_ERROR("PromptRegistry", "Error loading task '" + task_name + "': " + e.what());
        }
    }

    result.success = true;
    LOG_INFO("PromptRegistry", "Loaded " + std::to_string(result.loaded) + " task(s) from " + tasks_dir);
    return result;
}

bool PromptRegistry::addTaskFromString(const std::string& task_name, const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (!root.IsMap()) {
            LOG_ERROR("PromptRegistry", "Task '" + task_name + "' is not a YAML mapping");
            return false;
        }
        m_tasks[task_name] = taskFromNode(root);
        return true;
    } catch (const YAML::Exception& e) {
        LOG_ERROR("PromptRegistry", "Error parsing task '" + task_name + "': " + e.what());
        return false;
    }
}

void PromptRegistry::addTask(const std::string& task_name, const Task& task) {
    m_tasks[task_name] = task;
}

void PromptRegistry::addSystemPrompt(const std::string& name, const std::string& text) {
    m_system_prompts[name] = text;
}

std::optional<std::string> PromptRegistry::getSystemPrompt(const std::string& name) const {
    auto it = m_system_prompts.find(name);
    if (it == m_system_prompts.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Task> PromptRegistry::getTask(const std::string& name) const {
    auto it = m_tasks.find(name);
    if (it == m_tasks.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> PromptRegistry::listSystemPrompts() const {
    std::vector<std::string> names;
    for (const auto& [name, text] : m_system_prompts) {
        names.push_back(name);
    }
    return names;
}

std::vector<std::string> PromptRegistry::listTasks() const {
    std::vector<std::string> names;
    for (const auto& [name, task] : m_tasks) {
        names.push_back(name);
    }
    return names;
}

std::string PromptRegistry::formatSystemPromptList() const {
    std::ostringstream out;
    for (const auto& name : listSystemPrompts()) {
        out << "- " << name << "\n";
    }
    return out.str();
}

std::string PromptRegistry::formatTaskList() const {
    std::ostringstream out;
    for (const auto& [name, task] : m_tasks) {
        out << "- " << name << ": " << task.description << "\n";
    }
    return out.str();
}

void PromptRegistry::initializeBuiltinPrompts() {
    m_system_prompts["code_review"] = R"(You are an expert code reviewer. Your task is to:
1. Review the provided code for:
   - Code quality and best practices
   - Potential bugs and edge cases
   - Security vulnerabilities
   - Performance optimizations
   - Documentation and readability
2. Provide specific, actionable feedback
3. Suggest improvements with code examples when relevant
4. Focus on the most critical issues first

Format your response in markdown with clear sections for:
- Summary of findings
- Critical issues
- Suggestions for improvement
- Code examples (if applicable))";

    m_system_prompts["text_summary"] = R"(You are an expert content summarizer. Your task is to:
1. Read and understand the provided text thoroughly
2. Identify the key points, main arguments, and important details
3. Create a concise yet comprehensive summary that:
   - Captures the essential information
   - Maintains the original meaning and context
   - Is well-structured and easy to read
4. Format the summary in markdown with:
   - A clear title
   - Bullet points for key points
   - Brief explanations where needed)";

    m_system_prompts["markdown_expert"] = R"(You are a markdown formatting expert. Your task is to:
1. Format the provided content in clean, well-structured markdown
2. Use appropriate markdown elements:
   - Headers for hierarchy
   - Lists for related items
   - Code blocks for technical content
   - Tables for structured data
   - Blockquotes for emphasis
3. Ensure the content is:
   - Easy to read
   - Well-organized
   - Properly formatted
   - Consistent in style)";

    m_system_prompts["linux_help"] = R"(You are a Linux system expert. Your task is to:
1. Provide clear, accurate Linux-related assistance
2. Explain concepts and commands in a beginner-friendly way
3. Include:
   - Command syntax and options
   - Common use cases
   - Best practices
   - Troubleshooting tips
4. Format responses with:
   - Code blocks for commands
   - Examples with explanations
   - Step-by-step instructions when needed
   - Links to relevant documentation)";

    m_system_prompts["linux_quick"] = R"(You are a Linux command expert. Your task is to:
1. Provide ONLY the command(s) needed to solve the user's problem
2. Be extremely concise - just the command, no explanations
3. If the user specifically asks for an explanation, provide a brief one
4. Format the command in a code block
5. If multiple commands are needed, number them

Example response format:
```bash
command -options arguments
```

If explanation is requested:
```bash
command -options arguments
```
This command does X because of Y.)";

    m_system_prompts["debugging"] = R"(You are a debugging expert. Your task is to:
1. Help identify and fix issues in the provided code or error messages
2. Follow a systematic approach:
   - Analyze the error/problem
   - Identify potential causes
   - Suggest specific solutions
   - Provide prevention tips
3. Format your response with:
   - Clear problem description
   - Step-by-step solution
   - Code examples
   - Best practices for prevention)";

    m_system_prompts["documentation"] = R"(You are a technical documentation expert. Your task is to:
1. Create clear, comprehensive documentation for the provided content
2. Include:
   - Overview and purpose
   - Installation/setup instructions
   - Usage examples
   - API reference (if applicable)
   - Configuration options
3. Format in markdown with:
   - Clear hierarchy
   - Code examples
   - Tables for parameters
   - Diagrams when helpful)";

    m_system_prompts["security"] = R"(You are a security expert. Your task is to:
1. Review and analyze security aspects of the provided content
2. Identify:
   - Potential vulnerabilities
   - Security best practices
   - Compliance requirements
   - Risk mitigation strategies
3. Provide:
   - Detailed security analysis
   - Specific recommendations
   - Code examples for fixes
   - Security checklist)";

    m_system_prompts["performance"] = R"(You are a performance optimization expert. Your task is to:
1. Analyze and optimize the provided code or system
2. Focus on:
   - Algorithm efficiency
   - Resource usage
   - Bottlenecks
   - Scalability
3. Provide:
   - Performance analysis
   - Optimization suggestions
   - Benchmarking tips
   - Code examples)";

    m_system_prompts["testing"] = R"(You are a testing expert. Your task is to:
1. Help create comprehensive test cases for the provided code
2. Include:
   - Unit tests
   - Integration tests
   - Edge cases
   - Test scenarios
3. Provide:
   - Test code examples
   - Testing strategies
   - Best practices
   - Coverage recommendations)";
}

} // namespace ArgoAgent
