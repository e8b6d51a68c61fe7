// =================================================================
// tests/PromptRegistryTest.cpp
// =================================================================
// Unit tests for PromptRegistry component.

#include "ArgoAgent/PromptRegistry.hpp"
#include "ArgoAgent/Logger.hpp"
#include <iostream>
#include <filesystem>
#include <fstream>
#include <cassert>
#include <algorithm>

namespace fs = std::filesystem;

class PromptRegistryTest {
private:
    std::string test_dir;

    void setupTaskFiles() {
        fs::create_directories(test_dir);

        std::ofstream(test_dir + "/summarize.yaml")
            << "name: Summarize\n"
            << "description: Summarize the given documents\n"
            << "goal: A short summary\n"
            << "system_prompt: You summarize documents.\n"
            << "user_prompt: \"Summarize this: {context}\"\n";

        std::ofstream(test_dir + "/explain.yaml")
            << "description: Explain a concept\n"
            << "system_prompt: You explain things simply.\n";

        std::ofstream(test_dir + "/broken.yaml") << "description: [unterminated\n";
        std::ofstream(test_dir + "/scalar.yaml") << "just a string\n";
        std::ofstream(test_dir + "/ignored.yml") << "description: wrong extension\n";
    }

    void cleanupTaskFiles() {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }

public:
    PromptRegistryTest() : test_dir("test_prompt_registry") {}

    void testBuiltinSystemPrompts() {
        std::cout << "Testing built-in system prompts..." << std::endl;

        ArgoAgent::PromptRegistry registry;
        auto names = registry.listSystemPrompts();

        assert(names.size() == 10);
        assert(std::is_sorted(names.begin(), names.end()));
        assert(registry.getSystemPrompt("code_review"));
        assert(registry.getSystemPrompt("code_review")->find("code reviewer") != std::string::npos);
        assert(registry.getSystemPrompt("linux_quick"));
        assert(!registry.getSystemPrompt("not_a_prompt"));

        std::string listing = registry.formatSystemPromptList();
        assert(listing.find("- code_review\n") != std::string::npos);
        assert(listing.find("- testing\n") != std::string::npos);

        std::cout << "✓ Built-in system prompts test passed" << std::endl;
    }

    void testLoadTasks() {
        std::cout << "Testing task directory loading..." << std::endl;

        setupTaskFiles();

        ArgoAgent::PromptRegistry registry;
        auto result = registry.loadTasks(test_dir);

        assert(result.success);
        assert(result.loaded == 2 && "Malformed task files are skipped");

        auto tasks = registry.listTasks();
        assert(tasks.size() == 2);
        assert(tasks[0] == "explain" && tasks[1] == "summarize" && "Tasks are keyed by file stem");

        auto summarize = registry.getTask("summarize");
        assert(summarize);
        assert(summarize->name == "Summarize");
        assert(summarize->goal == "A short summary");
        assert(summarize->user_prompt == "Summarize this: {context}");

        auto explain = registry.getTask("explain");
        assert(explain);
        assert(explain->user_prompt.empty() && "Missing fields default to empty");

        assert(!registry.getTask("ignored"));

        std::string listing = registry.formatTaskList();
        assert(listing.find("- summarize: Summarize the given documents\n") != std::string::npos);

        cleanupTaskFiles();
        std::cout << "✓ Task loading test passed" << std::endl;
    }

    void testMissingTaskDirectory() {
        std::cout << "Testing missing task directory..." << std::endl;

        ArgoAgent::PromptRegistry registry;
        auto result = registry.loadTasks("no_such_task_dir");

        assert(result.success && "A missing task directory is not an error");
        assert(result.loaded == 0);
        assert(registry.listTasks().empty());

        std::cout << "✓ Missing task directory test passed" << std::endl;
    }

    void testTasksFromString() {
        std::cout << "Testing tasks defined from YAML text..." << std::endl;

        ArgoAgent::PromptRegistry registry;
        assert(registry.addTaskFromString("review", "system_prompt: Review code.\nuser_prompt: Review {context}\n"));
        assert(!registry.addTaskFromString("bad", "- a\n- b\n"));
        assert(!registry.addTaskFromString("worse", "key: [1, 2\n"));

        auto review = registry.getTask("review");
        assert(review && review->system_prompt == "Review code.");
        assert(!registry.getTask("bad"));

        registry.addSystemPrompt("custom", "Be brief.");
        assert(registry.getSystemPrompt("custom") == std::string("Be brief."));

        std::cout << "✓ Tasks from string test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running PromptRegistry unit tests..." << std::endl;

        testBuiltinSystemPrompts();
        testLoadTasks();
        testMissingTaskDirectory();
        testTasksFromString();

        std::cout << "All PromptRegistry tests passed!" << std::endl;
    }
};

int main() {
    try {
        ArgoAgent::Logger::getInstance().setFileLogging(false);
        ArgoAgent::Logger::getInstance().setConsoleLogging(false);

        PromptRegistryTest tests;
        tests.runAllTests();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
