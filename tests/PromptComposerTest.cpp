// =================================================================
// tests/PromptComposerTest.cpp
// =================================================================
// Unit tests for PromptComposer component.

#include "ArgoAgent/PromptComposer.hpp"
#include <iostream>
#include <cassert>

class PromptComposerTest {
private:
    ArgoAgent::PromptComposer composer;

public:
    void testPromptOnly() {
        std::cout << "Testing composition without context or system prompt..." << std::endl;

        assert(composer.compose("Explain RAII") == "Explain RAII");
        assert(composer.compose("Keep {context} as is") == "Keep {context} as is" &&
               "Placeholder is untouched without context");
        assert(composer.compose("Hello", std::nullopt, std::string()) == "Hello" &&
               "An empty system prompt adds nothing");

        std::cout << "✓ Prompt-only test passed" << std::endl;
    }

    void testPlaceholderSubstitution() {
        std::cout << "Testing context placeholder substitution..." << std::endl;

        std::string prompt = composer.compose("Summarize {context} then compare with {context}.",
                                              std::string("{\"a.txt\": \"x\"}"));
        assert(prompt == "Summarize {\"a.txt\": \"x\"} then compare with {\"a.txt\": \"x\"}." &&
               "Every placeholder is replaced");
        assert(prompt.find("reply based on the content here:") == std::string::npos);

        std::cout << "✓ Placeholder substitution test passed" << std::endl;
    }

    void testContextAppended() {
        std::cout << "Testing appended context..." << std::endl;

        std::string prompt = composer.compose("What changed?", std::string("CTX"));
        assert(prompt == "What changed?\nreply based on the content here:CTX");

        std::cout << "✓ Appended context test passed" << std::endl;
    }

    void testSystemInstruction() {
        std::cout << "Testing system instruction prefix..." << std::endl;

        std::string prompt = composer.compose("Review this", std::nullopt, std::string("You are a reviewer."));
        assert(prompt == "You are a reviewer.\n\nReview this");

        // The placeholder may sit in the system text
        std::string with_context = composer.compose("Go", std::string("DATA"),
                                                    std::string("Use {context} only."));
        assert(with_context == "Use DATA only.\n\nGo");

        std::cout << "✓ System instruction test passed" << std::endl;
    }

    void testComposeIsRepeatable() {
        std::cout << "Testing repeated composition..." << std::endl;

        const std::string user_prompt = "Compare {context} with the notes";
        const std::optional<std::string> context = std::string("{\"a.txt\": \"alpha\"}");
        const std::optional<std::string> system = std::string("You are a reviewer.");

        std::string first = composer.compose(user_prompt, context, system);
        std::string second = composer.compose(user_prompt, context, system);
        assert(first == second && "Same inputs give the same prompt");

        std::string appended = composer.compose("Summarize", context, system);
        assert(appended == composer.compose("Summarize", context, system));

        std::cout << "✓ Repeated composition test passed" << std::endl;
    }

    void testTaskComposition() {
        std::cout << "Testing task composition..." << std::endl;

        ArgoAgent::Task task;
        task.name = "summarize";
        task.system_prompt = "You summarize documents.";
        task.user_prompt = "Summarize: {context}";

        assert(composer.composeTask(task, std::nullopt, std::string("doc")) ==
               "You summarize documents.\n\nSummarize: doc" && "Task prompt is the default");
        assert(composer.composeTask(task, std::string("Only the title"), std::nullopt) ==
               "You summarize documents.\n\nOnly the title" && "An explicit prompt wins");

        ArgoAgent::Task bare;
        bare.user_prompt = "List the steps";
        assert(composer.composeTask(bare, std::nullopt) == "List the steps");

        std::cout << "✓ Task composition test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running PromptComposer unit tests..." << std::endl;

        testPromptOnly();
        testPlaceholderSubstitution();
        testContextAppended();
        testSystemInstruction();
        testComposeIsRepeatable();
        testTaskComposition();

        std::cout << "All PromptComposer tests passed!" << std::endl;
    }
};

int main() {
    try {
        PromptComposerTest tests;
        tests.runAllTests();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
