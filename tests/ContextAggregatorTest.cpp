// =================================================================
// tests/ContextAggregatorTest.cpp
// =================================================================
// Unit tests for ContextAggregator component.

#include "ArgoAgent/ContextAggregator.hpp"
#include "ArgoAgent/TextExtractor.hpp"
#include "ArgoAgent/TokenCounter.hpp"
#include "ArgoAgent/Errors.hpp"
#include "ArgoAgent/Logger.hpp"
#include <iostream>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <cassert>

namespace fs = std::filesystem;

namespace {

// One token per whitespace-separated word; "unknown-model" has no encoding
class WordTokenCounter : public ArgoAgent::TokenCounter {
public:
    std::optional<size_t> count(const std::string& text, const std::string& model_hint) const override {
        ++calls;
        if (model_hint == "unknown-model") {
            return std::nullopt;
        }
        std::istringstream stream(text);
        std::string word;
        size_t words = 0;
        while (stream >> word) {
            ++words;
        }
        return words;
    }

    mutable int calls = 0;
};

class FailingExtractor : public ArgoAgent::TextExtractor {
public:
    ArgoAgent::ExtractionResult extract(const std::string& file_path) const override {
        (void)file_path;
        return ArgoAgent::ExtractionResult::skip("Corrupted document");
    }
    std::string getName() const override { return "failing"; }
};

std::string words(size_t n) {
    std::string text;
    for (size_t i = 0; i < n; ++i) {
        text += (i ? " w" : "w") + std::to_string(i);
    }
    return text;
}

} // namespace

class ContextAggregatorTest {
private:
    std::string test_dir;
    std::shared_ptr<ArgoAgent::ExtractorRegistry> extractors;
    std::shared_ptr<WordTokenCounter> counter;

    void setupTestFiles() {
        fs::create_directories(test_dir + "/docs");
        std::ofstream(test_dir + "/a.txt") << words(10);
        std::ofstream(test_dir + "/b.pdf") << "%PDF-1.4 broken";
        std::ofstream(test_dir + "/docs/c.txt") << words(5);
        std::ofstream(test_dir + "/docs/d.txt") << words(5);

        extractors = std::make_shared<ArgoAgent::ExtractorRegistry>();
        extractors->registerExtractor(".pdf", std::make_shared<FailingExtractor>());
        counter = std::make_shared<WordTokenCounter>();
    }

    void cleanupTestFiles() {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }

public:
    ContextAggregatorTest() : test_dir("test_context_aggregator") {}

    void testSkipsFailedExtraction() {
        std::cout << "Testing aggregation with a failing extractor..." << std::endl;

        setupTestFiles();

        ArgoAgent::ContextAggregator aggregator(extractors, counter);
        auto result = aggregator.aggregate({test_dir + "/a.txt", test_dir + "/b.pdf"}, 100);

        assert(result.entries.size() == 1 && "Failed extraction should be skipped");
        assert(result.entries[0].source_path == test_dir + "/a.txt");
        assert(result.entries[0].token_count == size_t(10));
        assert(result.total_tokens == 10);
        assert(result.find(test_dir + "/b.pdf") == nullptr);

        auto stats = aggregator.getLastStats();
        assert(stats["specs_total"] == 2);
        assert(stats["files_resolved"] == 2);
        assert(stats["files_included"] == 1);
        assert(stats["files_skipped"] == 1);
        assert(stats["tokens_counted"] == 10);

        cleanupTestFiles();
        std::cout << "✓ Failing extractor test passed" << std::endl;
    }

    void testDirectoryWithFailingDocument() {
        std::cout << "Testing a directory holding a failing document..." << std::endl;

        setupTestFiles();
        const std::string bundle = test_dir + "/bundle";
        fs::create_directories(bundle);
        std::ofstream(bundle + "/a.txt") << words(10);
        std::ofstream(bundle + "/b.pdf") << "%PDF-1.4 broken";

        ArgoAgent::ContextAggregator aggregator(extractors, counter);
        auto result = aggregator.aggregate({bundle}, 100);

        assert(result.entries.size() == 1);
        assert(result.entries[0].source_path == bundle + "/a.txt");
        assert(result.entries[0].token_count == size_t(10));
        assert(result.total_tokens == 10);

        auto stats = aggregator.getLastStats();
        assert(stats["files_resolved"] == 2 && "The walk finds both documents");
        assert(stats["files_skipped"] == 1);

        cleanupTestFiles();
        std::cout << "✓ Directory with failing document test passed" << std::endl;
    }

    void testBudgetThreshold() {
        std::cout << "Testing token budget threshold..." << std::endl;

        setupTestFiles();

        ArgoAgent::ContextAggregator aggregator(extractors, counter);

        // Exactly at the budget is allowed
        auto at_limit = aggregator.aggregate({test_dir + "/a.txt"}, 10);
        assert(at_limit.total_tokens == 10);

        bool thrown = false;
        try {
            aggregator.aggregate({test_dir + "/a.txt"}, 9);
        } catch (const ArgoAgent::TokenBudgetExceeded& e) {
            thrown = true;
            assert(e.total() == 10);
            assert(e.limit() == 9);
        }
        assert(thrown && "Exceeding the budget should throw");

        cleanupTestFiles();
        std::cout << "✓ Budget threshold test passed" << std::endl;
    }

    void testBudgetIsCumulative() {
        std::cout << "Testing cumulative budget across specifications..." << std::endl;

        setupTestFiles();

        ArgoAgent::ContextAggregator aggregator(extractors, counter);

        // 10 + 5 + 5 tokens; each file alone fits in 15
        bool thrown = false;
        try {
            aggregator.aggregate({test_dir + "/a.txt", test_dir + "/docs"}, 15);
        } catch (const ArgoAgent::TokenBudgetExceeded& e) {
            thrown = true;
            assert(e.total() == 20);
        }
        assert(thrown);

        auto fits = aggregator.aggregate({test_dir + "/a.txt", test_dir + "/docs"}, 20);
        assert(fits.entries.size() == 3);
        assert(fits.total_tokens == 20);

        cleanupTestFiles();
        std::cout << "✓ Cumulative budget test passed" << std::endl;
    }

    void testNoBudgetSkipsCounting() {
        std::cout << "Testing aggregation without a budget..." << std::endl;

        setupTestFiles();

        ArgoAgent::ContextAggregator aggregator(extractors, counter);
        auto result = aggregator.aggregate({test_dir + "/a.txt", test_dir + "/docs"});

        assert(result.entries.size() == 3);
        assert(counter->calls == 0 && "No budget means no counting");
        assert(result.total_tokens == 0);
        for (const auto& entry : result.entries) {
            assert(!entry.token_count);
        }

        cleanupTestFiles();
        std::cout << "✓ No budget test passed" << std::endl;
    }

    void testUnknownCounts() {
        std::cout << "Testing entries with unknown token counts..." << std::endl;

        setupTestFiles();

        ArgoAgent::ContextAggregator aggregator(extractors, counter, "unknown-model");
        auto result = aggregator.aggregate({test_dir + "/a.txt"}, 1);

        assert(result.entries.size() == 1 && "Uncountable text is still included");
        assert(!result.entries[0].token_count);
        assert(result.total_tokens == 0);
        assert(aggregator.getLastStats()["tokens_unknown"] == 1);

        cleanupTestFiles();
        std::cout << "✓ Unknown counts test passed" << std::endl;
    }

    void testDuplicatePaths() {
        std::cout << "Testing duplicate path handling..." << std::endl;

        setupTestFiles();

        ArgoAgent::ContextAggregator aggregator(extractors, counter);
        auto result = aggregator.aggregate(
            {test_dir + "/docs/c.txt", test_dir + "/docs/c.txt", test_dir + "/docs/*.txt"}, 100);

        assert(result.entries.size() == 2 && "Each path is included once");
        assert(result.entries[0].source_path == test_dir + "/docs/c.txt");
        assert(result.entries[1].source_path == test_dir + "/docs/d.txt");
        assert(result.total_tokens == 10 && "Duplicates are counted once");

        cleanupTestFiles();
        std::cout << "✓ Duplicate paths test passed" << std::endl;
    }

    void testIdenticalContentKeepsBothPaths() {
        std::cout << "Testing identical content at different paths..." << std::endl;

        setupTestFiles();

        ArgoAgent::ContextAggregator aggregator(extractors, counter);
        auto result = aggregator.aggregate({test_dir + "/docs"}, 100);

        assert(result.entries.size() == 2);
        assert(result.entries[0].text == result.entries[1].text);
        assert(result.find(test_dir + "/docs/c.txt") != nullptr);
        assert(result.find(test_dir + "/docs/d.txt") != nullptr);

        cleanupTestFiles();
        std::cout << "✓ Identical content test passed" << std::endl;
    }

    void testMissingPaths() {
        std::cout << "Testing missing path specifications..." << std::endl;

        setupTestFiles();

        ArgoAgent::ContextAggregator aggregator(extractors, counter);
        auto result = aggregator.aggregate({test_dir + "/nope.txt", test_dir + "/*.none"}, 100);

        assert(result.empty());
        assert(aggregator.getLastStats()["files_resolved"] == 0);

        cleanupTestFiles();
        std::cout << "✓ Missing paths test passed" << std::endl;
    }

    void testSerialization() {
        std::cout << "Testing context serialization..." << std::endl;

        ArgoAgent::AggregationResult result;
        result.entries.push_back({"z/last.txt", "first entry", std::nullopt});
        result.entries.push_back({"a/first.txt", "quote \" and\nnewline", std::nullopt});

        std::string json = ArgoAgent::ContextAggregator::serializeContext(result);

        size_t z_pos = json.find("\"z/last.txt\"");
        size_t a_pos = json.find("\"a/first.txt\"");
        assert(z_pos != std::string::npos && a_pos != std::string::npos);
        assert(z_pos < a_pos && "Entries keep discovery order");
        assert(json.find("quote \\\" and\\nnewline") != std::string::npos);
        assert(json.find("\n  \"z/last.txt\": \"first entry\"") != std::string::npos && "Two-space indent");

        assert(ArgoAgent::ContextAggregator::serializeContext(ArgoAgent::AggregationResult()) == "{}");

        std::cout << "✓ Serialization test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running ContextAggregator unit tests..." << std::endl;

        testSkipsFailedExtraction();
        testDirectoryWithFailingDocument();
        testBudgetThreshold();
        testBudgetIsCumulative();
        testNoBudgetSkipsCounting();
        testUnknownCounts();
        testDuplicatePaths();
        testIdenticalContentKeepsBothPaths();
        testMissingPaths();
        testSerialization();

        std::cout << "All ContextAggregator tests passed!" << std::endl;
    }
};

int main() {
    try {
        ArgoAgent::Logger::getInstance().setFileLogging(false);
        ArgoAgent::Logger::getInstance().setConsoleLogging(false);

        ContextAggregatorTest tests;
        tests.runAllTests();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
