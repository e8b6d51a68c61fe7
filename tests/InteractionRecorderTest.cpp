// =================================================================
// tests/InteractionRecorderTest.cpp
// =================================================================
// Unit tests for interaction record files.

#include "ArgoAgent/InteractionRecorder.hpp"
#include "ArgoAgent/Logger.hpp"
#include <iostream>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <cassert>
#include <regex>

namespace fs = std::filesystem;

namespace {

ArgoAgent::PromptRequest standardRequest() {
    ArgoAgent::PromptRequest request;
    request.user = "jdoe";
    request.model = "gpt4o";
    request.system = "You are a helpful AI assistant.";
    request.prompt = {"Hello"};
    request.temperature = 0.5;
    request.top_p = 0.9;
    request.max_tokens = 1000;
    return request;
}

ArgoAgent::DispatchResult sampleResult() {
    ArgoAgent::DispatchResult result;
    result.text = "Hi there";
    result.elapsed_seconds = 1.25;
    result.attempts = 1;
    return result;
}

} // namespace

class InteractionRecorderTest {
private:
    std::string test_dir;

    void cleanupTestDir() {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }

public:
    InteractionRecorderTest() : test_dir("test_interactions") {}

    void testRecordLayout() {
        std::cout << "Testing interaction record layout..." << std::endl;

        auto record = ArgoAgent::InteractionRecorder::buildRecord(
            standardRequest(), sampleResult(), std::chrono::system_clock::now());

        assert(record["request"]["prompt"] == "Hello");
        assert(record["request"]["model"] == "gpt4o");
        assert(record["request"]["system"] == "You are a helpful AI assistant.");
        assert(record["response"]["content"] == "Hi there");
        assert(record["response"]["time_taken"] == 1.25);

        const auto& parameters = record["request"]["parameters"];
        assert(parameters.size() == 4);
        assert(parameters["temperature"] == 0.5);
        assert(parameters["max_tokens"] == 1000);
        assert(parameters["max_completion_tokens"].is_null() && "Parameters not sent are null");

        std::string timestamp = record["timestamp"].get<std::string>();
        assert(std::regex_match(timestamp, std::regex(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{6})")));

        std::cout << "✓ Record layout test passed" << std::endl;
    }

    void testReasoningModelRecord() {
        std::cout << "Testing record for models without sampling parameters..." << std::endl;

        ArgoAgent::PromptRequest request = standardRequest();
        request.model = "gpto1";
        request.temperature.reset();
        request.top_p.reset();
        request.max_tokens.reset();
        request.max_completion_tokens = 2000;

        auto record = ArgoAgent::InteractionRecorder::buildRecord(
            request, sampleResult(), std::chrono::system_clock::now());

        const auto& parameters = record["request"]["parameters"];
        assert(parameters["temperature"].is_null());
        assert(parameters["top_p"].is_null());
        assert(parameters["max_tokens"].is_null());
        assert(parameters["max_completion_tokens"] == 2000);

        std::cout << "✓ Reasoning model record test passed" << std::endl;
    }

    void testFilename() {
        std::cout << "Testing interaction filenames..." << std::endl;

        std::string name = ArgoAgent::InteractionRecorder::buildFilename(
            "jdoe", "gpt4o", std::chrono::system_clock::now());
        assert(std::regex_match(name, std::regex(R"(jdoe_gpt4o_\d{8}_\d{6}\.json)")));

        auto when = std::chrono::system_clock::now();
        std::string second = ArgoAgent::InteractionRecorder::buildFilename("jdoe", "gpt4o", when, 2);
        assert(std::regex_match(second, std::regex(R"(jdoe_gpt4o_\d{8}_\d{6}_2\.json)")));

        std::string unsafe = ArgoAgent::InteractionRecorder::buildFilename("ops/jdoe", "team\\gpt4o", when);
        assert(unsafe.rfind("ops_jdoe_team_gpt4o_", 0) == 0 && "Path separators are replaced");

        std::cout << "✓ Filename test passed" << std::endl;
    }

    void testRecordWritesFile() {
        std::cout << "Testing interaction file output..." << std::endl;

        cleanupTestDir();
        ArgoAgent::InteractionRecorder recorder(test_dir + "/nested");
        auto path = recorder.record(standardRequest(), sampleResult());

        assert(path && "Recording should succeed");
        assert(fs::exists(*path));
        assert(fs::path(*path).parent_path() == fs::path(test_dir + "/nested") &&
               "Missing directories are created");

        std::ifstream file(*path);
        std::stringstream buffer;
        buffer << file.rdbuf();
        auto saved = nlohmann::json::parse(buffer.str());
        assert(saved["response"]["content"] == "Hi there");
        assert(buffer.str().find("\n  \"timestamp\"") != std::string::npos && "Indented with two spaces");

        cleanupTestDir();
        std::cout << "✓ File output test passed" << std::endl;
    }

    void testRecordsAreNotOverwritten() {
        std::cout << "Testing records written within the same second..." << std::endl;

        cleanupTestDir();
        ArgoAgent::InteractionRecorder recorder(test_dir);
        ArgoAgent::PromptRequest request = standardRequest();
        request.user = "ops/jdoe";

        auto first = recorder.record(request, sampleResult());
        auto second = recorder.record(request, sampleResult());
        auto third = recorder.record(request, sampleResult());

        assert(first && second && third);
        assert(*first != *second && *second != *third && *first != *third);
        assert(fs::exists(*first) && fs::exists(*second) && fs::exists(*third));
        assert(fs::path(*first).parent_path() == fs::path(test_dir) && "Records stay in the directory");

        size_t files = 0;
        for (const auto& entry : fs::directory_iterator(test_dir)) {
            (void)entry;
            ++files;
        }
        assert(files == 3);

        cleanupTestDir();
        std::cout << "✓ Same second records test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running InteractionRecorder unit tests..." << std::endl;

        testRecordLayout();
        testReasoningModelRecord();
        testFilename();
        testRecordWritesFile();
        testRecordsAreNotOverwritten();

        std::cout << "All InteractionRecorder tests passed!" << std::endl;
    }
};

int main() {
    try {
        ArgoAgent::Logger::getInstance().setFileLogging(false);
        ArgoAgent::Logger::getInstance().setConsoleLogging(false);

        InteractionRecorderTest tests;
        tests.runAllTests();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
