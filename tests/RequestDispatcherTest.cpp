// =================================================================
// tests/RequestDispatcherTest.cpp
// =================================================================
// Unit tests for request shaping, validation and retrying dispatch.

#include "ArgoAgent/RequestDispatcher.hpp"
#include "ArgoAgent/ModelCatalog.hpp"
#include "ArgoAgent/Errors.hpp"
#include "ArgoAgent/Logger.hpp"
#include <iostream>
#include <cassert>
#include <cmath>
#include <deque>

namespace {

// Replays a scripted sequence of responses and records every call
class ScriptedTransport : public ArgoAgent::HttpTransport {
public:
    ArgoAgent::HttpResponse post(const std::string& url,
                                 const std::string& body,
                                 const ArgoAgent::HttpHeaders& headers,
                                 const ArgoAgent::HttpTimeouts& timeouts) override {
        (void)headers;
        ++calls;
        last_url = url;
        last_body = body;
        last_timeouts = timeouts;

        if (script.empty()) {
            ArgoAgent::HttpResponse unreachable;
            unreachable.error = "Connection refused";
            return unreachable;
        }
        ArgoAgent::HttpResponse response = script.front();
        script.pop_front();
        return response;
    }

    void reply(int status, const std::string& body) {
        ArgoAgent::HttpResponse response;
        response.connected = true;
        response.status = status;
        response.body = body;
        script.push_back(response);
    }

    void reject(const std::string& error) {
        ArgoAgent::HttpResponse response;
        response.error = error;
        response.retryable = false;
        script.push_back(response);
    }

    void refuse() {
        ArgoAgent::HttpResponse response;
        response.error = "Connection refused";
        script.push_back(response);
    }

    std::deque<ArgoAgent::HttpResponse> script;
    int calls = 0;
    std::string last_url;
    std::string last_body;
    ArgoAgent::HttpTimeouts last_timeouts;
};

bool nearlyEqual(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

} // namespace

class RequestDispatcherTest {
private:
    std::shared_ptr<ScriptedTransport> transport;
    std::vector<double> sleeps;

    ArgoAgent::RequestDispatcher makeDispatcher() {
        transport = std::make_shared<ScriptedTransport>();
        sleeps.clear();
        ArgoAgent::RequestDispatcher dispatcher(transport);
        dispatcher.setSleeper([this](double seconds) { sleeps.push_back(seconds); });
        return dispatcher;
    }

    ArgoAgent::PromptRequest sampleRequest() {
        ArgoAgent::ModelConfig model{"gpt4o", 16384, true, {}};
        return ArgoAgent::RequestDispatcher::buildRequest("Hello", "jdoe", "You are a helpful AI assistant.",
                                                          model, ArgoAgent::SamplingParameters());
    }

public:
    void testRetryThenSuccess() {
        std::cout << "Testing retries on transient failures..." << std::endl;

        auto dispatcher = makeDispatcher();
        transport->reply(503, "Service Unavailable");
        transport->reply(503, "Service Unavailable");
        transport->reply(200, R"({"response": "Hi there"})");

        auto result = dispatcher.dispatch("https://argo.example.com/api/chat/", sampleRequest());

        assert(transport->calls == 3);
        assert(result.attempts == 3);
        assert(result.text == "Hi there");
        assert(result.elapsed_seconds >= 0.0);
        assert(sleeps.size() == 2);
        assert(nearlyEqual(sleeps[0], 0.3) && nearlyEqual(sleeps[1], 0.6) && "Exponential backoff");

        std::cout << "✓ Retry then success test passed" << std::endl;
    }

    void testRetriesExhausted() {
        std::cout << "Testing exhausted retries..." << std::endl;

        auto dispatcher = makeDispatcher();
        transport->reply(503, "");
        transport->reply(502, "");
        transport->reply(504, "");
        transport->reply(200, R"({"response": "too late"})");

        bool thrown = false;
        try {
            dispatcher.dispatch("https://argo.example.com/api/chat/", sampleRequest());
        } catch (const ArgoAgent::TransportError& e) {
            thrown = true;
            assert(e.status() == 504);
        }
        assert(thrown);
        assert(transport->calls == 3 && "Three attempts in total");

        std::cout << "✓ Exhausted retries test passed" << std::endl;
    }

    void testClientErrorNotRetried() {
        std::cout << "Testing non-retryable status..." << std::endl;

        auto dispatcher = makeDispatcher();
        transport->reply(400, R"({"error": "bad request"})");
        transport->reply(200, R"({"response": "unused"})");

        bool thrown = false;
        try {
            dispatcher.dispatch("https://argo.example.com/api/chat/", sampleRequest());
        } catch (const ArgoAgent::TransportError& e) {
            thrown = true;
            assert(e.status() == 400);
        }
        assert(thrown);
        assert(transport->calls == 1 && "4xx responses fail immediately");
        assert(sleeps.empty());

        std::cout << "✓ Non-retryable status test passed" << std::endl;
    }

    void testConnectionFailures() {
        std::cout << "Testing connection failures..." << std::endl;

        auto dispatcher = makeDispatcher();
        transport->refuse();
        transport->reply(200, R"({"response": "recovered"})");

        auto result = dispatcher.dispatch("http://localhost:1/chat", sampleRequest());
        assert(result.text == "recovered");
        assert(transport->calls == 2);

        auto unreachable = makeDispatcher();
        bool thrown = false;
        try {
            unreachable.dispatch("http://localhost:1/chat", sampleRequest());
        } catch (const ArgoAgent::TransportError& e) {
            thrown = true;
            assert(e.status() == 0 && "No status without a connection");
        }
        assert(thrown);
        assert(transport->calls == 3);

        std::cout << "✓ Connection failure test passed" << std::endl;
    }

    void testUnusableEndpointNotRetried() {
        std::cout << "Testing endpoints that cannot be used..." << std::endl;

        auto dispatcher = makeDispatcher();
        transport->reject("Malformed URL: argo.example/api");
        transport->reply(200, R"({"response": "unused"})");

        bool thrown = false;
        try {
            dispatcher.dispatch("argo.example/api", sampleRequest());
        } catch (const ArgoAgent::TransportError& e) {
            thrown = true;
            assert(e.status() == 0);
            assert(std::string(e.what()).find("Malformed URL") != std::string::npos);
        }
        assert(thrown);
        assert(transport->calls == 1 && "Configuration failures are not retried");
        assert(sleeps.empty());

        std::cout << "✓ Unusable endpoint test passed" << std::endl;
    }

    void testInvalidUtf8Prompt() {
        std::cout << "Testing prompts with invalid UTF-8..." << std::endl;

        auto dispatcher = makeDispatcher();
        transport->reply(200, R"({"response": "ok"})");

        ArgoAgent::ModelConfig model{"gpt4o", 16384, true, {}};
        auto request = ArgoAgent::RequestDispatcher::buildRequest(
            std::string("caf") + static_cast<char>(0xE9), "jdoe", "sys", model, ArgoAgent::SamplingParameters());

        auto result = dispatcher.dispatch("https://argo.example.com/api/chat/", request);
        assert(result.text == "ok");
        assert(transport->last_body.find("caf\xEF\xBF\xBD") != std::string::npos &&
               "Invalid bytes are sent as U+FFFD");

        std::cout << "✓ Invalid UTF-8 prompt test passed" << std::endl;
    }

    void testResponseParsing() {
        std::cout << "Testing response body parsing..." << std::endl;

        using ArgoAgent::RequestDispatcher;
        assert(RequestDispatcher::parseResponseBody(R"({"response": "text"})") == "text");
        assert(RequestDispatcher::parseResponseBody(R"({"other": 1})").empty() && "Missing field is lenient");
        assert(RequestDispatcher::parseResponseBody(R"({"response": null})").empty());
        assert(RequestDispatcher::parseResponseBody(R"({"response": {"a": 1}})") == R"({"a":1})");

        bool thrown = false;
        try {
            RequestDispatcher::parseResponseBody("<html>Bad Gateway</html>");
        } catch (const ArgoAgent::ResponseParseError&) {
            thrown = true;
        }
        assert(thrown && "Non-JSON success bodies are parse errors");

        thrown = false;
        try {
            RequestDispatcher::parseResponseBody(R"(["response"])");
        } catch (const ArgoAgent::ResponseParseError&) {
            thrown = true;
        }
        assert(thrown && "Non-object bodies are parse errors");

        auto dispatcher = makeDispatcher();
        transport->reply(200, "not json");
        thrown = false;
        try {
            dispatcher.dispatch("https://argo.example.com/api/chat/", sampleRequest());
        } catch (const ArgoAgent::ResponseParseError&) {
            thrown = true;
        }
        assert(thrown);
        assert(transport->calls == 1 && "Parse errors are not retried");

        std::cout << "✓ Response parsing test passed" << std::endl;
    }

    void testParameterValidation() {
        std::cout << "Testing parameter validation..." << std::endl;

        ArgoAgent::SamplingParameters params;
        ArgoAgent::RequestDispatcher::validateParameters(params);

        params.temperature = 3.0;
        bool thrown = false;
        try {
            ArgoAgent::RequestDispatcher::validateParameters(params);
        } catch (const ArgoAgent::InvalidParameter& e) {
            thrown = true;
            assert(e.name() == "temperature");
            assert(e.value() == 3.0);
        }
        assert(thrown);

        params = ArgoAgent::SamplingParameters();
        params.top_p = 1.5;
        thrown = false;
        try {
            ArgoAgent::RequestDispatcher::validateParameters(params);
        } catch (const ArgoAgent::InvalidParameter& e) {
            thrown = true;
            assert(e.name() == "top_p");
        }
        assert(thrown);

        params = ArgoAgent::SamplingParameters();
        params.max_tokens = 0;
        thrown = false;
        try {
            ArgoAgent::RequestDispatcher::validateParameters(params);
        } catch (const ArgoAgent::InvalidParameter& e) {
            thrown = true;
            assert(e.name() == "max_tokens");
        }
        assert(thrown);

        // Boundaries are inclusive
        params = ArgoAgent::SamplingParameters();
        params.temperature = 2.0;
        params.top_p = 0.0;
        ArgoAgent::RequestDispatcher::validateParameters(params);

        std::cout << "✓ Parameter validation test passed" << std::endl;
    }

    void testRequestShaping() {
        std::cout << "Testing request shaping per model..." << std::endl;

        auto catalog = ArgoAgent::ModelCatalog::createDefault();
        ArgoAgent::SamplingParameters params;
        params.max_tokens = 50000;

        auto standard = ArgoAgent::RequestDispatcher::buildRequest(
            "Hello", "jdoe", "sys", catalog.require("gpt4o"), params);
        auto body = standard.toJson();
        assert(body["temperature"] == 0.7);
        assert(body["top_p"] == 0.9);
        assert(body["max_tokens"] == 16384 && "max_tokens is capped at the model limit");
        assert(!body.contains("max_completion_tokens"));
        assert(body["prompt"].size() == 1 && body["prompt"][0] == "Hello");
        assert(body["user"] == "jdoe");
        assert(body["system"] == "sys");
        assert(body["stop"].is_array() && body["stop"].empty());

        auto reasoning = ArgoAgent::RequestDispatcher::buildRequest(
            "Hello", "jdoe", "sys", catalog.require("gpto1"), params);
        auto reasoning_body = reasoning.toJson();
        assert(!reasoning_body.contains("temperature"));
        assert(!reasoning_body.contains("top_p"));
        assert(!reasoning_body.contains("max_tokens"));
        assert(reasoning_body["max_completion_tokens"] == 50000 && "Below the cap the request wins");

        std::cout << "✓ Request shaping test passed" << std::endl;
    }

    void testTimeoutsPassedThrough() {
        std::cout << "Testing transport timeouts..." << std::endl;

        auto local = std::make_shared<ScriptedTransport>();
        local->reply(200, R"({"response": "ok"})");

        ArgoAgent::HttpTimeouts timeouts;
        timeouts.connect_seconds = 5.0;
        timeouts.read_seconds = 42.0;
        ArgoAgent::RequestDispatcher dispatcher(local, ArgoAgent::RetryPolicy(), timeouts);
        dispatcher.dispatch("https://argo.example.com/api/chat/", sampleRequest());

        assert(local->last_timeouts.connect_seconds == 5.0);
        assert(local->last_timeouts.read_seconds == 42.0);
        assert(local->last_url == "https://argo.example.com/api/chat/");
        assert(local->last_body.find("\"model\":\"gpt4o\"") != std::string::npos);

        std::cout << "✓ Transport timeouts test passed" << std::endl;
    }

    void testBackoffSchedule() {
        std::cout << "Testing backoff schedule..." << std::endl;

        ArgoAgent::RetryPolicy policy;
        assert(nearlyEqual(policy.delayBeforeRetry(1), 0.3));
        assert(nearlyEqual(policy.delayBeforeRetry(2), 0.6));
        assert(nearlyEqual(policy.delayBeforeRetry(3), 1.2));
        assert(policy.isRetryableStatus(500));
        assert(policy.isRetryableStatus(502));
        assert(!policy.isRetryableStatus(404));
        assert(!policy.isRetryableStatus(429));

        std::cout << "✓ Backoff schedule test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running RequestDispatcher unit tests..." << std::endl;

        testRetryThenSuccess();
        testRetriesExhausted();
        testClientErrorNotRetried();
        testConnectionFailures();
        testUnusableEndpointNotRetried();
        testInvalidUtf8Prompt();
        testResponseParsing();
        testParameterValidation();
        testRequestShaping();
        testTimeoutsPassedThrough();
        testBackoffSchedule();

        std::cout << "All RequestDispatcher tests passed!" << std::endl;
    }
};

int main() {
    try {
        ArgoAgent::Logger::getInstance().setFileLogging(false);
        ArgoAgent::Logger::getInstance().setConsoleLogging(false);

        RequestDispatcherTest tests;
        tests.runAllTests();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
