#include <cassert>
#include <chrono>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "domain/Errors.hpp"
#include "infrastructure/OllamaClient.hpp"
#include "infrastructure/OllamaSummarizer.hpp"

using namespace localscribe;
using namespace localscribe::infrastructure;
using json = nlohmann::json;

namespace {

/** @brief Canned /api/generate behavior for the in-process server. */
struct FakeOllama {
    std::mutex mutex;
    int status = 200;
    std::string body;
    std::string lastRequest;
    int requestCount = 0;

    void respond(int newStatus, std::string newBody) {
        std::lock_guard<std::mutex> lock(mutex);
        status = newStatus;
        body = std::move(newBody);
    }
};

std::string SummarizeError(OllamaSummarizer& summarizer, const std::string& text) {
    try {
        summarizer.summarize(text);
    } catch (const domain::ApiError& e) {
        return e.what();
    }
    assert(false && "expected ApiError");
    return {};
}

} // namespace

int main() {
    std::cout << "[Test] Starting OllamaSummarizer Test..." << std::endl;

    FakeOllama fake;
    httplib::Server svr;
    svr.Post("/api/generate", [&fake](const httplib::Request& req, httplib::Response& res) {
        std::lock_guard<std::mutex> lock(fake.mutex);
        fake.lastRequest = req.body;
        ++fake.requestCount;
        res.status = fake.status;
        res.set_content(fake.body, "application/json");
    });

    int port = svr.bind_to_any_port("127.0.0.1");
    assert(port > 0);
    std::thread serverThread([&svr]() { svr.listen_after_bind(); });
    while (!svr.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    OllamaSummarizer summarizer(OllamaClient("127.0.0.1", port, 30), "qwen2.5-coder:7b");

    // Successful generation and request shape.
    {
        fake.respond(200, R"({"model":"qwen2.5-coder:7b","response":"hello","done":true})");
        assert(summarizer.summarize("Alice met Bob.") == "hello");

        json request = json::parse(fake.lastRequest);
        assert(request["model"] == "qwen2.5-coder:7b");
        assert(request["prompt"] == "Summarize the following text concisely:\n\nAlice met Bob.");
        assert(request["stream"] == false);
        assert(fake.requestCount == 1);

        fake.respond(201, R"({"response":"created"})");
        assert(summarizer.summarize("text") == "created");
        std::cout << "[PASS] Summary extracted from 'response'." << std::endl;
    }

    // Missing or non-string field is an error, never an empty summary.
    {
        fake.respond(200, R"({"done":true})");
        assert(SummarizeError(summarizer, "text") == "Ollama response missing 'response' field");

        fake.respond(200, R"({"response":42})");
        assert(SummarizeError(summarizer, "text") == "Ollama response missing 'response' field");
        std::cout << "[PASS] Missing field reported." << std::endl;
    }

    // Non-JSON success body.
    {
        fake.respond(200, "<html>proxy</html>");
        std::string error = SummarizeError(summarizer, "text");
        assert(error.rfind("Failed to parse Ollama response: ", 0) == 0);
        std::cout << "[PASS] Unparseable body reported." << std::endl;
    }

    // Non-200 status names the code and is attempted exactly once.
    {
        int before = fake.requestCount;
        fake.respond(500, R"({"response":"should not be read"})");
        std::string error = SummarizeError(summarizer, "text");
        assert(error.rfind("Ollama API error: 500", 0) == 0);
        assert(fake.requestCount == before + 1);

        fake.respond(404, R"({"error":"model 'x' not found"})");
        error = SummarizeError(summarizer, "text");
        assert(error.find("404") != std::string::npos);
        std::cout << "[PASS] HTTP status errors reported." << std::endl;
    }

    svr.stop();
    serverThread.join();

    // Transport failure once nothing is listening.
    {
        std::string error = SummarizeError(summarizer, "text");
        assert(error.rfind("Ollama request failed: ", 0) == 0);
        std::cout << "[PASS] Connection failure reported." << std::endl;
    }

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
