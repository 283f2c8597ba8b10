/**
 * Execution Engine Integration Tests
 *
 * Runs PistonClient and the feeder's TaskProcessor against a local HTTP
 * server that speaks the Piston v2 API.
 */

#include <gtest/gtest.h>
#include "flagrun/feeder.h"
#include "flagrun/http_server.h"
#include "flagrun/piston_client.h"

#include <json/json.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace flagrun;

// ============================================================================
// Test Fixture
// ============================================================================

class PistonIntegrationTest : public ::testing::Test {
protected:
    std::mutex mutex;
    std::vector<Json::Value> executed;
    std::atomic<int> rate_limited_calls{0};  // 429s still to hand out
    std::atomic<int> runtimes_failures{0};   // 503s still to hand out
    std::unique_ptr<HttpServer> server;
    std::thread server_thread;

    void SetUp() override {
        server = std::make_unique<HttpServer>(0);

        server->route("GET", "/api/v2/runtimes", [this](const HttpRequest&) {
            if (runtimes_failures > 0) {
                --runtimes_failures;
                return HttpResponse::error(503, "warming up");
            }
            HttpResponse resp;
            resp.body = R"([
                {"language":"python","version":"3.10.0","aliases":["py","py3","python3"]},
                {"language":"javascript","version":"18.15.0","aliases":["node-javascript","js"]},
                {"language":"broken"}
            ])";
            return resp;
        });

        server->route("POST", "/api/v2/execute", [this](const HttpRequest& req) {
            if (rate_limited_calls > 0) {
                --rate_limited_calls;
                HttpResponse resp;
                resp.status_code = 429;
                resp.body = R"({"message":"Requests are being rate limited"})";
                return resp;
            }

            Json::Value request;
            if (!parse_json(req.body, request)) {
                return HttpResponse::error(400, "bad json");
            }
            {
                std::lock_guard<std::mutex> lock(mutex);
                executed.push_back(request);
            }

            // Echo the program text back as stdout
            Json::Value out;
            out["language"] = request["language"];
            out["version"] = request["version"];
            out["run"]["stdout"] = request["files"][0]["content"].asString() + "\n";
            out["run"]["stderr"] = "";
            out["run"]["code"] = 0;
            out["run"]["signal"] = Json::Value(Json::nullValue);
            HttpResponse resp;
            resp.body = write_json(out);
            return resp;
        });

        server_thread = std::thread([this]() { server->start(); });
        ASSERT_TRUE(server->wait_until_listening(5000)) << "Server failed to start";
    }

    void TearDown() override {
        if (server) {
            server->stop();
        }
        if (server_thread.joinable()) {
            server_thread.join();
        }
    }

    std::string base_url() const {
        return "http://127.0.0.1:" + std::to_string(server->port()) + "/api/v2";
    }
};

// ============================================================================
// Test Contract: Runtime Discovery
// ============================================================================

TEST_F(PistonIntegrationTest, FetchesRuntimeList) {
    PistonClient piston(base_url());

    auto runtimes = piston.runtimes(std::chrono::seconds(5));

    // Then: Entries without a version are skipped
    ASSERT_EQ(runtimes.size(), 2u);
    EXPECT_EQ(runtimes[0].language, "python");
    EXPECT_EQ(runtimes[0].aliases.size(), 3u);
}

TEST_F(PistonIntegrationTest, LoadRuntimesRetriesUntilAvailable) {
    // Given: The engine fails its first runtime request
    runtimes_failures = 1;
    PistonClient piston(base_url());

    // When: Loading with retry
    RuntimeRegistry registry = load_runtimes(piston, 3);

    // Then: The second attempt succeeds
    EXPECT_EQ(registry.version_for("js"), std::optional<std::string>("18.15.0"));
    EXPECT_EQ(registry.version_for("PY3"), std::optional<std::string>("3.10.0"));
}

TEST_F(PistonIntegrationTest, LoadRuntimesGivesUp) {
    runtimes_failures = 10;
    PistonClient piston(base_url());

    EXPECT_THROW(load_runtimes(piston, 1), std::runtime_error);
}

// ============================================================================
// Test Contract: Task Execution
// ============================================================================

TEST_F(PistonIntegrationTest, ProcessesTaskEndToEnd) {
    PistonClient piston(base_url());
    RuntimeRegistry registry(piston.runtimes(std::chrono::seconds(5)));
    ExecutionDefaults defaults;
    defaults.memory_limit_mb = 128;
    TaskProcessor processor(piston, registry, defaults);

    ResultMessage result = processor.process(
        R"({"job_id":"job-1","code":"hello","language":"py","run_timeout":2500})");

    EXPECT_EQ(result.status, status::SUCCESS);
    EXPECT_EQ(result.stdout_text, std::optional<std::string>("hello\n"));
    EXPECT_EQ(result.job_id, std::optional<std::string>("job-1"));
    EXPECT_FALSE(result.fail);

    ASSERT_EQ(executed.size(), 1u);
    EXPECT_EQ(executed[0]["version"].asString(), "3.10.0");
    EXPECT_EQ(executed[0]["run_timeout"].asInt(), 2500);
    EXPECT_EQ(executed[0]["run_memory_limit"].asInt64(), 128LL * 1024 * 1024);
}

TEST_F(PistonIntegrationTest, RateLimitedTaskEventuallyRuns) {
    // Given: The engine rate limits the first two calls
    rate_limited_calls = 2;
    PistonClient piston(base_url());
    RuntimeRegistry registry(piston.runtimes(std::chrono::seconds(5)));
    std::vector<std::chrono::milliseconds> sleeps;
    TaskProcessor processor(piston, registry, ExecutionDefaults{},
                            [&sleeps](std::chrono::milliseconds d) { sleeps.push_back(d); });

    ResultMessage result = processor.process(
        R"({"job_id":"job-2","code":"x","language":"python"})");

    EXPECT_EQ(result.status, status::SUCCESS);
    EXPECT_EQ(sleeps.size(), 2u);
    EXPECT_EQ(executed.size(), 1u);
}

TEST_F(PistonIntegrationTest, UnreachableEngineIsReported) {
    PistonClient piston(base_url());
    RuntimeRegistry registry(piston.runtimes(std::chrono::seconds(5)));
    TaskProcessor processor(piston, registry, ExecutionDefaults{});

    // When: The engine goes away before the task arrives
    server->stop();
    server_thread.join();

    ResultMessage result = processor.process(
        R"({"job_id":"job-3","code":"x","language":"python"})");

    EXPECT_EQ(result.status, status::PISTON_CONNECTION_ERROR);
    EXPECT_TRUE(result.fail);
}
