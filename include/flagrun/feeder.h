#pragma once

#include "flagrun/broker.h"
#include "flagrun/config.h"
#include "flagrun/execution_engine.h"
#include "flagrun/messages.h"
#include "flagrun/runtime_registry.h"

#include <json/json.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace flagrun {

// Limits applied when a task carries no override
struct ExecutionDefaults {
    int memory_limit_mb = DEFAULT_MEMORY_LIMIT_MB;
    int compile_timeout_ms = DEFAULT_COMPILE_TIMEOUT_MS;
    int run_timeout_ms = DEFAULT_RUN_TIMEOUT_MS;
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

// Turns one task body into exactly one ResultMessage
class TaskProcessor {
public:
    TaskProcessor(ExecutionEngine& engine, const RuntimeRegistry& runtimes,
                  ExecutionDefaults defaults, Sleeper sleeper = nullptr);

    // Never throws: every failure is reported as a typed result
    ResultMessage process(const std::string& body) const;

    // Piston /execute request body
    static Json::Value build_request(const std::string& language, const std::string& version,
                                     const std::string& code, int memory_limit_mb,
                                     int compile_timeout_ms, int run_timeout_ms);

    // Maps a 2xx /execute body onto a result
    static ResultMessage interpret_response(const std::string& job_id, const std::string& language,
                                            const std::string& version, const std::string& body);

private:
    ResultMessage run(const std::string& body, std::optional<std::string>& job_id,
                      std::optional<std::string>& language) const;
    ResultMessage call_engine(const std::string& job_id, const std::string& language,
                              const std::string& version, const std::string& request,
                              std::chrono::milliseconds timeout) const;
    int override_or(const Json::Value& task, const char* name, int fallback) const;

    ExecutionEngine& engine_;
    const RuntimeRegistry& runtimes_;
    ExecutionDefaults defaults_;
    Sleeper sleeper_;
};

// Consumes the task queue and publishes one result per task
class Feeder {
public:
    Feeder(const FeederConfig& config, const TaskProcessor& processor);

    // Process, publish, then ack. A failed publish rejects with requeue.
    static void handle_delivery(const TaskProcessor& processor, MessagePublisher& publisher,
                                DeliveryAcknowledger& acker, const std::string& results_queue,
                                const Delivery& delivery);

    // Connects with retry and consumes until `stop` is set or the broker
    // connection is lost. Returns the process exit code.
    int run(const std::atomic<bool>& stop);

private:
    FeederConfig config_;
    const TaskProcessor& processor_;
};

// Fetches the runtime list with retry. Throws once attempts are exhausted.
RuntimeRegistry load_runtimes(ExecutionEngine& engine, int attempts);

} // namespace flagrun
