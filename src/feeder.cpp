#include "flagrun/feeder.h"
#include "flagrun/amqp_client.h"

#include <algorithm>
#include <cmath>
#include <condition_variable>
#include <iostream>
#include <limits>
#include <mutex>
#include <thread>

namespace flagrun {

namespace {

std::optional<std::string> string_field(const Json::Value& object, const char* name) {
    if (!object.isObject()) return std::nullopt;
    const Json::Value& value = object[name];
    if (!value.isString()) return std::nullopt;
    return value.asString();
}

std::optional<std::string> non_empty(const std::optional<std::string>& value) {
    if (value && !value->empty()) return value;
    return std::nullopt;
}

std::optional<int> to_int(double d) {
    if (!std::isfinite(d) ||
        d > static_cast<double>(std::numeric_limits<int>::max()) ||
        d < static_cast<double>(std::numeric_limits<int>::min())) {
        return std::nullopt;
    }
    return static_cast<int>(d);
}

void sleep_for(std::chrono::milliseconds delay) {
    std::this_thread::sleep_for(delay);
}

} // namespace

// ============================================================================
// TaskProcessor
// ============================================================================

TaskProcessor::TaskProcessor(ExecutionEngine& engine, const RuntimeRegistry& runtimes,
                             ExecutionDefaults defaults, Sleeper sleeper)
    : engine_(engine), runtimes_(runtimes), defaults_(defaults),
      sleeper_(sleeper ? std::move(sleeper) : Sleeper(sleep_for)) {}

ResultMessage TaskProcessor::process(const std::string& body) const {
    std::optional<std::string> job_id;
    std::optional<std::string> language;
    try {
        return run(body, job_id, language);
    } catch (const std::exception& e) {
        std::cerr << "[Feeder] Job " << job_id.value_or("<unknown>")
                  << ": processing failed: " << e.what() << std::endl;
        return ResultMessage::failure(job_id, language, status::FEEDER_PROCESSING_ERROR,
                                      e.what(), e.what());
    }
}

int TaskProcessor::override_or(const Json::Value& task, const char* name, int fallback) const {
    if (!task.isMember(name)) return fallback;
    const Json::Value& value = task[name];

    std::optional<int> parsed;
    if (value.isNumeric() && !value.isBool()) {
        parsed = to_int(value.asDouble());
    } else if (value.isString()) {
        const std::string text = value.asString();
        try {
            size_t consumed = 0;
            double d = std::stod(text, &consumed);
            if (consumed == text.size()) parsed = to_int(d);
        } catch (const std::exception&) {
            parsed = std::nullopt;
        }
    }

    if (!parsed) {
        std::cerr << "[Feeder] Ignoring non-numeric " << name << "; using " << fallback << std::endl;
        return fallback;
    }
    return *parsed;
}

ResultMessage TaskProcessor::run(const std::string& body, std::optional<std::string>& job_id,
                                 std::optional<std::string>& language) const {
    Json::Value task;
    std::string errors;
    if (!parse_json(body, task, &errors) || !task.isObject()) {
        std::cerr << "[Feeder] Discarding malformed task: " << errors << std::endl;
        return ResultMessage::failure(std::nullopt, std::nullopt, status::FEEDER_ERROR,
                                      "Task is not a JSON object", "Malformed task message");
    }

    job_id = non_empty(string_field(task, "job_id"));
    language = non_empty(string_field(task, "language"));
    auto code = non_empty(string_field(task, "code"));
    if (!job_id || !language || !code) {
        std::cerr << "[Feeder] Job " << job_id.value_or("<unknown>")
                  << ": task is missing job_id, code or language" << std::endl;
        return ResultMessage::failure(job_id, language, status::FEEDER_ERROR,
                                      "Task requires non-empty job_id, code and language",
                                      "Malformed task message");
    }

    auto version = runtimes_.version_for(*language);
    if (!version) {
        std::cout << "[Feeder] Job " << *job_id << ": unsupported language '" << *language << "'"
                  << std::endl;
        std::string detail = "Language '" + *language + "' is not supported";
        return ResultMessage::failure(job_id, language, status::UNSUPPORTED_LANGUAGE, detail, detail);
    }

    int memory_limit = override_or(task, "memory_limit", defaults_.memory_limit_mb);
    int compile_timeout = override_or(task, "compile_timeout", defaults_.compile_timeout_ms);
    int run_timeout = override_or(task, "run_timeout", defaults_.run_timeout_ms);

    // The engine matches names and aliases case-sensitively
    std::string request = write_json(build_request(to_lower(*language), *version, *code,
                                                   memory_limit, compile_timeout, run_timeout));
    auto timeout = std::chrono::milliseconds(std::max(compile_timeout, 0)) +
                   std::chrono::milliseconds(std::max(run_timeout, 0)) +
                   std::chrono::milliseconds(ENGINE_TIMEOUT_MARGIN_MS);

    std::cout << "[Feeder] Job " << *job_id << ": executing " << *language << " " << *version
              << std::endl;
    ResultMessage result = call_engine(*job_id, *language, *version, request, timeout);
    std::cout << "[Feeder] Job " << *job_id << ": " << result.status << std::endl;
    return result;
}

Json::Value TaskProcessor::build_request(const std::string& language, const std::string& version,
                                         const std::string& code, int memory_limit_mb,
                                         int compile_timeout_ms, int run_timeout_ms) {
    Json::Value request;
    request["language"] = language;
    request["version"] = version;

    Json::Value file;
    file["content"] = code;
    request["files"] = Json::Value(Json::arrayValue);
    request["files"].append(file);

    request["compile_timeout"] = compile_timeout_ms;
    request["run_timeout"] = run_timeout_ms;
    if (memory_limit_mb != -1) {
        Json::Int64 bytes = static_cast<Json::Int64>(memory_limit_mb) *
                            static_cast<Json::Int64>(BYTES_PER_MB);
        request["compile_memory_limit"] = bytes;
        request["run_memory_limit"] = bytes;
    }
    return request;
}

ResultMessage TaskProcessor::call_engine(const std::string& job_id, const std::string& language,
                                         const std::string& version, const std::string& request,
                                         std::chrono::milliseconds timeout) const {
    HttpClientResponse resp;
    try {
        resp = engine_.execute(request, timeout);
    } catch (const HttpTimeoutError& e) {
        return ResultMessage::failure(job_id, language, status::PISTON_TIMEOUT, e.what(),
                                      "Execution engine timed out");
    } catch (const HttpConnectionError& e) {
        return ResultMessage::failure(job_id, language, status::PISTON_CONNECTION_ERROR, e.what(),
                                      "Cannot reach execution engine");
    }

    for (int attempt = 1; resp.status_code == 429 && attempt <= MAX_RATE_LIMIT_RETRIES; ++attempt) {
        auto delay = std::chrono::milliseconds(attempt * RATE_LIMIT_BACKOFF_STEP_MS);
        std::cerr << "[Feeder] Job " << job_id << ": rate limited, retry " << attempt << "/"
                  << MAX_RATE_LIMIT_RETRIES << " in " << delay.count() << "ms" << std::endl;
        sleeper_(delay);

        try {
            resp = engine_.execute(request, timeout);
        } catch (const std::exception& e) {
            return ResultMessage::failure(job_id, language, status::PISTON_API_ERROR_RETRY, e.what(),
                                          "Execution engine failed while retrying");
        }
        if (resp.status_code != 429 && !resp.ok()) {
            std::string detail = "HTTP " + std::to_string(resp.status_code) + ": " + resp.body;
            return ResultMessage::failure(job_id, language, status::PISTON_API_ERROR_RETRY, detail,
                                          "Execution engine failed while retrying");
        }
    }

    if (resp.status_code == 429) {
        return ResultMessage::failure(job_id, language, status::PISTON_RATE_LIMITED, resp.body,
                                      "Execution engine still rate limited after " +
                                      std::to_string(MAX_RATE_LIMIT_RETRIES) + " retries");
    }
    if (!resp.ok()) {
        return ResultMessage::failure(job_id, language, status::piston_http_error(resp.status_code),
                                      resp.body,
                                      "Execution engine returned HTTP " +
                                      std::to_string(resp.status_code));
    }
    return interpret_response(job_id, language, version, resp.body);
}

ResultMessage TaskProcessor::interpret_response(const std::string& job_id, const std::string& language,
                                                const std::string& version, const std::string& body) {
    Json::Value root;
    std::string errors;
    if (!parse_json(body, root, &errors) || !root.isObject()) {
        return ResultMessage::failure(job_id, language, status::PISTON_RESPONSE_ERROR,
                                      errors.empty() ? "Response is not a JSON object" : errors,
                                      "Invalid response from execution engine");
    }

    const Json::Value& run = root["run"];
    const Json::Value& compile = root["compile"];

    ResultMessage result;
    result.job_id = job_id;
    result.language = string_field(root, "language").value_or(language);
    result.version = string_field(root, "version").value_or(version);
    result.stdout_text = string_field(run, "stdout");
    result.stderr_text = string_field(run, "stderr");
    result.compile_output = string_field(compile, "output");
    result.compile_stderr = string_field(compile, "stderr");

    bool exited_cleanly = run.isObject() && run["code"].isIntegral() && run["code"].asInt64() == 0;
    result.status = exited_cleanly ? status::SUCCESS : status::ERROR;

    if (auto signal = non_empty(string_field(run, "signal"))) {
        result.message = signal;
    } else if (non_empty(result.compile_stderr)) {
        result.message = result.compile_stderr;
    } else if (non_empty(result.stderr_text)) {
        result.message = result.stderr_text;
    }
    result.fail = false;
    return result;
}

// ============================================================================
// Feeder
// ============================================================================

Feeder::Feeder(const FeederConfig& config, const TaskProcessor& processor)
    : config_(config), processor_(processor) {}

void Feeder::handle_delivery(const TaskProcessor& processor, MessagePublisher& publisher,
                             DeliveryAcknowledger& acker, const std::string& results_queue,
                             const Delivery& delivery) {
    ResultMessage result = processor.process(delivery.body);
    const std::string job = result.job_id.value_or("<unknown>");

    try {
        publisher.publish(results_queue, result.to_json());
    } catch (const std::exception& e) {
        std::cerr << "[Feeder] Job " << job << ": result publish failed (" << e.what()
                  << "), requeueing task" << std::endl;
        try {
            acker.reject(delivery.delivery_tag, true);
        } catch (const std::exception& reject_error) {
            std::cerr << "[Feeder] Job " << job << ": reject failed (" << reject_error.what()
                      << "), broker will redeliver on reconnect" << std::endl;
        }
        return;
    }

    try {
        acker.ack(delivery.delivery_tag);
    } catch (const std::exception& e) {
        std::cerr << "[Feeder] Job " << job << ": ack failed (" << e.what()
                  << "), task may be redelivered" << std::endl;
    }
}

int Feeder::run(const std::atomic<bool>& stop) {
    const BrokerConfig& broker = config_.broker;
    AmqpConnection connection(broker);
    try {
        retry_with_backoff("Feeder", "Broker connection", broker.connect_attempts,
                           [&] { connection.open(); }, &stop);
    } catch (const std::exception& e) {
        std::cerr << "❌ Cannot connect to broker: " << e.what() << std::endl;
        return 1;
    }

    std::unique_ptr<AmqpChannel> consumer;
    std::unique_ptr<AmqpChannel> publisher;
    try {
        consumer = connection.open_channel();
        publisher = connection.open_channel();
        consumer->declare_queue(broker.task_queue, true);
        consumer->declare_queue(broker.results_queue, true);
        consumer->set_prefetch(static_cast<uint16_t>(config_.prefetch_count));
        publisher->enable_confirms();
        consumer->consume(broker.task_queue);
    } catch (const AmqpError& e) {
        std::cerr << "❌ Broker setup failed: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "[Feeder] Consuming '" << broker.task_queue << "' (prefetch "
              << config_.prefetch_count << "), results to '" << broker.results_queue << "'"
              << std::endl;

    std::mutex workers_mutex;
    std::condition_variable workers_cv;
    int active_workers = 0;
    int exit_code = 0;

    while (!stop) {
        std::optional<Delivery> delivery;
        try {
            delivery = consumer->next_delivery(std::chrono::milliseconds(500));
        } catch (const AmqpError& e) {
            std::cerr << "[Feeder] Broker connection lost: " << e.what() << std::endl;
            exit_code = 1;
            break;
        }
        if (!delivery) continue;

        {
            std::lock_guard<std::mutex> lock(workers_mutex);
            ++active_workers;
        }
        // The prefetch grant bounds how many of these run at once
        std::thread([&, task = std::move(*delivery)]() {
            handle_delivery(processor_, *publisher, *consumer, broker.results_queue, task);
            std::lock_guard<std::mutex> lock(workers_mutex);
            --active_workers;
            workers_cv.notify_all();
        }).detach();
    }

    std::unique_lock<std::mutex> lock(workers_mutex);
    if (active_workers > 0) {
        std::cout << "[Feeder] Waiting for " << active_workers << " in-flight task(s)" << std::endl;
    }
    workers_cv.wait(lock, [&] { return active_workers == 0; });
    return exit_code;
}

// ============================================================================
// Runtime loading
// ============================================================================

RuntimeRegistry load_runtimes(ExecutionEngine& engine, int attempts) {
    std::vector<RuntimeInfo> runtimes;
    retry_with_backoff("Runtimes", "Fetching runtimes", attempts, [&] {
        runtimes = engine.runtimes(std::chrono::milliseconds(RUNTIME_FETCH_TIMEOUT_MS));
    });

    RuntimeRegistry registry(runtimes);
    std::cout << "[Runtimes] Loaded " << runtimes.size() << " runtimes (" << registry.size()
              << " names)" << std::endl;
    if (registry.empty()) {
        std::cerr << "[Runtimes] Engine reports no runtimes; every task will be unsupported"
                  << std::endl;
    }
    return registry;
}

} // namespace flagrun
