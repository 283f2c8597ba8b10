#pragma once

#include "flagrun/constants.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <stdexcept>
#include <string>

namespace flagrun {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

// RabbitMQ connection and queue names, shared by both services
struct BrokerConfig {
    std::string host = "127.0.0.1";
    int port = DEFAULT_AMQP_PORT;
    std::string user = "guest";
    std::string password = "guest";
    std::string vhost = "/";
    int heartbeat_seconds = DEFAULT_AMQP_HEARTBEAT_SECONDS;
    std::string task_queue = "execution_tasks";
    std::string results_queue = "execution_results";
    int connect_attempts = SCHEDULER_CONNECT_ATTEMPTS;

    static BrokerConfig from_env();
};

struct SchedulerConfig {
    BrokerConfig broker;
    int port = DEFAULT_SCHEDULER_PORT;
    int execution_timeout_seconds = DEFAULT_EXECUTION_TIMEOUT_SECONDS;
    std::string encryption_key;   // Fernet key, empty when unset
    std::string signature_key;    // HMAC key, empty when unset
    int settings_ttl_seconds = 0; // 0 = tokens never expire

    static SchedulerConfig from_env();
};

struct FeederConfig {
    BrokerConfig broker;
    std::string piston_url = "http://127.0.0.1:2000/api/v2";
    int default_memory_limit_mb = DEFAULT_MEMORY_LIMIT_MB;
    int default_compile_timeout_ms = DEFAULT_COMPILE_TIMEOUT_MS;
    int default_run_timeout_ms = DEFAULT_RUN_TIMEOUT_MS;
    int prefetch_count = DEFAULT_PREFETCH_COUNT;
    int runtime_fetch_attempts = RUNTIME_FETCH_ATTEMPTS;

    static FeederConfig from_env();
};

// Environment lookups. Throw ConfigError when a set value is not an integer.
std::string env_string(const char* name, const std::string& fallback);
int env_int(const char* name, int fallback);

// Parse a whole string as an int, throws ConfigError naming `what`
int parse_int(const std::string& value, const std::string& what);

// base * 2^(attempt-1), capped
std::chrono::milliseconds backoff_delay(int attempt, int base_ms = RECONNECT_BASE_DELAY_MS,
                                        int max_ms = RECONNECT_MAX_DELAY_MS);

// Calls `action` until it succeeds, sleeping backoff_delay() between failed
// attempts. Rethrows the last failure once `attempts` are used up (attempts
// <= 0 retries forever). Gives up early, rethrowing, once `stop` is set.
void retry_with_backoff(const std::string& tag, const std::string& what, int attempts,
                        const std::function<void()>& action,
                        const std::atomic<bool>* stop = nullptr);

} // namespace flagrun
