#include "flagrun/config.h"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <thread>

namespace flagrun {

std::string env_string(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return fallback;
    }
    return value;
}

int parse_int(const std::string& value, const std::string& what) {
    size_t consumed = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw ConfigError(what + " must be an integer, got '" + value + "'");
    }
    if (consumed != value.size()) {
        throw ConfigError(what + " must be an integer, got '" + value + "'");
    }
    return parsed;
}

int env_int(const char* name, int fallback) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return fallback;
    }
    return parse_int(value, name);
}

BrokerConfig BrokerConfig::from_env() {
    BrokerConfig config;
    config.host = env_string("RABBITMQ_HOST", config.host);
    config.port = env_int("RABBITMQ_PORT", config.port);
    config.user = env_string("RABBITMQ_USER", config.user);
    config.password = env_string("RABBITMQ_PASSWORD", config.password);
    config.vhost = env_string("RABBITMQ_VHOST", config.vhost);
    config.heartbeat_seconds = env_int("RABBITMQ_HEARTBEAT", config.heartbeat_seconds);
    config.task_queue = env_string("TASK_QUEUE", config.task_queue);
    config.results_queue = env_string("RESULTS_QUEUE", config.results_queue);

    if (config.port <= 0 || config.port > 65535) {
        throw ConfigError("RABBITMQ_PORT out of range: " + std::to_string(config.port));
    }
    if (config.heartbeat_seconds < 0) {
        throw ConfigError("RABBITMQ_HEARTBEAT must not be negative");
    }
    return config;
}

SchedulerConfig SchedulerConfig::from_env() {
    SchedulerConfig config;
    config.broker = BrokerConfig::from_env();
    config.broker.connect_attempts = SCHEDULER_CONNECT_ATTEMPTS;
    config.port = env_int("SCHEDULER_PORT", config.port);
    config.execution_timeout_seconds = env_int("EXECUTION_TIMEOUT", config.execution_timeout_seconds);
    config.encryption_key = env_string("ENCRYPTION_KEY", "");
    config.signature_key = env_string("SIGNATURE_KEY", "");
    config.settings_ttl_seconds = env_int("SETTINGS_TOKEN_TTL", config.settings_ttl_seconds);

    if (config.execution_timeout_seconds <= 0) {
        throw ConfigError("EXECUTION_TIMEOUT must be positive");
    }
    return config;
}

FeederConfig FeederConfig::from_env() {
    FeederConfig config;
    config.broker = BrokerConfig::from_env();
    config.broker.connect_attempts = FEEDER_CONNECT_ATTEMPTS;
    config.piston_url = env_string("PISTON_URL", config.piston_url);
    config.default_memory_limit_mb = env_int("DEFAULT_MEMORY_LIMIT", config.default_memory_limit_mb);
    config.default_compile_timeout_ms = env_int("DEFAULT_COMPILE_TIMEOUT", config.default_compile_timeout_ms);
    config.default_run_timeout_ms = env_int("DEFAULT_RUN_TIMEOUT", config.default_run_timeout_ms);
    config.prefetch_count = env_int("PREFETCH_COUNT", config.prefetch_count);

    if (config.prefetch_count <= 0 || config.prefetch_count > 65535) {
        throw ConfigError("PREFETCH_COUNT must be between 1 and 65535");
    }
    return config;
}

std::chrono::milliseconds backoff_delay(int attempt, int base_ms, int max_ms) {
    long long delay = base_ms;
    for (int i = 1; i < attempt && delay < max_ms; ++i) {
        delay *= 2;
    }
    return std::chrono::milliseconds(std::min<long long>(delay, max_ms));
}

void retry_with_backoff(const std::string& tag, const std::string& what, int attempts,
                        const std::function<void()>& action,
                        const std::atomic<bool>* stop) {
    for (int attempt = 1;; ++attempt) {
        try {
            action();
            return;
        } catch (const std::exception& e) {
            bool exhausted = attempts > 0 && attempt >= attempts;
            bool stopping = stop != nullptr && stop->load();
            if (exhausted || stopping) {
                std::cerr << "[" << tag << "] " << what << " failed after " << attempt
                          << " attempt(s): " << e.what() << std::endl;
                throw;
            }

            auto delay = backoff_delay(attempt);
            std::cerr << "[" << tag << "] " << what << " failed (attempt " << attempt;
            if (attempts > 0) std::cerr << "/" << attempts;
            std::cerr << "): " << e.what() << "; retrying in " << delay.count() << "ms"
                      << std::endl;

            // Sleep in slices so shutdown is not held up by a long backoff
            auto until = std::chrono::steady_clock::now() + delay;
            while (std::chrono::steady_clock::now() < until) {
                if (stop != nullptr && stop->load()) break;
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
        }
    }
}

} // namespace flagrun
