#pragma once

#include <cstddef>  // for size_t

namespace flagrun {

// Execution defaults (feeder)
constexpr int DEFAULT_MEMORY_LIMIT_MB = -1;                      // -1 = unlimited
constexpr int DEFAULT_COMPILE_TIMEOUT_MS = 10000;                // 10 seconds
constexpr int DEFAULT_RUN_TIMEOUT_MS = 10000;                    // 10 seconds
constexpr int ENGINE_TIMEOUT_MARGIN_MS = 10000;                  // Added to compile+run timeout
constexpr size_t BYTES_PER_MB = 1024 * 1024;

// Rate limiting by the execution engine (HTTP 429)
constexpr int MAX_RATE_LIMIT_RETRIES = 10;                       // Retries after the first 429
constexpr int RATE_LIMIT_BACKOFF_STEP_MS = 1000;                 // attempt * step

// Feeder startup
constexpr int RUNTIME_FETCH_ATTEMPTS = 5;
constexpr int RUNTIME_FETCH_TIMEOUT_MS = 10000;
constexpr int DEFAULT_PREFETCH_COUNT = 5;                        // Concurrent in-flight tasks

// Scheduler
constexpr int DEFAULT_EXECUTION_TIMEOUT_SECONDS = 60;            // Wait for a result
constexpr int DEFAULT_SCHEDULER_PORT = 8001;

// Broker
constexpr int DEFAULT_AMQP_PORT = 5672;
constexpr int DEFAULT_AMQP_HEARTBEAT_SECONDS = 30;
constexpr int SCHEDULER_CONNECT_ATTEMPTS = 10;
constexpr int FEEDER_CONNECT_ATTEMPTS = 5;
constexpr int RECONNECT_BASE_DELAY_MS = 1000;                    // Doubles per attempt
constexpr int RECONNECT_MAX_DELAY_MS = 30000;                    // Backoff cap
constexpr int AMQP_RPC_TIMEOUT_MS = 10000;                       // Wait for a method reply
constexpr size_t AMQP_DEFAULT_FRAME_MAX = 131072;

// Settings tokens
constexpr int FERNET_MAX_CLOCK_SKEW_SECONDS = 60;

// Buffer sizes
constexpr size_t PIPE_BUFFER_SIZE = 4096;                        // Read buffer size
constexpr size_t INITIAL_HTTP_BUFFER = 8192;                     // Initial HTTP buffer
constexpr size_t MAX_REQUEST_SIZE = 10 * 1024 * 1024;            // 10MB max request
constexpr size_t MAX_RESPONSE_SIZE = 64 * 1024 * 1024;           // 64MB max engine response

// Network
constexpr int LISTEN_BACKLOG = 64;                               // Socket listen backlog

} // namespace flagrun
