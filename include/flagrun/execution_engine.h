#pragma once

#include "flagrun/http_client.h"
#include "flagrun/runtime_registry.h"

#include <chrono>
#include <string>
#include <vector>

namespace flagrun {

// Sandboxed code execution service (Piston API v2)
class ExecutionEngine {
public:
    virtual ~ExecutionEngine() = default;

    // GET /runtimes. Throws HttpTimeoutError, HttpConnectionError or
    // std::runtime_error for a non-2xx status or an unreadable list.
    virtual std::vector<RuntimeInfo> runtimes(std::chrono::milliseconds timeout) = 0;

    // POST /execute. Any HTTP status is returned as-is; only transport
    // failures throw (HttpTimeoutError, HttpConnectionError).
    virtual HttpClientResponse execute(const std::string& request_json,
                                       std::chrono::milliseconds timeout) = 0;
};

} // namespace flagrun
