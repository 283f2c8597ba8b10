#pragma once

#include "flagrun/execution_engine.h"
#include "flagrun/http_client.h"

namespace flagrun {

// ExecutionEngine backed by a Piston HTTP endpoint, e.g.
// http://127.0.0.1:2000/api/v2
class PistonClient : public ExecutionEngine {
public:
    explicit PistonClient(const std::string& base_url);

    std::vector<RuntimeInfo> runtimes(std::chrono::milliseconds timeout) override;
    HttpClientResponse execute(const std::string& request_json,
                               std::chrono::milliseconds timeout) override;

private:
    HttpClient http_;
};

} // namespace flagrun
