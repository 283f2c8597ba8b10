#include "flagrun/piston_client.h"

#include <stdexcept>

namespace flagrun {

PistonClient::PistonClient(const std::string& base_url) : http_(base_url) {}

std::vector<RuntimeInfo> PistonClient::runtimes(std::chrono::milliseconds timeout) {
    HttpClientResponse resp = http_.get("/runtimes", timeout);
    if (!resp.ok()) {
        throw std::runtime_error("GET /runtimes returned HTTP " + std::to_string(resp.status_code));
    }
    return RuntimeRegistry::parse_runtimes(resp.body);
}

HttpClientResponse PistonClient::execute(const std::string& request_json,
                                         std::chrono::milliseconds timeout) {
    return http_.post_json("/execute", request_json, timeout);
}

} // namespace flagrun
