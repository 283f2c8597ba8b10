#include "flagrun/config.h"
#include "flagrun/http_client.h"
#include "flagrun/messages.h"

#include <json/json.h>

#include <fstream>
#include <iostream>
#include <sstream>

namespace {

bool read_file(const std::string& path, std::string& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return false;
    std::stringstream buffer;
    buffer << file.rdbuf();
    out = buffer.str();
    return true;
}

void replace_all(std::string& text, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

} // namespace

// Submits a solution with its input spliced in at {{INPUT}} and prints the flag
int main(int argc, char* argv[]) {
    if (argc != 4) {
        std::cerr << "Usage: " << argv[0] << " <language> <code_file> <input_file>" << std::endl;
        return 1;
    }

    std::string code;
    std::string input;
    if (!read_file(argv[2], code)) {
        std::cerr << "❌ Cannot read " << argv[2] << std::endl;
        return 1;
    }
    if (!read_file(argv[3], input)) {
        std::cerr << "❌ Cannot read " << argv[3] << std::endl;
        return 1;
    }
    replace_all(code, "{{INPUT}}", input);

    Json::Value request;
    request["language"] = argv[1];
    request["code"] = code;
    std::string settings = flagrun::env_string("SETTINGS", "");
    if (!settings.empty()) {
        request["settings"] = settings;
    }

    // SCHEDULER_URL names the endpoint itself; split it into base and path
    std::string url = flagrun::env_string("SCHEDULER_URL", "http://127.0.0.1:8001/submit");
    try {
        flagrun::Url parsed = flagrun::Url::parse(url);
        std::string base = "http://" + parsed.host + ":" + std::to_string(parsed.port);
        std::string path = parsed.path.empty() ? "/submit" : parsed.path;

        flagrun::HttpClient client(base);
        // Scheduler waits up to its execution timeout; leave room on top
        auto resp = client.post_json(path, flagrun::write_json(request), std::chrono::seconds(90));

        Json::Value body;
        bool parsed_body = flagrun::parse_json(resp.body, body) && body.isObject();
        if (resp.ok() && parsed_body && body["flag"].isString()) {
            std::cout << body["flag"].asString() << std::endl;
            return 0;
        }

        std::string detail = parsed_body && body["detail"].isString() ? body["detail"].asString()
                                                                      : resp.body;
        std::cerr << "❌ HTTP " << resp.status_code << ": " << detail << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "❌ " << e.what() << std::endl;
        return 1;
    }
}
