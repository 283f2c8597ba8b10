#pragma once

#include "flagrun/settings.h"

#include <optional>
#include <stdexcept>
#include <string>

namespace Json {
class Value;
}

namespace flagrun {

// Result statuses reported by the feeder
namespace status {
constexpr const char* SUCCESS = "success";
constexpr const char* ERROR = "error";
constexpr const char* UNSUPPORTED_LANGUAGE = "unsupported_language";
constexpr const char* PISTON_TIMEOUT = "piston_timeout";
constexpr const char* PISTON_CONNECTION_ERROR = "piston_connection_error";
constexpr const char* PISTON_RATE_LIMITED = "piston_rate_limited";
constexpr const char* PISTON_API_ERROR_RETRY = "piston_api_error_retry";
constexpr const char* PISTON_RESPONSE_ERROR = "piston_response_error";
constexpr const char* FEEDER_ERROR = "feeder_error";
constexpr const char* FEEDER_PROCESSING_ERROR = "feeder_processing_error";

// "piston_http_error_<code>"
std::string piston_http_error(int http_status);
}

class MessageFormatError : public std::runtime_error {
public:
    explicit MessageFormatError(const std::string& message)
        : std::runtime_error(message) {}
};

// Scheduler -> feeder
struct TaskMessage {
    std::string job_id;
    std::string code;
    std::string language;
    ExecutionOverrides overrides;

    std::string to_json() const;
};

// Feeder -> scheduler. Absent values travel as JSON null.
struct ResultMessage {
    std::optional<std::string> job_id;
    std::optional<std::string> stdout_text;
    std::optional<std::string> stderr_text;
    std::optional<std::string> compile_output;
    std::optional<std::string> compile_stderr;
    std::optional<std::string> language;
    std::optional<std::string> version;
    std::string status;
    std::optional<std::string> message;
    bool fail = false;

    std::string to_json() const;

    // Throws MessageFormatError when the body is not a JSON object
    static ResultMessage from_json(const std::string& body);

    // Typed failure result: fail=true, stderr and message set
    static ResultMessage failure(const std::optional<std::string>& job_id,
                                 const std::optional<std::string>& language,
                                 const std::string& status,
                                 const std::string& stderr_text,
                                 const std::string& message);
};

// Parse a JSON document, returns false on syntax errors
bool parse_json(const std::string& text, Json::Value& out, std::string* errors = nullptr);

// Compact single-line JSON
std::string write_json(const Json::Value& value);

} // namespace flagrun
