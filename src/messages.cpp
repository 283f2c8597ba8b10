#include "flagrun/messages.h"

#include <json/json.h>

#include <sstream>

namespace flagrun {

std::string status::piston_http_error(int http_status) {
    return "piston_http_error_" + std::to_string(http_status);
}

namespace {

Json::Value nullable(const std::optional<std::string>& value) {
    return value ? Json::Value(*value) : Json::Value(Json::nullValue);
}

std::optional<std::string> optional_string(const Json::Value& root, const char* name) {
    const Json::Value& value = root[name];
    if (value.isNull()) return std::nullopt;
    if (value.isString()) return value.asString();
    // Numbers and booleans are kept in their JSON spelling
    return write_json(value);
}

} // namespace

bool parse_json(const std::string& text, Json::Value& out, std::string* errors) {
    Json::CharReaderBuilder builder;
    std::string errs;
    std::istringstream stream(text);
    bool ok = Json::parseFromStream(builder, stream, &out, &errs);
    if (!ok && errors) *errors = errs;
    return ok;
}

std::string write_json(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

std::string TaskMessage::to_json() const {
    Json::Value json;
    json["job_id"] = job_id;
    json["code"] = code;
    json["language"] = language;
    if (overrides.memory_limit) json["memory_limit"] = *overrides.memory_limit;
    if (overrides.compile_timeout) json["compile_timeout"] = *overrides.compile_timeout;
    if (overrides.run_timeout) json["run_timeout"] = *overrides.run_timeout;
    return write_json(json);
}

std::string ResultMessage::to_json() const {
    Json::Value json;
    json["job_id"] = nullable(job_id);
    json["stdout"] = nullable(stdout_text);
    json["stderr"] = nullable(stderr_text);
    json["compile_output"] = nullable(compile_output);
    json["compile_stderr"] = nullable(compile_stderr);
    json["language"] = nullable(language);
    json["version"] = nullable(version);
    json["status"] = status;
    json["message"] = nullable(message);
    json["fail"] = fail;
    return write_json(json);
}

ResultMessage ResultMessage::from_json(const std::string& body) {
    Json::Value json;
    std::string errors;
    if (!parse_json(body, json, &errors)) {
        throw MessageFormatError("Result is not valid JSON: " + errors);
    }
    if (!json.isObject()) {
        throw MessageFormatError("Result is not a JSON object");
    }

    ResultMessage result;
    result.job_id = optional_string(json, "job_id");
    result.stdout_text = optional_string(json, "stdout");
    result.stderr_text = optional_string(json, "stderr");
    result.compile_output = optional_string(json, "compile_output");
    result.compile_stderr = optional_string(json, "compile_stderr");
    result.language = optional_string(json, "language");
    result.version = optional_string(json, "version");
    result.status = json["status"].isString() ? json["status"].asString() : "";
    result.message = optional_string(json, "message");
    result.fail = json["fail"].isBool() ? json["fail"].asBool() : false;
    return result;
}

ResultMessage ResultMessage::failure(const std::optional<std::string>& job_id,
                                     const std::optional<std::string>& language,
                                     const std::string& status,
                                     const std::string& stderr_text,
                                     const std::string& message) {
    ResultMessage result;
    result.job_id = job_id;
    result.language = language;
    result.status = status;
    result.stderr_text = stderr_text;
    result.message = message;
    result.fail = true;
    return result;
}

} // namespace flagrun
