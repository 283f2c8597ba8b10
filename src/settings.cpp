#include "flagrun/settings.h"
#include "flagrun/crypto.h"

#include <json/json.h>

#include <cmath>
#include <limits>
#include <sstream>

namespace flagrun {

namespace {

std::optional<int> numeric_field(const Json::Value& root, const char* name) {
    if (!root.isMember(name)) return std::nullopt;

    const Json::Value& value = root[name];
    // Booleans are not numbers here even though jsoncpp converts them
    if (value.isBool() || !value.isNumeric()) return std::nullopt;

    double d = value.asDouble();
    if (!std::isfinite(d) ||
        d > static_cast<double>(std::numeric_limits<int>::max()) ||
        d < static_cast<double>(std::numeric_limits<int>::min())) {
        return std::nullopt;
    }
    return static_cast<int>(d);
}

} // namespace

ExecutionOverrides parse_settings(const std::string& plaintext) {
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream stream(plaintext);

    if (!Json::parseFromStream(builder, stream, &root, &errors)) {
        throw SettingsError(SettingsError::Kind::INVALID_JSON,
                            "Decrypted settings is not valid JSON");
    }
    if (!root.isObject()) {
        throw SettingsError(SettingsError::Kind::NOT_AN_OBJECT,
                            "Decrypted settings is not a JSON object");
    }

    ExecutionOverrides overrides;
    overrides.memory_limit = numeric_field(root, "memory_limit");
    overrides.compile_timeout = numeric_field(root, "compile_timeout");
    overrides.run_timeout = numeric_field(root, "run_timeout");
    return overrides;
}

ExecutionOverrides decrypt_settings(const FernetCipher& cipher,
                                    const std::string& token,
                                    int ttl_seconds) {
    std::string plaintext;
    try {
        plaintext = cipher.decrypt(token, ttl_seconds);
    } catch (const InvalidTokenError& e) {
        throw SettingsError(SettingsError::Kind::INVALID_TOKEN,
                            std::string("Invalid encrypted settings token: ") + e.what());
    }
    return parse_settings(plaintext);
}

} // namespace flagrun
