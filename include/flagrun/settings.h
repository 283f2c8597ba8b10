#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace flagrun {

class FernetCipher;

// Per-job overrides carried in an encrypted settings token.
// Unset fields are left out of the task so the feeder applies its defaults.
struct ExecutionOverrides {
    std::optional<int> memory_limit;     // MB, -1 = unlimited
    std::optional<int> compile_timeout;  // ms
    std::optional<int> run_timeout;      // ms

    bool empty() const {
        return !memory_limit && !compile_timeout && !run_timeout;
    }
};

class SettingsError : public std::runtime_error {
public:
    enum class Kind {
        INVALID_TOKEN,   // decryption rejected the token
        INVALID_JSON,    // plaintext is not JSON
        NOT_AN_OBJECT    // plaintext is JSON but not an object
    };

    SettingsError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

// Parse decrypted settings JSON. Only numeric memory_limit, compile_timeout
// and run_timeout are taken; everything else is ignored.
ExecutionOverrides parse_settings(const std::string& plaintext);

// Decrypt then parse. Throws SettingsError.
ExecutionOverrides decrypt_settings(const FernetCipher& cipher,
                                    const std::string& token,
                                    int ttl_seconds = 0);

} // namespace flagrun
