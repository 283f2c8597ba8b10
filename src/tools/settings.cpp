#include "flagrun/config.h"
#include "flagrun/crypto.h"
#include "flagrun/messages.h"

#include <json/json.h>

#include <iostream>

// Encrypts a settings object for the `settings` field of POST /submit
int main(int argc, char* argv[]) {
    if (argc > 2) {
        std::cerr << "Usage: " << argv[0] << " [json-object]" << std::endl;
        return 1;
    }
    std::string settings = argc == 2 ? argv[1] : "{\"memory_limit\":512}";

    Json::Value parsed;
    std::string errors;
    if (!flagrun::parse_json(settings, parsed, &errors) || !parsed.isObject()) {
        std::cerr << "❌ Settings must be a JSON object" << (errors.empty() ? "" : ": " + errors)
                  << std::endl;
        return 1;
    }

    std::string key = flagrun::env_string("ENCRYPTION_KEY", "");
    if (key.empty()) {
        std::cerr << "❌ ENCRYPTION_KEY is not set" << std::endl;
        return 1;
    }

    try {
        flagrun::FernetCipher cipher(key);
        std::cout << cipher.encrypt(flagrun::write_json(parsed)) << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "❌ " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
