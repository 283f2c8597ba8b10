#include "flagrun/config.h"
#include "flagrun/crypto.h"

#include <iostream>

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::cerr << "Usage: " << argv[0] << " <string>" << std::endl;
        return 1;
    }

    std::string key = flagrun::env_string("SIGNATURE_KEY", "");
    if (key.empty()) {
        std::cerr << "❌ SIGNATURE_KEY is not set" << std::endl;
        return 1;
    }

    std::cout << flagrun::generate_flag(key, argv[1]) << std::endl;
    return 0;
}
