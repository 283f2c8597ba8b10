#include "flagrun/crypto.h"

#include <iostream>

// Prints a fresh key pair in environment-file form
int main() {
    try {
        std::cout << "ENCRYPTION_KEY=" << flagrun::FernetCipher::generate_key() << std::endl;
        std::cout << "SIGNATURE_KEY=" << flagrun::generate_hmac_key() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "❌ Key generation failed: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
