#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace flagrun {

// Raised for any settings token that cannot be trusted: malformed base64,
// unknown version, HMAC mismatch, bad padding or expired timestamp.
class InvalidTokenError : public std::runtime_error {
public:
    explicit InvalidTokenError(const std::string& message)
        : std::runtime_error(message) {}
};

// Fernet authenticated encryption (AES-128-CBC + HMAC-SHA256).
// Tokens are interchangeable with the `cryptography` package's Fernet.
class FernetCipher {
public:
    // key: URL-safe base64 of 32 bytes. Throws std::invalid_argument.
    explicit FernetCipher(const std::string& key);

    std::string encrypt(const std::string& plaintext) const;
    std::string encrypt_at(const std::string& plaintext, int64_t timestamp) const;

    // ttl_seconds <= 0 disables the expiry check.
    std::string decrypt(const std::string& token, int ttl_seconds = 0) const;
    std::string decrypt_at(const std::string& token, int ttl_seconds, int64_t now) const;

    // New random key, URL-safe base64 encoded
    static std::string generate_key();

private:
    std::vector<unsigned char> signing_key_;     // 16 bytes
    std::vector<unsigned char> encryption_key_;  // 16 bytes
};

// Flag: lowercase hex of HMAC-SHA256(key, data)
std::string generate_flag(const std::string& key, const std::string& data);

// Random HMAC key (32 bytes), URL-safe base64 encoded
std::string generate_hmac_key();

// Random RFC 4122 version 4 UUID
std::string random_uuid();

// Helpers
std::string base64url_encode(const unsigned char* data, size_t len);
std::vector<unsigned char> base64url_decode(const std::string& encoded);  // throws InvalidTokenError
std::string bytes_to_hex(const unsigned char* data, size_t len);
std::vector<unsigned char> random_bytes(size_t len);

} // namespace flagrun
