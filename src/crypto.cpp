#include "flagrun/crypto.h"
#include "flagrun/constants.h"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <ctime>
#include <iomanip>
#include <memory>
#include <sstream>

namespace flagrun {

namespace {

constexpr unsigned char FERNET_VERSION = 0x80;
constexpr size_t FERNET_KEY_SIZE = 32;
constexpr size_t AES_BLOCK = 16;
constexpr size_t TIMESTAMP_SIZE = 8;
constexpr size_t HMAC_SIZE = SHA256_DIGEST_LENGTH;
constexpr size_t TOKEN_OVERHEAD = 1 + TIMESTAMP_SIZE + AES_BLOCK + HMAC_SIZE;

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

std::vector<unsigned char> hmac_sha256(const std::vector<unsigned char>& key,
                                       const unsigned char* data, size_t len) {
    // HMAC() rejects a null key pointer even when the length is zero
    static const unsigned char empty_key = 0;
    const unsigned char* key_ptr = key.empty() ? &empty_key : key.data();

    std::vector<unsigned char> mac(EVP_MAX_MD_SIZE);
    unsigned int mac_len = 0;
    if (!HMAC(EVP_sha256(), key_ptr, static_cast<int>(key.size()),
              data, len, mac.data(), &mac_len)) {
        throw std::runtime_error("HMAC-SHA256 failed");
    }
    mac.resize(mac_len);
    return mac;
}

} // namespace

std::string base64url_encode(const unsigned char* data, size_t len) {
    if (len == 0) return "";

    std::string out(4 * ((len + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data,
                                  static_cast<int>(len));
    out.resize(written);

    for (auto& c : out) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    return out;
}

std::vector<unsigned char> base64url_decode(const std::string& encoded) {
    std::string std_b64;
    std_b64.reserve(encoded.size() + 3);
    for (char c : encoded) {
        if (c == '+' || c == '/') {
            throw InvalidTokenError("Token is not URL-safe base64");
        }
        if (c == '-') std_b64 += '+';
        else if (c == '_') std_b64 += '/';
        else std_b64 += c;
    }
    while (std_b64.size() % 4 != 0) std_b64 += '=';
    if (std_b64.empty()) return {};

    size_t padding = 0;
    if (std_b64[std_b64.size() - 1] == '=') padding++;
    if (std_b64[std_b64.size() - 2] == '=') padding++;

    std::vector<unsigned char> out(3 * (std_b64.size() / 4));
    int decoded = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(std_b64.data()),
                                  static_cast<int>(std_b64.size()));
    if (decoded < 0 || static_cast<size_t>(decoded) < padding) {
        throw InvalidTokenError("Token is not valid base64");
    }
    out.resize(decoded - padding);
    return out;
}

std::string bytes_to_hex(const unsigned char* data, size_t len) {
    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        ss << std::setw(2) << static_cast<int>(data[i]);
    }
    return ss.str();
}

std::vector<unsigned char> random_bytes(size_t len) {
    std::vector<unsigned char> out(len);
    if (len > 0 && RAND_bytes(out.data(), static_cast<int>(len)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return out;
}

FernetCipher::FernetCipher(const std::string& key) {
    std::vector<unsigned char> raw;
    try {
        raw = base64url_decode(key);
    } catch (const InvalidTokenError&) {
        throw std::invalid_argument("Fernet key must be URL-safe base64");
    }
    if (raw.size() != FERNET_KEY_SIZE) {
        throw std::invalid_argument("Fernet key must decode to 32 bytes");
    }
    signing_key_.assign(raw.begin(), raw.begin() + 16);
    encryption_key_.assign(raw.begin() + 16, raw.end());
}

std::string FernetCipher::generate_key() {
    auto raw = random_bytes(FERNET_KEY_SIZE);
    return base64url_encode(raw.data(), raw.size());
}

std::string FernetCipher::encrypt(const std::string& plaintext) const {
    return encrypt_at(plaintext, static_cast<int64_t>(std::time(nullptr)));
}

std::string FernetCipher::encrypt_at(const std::string& plaintext, int64_t timestamp) const {
    auto iv = random_bytes(AES_BLOCK);

    CipherCtx ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    if (!ctx) throw std::runtime_error("EVP_CIPHER_CTX_new failed");

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_128_cbc(), nullptr,
                           encryption_key_.data(), iv.data()) != 1) {
        throw std::runtime_error("AES init failed");
    }

    std::vector<unsigned char> ciphertext(plaintext.size() + AES_BLOCK);
    int len = 0;
    int total = 0;
    if (EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &len,
                          reinterpret_cast<const unsigned char*>(plaintext.data()),
                          static_cast<int>(plaintext.size())) != 1) {
        throw std::runtime_error("AES encrypt failed");
    }
    total = len;
    if (EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + total, &len) != 1) {
        throw std::runtime_error("AES finalize failed");
    }
    total += len;
    ciphertext.resize(total);

    std::vector<unsigned char> token;
    token.reserve(TOKEN_OVERHEAD + ciphertext.size());
    token.push_back(FERNET_VERSION);
    uint64_t ts = static_cast<uint64_t>(timestamp);
    for (int i = 7; i >= 0; --i) {
        token.push_back(static_cast<unsigned char>((ts >> (i * 8)) & 0xFF));
    }
    token.insert(token.end(), iv.begin(), iv.end());
    token.insert(token.end(), ciphertext.begin(), ciphertext.end());

    auto mac = hmac_sha256(signing_key_, token.data(), token.size());
    token.insert(token.end(), mac.begin(), mac.end());

    return base64url_encode(token.data(), token.size());
}

std::string FernetCipher::decrypt(const std::string& token, int ttl_seconds) const {
    return decrypt_at(token, ttl_seconds, static_cast<int64_t>(std::time(nullptr)));
}

std::string FernetCipher::decrypt_at(const std::string& token, int ttl_seconds, int64_t now) const {
    auto data = base64url_decode(token);

    if (data.size() < TOKEN_OVERHEAD || data[0] != FERNET_VERSION) {
        throw InvalidTokenError("Malformed settings token");
    }

    uint64_t ts = 0;
    for (size_t i = 1; i <= TIMESTAMP_SIZE; ++i) {
        ts = (ts << 8) | data[i];
    }
    int64_t timestamp = static_cast<int64_t>(ts);

    if (ttl_seconds > 0) {
        if (timestamp + ttl_seconds < now) {
            throw InvalidTokenError("Settings token expired");
        }
        if (now + FERNET_MAX_CLOCK_SKEW_SECONDS < timestamp) {
            throw InvalidTokenError("Settings token timestamp is in the future");
        }
    }

    size_t signed_len = data.size() - HMAC_SIZE;
    auto expected = hmac_sha256(signing_key_, data.data(), signed_len);
    if (CRYPTO_memcmp(expected.data(), data.data() + signed_len, HMAC_SIZE) != 0) {
        throw InvalidTokenError("Settings token signature mismatch");
    }

    const unsigned char* iv = data.data() + 1 + TIMESTAMP_SIZE;
    const unsigned char* ciphertext = iv + AES_BLOCK;
    size_t ciphertext_len = signed_len - 1 - TIMESTAMP_SIZE - AES_BLOCK;
    if (ciphertext_len == 0 || ciphertext_len % AES_BLOCK != 0) {
        throw InvalidTokenError("Malformed settings token");
    }

    CipherCtx ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    if (!ctx) throw std::runtime_error("EVP_CIPHER_CTX_new failed");

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_128_cbc(), nullptr,
                           encryption_key_.data(), iv) != 1) {
        throw std::runtime_error("AES init failed");
    }

    std::vector<unsigned char> plaintext(ciphertext_len + AES_BLOCK);
    int len = 0;
    int total = 0;
    if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len, ciphertext,
                          static_cast<int>(ciphertext_len)) != 1) {
        throw InvalidTokenError("Settings token could not be decrypted");
    }
    total = len;
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + total, &len) != 1) {
        throw InvalidTokenError("Settings token has invalid padding");
    }
    total += len;

    return std::string(reinterpret_cast<const char*>(plaintext.data()), total);
}

std::string generate_flag(const std::string& key, const std::string& data) {
    std::vector<unsigned char> key_bytes(key.begin(), key.end());
    auto mac = hmac_sha256(key_bytes,
                           reinterpret_cast<const unsigned char*>(data.data()),
                           data.size());
    return bytes_to_hex(mac.data(), mac.size());
}

std::string generate_hmac_key() {
    auto raw = random_bytes(32);
    return base64url_encode(raw.data(), raw.size());
}

std::string random_uuid() {
    auto b = random_bytes(16);
    b[6] = (b[6] & 0x0F) | 0x40;  // version 4
    b[8] = (b[8] & 0x3F) | 0x80;  // RFC 4122 variant

    std::string hex = bytes_to_hex(b.data(), b.size());
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

} // namespace flagrun
