/**
 * Unit tests for encrypted execution settings
 */

#include <gtest/gtest.h>
#include "flagrun/crypto.h"
#include "flagrun/settings.h"

#include <ctime>

using namespace flagrun;

class SettingsTest : public ::testing::Test {
protected:
    FernetCipher cipher{FernetCipher::generate_key()};

    SettingsError::Kind failure_kind(const std::string& token) {
        try {
            decrypt_settings(cipher, token);
        } catch (const SettingsError& e) {
            return e.kind();
        }
        ADD_FAILURE() << "expected SettingsError";
        return SettingsError::Kind::INVALID_TOKEN;
    }
};

// ============================================================================
// Test Contract: Recognized Fields
// ============================================================================

TEST_F(SettingsTest, ExtractsAllRecognizedFields) {
    // Given: A token carrying every override
    std::string token = cipher.encrypt(
        "{\"memory_limit\":256,\"compile_timeout\":5000,\"run_timeout\":3000}");

    // When: Decrypted
    ExecutionOverrides overrides = decrypt_settings(cipher, token);

    // Then: Each field is recovered exactly
    EXPECT_EQ(overrides.memory_limit, 256);
    EXPECT_EQ(overrides.compile_timeout, 5000);
    EXPECT_EQ(overrides.run_timeout, 3000);
}

TEST_F(SettingsTest, IgnoresUnknownFields) {
    std::string token = cipher.encrypt("{\"memory_limit\":512,\"admin\":true,\"flag\":\"x\"}");

    ExecutionOverrides overrides = decrypt_settings(cipher, token);

    EXPECT_EQ(overrides.memory_limit, 512);
    EXPECT_FALSE(overrides.compile_timeout.has_value());
    EXPECT_FALSE(overrides.run_timeout.has_value());
}

TEST_F(SettingsTest, TruncatesFractionalValues) {
    ExecutionOverrides overrides = parse_settings("{\"run_timeout\":2500.9,\"memory_limit\":-1}");

    EXPECT_EQ(overrides.run_timeout, 2500);
    EXPECT_EQ(overrides.memory_limit, -1);
}

TEST_F(SettingsTest, IgnoresNonNumericValues) {
    ExecutionOverrides overrides = parse_settings(
        "{\"memory_limit\":\"512\",\"compile_timeout\":true,\"run_timeout\":null}");

    EXPECT_TRUE(overrides.empty());
}

TEST_F(SettingsTest, IgnoresOutOfRangeValues) {
    ExecutionOverrides overrides = parse_settings("{\"run_timeout\":1e300}");
    EXPECT_FALSE(overrides.run_timeout.has_value());
}

TEST_F(SettingsTest, EmptyObjectYieldsNoOverrides) {
    EXPECT_TRUE(decrypt_settings(cipher, cipher.encrypt("{}")).empty());
}

// ============================================================================
// Test Contract: Failure Modes
// ============================================================================

TEST_F(SettingsTest, InvalidTokenIsReported) {
    EXPECT_EQ(failure_kind("garbage"), SettingsError::Kind::INVALID_TOKEN);

    FernetCipher other(FernetCipher::generate_key());
    EXPECT_EQ(failure_kind(other.encrypt("{}")), SettingsError::Kind::INVALID_TOKEN);
}

TEST_F(SettingsTest, NonJsonPayloadIsReported) {
    EXPECT_EQ(failure_kind(cipher.encrypt("memory_limit=512")), SettingsError::Kind::INVALID_JSON);
}

TEST_F(SettingsTest, NonObjectPayloadIsReported) {
    EXPECT_EQ(failure_kind(cipher.encrypt("[1,2,3]")), SettingsError::Kind::NOT_AN_OBJECT);
    EXPECT_EQ(failure_kind(cipher.encrypt("42")), SettingsError::Kind::NOT_AN_OBJECT);
}

TEST_F(SettingsTest, ExpiredTokenIsInvalid) {
    // Issued an hour ago, accepted for one minute
    std::string token = cipher.encrypt_at("{}", static_cast<int64_t>(std::time(nullptr)) - 3600);
    EXPECT_THROW(decrypt_settings(cipher, token, 60), SettingsError);
    EXPECT_NO_THROW(decrypt_settings(cipher, token, 0));
}
