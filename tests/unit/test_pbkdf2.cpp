#include <catch2/catch_test_macros.hpp>
#include "simhsm/crypto/pbkdf2.hpp"
#include "simhsm/crypto/sodium_interop.hpp"
#include "simhsm/models/authentication_key.hpp"
#include "simhsm/core/constants.hpp"
#include <openssl/evp.h>
#include <array>
#include <string_view>
#include <vector>
using namespace simhsm;
using namespace simhsm::crypto;
namespace {
std::span<const uint8_t> Bytes(std::string_view text) {
    return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}
}
TEST_CASE("PBKDF2 - Known answer", "[pbkdf2][crypto]") {
    // RFC 7914 section 11, PBKDF2-HMAC-SHA256("passwd", "salt", 1, 64)
    const std::array<uint8_t, 64> expected = {
        0x55, 0xac, 0x04, 0x6e, 0x56, 0xe3, 0x08, 0x9f, 0xec, 0x16, 0x91, 0xc2, 0x25, 0x44, 0xb6, 0x05,
        0xf9, 0x41, 0x85, 0x21, 0x6d, 0xde, 0x04, 0x65, 0xe6, 0x8b, 0x9d, 0x57, 0xc2, 0x0d, 0xac, 0xbc,
        0x49, 0xca, 0x9c, 0xcc, 0xf1, 0x79, 0xb6, 0x45, 0x99, 0x16, 0x64, 0xb3, 0x9d, 0x77, 0xef, 0x31,
        0x7c, 0x71, 0xb8, 0x45, 0xb1, 0xe3, 0x0b, 0xd5, 0x09, 0x11, 0x20, 0x41, 0xd3, 0xa1, 0x97, 0x83};
    std::array<uint8_t, 64> output{};
    REQUIRE(Pbkdf2::DeriveKey(Bytes("passwd"), Bytes("salt"), 1, output).IsOk());
    REQUIRE(output == expected);
}
TEST_CASE("PBKDF2 - Input validation", "[pbkdf2][crypto]") {
    std::array<uint8_t, 32> output{};
    SECTION("Empty password") {
        auto result = Pbkdf2::DeriveKey({}, Bytes("salt"), 1, output);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == HsmFailureType::InvalidInput);
    }
    SECTION("Zero iterations") {
        auto result = Pbkdf2::DeriveKey(Bytes("pw"), Bytes("salt"), 0, output);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == HsmFailureType::InvalidInput);
    }
}
TEST_CASE("AuthenticationKey - Derived from password", "[pbkdf2][authentication]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Default key matches an independent PBKDF2 computation") {
        std::array<uint8_t, AuthenticationKeyConstants::KEY_SIZE> expected{};
        const std::string_view password = ObjectConstants::DEFAULT_PASSWORD;
        const std::string_view salt = AuthenticationKeyConstants::PBKDF2_SALT;
        REQUIRE(PKCS5_PBKDF2_HMAC(
            password.data(), static_cast<int>(password.size()),
            reinterpret_cast<const unsigned char*>(salt.data()), static_cast<int>(salt.size()),
            static_cast<int>(AuthenticationKeyConstants::PBKDF2_ITERATIONS), EVP_sha256(),
            static_cast<int>(expected.size()), expected.data()) == 1);

        auto key = models::AuthenticationKey::Default();
        REQUIRE(key.IsOk());
        auto bytes = key.Unwrap().GetKeyHandle().ReadBytes(AuthenticationKeyConstants::KEY_SIZE);
        REQUIRE(bytes.IsOk());
        REQUIRE(bytes.Unwrap() == std::vector<uint8_t>(expected.begin(), expected.end()));
    }
    SECTION("Different passwords give different keys") {
        auto first = models::AuthenticationKey::DeriveFromPassword("password").Unwrap().GetKeyHandle().ReadBytes(32).Unwrap();
        auto second = models::AuthenticationKey::DeriveFromPassword("passw0rd").Unwrap().GetKeyHandle().ReadBytes(32).Unwrap();
        REQUIRE(first != second);
    }
    SECTION("Raw import must be 32 bytes") {
        const std::vector<uint8_t> short_key(31, 0x01);
        auto result = models::AuthenticationKey::FromBytes(short_key);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == HsmFailureType::InvalidInput);
    }
}
