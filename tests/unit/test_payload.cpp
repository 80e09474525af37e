#include <catch2/catch_test_macros.hpp>
#include "simhsm/models/payload.hpp"
#include "simhsm/crypto/sodium_interop.hpp"
#include "simhsm/core/constants.hpp"
#include <vector>
using namespace simhsm;
using namespace simhsm::models;
using enums::Algorithm;
TEST_CASE("Payload - Generation", "[payload][models]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    SECTION("Wrap keys have the AES key length") {
        REQUIRE(Payload::Generate(Algorithm::Aes128CcmWrap).Unwrap().Length() == 16);
        REQUIRE(Payload::Generate(Algorithm::Aes192CcmWrap).Unwrap().Length() == 24);
        REQUIRE(Payload::Generate(Algorithm::Aes256CcmWrap).Unwrap().Length() == 32);
    }
    SECTION("HMAC keys have the digest length") {
        REQUIRE(Payload::Generate(Algorithm::HmacSha256).Unwrap().Length() == 32);
        REQUIRE(Payload::Generate(Algorithm::HmacSha384).Unwrap().Length() == 48);
    }
    SECTION("Variant follows the algorithm family") {
        auto payload = Payload::Generate(Algorithm::Aes128).Unwrap();
        REQUIRE(std::holds_alternative<SymmetricKeyPayload>(payload.Value()));
        REQUIRE(payload.GetAlgorithm() == Algorithm::Aes128);
    }
    SECTION("Two generations differ") {
        auto first = Payload::Generate(Algorithm::Aes256).Unwrap().CopyBytes().Unwrap();
        auto second = Payload::Generate(Algorithm::Aes256).Unwrap().CopyBytes().Unwrap();
        REQUIRE(first != second);
    }
    SECTION("Asymmetric keys carry their public half") {
        auto ed25519 = Payload::Generate(Algorithm::EcEd25519).Unwrap();
        REQUIRE(ed25519.Length() == Constants::ED_25519_SEED_SIZE);
        REQUIRE(ed25519.PublicKey().Unwrap().size() == Constants::ED_25519_PUBLIC_KEY_SIZE);
        auto p256 = Payload::Generate(Algorithm::EcP256).Unwrap();
        REQUIRE(p256.Length() == Constants::P_256_SCALAR_SIZE);
        REQUIRE(p256.PublicKey().Unwrap().size() == Constants::P_256_UNTAGGED_POINT_SIZE);
    }
    SECTION("Unsupported algorithms") {
        REQUIRE(Payload::Generate(Algorithm::OpaqueData).UnwrapErr().type == HsmFailureType::UnsupportedAlgorithm);
        REQUIRE(Payload::Generate(Algorithm::Rsa2048).UnwrapErr().type == HsmFailureType::UnsupportedAlgorithm);
        REQUIRE(Payload::Generate(Algorithm::EcP384).UnwrapErr().type == HsmFailureType::UnsupportedAlgorithm);
    }
}
TEST_CASE("Payload - Construction from bytes", "[payload][models]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    SECTION("Bytes are preserved") {
        const std::vector<uint8_t> key(16, 0x5A);
        auto payload = Payload::FromBytes(Algorithm::Aes128CcmWrap, key);
        REQUIRE(payload.IsOk());
        REQUIRE(payload.Unwrap().CopyBytes().Unwrap() == key);
    }
    SECTION("Exact length for keys") {
        const std::vector<uint8_t> key(31, 0x5A);
        auto payload = Payload::FromBytes(Algorithm::Aes256CcmWrap, key);
        REQUIRE(payload.IsErr());
        REQUIRE(payload.UnwrapErr().type == HsmFailureType::InvalidInput);
    }
    SECTION("HMAC accepts up to the block size") {
        REQUIRE(Payload::FromBytes(Algorithm::HmacSha256, std::vector<uint8_t>(64, 1)).IsOk());
        REQUIRE(Payload::FromBytes(Algorithm::HmacSha256, std::vector<uint8_t>(65, 1)).IsErr());
        REQUIRE(Payload::FromBytes(Algorithm::HmacSha512, std::vector<uint8_t>(128, 1)).IsOk());
        REQUIRE(Payload::FromBytes(Algorithm::HmacSha1, std::vector<uint8_t>{}).IsErr());
    }
    SECTION("Opaque data between 1 and 2048 bytes") {
        REQUIRE(Payload::FromBytes(Algorithm::OpaqueData, std::vector<uint8_t>(1, 1)).IsOk());
        REQUIRE(Payload::FromBytes(Algorithm::OpaqueData, std::vector<uint8_t>(ObjectConstants::MAX_OBJECT_SIZE, 1)).IsOk());
        REQUIRE(Payload::FromBytes(Algorithm::OpaqueData, std::vector<uint8_t>(ObjectConstants::MAX_OBJECT_SIZE + 1, 1)).IsErr());
        REQUIRE(Payload::FromBytes(Algorithm::OpaqueData, std::vector<uint8_t>{}).IsErr());
    }
    SECTION("Invalid P-256 scalar") {
        auto payload = Payload::FromBytes(Algorithm::EcP256, std::vector<uint8_t>(32, 0xFF));
        REQUIRE(payload.IsErr());
        REQUIRE(payload.UnwrapErr().type == HsmFailureType::InvalidInput);
    }
    SECTION("Public key only for asymmetric payloads") {
        auto payload = Payload::FromBytes(Algorithm::Aes128, std::vector<uint8_t>(16, 1)).Unwrap();
        REQUIRE(payload.PublicKey().UnwrapErr().type == HsmFailureType::InvalidInput);
    }
    SECTION("Read-only view") {
        auto payload = Payload::FromBytes(Algorithm::OpaqueData, std::vector<uint8_t>{1, 2, 3}).Unwrap();
        auto first = payload.WithBytes([](std::span<const uint8_t> bytes) { return bytes[0]; });
        REQUIRE(first.Unwrap() == 1);
    }
}
