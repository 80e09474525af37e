#include <catch2/catch_test_macros.hpp>
#include "helpers/store_fixtures.hpp"
#include <vector>
using namespace simhsm;
using namespace simhsm::test_helpers;
using enums::Algorithm;
using enums::ObjectType;
namespace {
void RequireDecryptionFailure(const Result<models::ObjectHandle, HsmFailure>& result) {
    REQUIRE(result.IsErr());
    REQUIRE(result.UnwrapErr().type == HsmFailureType::DecryptionFailed);
    REQUIRE(result.UnwrapErr().message == ErrorMessages::DECRYPTION_FAILED);
}
}
TEST_CASE("Unwrap - Tamper detection", "[wrap][security]") {
    auto store = MakeStore();
    GenerateWrapKey(store, WRAP_KEY_ID, Algorithm::Aes256CcmWrap);
    GenerateExportableAes256(store, TARGET_ID);
    const auto nonce = DeviceNonce(0x3C);
    const auto ciphertext = store.Wrap(WRAP_KEY_ID, TARGET_ID, ObjectType::SymmetricKey, nonce).Unwrap();
    REQUIRE(store.Remove(TARGET_ID, ObjectType::SymmetricKey).has_value());
    const size_t size_before = store.Size();

    SECTION("Every single-bit flip is rejected") {
        for (size_t byte = 0; byte < ciphertext.size(); ++byte) {
            for (int bit = 0; bit < 8; ++bit) {
                auto tampered = ciphertext;
                tampered[byte] ^= static_cast<uint8_t>(1u << bit);
                RequireDecryptionFailure(store.Unwrap(WRAP_KEY_ID, nonce, tampered));
            }
        }
        REQUIRE(store.Size() == size_before);
        REQUIRE_FALSE(store.Contains(TARGET_ID, ObjectType::SymmetricKey));
    }
    SECTION("Truncated ciphertext") {
        std::vector<uint8_t> truncated(ciphertext.begin(), ciphertext.end() - 1);
        RequireDecryptionFailure(store.Unwrap(WRAP_KEY_ID, nonce, truncated));
    }
    SECTION("Shorter than the tag") {
        std::vector<uint8_t> tiny(WrapConstants::WRAPPED_DATA_MAC_SIZE - 1, 0);
        RequireDecryptionFailure(store.Unwrap(WRAP_KEY_ID, nonce, tiny));
        RequireDecryptionFailure(store.Unwrap(WRAP_KEY_ID, nonce, std::vector<uint8_t>{}));
    }
    SECTION("Different nonce") {
        RequireDecryptionFailure(store.Unwrap(WRAP_KEY_ID, DeviceNonce(0x3D), ciphertext));
    }
    SECTION("Only the first 12 nonce bytes matter") {
        auto nonce_variant = nonce;
        nonce_variant.back() ^= 0xFF;
        REQUIRE(store.Unwrap(WRAP_KEY_ID, nonce_variant, ciphertext).IsOk());
    }
    SECTION("Wrong wrap key gives the same error as corruption") {
        GenerateWrapKey(store, WRAP_KEY_ID + 1, Algorithm::Aes256CcmWrap);
        RequireDecryptionFailure(store.Unwrap(WRAP_KEY_ID + 1, nonce, ciphertext));
    }
    SECTION("Wrap key of another size fails authentication") {
        GenerateWrapKey(store, WRAP_KEY_ID + 2, Algorithm::Aes128CcmWrap);
        RequireDecryptionFailure(store.Unwrap(WRAP_KEY_ID + 2, nonce, ciphertext));
    }
}
