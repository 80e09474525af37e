#include "simhsm/enums/algorithm.hpp"
#include "simhsm/core/constants.hpp"

namespace simhsm::enums {

const char* ToString(const Algorithm algorithm) noexcept {
    switch (algorithm) {
        case Algorithm::Rsa2048: return "rsa2048";
        case Algorithm::Rsa3072: return "rsa3072";
        case Algorithm::Rsa4096: return "rsa4096";
        case Algorithm::EcP256: return "ecp256";
        case Algorithm::EcP384: return "ecp384";
        case Algorithm::EcP521: return "ecp521";
        case Algorithm::EcK256: return "eck256";
        case Algorithm::HmacSha1: return "hmac-sha1";
        case Algorithm::HmacSha256: return "hmac-sha256";
        case Algorithm::HmacSha384: return "hmac-sha384";
        case Algorithm::HmacSha512: return "hmac-sha512";
        case Algorithm::Aes128CcmWrap: return "aes128-ccm-wrap";
        case Algorithm::OpaqueData: return "opaque-data";
        case Algorithm::OpaqueX509Certificate: return "opaque-x509-certificate";
        case Algorithm::YubicoAesAuthentication: return "yubico-aes-authentication";
        case Algorithm::Aes192CcmWrap: return "aes192-ccm-wrap";
        case Algorithm::Aes256CcmWrap: return "aes256-ccm-wrap";
        case Algorithm::EcEd25519: return "ed25519";
        case Algorithm::Aes128: return "aes128";
        case Algorithm::Aes192: return "aes192";
        case Algorithm::Aes256: return "aes256";
    }
    return "UNKNOWN";
}

Option<Algorithm> AlgorithmFromU8(const uint8_t value) noexcept {
    switch (static_cast<Algorithm>(value)) {
        case Algorithm::Rsa2048:
        case Algorithm::Rsa3072:
        case Algorithm::Rsa4096:
        case Algorithm::EcP256:
        case Algorithm::EcP384:
        case Algorithm::EcP521:
        case Algorithm::EcK256:
        case Algorithm::HmacSha1:
        case Algorithm::HmacSha256:
        case Algorithm::HmacSha384:
        case Algorithm::HmacSha512:
        case Algorithm::Aes128CcmWrap:
        case Algorithm::OpaqueData:
        case Algorithm::OpaqueX509Certificate:
        case Algorithm::YubicoAesAuthentication:
        case Algorithm::Aes192CcmWrap:
        case Algorithm::Aes256CcmWrap:
        case Algorithm::EcEd25519:
        case Algorithm::Aes128:
        case Algorithm::Aes192:
        case Algorithm::Aes256:
            return static_cast<Algorithm>(value);
    }
    return None<Algorithm>();
}

AlgorithmFamily FamilyOf(const Algorithm algorithm) noexcept {
    switch (algorithm) {
        case Algorithm::HmacSha1:
        case Algorithm::HmacSha256:
        case Algorithm::HmacSha384:
        case Algorithm::HmacSha512:
            return AlgorithmFamily::Hmac;
        case Algorithm::Aes128CcmWrap:
        case Algorithm::Aes192CcmWrap:
        case Algorithm::Aes256CcmWrap:
            return AlgorithmFamily::Wrap;
        case Algorithm::OpaqueData:
        case Algorithm::OpaqueX509Certificate:
            return AlgorithmFamily::Opaque;
        case Algorithm::YubicoAesAuthentication:
            return AlgorithmFamily::Authentication;
        case Algorithm::Aes128:
        case Algorithm::Aes192:
        case Algorithm::Aes256:
            return AlgorithmFamily::Symmetric;
        default:
            return AlgorithmFamily::Asymmetric;
    }
}

ObjectType ObjectTypeFor(const Algorithm algorithm) noexcept {
    switch (FamilyOf(algorithm)) {
        case AlgorithmFamily::Hmac:
            return ObjectType::HmacKey;
        case AlgorithmFamily::Wrap:
            return ObjectType::WrapKey;
        case AlgorithmFamily::Opaque:
            return ObjectType::Opaque;
        case AlgorithmFamily::Authentication:
            return ObjectType::AuthenticationKey;
        case AlgorithmFamily::Symmetric:
            return ObjectType::SymmetricKey;
        case AlgorithmFamily::Asymmetric:
            break;
    }
    return ObjectType::AsymmetricKey;
}

Option<size_t> GeneratedKeyLength(const Algorithm algorithm) noexcept {
    switch (algorithm) {
        case Algorithm::Aes128CcmWrap:
        case Algorithm::Aes128:
            return Constants::AES_128_KEY_SIZE;
        case Algorithm::Aes192CcmWrap:
        case Algorithm::Aes192:
            return Constants::AES_192_KEY_SIZE;
        case Algorithm::Aes256CcmWrap:
        case Algorithm::Aes256:
            return Constants::AES_256_KEY_SIZE;
        case Algorithm::HmacSha1:
            return size_t{20};
        case Algorithm::HmacSha256:
            return size_t{32};
        case Algorithm::HmacSha384:
            return size_t{48};
        case Algorithm::HmacSha512:
            return size_t{64};
        case Algorithm::EcP256:
            return Constants::P_256_SCALAR_SIZE;
        case Algorithm::EcEd25519:
            return Constants::ED_25519_SEED_SIZE;
        case Algorithm::YubicoAesAuthentication:
            return AuthenticationKeyConstants::KEY_SIZE;
        default:
            return None<size_t>();
    }
}

Option<size_t> MaxHmacKeyLength(const Algorithm algorithm) noexcept {
    switch (algorithm) {
        case Algorithm::HmacSha1:
        case Algorithm::HmacSha256:
            return size_t{64};
        case Algorithm::HmacSha384:
        case Algorithm::HmacSha512:
            return size_t{128};
        default:
            return None<size_t>();
    }
}

} // namespace simhsm::enums
