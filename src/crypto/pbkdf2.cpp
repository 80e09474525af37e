#include "simhsm/crypto/pbkdf2.hpp"
#include "simhsm/core/constants.hpp"

#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <string>

namespace simhsm::crypto {

Result<Unit, HsmFailure> Pbkdf2::DeriveKey(
    std::span<const uint8_t> password,
    std::span<const uint8_t> salt,
    const uint32_t iterations,
    std::span<uint8_t> output) {

    if (password.empty()) {
        return Result<Unit, HsmFailure>::Err(
            HsmFailure::InvalidInput("PBKDF2 password cannot be empty"));
    }

    if (output.empty()) {
        return Result<Unit, HsmFailure>::Err(
            HsmFailure::InvalidInput("PBKDF2 output buffer cannot be empty"));
    }

    if (iterations == 0) {
        return Result<Unit, HsmFailure>::Err(
            HsmFailure::InvalidInput("PBKDF2 iteration count must be positive"));
    }

    EVP_KDF* kdf = EVP_KDF_fetch(nullptr, OpenSSLConstants::ALGORITHM_PBKDF2.data(), nullptr);
    if (!kdf) {
        return Result<Unit, HsmFailure>::Err(
            HsmFailure::DeriveKey("Failed to fetch PBKDF2 algorithm"));
    }

    EVP_KDF_CTX* kctx = EVP_KDF_CTX_new(kdf);
    EVP_KDF_free(kdf);

    if (!kctx) {
        return Result<Unit, HsmFailure>::Err(
            HsmFailure::DeriveKey("Failed to create PBKDF2 context"));
    }

    uint64_t iteration_count = iterations;
    // The device salt is shorter than SP 800-132 allows, so the legacy PKCS#5 mode is required.
    int pkcs5_mode = 1;
    OSSL_PARAM params[6];
    int param_idx = 0;

    params[param_idx++] = OSSL_PARAM_construct_utf8_string(
        OpenSSLConstants::PARAM_DIGEST.data(),
        const_cast<char*>(OpenSSLConstants::ALGORITHM_SHA256.data()), 0);
    params[param_idx++] = OSSL_PARAM_construct_octet_string(
        OpenSSLConstants::PARAM_PASSWORD.data(), const_cast<uint8_t*>(password.data()), password.size());
    params[param_idx++] = OSSL_PARAM_construct_octet_string(
        OpenSSLConstants::PARAM_SALT.data(), const_cast<uint8_t*>(salt.data()), salt.size());
    params[param_idx++] = OSSL_PARAM_construct_uint64(
        OpenSSLConstants::PARAM_ITERATIONS.data(), &iteration_count);
    params[param_idx++] = OSSL_PARAM_construct_int(
        OpenSSLConstants::PARAM_PKCS5.data(), &pkcs5_mode);
    params[param_idx] = OSSL_PARAM_construct_end();

    const int result = EVP_KDF_derive(kctx, output.data(), output.size(), params);
    EVP_KDF_CTX_free(kctx);

    if (result != OpenSSLConstants::SUCCESS) {
        return Result<Unit, HsmFailure>::Err(
            HsmFailure::DeriveKey("PBKDF2 key derivation failed"));
    }

    return Result<Unit, HsmFailure>::Ok(unit);
}

} // namespace simhsm::crypto
