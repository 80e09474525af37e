#pragma once

#include "simhsm/core/result.hpp"
#include "simhsm/core/failures.hpp"
#include "simhsm/crypto/sodium_secure_memory_handle.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace simhsm::crypto {

/**
 * @brief Secret-key handling for the asymmetric payload families
 *
 * Only what the object store needs to hold and describe a key: generating
 * a valid secret and deriving its public half. Signing lives elsewhere.
 */
class AsymmetricKeys {
public:
    /// Random 32-byte scalar in [1, n) for NIST P-256, kept in secure memory
    static Result<SecureMemoryHandle, HsmFailure> GenerateP256SecretKey();

    static Result<Unit, HsmFailure> ValidateP256SecretKey(std::span<const uint8_t> scalar);

    /// Public point as 64 bytes X || Y (uncompressed, without the 0x04 tag)
    static Result<std::vector<uint8_t>, HsmFailure> DeriveP256PublicKey(std::span<const uint8_t> scalar);

    static Result<std::vector<uint8_t>, HsmFailure> DeriveEd25519PublicKey(std::span<const uint8_t> seed);

private:
    AsymmetricKeys() = delete;
};

} // namespace simhsm::crypto
