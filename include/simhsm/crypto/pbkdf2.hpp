#pragma once

#include "simhsm/core/result.hpp"
#include "simhsm/core/failures.hpp"

#include <cstdint>
#include <span>

namespace simhsm::crypto {

/**
 * @brief PBKDF2-HMAC-SHA256 via the OpenSSL 3 KDF API
 *
 * Used to turn the factory password into the bootstrap authentication key.
 */
class Pbkdf2 {
public:
    static Result<Unit, HsmFailure> DeriveKey(
        std::span<const uint8_t> password,
        std::span<const uint8_t> salt,
        uint32_t iterations,
        std::span<uint8_t> output);

private:
    Pbkdf2() = delete;
};

} // namespace simhsm::crypto
