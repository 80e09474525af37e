#pragma once

#include "simhsm/core/option.hpp"
#include "simhsm/enums/object_type.hpp"

#include <cstddef>
#include <cstdint>

namespace simhsm::enums {

/**
 * @brief Device algorithm identifiers for stored objects
 *
 * Numeric values match the identifiers used on the wire by the device,
 * so an envelope produced here carries the same algorithm byte a real
 * device would report.
 */
enum class Algorithm : uint8_t {
    Rsa2048 = 9,
    Rsa3072 = 10,
    Rsa4096 = 11,
    EcP256 = 12,
    EcP384 = 13,
    EcP521 = 14,
    EcK256 = 15,
    HmacSha1 = 19,
    HmacSha256 = 20,
    HmacSha384 = 21,
    HmacSha512 = 22,
    Aes128CcmWrap = 29,
    OpaqueData = 30,
    OpaqueX509Certificate = 31,
    YubicoAesAuthentication = 38,
    Aes192CcmWrap = 41,
    Aes256CcmWrap = 42,
    EcEd25519 = 46,
    Aes128 = 50,
    Aes192 = 51,
    Aes256 = 52
};

enum class AlgorithmFamily : uint8_t {
    Asymmetric,
    Hmac,
    Wrap,
    Opaque,
    Authentication,
    Symmetric
};

[[nodiscard]] const char* ToString(Algorithm algorithm) noexcept;

[[nodiscard]] Option<Algorithm> AlgorithmFromU8(uint8_t value) noexcept;

[[nodiscard]] AlgorithmFamily FamilyOf(Algorithm algorithm) noexcept;

/// Object type that may hold key material of the given algorithm
[[nodiscard]] ObjectType ObjectTypeFor(Algorithm algorithm) noexcept;

/**
 * @brief Length in bytes of key material the device generates
 *
 * None for algorithms the simulator cannot generate (RSA, opaque data).
 */
[[nodiscard]] Option<size_t> GeneratedKeyLength(Algorithm algorithm) noexcept;

/// Largest HMAC key accepted on import (the digest's block size)
[[nodiscard]] Option<size_t> MaxHmacKeyLength(Algorithm algorithm) noexcept;

} // namespace simhsm::enums
