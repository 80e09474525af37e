#pragma once

#include "simhsm/core/result.hpp"
#include "simhsm/core/failures.hpp"
#include "simhsm/crypto/sodium_secure_memory_handle.hpp"
#include "simhsm/enums/algorithm.hpp"
#include "simhsm/models/authentication_key.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <type_traits>
#include <variant>
#include <vector>

namespace simhsm::models {

struct AuthenticationKeyPayload {
    crypto::SecureMemoryHandle key;
};

/// Secret scalar or seed, with the public key derived once at construction
struct AsymmetricKeyPayload {
    enums::Algorithm algorithm;
    crypto::SecureMemoryHandle secret_key;
    std::vector<uint8_t> public_key;
};

struct HmacKeyPayload {
    enums::Algorithm algorithm;
    crypto::SecureMemoryHandle key;
};

struct SymmetricKeyPayload {
    enums::Algorithm algorithm;
    crypto::SecureMemoryHandle key;
};

struct OpaquePayload {
    enums::Algorithm algorithm;
    crypto::SecureMemoryHandle data;
};

struct WrapKeyPayload {
    enums::Algorithm algorithm;
    crypto::SecureMemoryHandle key;
};

/**
 * @brief Key or data material of one object
 *
 * Closed union over the algorithm families the store understands. Each
 * alternative keeps its bytes in sodium secure memory; the only way to look
 * at them is through WithBytes or an explicit CopyBytes.
 */
class Payload {
public:
    using Variant = std::variant<
        AuthenticationKeyPayload,
        AsymmetricKeyPayload,
        HmacKeyPayload,
        SymmetricKeyPayload,
        OpaquePayload,
        WrapKeyPayload>;

    /**
     * @brief Fresh random material for @p algorithm
     *
     * Fails with UnsupportedAlgorithm for opaque data and for asymmetric
     * algorithms other than P-256 and Ed25519.
     */
    [[nodiscard]] static Result<Payload, HsmFailure> Generate(enums::Algorithm algorithm);

    /**
     * @brief Payload built from caller-supplied bytes
     *
     * Length rules: wrap, symmetric, authentication and asymmetric keys must
     * be exactly the algorithm's key length; HMAC keys 1..block size; opaque
     * data 1..2048 bytes. P-256 scalars must lie in [1, n).
     */
    [[nodiscard]] static Result<Payload, HsmFailure> FromBytes(
        enums::Algorithm algorithm,
        std::span<const uint8_t> bytes);

    [[nodiscard]] static Payload FromAuthenticationKey(AuthenticationKey key);

    Payload(Payload&&) noexcept = default;
    Payload& operator=(Payload&&) noexcept = default;
    Payload(const Payload&) = delete;
    Payload& operator=(const Payload&) = delete;

    [[nodiscard]] enums::Algorithm GetAlgorithm() const noexcept;

    [[nodiscard]] size_t Length() const noexcept;

    [[nodiscard]] const Variant& Value() const noexcept {
        return value_;
    }

    template<typename F>
    auto WithBytes(F&& func) const -> Result<std::invoke_result_t<F, std::span<const uint8_t>>, HsmFailure> {
        using T = std::invoke_result_t<F, std::span<const uint8_t>>;
        auto access = Bytes().WithReadAccess(std::forward<F>(func));
        if (access.IsErr()) {
            return Result<T, HsmFailure>::Err(HsmFailure::FromSodiumFailure(access.UnwrapErr()));
        }
        return Result<T, HsmFailure>::Ok(std::move(access).Unwrap());
    }

    [[nodiscard]] Result<std::vector<uint8_t>, HsmFailure> CopyBytes() const;

    /// Public half of an asymmetric key; InvalidInput for other families
    [[nodiscard]] Result<std::vector<uint8_t>, HsmFailure> PublicKey() const;

private:
    explicit Payload(Variant value) : value_(std::move(value)) {}

    [[nodiscard]] const crypto::SecureMemoryHandle& Bytes() const noexcept;

    Variant value_;
};

} // namespace simhsm::models
