#include "simhsm/models/payload.hpp"
#include "simhsm/crypto/asymmetric_keys.hpp"
#include "simhsm/crypto/sodium_interop.hpp"
#include "simhsm/core/constants.hpp"
#include "simhsm/core/format.hpp"

namespace simhsm::models {

using enums::Algorithm;
using enums::AlgorithmFamily;

namespace {

Result<crypto::SecureMemoryHandle, HsmFailure> RandomHandle(const size_t size) {
    auto allocate_result = crypto::SecureMemoryHandle::Allocate(size);
    if (allocate_result.IsErr()) {
        return Result<crypto::SecureMemoryHandle, HsmFailure>::Err(
            HsmFailure::FromSodiumFailure(allocate_result.UnwrapErr()));
    }
    auto handle = std::move(allocate_result).Unwrap();
    auto fill_result = handle.WithWriteAccess([](std::span<uint8_t> bytes) {
        crypto::SodiumInterop::FillRandom(bytes);
        return unit;
    });
    if (fill_result.IsErr()) {
        return Result<crypto::SecureMemoryHandle, HsmFailure>::Err(
            HsmFailure::FromSodiumFailure(fill_result.UnwrapErr()));
    }
    return Result<crypto::SecureMemoryHandle, HsmFailure>::Ok(std::move(handle));
}

Result<crypto::SecureMemoryHandle, HsmFailure> CopyToHandle(std::span<const uint8_t> bytes) {
    auto handle_result = crypto::SecureMemoryHandle::FromBytes(bytes);
    if (handle_result.IsErr()) {
        return Result<crypto::SecureMemoryHandle, HsmFailure>::Err(
            HsmFailure::FromSodiumFailure(handle_result.UnwrapErr()));
    }
    return Result<crypto::SecureMemoryHandle, HsmFailure>::Ok(std::move(handle_result).Unwrap());
}

Result<Unit, HsmFailure> CheckLength(
    const Algorithm algorithm,
    const size_t actual,
    const size_t min,
    const size_t max) {
    if (actual < min || actual > max) {
        if (min == max) {
            return Result<Unit, HsmFailure>::Err(
                HsmFailure::InvalidInput(
                    compat::format("{} key must be {} bytes, got {}",
                        enums::ToString(algorithm), min, actual)));
        }
        return Result<Unit, HsmFailure>::Err(
            HsmFailure::InvalidInput(
                compat::format("{} data must be {}..{} bytes, got {}",
                    enums::ToString(algorithm), min, max, actual)));
    }
    return Result<Unit, HsmFailure>::Ok(unit);
}

bool IsSupportedAsymmetric(const Algorithm algorithm) noexcept {
    return algorithm == Algorithm::EcP256 || algorithm == Algorithm::EcEd25519;
}

Result<std::vector<uint8_t>, HsmFailure> DerivePublicKey(
    const Algorithm algorithm,
    const crypto::SecureMemoryHandle& secret_key) {
    auto access = secret_key.WithReadAccess([algorithm](std::span<const uint8_t> secret) {
        if (algorithm == Algorithm::EcP256) {
            return crypto::AsymmetricKeys::DeriveP256PublicKey(secret);
        }
        return crypto::AsymmetricKeys::DeriveEd25519PublicKey(secret);
    });
    if (access.IsErr()) {
        return Result<std::vector<uint8_t>, HsmFailure>::Err(
            HsmFailure::FromSodiumFailure(access.UnwrapErr()));
    }
    return std::move(access).Unwrap();
}

Result<Payload::Variant, HsmFailure> MakeVariant(
    const Algorithm algorithm,
    crypto::SecureMemoryHandle bytes) {
    switch (enums::FamilyOf(algorithm)) {
        case AlgorithmFamily::Authentication:
            return Result<Payload::Variant, HsmFailure>::Ok(
                AuthenticationKeyPayload{std::move(bytes)});
        case AlgorithmFamily::Hmac:
            return Result<Payload::Variant, HsmFailure>::Ok(
                HmacKeyPayload{algorithm, std::move(bytes)});
        case AlgorithmFamily::Symmetric:
            return Result<Payload::Variant, HsmFailure>::Ok(
                SymmetricKeyPayload{algorithm, std::move(bytes)});
        case AlgorithmFamily::Opaque:
            return Result<Payload::Variant, HsmFailure>::Ok(
                OpaquePayload{algorithm, std::move(bytes)});
        case AlgorithmFamily::Wrap:
            return Result<Payload::Variant, HsmFailure>::Ok(
                WrapKeyPayload{algorithm, std::move(bytes)});
        case AlgorithmFamily::Asymmetric:
            break;
    }

    auto public_key = DerivePublicKey(algorithm, bytes);
    if (public_key.IsErr()) {
        return Result<Payload::Variant, HsmFailure>::Err(std::move(public_key).UnwrapErr());
    }
    return Result<Payload::Variant, HsmFailure>::Ok(
        AsymmetricKeyPayload{algorithm, std::move(bytes), std::move(public_key).Unwrap()});
}

} // namespace

Result<Payload, HsmFailure> Payload::Generate(const Algorithm algorithm) {
    const AlgorithmFamily family = enums::FamilyOf(algorithm);
    const Option<size_t> key_length = enums::GeneratedKeyLength(algorithm);
    if (family == AlgorithmFamily::Opaque || !key_length.has_value() ||
        (family == AlgorithmFamily::Asymmetric && !IsSupportedAsymmetric(algorithm))) {
        return Result<Payload, HsmFailure>::Err(
            HsmFailure::UnsupportedAlgorithm(
                compat::format("Cannot generate {} key material", enums::ToString(algorithm))));
    }

    auto secret = algorithm == Algorithm::EcP256
        ? crypto::AsymmetricKeys::GenerateP256SecretKey()
        : RandomHandle(*key_length);
    if (secret.IsErr()) {
        return Result<Payload, HsmFailure>::Err(std::move(secret).UnwrapErr());
    }

    auto variant = MakeVariant(algorithm, std::move(secret).Unwrap());
    if (variant.IsErr()) {
        return Result<Payload, HsmFailure>::Err(std::move(variant).UnwrapErr());
    }
    return Result<Payload, HsmFailure>::Ok(Payload(std::move(variant).Unwrap()));
}

Result<Payload, HsmFailure> Payload::FromBytes(const Algorithm algorithm, std::span<const uint8_t> bytes) {
    Result<Unit, HsmFailure> length_check = Result<Unit, HsmFailure>::Ok(unit);

    switch (enums::FamilyOf(algorithm)) {
        case AlgorithmFamily::Opaque:
            length_check = CheckLength(algorithm, bytes.size(), 1, ObjectConstants::MAX_OBJECT_SIZE);
            break;
        case AlgorithmFamily::Hmac:
            length_check = CheckLength(algorithm, bytes.size(), 1, *enums::MaxHmacKeyLength(algorithm));
            break;
        case AlgorithmFamily::Asymmetric:
            if (!IsSupportedAsymmetric(algorithm)) {
                return Result<Payload, HsmFailure>::Err(
                    HsmFailure::UnsupportedAlgorithm(
                        compat::format("Cannot import {} key material", enums::ToString(algorithm))));
            }
            [[fallthrough]];
        case AlgorithmFamily::Authentication:
        case AlgorithmFamily::Symmetric:
        case AlgorithmFamily::Wrap: {
            const size_t expected = *enums::GeneratedKeyLength(algorithm);
            length_check = CheckLength(algorithm, bytes.size(), expected, expected);
            break;
        }
    }
    if (length_check.IsErr()) {
        return Result<Payload, HsmFailure>::Err(std::move(length_check).UnwrapErr());
    }

    if (algorithm == Algorithm::EcP256) {
        auto scalar_check = crypto::AsymmetricKeys::ValidateP256SecretKey(bytes);
        if (scalar_check.IsErr()) {
            return Result<Payload, HsmFailure>::Err(std::move(scalar_check).UnwrapErr());
        }
    }

    auto handle = CopyToHandle(bytes);
    if (handle.IsErr()) {
        return Result<Payload, HsmFailure>::Err(std::move(handle).UnwrapErr());
    }
    auto variant = MakeVariant(algorithm, std::move(handle).Unwrap());
    if (variant.IsErr()) {
        return Result<Payload, HsmFailure>::Err(std::move(variant).UnwrapErr());
    }
    return Result<Payload, HsmFailure>::Ok(Payload(std::move(variant).Unwrap()));
}

Payload Payload::FromAuthenticationKey(AuthenticationKey key) {
    return Payload(AuthenticationKeyPayload{std::move(key).TakeKeyHandle()});
}

Algorithm Payload::GetAlgorithm() const noexcept {
    return std::visit([](const auto& payload) {
        using P = std::decay_t<decltype(payload)>;
        if constexpr (std::is_same_v<P, AuthenticationKeyPayload>) {
            return Algorithm::YubicoAesAuthentication;
        } else {
            return payload.algorithm;
        }
    }, value_);
}

size_t Payload::Length() const noexcept {
    return Bytes().Size();
}

const crypto::SecureMemoryHandle& Payload::Bytes() const noexcept {
    return std::visit([](const auto& payload) -> const crypto::SecureMemoryHandle& {
        using P = std::decay_t<decltype(payload)>;
        if constexpr (std::is_same_v<P, AsymmetricKeyPayload>) {
            return payload.secret_key;
        } else if constexpr (std::is_same_v<P, OpaquePayload>) {
            return payload.data;
        } else {
            return payload.key;
        }
    }, value_);
}

Result<std::vector<uint8_t>, HsmFailure> Payload::CopyBytes() const {
    auto read_result = Bytes().ReadBytes(Length());
    if (read_result.IsErr()) {
        return Result<std::vector<uint8_t>, HsmFailure>::Err(
            HsmFailure::FromSodiumFailure(read_result.UnwrapErr()));
    }
    return Result<std::vector<uint8_t>, HsmFailure>::Ok(std::move(read_result).Unwrap());
}

Result<std::vector<uint8_t>, HsmFailure> Payload::PublicKey() const {
    const auto* asymmetric = std::get_if<AsymmetricKeyPayload>(&value_);
    if (asymmetric == nullptr) {
        return Result<std::vector<uint8_t>, HsmFailure>::Err(
            HsmFailure::InvalidInput(
                compat::format("{} payload has no public key", enums::ToString(GetAlgorithm()))));
    }
    return Result<std::vector<uint8_t>, HsmFailure>::Ok(asymmetric->public_key);
}

} // namespace simhsm::models
