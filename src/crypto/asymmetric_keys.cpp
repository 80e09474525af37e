#include "simhsm/crypto/asymmetric_keys.hpp"
#include "simhsm/crypto/sodium_interop.hpp"
#include "simhsm/core/constants.hpp"
#include "simhsm/core/format.hpp"

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>
#include <sodium.h>
#include <array>
#include <memory>

namespace simhsm::crypto {

namespace {
    struct BnDeleter {
        void operator()(BIGNUM* bn) const {
            if (bn) {
                BN_clear_free(bn);
            }
        }
    };
    struct BnCtxDeleter {
        void operator()(BN_CTX* ctx) const {
            if (ctx) {
                BN_CTX_free(ctx);
            }
        }
    };
    struct EcGroupDeleter {
        void operator()(EC_GROUP* group) const {
            if (group) {
                EC_GROUP_free(group);
            }
        }
    };
    struct EcPointDeleter {
        void operator()(EC_POINT* point) const {
            if (point) {
                EC_POINT_free(point);
            }
        }
    };
    using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;
    using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;
    using EcGroupPtr = std::unique_ptr<EC_GROUP, EcGroupDeleter>;
    using EcPointPtr = std::unique_ptr<EC_POINT, EcPointDeleter>;

    constexpr int MAX_SCALAR_ATTEMPTS = 16;
    constexpr uint8_t UNCOMPRESSED_POINT_TAG = 0x04;
}

Result<Unit, HsmFailure> AsymmetricKeys::ValidateP256SecretKey(std::span<const uint8_t> scalar) {
    if (scalar.size() != Constants::P_256_SCALAR_SIZE) {
        return Result<Unit, HsmFailure>::Err(
            HsmFailure::InvalidInput(
                compat::format("P-256 secret key must be {} bytes, got {}",
                    Constants::P_256_SCALAR_SIZE, scalar.size())));
    }

    EcGroupPtr group(EC_GROUP_new_by_curve_name(NID_X9_62_prime256v1));
    BnPtr k(BN_bin2bn(scalar.data(), static_cast<int>(scalar.size()), nullptr));
    if (!group || !k) {
        return Result<Unit, HsmFailure>::Err(
            HsmFailure::Generic("Failed to allocate P-256 group or scalar"));
    }

    const BIGNUM* order = EC_GROUP_get0_order(group.get());
    if (BN_is_zero(k.get()) || BN_cmp(k.get(), order) >= 0) {
        return Result<Unit, HsmFailure>::Err(
            HsmFailure::InvalidInput("P-256 secret key is not in the range [1, n)"));
    }

    return Result<Unit, HsmFailure>::Ok(unit);
}

Result<SecureMemoryHandle, HsmFailure> AsymmetricKeys::GenerateP256SecretKey() {
    auto allocate_result = SecureMemoryHandle::Allocate(Constants::P_256_SCALAR_SIZE);
    if (allocate_result.IsErr()) {
        return Result<SecureMemoryHandle, HsmFailure>::Err(
            HsmFailure::FromSodiumFailure(allocate_result.UnwrapErr()));
    }
    auto handle = std::move(allocate_result).Unwrap();

    for (int attempt = 0; attempt < MAX_SCALAR_ATTEMPTS; ++attempt) {
        auto fill_result = handle.WithWriteAccess([](std::span<uint8_t> secret) {
            SodiumInterop::FillRandom(secret);
            return ValidateP256SecretKey(secret).IsOk();
        });
        if (fill_result.IsErr()) {
            return Result<SecureMemoryHandle, HsmFailure>::Err(
                HsmFailure::FromSodiumFailure(fill_result.UnwrapErr()));
        }
        if (fill_result.Unwrap()) {
            return Result<SecureMemoryHandle, HsmFailure>::Ok(std::move(handle));
        }
    }

    return Result<SecureMemoryHandle, HsmFailure>::Err(
        HsmFailure::KeyGeneration("Failed to sample a valid P-256 secret key"));
}

Result<std::vector<uint8_t>, HsmFailure> AsymmetricKeys::DeriveP256PublicKey(std::span<const uint8_t> scalar) {
    auto validation = ValidateP256SecretKey(scalar);
    if (validation.IsErr()) {
        return Result<std::vector<uint8_t>, HsmFailure>::Err(std::move(validation).UnwrapErr());
    }

    EcGroupPtr group(EC_GROUP_new_by_curve_name(NID_X9_62_prime256v1));
    BnCtxPtr bn_ctx(BN_CTX_new());
    BnPtr k(BN_bin2bn(scalar.data(), static_cast<int>(scalar.size()), nullptr));
    if (!group || !bn_ctx || !k) {
        return Result<std::vector<uint8_t>, HsmFailure>::Err(
            HsmFailure::Generic("Failed to allocate P-256 context"));
    }

    EcPointPtr point(EC_POINT_new(group.get()));
    if (!point || EC_POINT_mul(group.get(), point.get(), k.get(), nullptr, nullptr, bn_ctx.get()) != OpenSSLConstants::SUCCESS) {
        return Result<std::vector<uint8_t>, HsmFailure>::Err(
            HsmFailure::DeriveKey("Failed to compute P-256 public point"));
    }

    std::array<uint8_t, Constants::P_256_UNTAGGED_POINT_SIZE + 1> encoded{};
    const size_t written = EC_POINT_point2oct(
        group.get(), point.get(), POINT_CONVERSION_UNCOMPRESSED,
        encoded.data(), encoded.size(), bn_ctx.get());
    if (written != encoded.size() || encoded[0] != UNCOMPRESSED_POINT_TAG) {
        return Result<std::vector<uint8_t>, HsmFailure>::Err(
            HsmFailure::DeriveKey("Unexpected P-256 public point encoding"));
    }

    return Result<std::vector<uint8_t>, HsmFailure>::Ok(
        std::vector<uint8_t>(encoded.begin() + 1, encoded.end()));
}

Result<std::vector<uint8_t>, HsmFailure> AsymmetricKeys::DeriveEd25519PublicKey(std::span<const uint8_t> seed) {
    if (seed.size() != crypto_sign_SEEDBYTES) {
        return Result<std::vector<uint8_t>, HsmFailure>::Err(
            HsmFailure::InvalidInput(
                compat::format("Ed25519 seed must be {} bytes, got {}",
                    crypto_sign_SEEDBYTES, seed.size())));
    }

    std::vector<uint8_t> public_key(crypto_sign_PUBLICKEYBYTES);
    std::array<uint8_t, crypto_sign_SECRETKEYBYTES> secret_key{};
    const int rc = crypto_sign_seed_keypair(public_key.data(), secret_key.data(), seed.data());
    auto wipe_result = SodiumInterop::SecureWipe(std::span<uint8_t>(secret_key));
    (void)wipe_result;

    if (rc != SodiumConstants::SUCCESS) {
        return Result<std::vector<uint8_t>, HsmFailure>::Err(
            HsmFailure::DeriveKey("Failed to derive Ed25519 public key"));
    }

    return Result<std::vector<uint8_t>, HsmFailure>::Ok(std::move(public_key));
}

} // namespace simhsm::crypto
