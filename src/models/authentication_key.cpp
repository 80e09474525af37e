#include "simhsm/models/authentication_key.hpp"
#include "simhsm/crypto/pbkdf2.hpp"
#include "simhsm/core/constants.hpp"
#include "simhsm/core/format.hpp"

namespace simhsm::models {

Result<AuthenticationKey, HsmFailure> AuthenticationKey::DeriveFromPassword(std::string_view password) {
    if (password.empty()) {
        return Result<AuthenticationKey, HsmFailure>::Err(
            HsmFailure::InvalidInput("Authentication key password must not be empty"));
    }

    auto allocate_result = crypto::SecureMemoryHandle::Allocate(AuthenticationKeyConstants::KEY_SIZE);
    if (allocate_result.IsErr()) {
        return Result<AuthenticationKey, HsmFailure>::Err(
            HsmFailure::FromSodiumFailure(allocate_result.UnwrapErr()));
    }
    auto handle = std::move(allocate_result).Unwrap();

    const std::span<const uint8_t> password_bytes(
        reinterpret_cast<const uint8_t*>(password.data()), password.size());
    const std::span<const uint8_t> salt_bytes(
        reinterpret_cast<const uint8_t*>(AuthenticationKeyConstants::PBKDF2_SALT.data()),
        AuthenticationKeyConstants::PBKDF2_SALT.size());

    auto derive_result = handle.WithWriteAccess([&](std::span<uint8_t> key) {
        return crypto::Pbkdf2::DeriveKey(
            password_bytes, salt_bytes, AuthenticationKeyConstants::PBKDF2_ITERATIONS, key);
    });
    if (derive_result.IsErr()) {
        return Result<AuthenticationKey, HsmFailure>::Err(
            HsmFailure::FromSodiumFailure(derive_result.UnwrapErr()));
    }
    auto pbkdf2_result = std::move(derive_result).Unwrap();
    if (pbkdf2_result.IsErr()) {
        return Result<AuthenticationKey, HsmFailure>::Err(std::move(pbkdf2_result).UnwrapErr());
    }

    return Result<AuthenticationKey, HsmFailure>::Ok(AuthenticationKey(std::move(handle)));
}

Result<AuthenticationKey, HsmFailure> AuthenticationKey::Default() {
    return DeriveFromPassword(ObjectConstants::DEFAULT_PASSWORD);
}

Result<AuthenticationKey, HsmFailure> AuthenticationKey::FromBytes(std::span<const uint8_t> key) {
    if (key.size() != AuthenticationKeyConstants::KEY_SIZE) {
        return Result<AuthenticationKey, HsmFailure>::Err(
            HsmFailure::InvalidInput(
                compat::format("Authentication key must be {} bytes, got {}",
                    AuthenticationKeyConstants::KEY_SIZE, key.size())));
    }
    auto handle_result = crypto::SecureMemoryHandle::FromBytes(key);
    if (handle_result.IsErr()) {
        return Result<AuthenticationKey, HsmFailure>::Err(
            HsmFailure::FromSodiumFailure(handle_result.UnwrapErr()));
    }
    return Result<AuthenticationKey, HsmFailure>::Ok(
        AuthenticationKey(std::move(handle_result).Unwrap()));
}

} // namespace simhsm::models
