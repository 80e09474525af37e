#pragma once

#include "simhsm/core/result.hpp"
#include "simhsm/core/failures.hpp"
#include "simhsm/crypto/sodium_secure_memory_handle.hpp"

#include <cstdint>
#include <span>
#include <string_view>

namespace simhsm::models {

/**
 * @brief Session authentication credential stored on the device
 *
 * 32 bytes of key material: the first 16 bytes are the session encryption
 * key, the last 16 the session MAC key.
 */
class AuthenticationKey {
public:
    /// PBKDF2-HMAC-SHA256(password, "Yubico", 10000) truncated to 32 bytes
    [[nodiscard]] static Result<AuthenticationKey, HsmFailure> DeriveFromPassword(std::string_view password);

    /// Factory-default credential derived from "password"
    [[nodiscard]] static Result<AuthenticationKey, HsmFailure> Default();

    [[nodiscard]] static Result<AuthenticationKey, HsmFailure> FromBytes(std::span<const uint8_t> key);

    AuthenticationKey(AuthenticationKey&&) noexcept = default;
    AuthenticationKey& operator=(AuthenticationKey&&) noexcept = default;
    AuthenticationKey(const AuthenticationKey&) = delete;
    AuthenticationKey& operator=(const AuthenticationKey&) = delete;

    [[nodiscard]] const crypto::SecureMemoryHandle& GetKeyHandle() const noexcept {
        return key_handle_;
    }

    [[nodiscard]] crypto::SecureMemoryHandle TakeKeyHandle() && {
        return std::move(key_handle_);
    }

private:
    explicit AuthenticationKey(crypto::SecureMemoryHandle key_handle)
        : key_handle_(std::move(key_handle)) {}

    crypto::SecureMemoryHandle key_handle_;
};

} // namespace simhsm::models
