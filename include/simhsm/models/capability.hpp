#pragma once

#include <cstdint>

namespace simhsm::models {

/**
 * @brief Set of operations an object may perform or be subjected to
 *
 * Flat 64-bit set using the device's bit assignments. Permission checks
 * are plain containment tests; there is no hierarchy between flags.
 */
class Capability {
public:
    constexpr Capability() noexcept : bits_(0) {}
    explicit constexpr Capability(const uint64_t bits) noexcept : bits_(bits) {}

    static const Capability GET_OPAQUE;
    static const Capability PUT_OPAQUE;
    static const Capability PUT_AUTHENTICATION_KEY;
    static const Capability PUT_ASYMMETRIC_KEY;
    static const Capability GENERATE_ASYMMETRIC_KEY;
    static const Capability SIGN_PKCS;
    static const Capability SIGN_PSS;
    static const Capability SIGN_ECDSA;
    static const Capability SIGN_EDDSA;
    static const Capability DECRYPT_PKCS;
    static const Capability DECRYPT_OAEP;
    static const Capability DERIVE_ECDH;
    static const Capability EXPORT_WRAPPED;
    static const Capability IMPORT_WRAPPED;
    static const Capability PUT_WRAP_KEY;
    static const Capability GENERATE_WRAP_KEY;
    static const Capability EXPORTABLE_UNDER_WRAP;
    static const Capability SET_OPTION;
    static const Capability GET_OPTION;
    static const Capability GET_PSEUDO_RANDOM;
    static const Capability PUT_HMAC_KEY;
    static const Capability GENERATE_HMAC_KEY;
    static const Capability SIGN_HMAC;
    static const Capability VERIFY_HMAC;
    static const Capability GET_LOG_ENTRIES;
    static const Capability SIGN_SSH_CERTIFICATE;
    static const Capability GET_TEMPLATE;
    static const Capability PUT_TEMPLATE;
    static const Capability RESET_DEVICE;
    static const Capability DECRYPT_OTP;
    static const Capability CREATE_OTP_AEAD;
    static const Capability RANDOMIZE_OTP_AEAD;
    static const Capability REWRAP_FROM_OTP_AEAD_KEY;
    static const Capability REWRAP_TO_OTP_AEAD_KEY;
    static const Capability SIGN_ATTESTATION_CERTIFICATE;
    static const Capability PUT_OTP_AEAD_KEY;
    static const Capability GENERATE_OTP_AEAD_KEY;
    static const Capability WRAP_DATA;
    static const Capability UNWRAP_DATA;
    static const Capability DELETE_OPAQUE;
    static const Capability DELETE_AUTHENTICATION_KEY;
    static const Capability DELETE_ASYMMETRIC_KEY;
    static const Capability DELETE_WRAP_KEY;
    static const Capability DELETE_HMAC_KEY;
    static const Capability DELETE_TEMPLATE;
    static const Capability DELETE_OTP_AEAD_KEY;
    static const Capability CHANGE_AUTHENTICATION_KEY;
    static const Capability PUT_SYMMETRIC_KEY;
    static const Capability GENERATE_SYMMETRIC_KEY;
    static const Capability DELETE_SYMMETRIC_KEY;
    static const Capability DECRYPT_ECB;
    static const Capability ENCRYPT_ECB;
    static const Capability DECRYPT_CBC;
    static const Capability ENCRYPT_CBC;

    [[nodiscard]] static constexpr Capability None() noexcept {
        return Capability(0);
    }

    /// Every flag the device defines
    [[nodiscard]] static constexpr Capability All() noexcept {
        return Capability(ALL_BITS);
    }

    [[nodiscard]] constexpr uint64_t Bits() const noexcept {
        return bits_;
    }

    [[nodiscard]] constexpr bool IsEmpty() const noexcept {
        return bits_ == 0;
    }

    /// True when every flag of @p other is also set here
    [[nodiscard]] constexpr bool Contains(const Capability other) const noexcept {
        return (bits_ & other.bits_) == other.bits_;
    }

    [[nodiscard]] constexpr bool IsSubsetOf(const Capability other) const noexcept {
        return other.Contains(*this);
    }

    [[nodiscard]] constexpr Capability Union(const Capability other) const noexcept {
        return Capability(bits_ | other.bits_);
    }

    [[nodiscard]] constexpr Capability Intersection(const Capability other) const noexcept {
        return Capability(bits_ & other.bits_);
    }

    constexpr Capability operator|(const Capability other) const noexcept {
        return Union(other);
    }

    constexpr Capability operator&(const Capability other) const noexcept {
        return Intersection(other);
    }

    constexpr Capability& operator|=(const Capability other) noexcept {
        bits_ |= other.bits_;
        return *this;
    }

    constexpr bool operator==(const Capability&) const noexcept = default;

private:
    static constexpr uint64_t ALL_BITS = 0x003F'FFFF'FFFF'FFFFULL;

    uint64_t bits_;
};

inline constexpr Capability Capability::GET_OPAQUE{0x0000'0000'0000'0001ULL};
inline constexpr Capability Capability::PUT_OPAQUE{0x0000'0000'0000'0002ULL};
inline constexpr Capability Capability::PUT_AUTHENTICATION_KEY{0x0000'0000'0000'0004ULL};
inline constexpr Capability Capability::PUT_ASYMMETRIC_KEY{0x0000'0000'0000'0008ULL};
inline constexpr Capability Capability::GENERATE_ASYMMETRIC_KEY{0x0000'0000'0000'0010ULL};
inline constexpr Capability Capability::SIGN_PKCS{0x0000'0000'0000'0020ULL};
inline constexpr Capability Capability::SIGN_PSS{0x0000'0000'0000'0040ULL};
inline constexpr Capability Capability::SIGN_ECDSA{0x0000'0000'0000'0080ULL};
inline constexpr Capability Capability::SIGN_EDDSA{0x0000'0000'0000'0100ULL};
inline constexpr Capability Capability::DECRYPT_PKCS{0x0000'0000'0000'0200ULL};
inline constexpr Capability Capability::DECRYPT_OAEP{0x0000'0000'0000'0400ULL};
inline constexpr Capability Capability::DERIVE_ECDH{0x0000'0000'0000'0800ULL};
inline constexpr Capability Capability::EXPORT_WRAPPED{0x0000'0000'0000'1000ULL};
inline constexpr Capability Capability::IMPORT_WRAPPED{0x0000'0000'0000'2000ULL};
inline constexpr Capability Capability::PUT_WRAP_KEY{0x0000'0000'0000'4000ULL};
inline constexpr Capability Capability::GENERATE_WRAP_KEY{0x0000'0000'0000'8000ULL};
inline constexpr Capability Capability::EXPORTABLE_UNDER_WRAP{0x0000'0000'0001'0000ULL};
inline constexpr Capability Capability::SET_OPTION{0x0000'0000'0002'0000ULL};
inline constexpr Capability Capability::GET_OPTION{0x0000'0000'0004'0000ULL};
inline constexpr Capability Capability::GET_PSEUDO_RANDOM{0x0000'0000'0008'0000ULL};
inline constexpr Capability Capability::PUT_HMAC_KEY{0x0000'0000'0010'0000ULL};
inline constexpr Capability Capability::GENERATE_HMAC_KEY{0x0000'0000'0020'0000ULL};
inline constexpr Capability Capability::SIGN_HMAC{0x0000'0000'0040'0000ULL};
inline constexpr Capability Capability::VERIFY_HMAC{0x0000'0000'0080'0000ULL};
inline constexpr Capability Capability::GET_LOG_ENTRIES{0x0000'0000'0100'0000ULL};
inline constexpr Capability Capability::SIGN_SSH_CERTIFICATE{0x0000'0000'0200'0000ULL};
inline constexpr Capability Capability::GET_TEMPLATE{0x0000'0000'0400'0000ULL};
inline constexpr Capability Capability::PUT_TEMPLATE{0x0000'0000'0800'0000ULL};
inline constexpr Capability Capability::RESET_DEVICE{0x0000'0000'1000'0000ULL};
inline constexpr Capability Capability::DECRYPT_OTP{0x0000'0000'2000'0000ULL};
inline constexpr Capability Capability::CREATE_OTP_AEAD{0x0000'0000'4000'0000ULL};
inline constexpr Capability Capability::RANDOMIZE_OTP_AEAD{0x0000'0000'8000'0000ULL};
inline constexpr Capability Capability::REWRAP_FROM_OTP_AEAD_KEY{0x0000'0001'0000'0000ULL};
inline constexpr Capability Capability::REWRAP_TO_OTP_AEAD_KEY{0x0000'0002'0000'0000ULL};
inline constexpr Capability Capability::SIGN_ATTESTATION_CERTIFICATE{0x0000'0004'0000'0000ULL};
inline constexpr Capability Capability::PUT_OTP_AEAD_KEY{0x0000'0008'0000'0000ULL};
inline constexpr Capability Capability::GENERATE_OTP_AEAD_KEY{0x0000'0010'0000'0000ULL};
inline constexpr Capability Capability::WRAP_DATA{0x0000'0020'0000'0000ULL};
inline constexpr Capability Capability::UNWRAP_DATA{0x0000'0040'0000'0000ULL};
inline constexpr Capability Capability::DELETE_OPAQUE{0x0000'0080'0000'0000ULL};
inline constexpr Capability Capability::DELETE_AUTHENTICATION_KEY{0x0000'0100'0000'0000ULL};
inline constexpr Capability Capability::DELETE_ASYMMETRIC_KEY{0x0000'0200'0000'0000ULL};
inline constexpr Capability Capability::DELETE_WRAP_KEY{0x0000'0400'0000'0000ULL};
inline constexpr Capability Capability::DELETE_HMAC_KEY{0x0000'0800'0000'0000ULL};
inline constexpr Capability Capability::DELETE_TEMPLATE{0x0000'1000'0000'0000ULL};
inline constexpr Capability Capability::DELETE_OTP_AEAD_KEY{0x0000'2000'0000'0000ULL};
inline constexpr Capability Capability::CHANGE_AUTHENTICATION_KEY{0x0000'4000'0000'0000ULL};
inline constexpr Capability Capability::PUT_SYMMETRIC_KEY{0x0000'8000'0000'0000ULL};
inline constexpr Capability Capability::GENERATE_SYMMETRIC_KEY{0x0001'0000'0000'0000ULL};
inline constexpr Capability Capability::DELETE_SYMMETRIC_KEY{0x0002'0000'0000'0000ULL};
inline constexpr Capability Capability::DECRYPT_ECB{0x0004'0000'0000'0000ULL};
inline constexpr Capability Capability::ENCRYPT_ECB{0x0008'0000'0000'0000ULL};
inline constexpr Capability Capability::DECRYPT_CBC{0x0010'0000'0000'0000ULL};
inline constexpr Capability Capability::ENCRYPT_CBC{0x0020'0000'0000'0000ULL};

} // namespace simhsm::models
