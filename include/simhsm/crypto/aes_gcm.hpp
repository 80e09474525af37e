#pragma once
#include "simhsm/core/result.hpp"
#include "simhsm/core/failures.hpp"
#include "simhsm/core/constants.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
namespace simhsm::crypto {

enum class AeadCipher : uint8_t {
    Aes128Gcm,
    Aes256Gcm
};

[[nodiscard]] constexpr size_t KeySize(const AeadCipher cipher) noexcept {
    return cipher == AeadCipher::Aes128Gcm ? Constants::AES_128_KEY_SIZE : Constants::AES_256_KEY_SIZE;
}

constexpr const char* ToString(const AeadCipher cipher) noexcept {
    switch (cipher) {
        case AeadCipher::Aes128Gcm:
            return "AES-128-GCM";
        case AeadCipher::Aes256Gcm:
            return "AES-256-GCM";
        default:
            return "UNKNOWN";
    }
}

/**
 * AES-GCM sealing and opening in place.
 *
 * Stateless primitive: the caller owns nonce uniqueness for a given key.
 * Both operations work on a single buffer laid out as
 *
 *   [ plaintext / ciphertext ][ tag_len bytes of tag ]
 *
 * so the wire form of a sealed object is exactly the buffer after sealing.
 */
class AesGcm {
public:
    /**
     * Encrypt in_out[0 .. size - tag_len) in place and write the tag into the
     * trailing tag_len bytes. The trailing bytes are ignored on input.
     */
    [[nodiscard]] static Result<Unit, HsmFailure>
    SealInPlace(
        AeadCipher cipher,
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> associated_data,
        std::span<uint8_t> in_out,
        size_t tag_len);

    /**
     * Verify the trailing tag and decrypt in place.
     *
     * @return length of the recovered plaintext (in_out.size() - tag_len).
     * Every verification failure, including a buffer shorter than the tag,
     * is reported as the same DecryptionFailed error and the buffer is wiped.
     */
    [[nodiscard]] static Result<size_t, HsmFailure>
    OpenInPlace(
        AeadCipher cipher,
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> associated_data,
        std::span<uint8_t> in_out,
        size_t tag_len);

    static constexpr size_t MIN_TAG_SIZE = 12;
private:
    AesGcm() = delete;
};
}
