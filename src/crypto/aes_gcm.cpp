#include "simhsm/crypto/aes_gcm.hpp"
#include "simhsm/crypto/sodium_interop.hpp"
#include "simhsm/core/format.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <memory>
#include <string>
namespace simhsm::crypto {
using OpenSSL = OpenSSLConstants;
namespace {
    struct EVP_CIPHER_CTX_Deleter {
        void operator()(EVP_CIPHER_CTX* ctx) const {
            if (ctx) {
                EVP_CIPHER_CTX_free(ctx);
            }
        }
    };
    using EVP_CIPHER_CTX_ptr = std::unique_ptr<EVP_CIPHER_CTX, EVP_CIPHER_CTX_Deleter>;
    std::string GetOpenSSLError() {
        const unsigned long err = ERR_get_error();
        if (err == OpenSSL::NO_ERROR) {
            return std::string(OpenSSL::UNKNOWN_ERROR_MESSAGE);
        }
        char buffer[Constants::OPENSSL_ERROR_BUFFER_SIZE];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }
    const EVP_CIPHER* SelectCipher(const AeadCipher cipher) {
        return cipher == AeadCipher::Aes128Gcm ? EVP_aes_128_gcm() : EVP_aes_256_gcm();
    }
    Result<Unit, HsmFailure> ValidateParameters(
        const AeadCipher cipher,
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        const size_t tag_len) {
        if (key.size() != KeySize(cipher)) {
            return Result<Unit, HsmFailure>::Err(
                HsmFailure::InvalidInput(
                    compat::format("{} key must be {} bytes, got {}",
                        ToString(cipher), KeySize(cipher), key.size())));
        }
        if (nonce.size() != Constants::AES_GCM_NONCE_SIZE) {
            return Result<Unit, HsmFailure>::Err(
                HsmFailure::InvalidInput(
                    compat::format("AES-GCM nonce must be {} bytes, got {}",
                        Constants::AES_GCM_NONCE_SIZE, nonce.size())));
        }
        if (tag_len < AesGcm::MIN_TAG_SIZE || tag_len > Constants::AES_GCM_TAG_SIZE) {
            return Result<Unit, HsmFailure>::Err(
                HsmFailure::InvalidInput(
                    compat::format("AES-GCM tag length must be {}..{} bytes, got {}",
                        AesGcm::MIN_TAG_SIZE, Constants::AES_GCM_TAG_SIZE, tag_len)));
        }
        return Result<Unit, HsmFailure>::Ok(unit);
    }
    void Wipe(std::span<uint8_t> buffer) {
        auto wipe_result = SodiumInterop::SecureWipe(buffer);
        (void)wipe_result;
    }
}
Result<Unit, HsmFailure>
AesGcm::SealInPlace(
    const AeadCipher cipher,
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> associated_data,
    std::span<uint8_t> in_out,
    const size_t tag_len) {
    auto validation = ValidateParameters(cipher, key, nonce, tag_len);
    if (validation.IsErr()) {
        return validation;
    }
    if (in_out.size() < tag_len) {
        return Result<Unit, HsmFailure>::Err(
            HsmFailure::BufferTooSmall(
                compat::format("Seal buffer of {} bytes has no room for a {}-byte tag",
                    in_out.size(), tag_len)));
    }
    const size_t plaintext_len = in_out.size() - tag_len;
    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return Result<Unit, HsmFailure>::Err(
            HsmFailure::Generic(
                compat::format("Failed to create cipher context: {}", GetOpenSSLError())));
    }
    if (EVP_EncryptInit_ex(ctx.get(), SelectCipher(cipher), nullptr, nullptr, nullptr) != OpenSSL::SUCCESS) {
        return Result<Unit, HsmFailure>::Err(
            HsmFailure::Generic(
                compat::format("Failed to initialize {}: {}", ToString(cipher), GetOpenSSLError())));
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                           static_cast<int>(nonce.size()), nullptr) != OpenSSL::SUCCESS) {
        return Result<Unit, HsmFailure>::Err(
            HsmFailure::Generic(
                compat::format("Failed to set nonce length: {}", GetOpenSSLError())));
    }
    if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != OpenSSL::SUCCESS) {
        return Result<Unit, HsmFailure>::Err(
            HsmFailure::Generic(
                compat::format("Failed to set key and nonce: {}", GetOpenSSLError())));
    }
    int outlen = 0;
    if (!associated_data.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), nullptr, &outlen,
                             associated_data.data(),
                             static_cast<int>(associated_data.size())) != OpenSSL::SUCCESS) {
            return Result<Unit, HsmFailure>::Err(
                HsmFailure::Generic(
                    compat::format("Failed to add associated data: {}", GetOpenSSLError())));
        }
    }
    int ciphertext_len = 0;
    if (plaintext_len > 0) {
        if (EVP_EncryptUpdate(ctx.get(), in_out.data(), &ciphertext_len,
                             in_out.data(),
                             static_cast<int>(plaintext_len)) != OpenSSL::SUCCESS) {
            Wipe(in_out);
            return Result<Unit, HsmFailure>::Err(
                HsmFailure::Generic(
                    compat::format("Encryption failed: {}", GetOpenSSLError())));
        }
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), in_out.data() + ciphertext_len, &final_len) != OpenSSL::SUCCESS) {
        Wipe(in_out);
        return Result<Unit, HsmFailure>::Err(
            HsmFailure::Generic(
                compat::format("Encryption finalization failed: {}", GetOpenSSLError())));
    }
    if (static_cast<size_t>(ciphertext_len + final_len) != plaintext_len) {
        Wipe(in_out);
        return Result<Unit, HsmFailure>::Err(
            HsmFailure::Generic("Encryption produced an unexpected ciphertext length"));
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                           static_cast<int>(tag_len),
                           in_out.data() + plaintext_len) != OpenSSL::SUCCESS) {
        Wipe(in_out);
        return Result<Unit, HsmFailure>::Err(
            HsmFailure::Generic(
                compat::format("Failed to get authentication tag: {}", GetOpenSSLError())));
    }
    return Result<Unit, HsmFailure>::Ok(unit);
}
Result<size_t, HsmFailure>
AesGcm::OpenInPlace(
    const AeadCipher cipher,
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> associated_data,
    std::span<uint8_t> in_out,
    const size_t tag_len) {
    auto validation = ValidateParameters(cipher, key, nonce, tag_len);
    if (validation.IsErr()) {
        return Result<size_t, HsmFailure>::Err(std::move(validation).UnwrapErr());
    }
    const auto decryption_failed = [] {
        return Result<size_t, HsmFailure>::Err(
            HsmFailure::DecryptionFailed(std::string(ErrorMessages::DECRYPTION_FAILED)));
    };
    if (in_out.size() < tag_len) {
        return decryption_failed();
    }
    const size_t ciphertext_len = in_out.size() - tag_len;
    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return Result<size_t, HsmFailure>::Err(
            HsmFailure::Generic(
                compat::format("Failed to create cipher context: {}", GetOpenSSLError())));
    }
    if (EVP_DecryptInit_ex(ctx.get(), SelectCipher(cipher), nullptr, nullptr, nullptr) != OpenSSL::SUCCESS) {
        return Result<size_t, HsmFailure>::Err(
            HsmFailure::Generic(
                compat::format("Failed to initialize {}: {}", ToString(cipher), GetOpenSSLError())));
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                           static_cast<int>(nonce.size()), nullptr) != OpenSSL::SUCCESS) {
        return Result<size_t, HsmFailure>::Err(
            HsmFailure::Generic(
                compat::format("Failed to set nonce length: {}", GetOpenSSLError())));
    }
    if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != OpenSSL::SUCCESS) {
        return Result<size_t, HsmFailure>::Err(
            HsmFailure::Generic(
                compat::format("Failed to set key and nonce: {}", GetOpenSSLError())));
    }
    int outlen = 0;
    if (!associated_data.empty()) {
        if (EVP_DecryptUpdate(ctx.get(), nullptr, &outlen,
                             associated_data.data(),
                             static_cast<int>(associated_data.size())) != OpenSSL::SUCCESS) {
            return Result<size_t, HsmFailure>::Err(
                HsmFailure::Generic(
                    compat::format("Failed to add associated data: {}", GetOpenSSLError())));
        }
    }
    int plaintext_len = 0;
    if (ciphertext_len > 0) {
        if (EVP_DecryptUpdate(ctx.get(), in_out.data(), &plaintext_len,
                             in_out.data(),
                             static_cast<int>(ciphertext_len)) != OpenSSL::SUCCESS) {
            Wipe(in_out);
            return decryption_failed();
        }
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                           static_cast<int>(tag_len),
                           in_out.data() + ciphertext_len) != OpenSSL::SUCCESS) {
        Wipe(in_out);
        return decryption_failed();
    }
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), in_out.data() + plaintext_len, &final_len) != OpenSSL::SUCCESS) {
        Wipe(in_out);
        ERR_clear_error();
        return decryption_failed();
    }
    return Result<size_t, HsmFailure>::Ok(static_cast<size_t>(plaintext_len + final_len));
}
}
