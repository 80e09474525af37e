#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
namespace simhsm {
struct Constants {
    static constexpr size_t AES_128_KEY_SIZE = 16;
    static constexpr size_t AES_192_KEY_SIZE = 24;
    static constexpr size_t AES_256_KEY_SIZE = 32;
    static constexpr size_t AES_GCM_NONCE_SIZE = 12;
    static constexpr size_t AES_GCM_TAG_SIZE = 16;
    static constexpr size_t ED_25519_SEED_SIZE = 32;
    static constexpr size_t ED_25519_PUBLIC_KEY_SIZE = 32;
    static constexpr size_t P_256_SCALAR_SIZE = 32;
    static constexpr size_t P_256_UNTAGGED_POINT_SIZE = 64;
    static constexpr size_t SMALL_BUFFER_THRESHOLD = 1024;
    static constexpr size_t OPENSSL_ERROR_BUFFER_SIZE = 256;
};
struct ObjectConstants {
    static constexpr size_t LABEL_SIZE = 40;
    static constexpr size_t MAX_OBJECT_SIZE = 2048;
    static constexpr uint16_t INITIAL_SEQUENCE = 1;
    static constexpr uint16_t DEFAULT_AUTHENTICATION_KEY_ID = 1;
    static constexpr std::string_view DEFAULT_AUTHENTICATION_KEY_LABEL = "DEFAULT AUTHKEY CHANGE THIS ASAP";
    static constexpr std::string_view DEFAULT_PASSWORD = "password";
};
struct WrapConstants {
    // Devices accept a 13-byte CCM nonce; only the first 12 bytes feed the GCM nonce.
    static constexpr size_t WRAP_NONCE_SIZE = 13;
    static constexpr size_t AEAD_NONCE_SIZE = Constants::AES_GCM_NONCE_SIZE;
    static constexpr size_t WRAPPED_DATA_MAC_SIZE = Constants::AES_GCM_TAG_SIZE;
};
struct AuthenticationKeyConstants {
    static constexpr size_t KEY_SIZE = 32;
    static constexpr size_t ENCRYPTION_KEY_SIZE = 16;
    static constexpr size_t MAC_KEY_SIZE = 16;
    static constexpr std::string_view PBKDF2_SALT = "Yubico";
    static constexpr uint32_t PBKDF2_ITERATIONS = 10000;
};
struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr unsigned long NO_ERROR = 0;
    static constexpr std::string_view ALGORITHM_PBKDF2 = "PBKDF2";
    static constexpr std::string_view ALGORITHM_SHA256 = "SHA256";
    static constexpr std::string_view PARAM_DIGEST = "digest";
    static constexpr std::string_view PARAM_PASSWORD = "pass";
    static constexpr std::string_view PARAM_SALT = "salt";
    static constexpr std::string_view PARAM_ITERATIONS = "iter";
    static constexpr std::string_view PARAM_PKCS5 = "pkcs5";
    static constexpr std::string_view CURVE_P_256 = "P-256";
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
};
struct SodiumConstants {
    static constexpr int SUCCESS = 0;
    static constexpr int FAILURE = -1;
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Secure memory handle has been disposed";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data exceeds secure buffer size";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view FAILED_TO_READ_SECURE_MEMORY = "Failed to read secure memory: ";
    static constexpr std::string_view DECRYPTION_FAILED = "error decrypting wrapped object";
};
}
