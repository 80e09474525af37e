#pragma once

/**
 * @file object_logger.hpp
 * @brief Debug tracing of object store mutations and wrap traffic.
 *
 * Enable via CMake: -DSIMHSM_DEBUG_OBJECTS=ON
 *
 * Secret payload bytes are never passed to these functions. Nonces and
 * ciphertexts are printed hex-truncated.
 */

#include "simhsm/core/failures.hpp"
#include "simhsm/enums/algorithm.hpp"
#include "simhsm/enums/object_origin.hpp"
#include "simhsm/models/object_handle.hpp"

#include <cstdint>
#include <cstdio>
#include <span>
#include <string>

namespace simhsm::debug {

#ifdef SIMHSM_DEBUG_OBJECTS

inline std::string ToHex(std::span<const uint8_t> data) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(data.size() * 2);
    for (const auto byte : data) {
        result.push_back(hex_chars[(byte >> 4) & 0x0F]);
        result.push_back(hex_chars[byte & 0x0F]);
    }
    return result;
}

inline std::string ToHexTruncated(std::span<const uint8_t> data, size_t max_bytes = 32) {
    if (data.size() <= max_bytes) {
        return ToHex(data);
    }
    auto truncated = ToHex(data.subspan(0, max_bytes));
    truncated += "...(" + std::to_string(data.size()) + " bytes)";
    return truncated;
}

#define SIMHSM_LOG_BYTES(operation, name, data) \
    do { \
        fprintf(stdout, "[SIMHSM-DEBUG] %s %s: %s\n", \
            operation, \
            name, \
            ::simhsm::debug::ToHexTruncated(data).c_str()); \
        fflush(stdout); \
    } while(0)

#define SIMHSM_LOG_HANDLE(operation, handle) \
    do { \
        fprintf(stdout, "[SIMHSM-DEBUG] %s %s\n", \
            operation, \
            (handle).ToString().c_str()); \
        fflush(stdout); \
    } while(0)

inline void LogObjectInserted(
    const char* operation,
    const models::ObjectHandle& handle,
    enums::Algorithm algorithm,
    enums::ObjectOrigin origin,
    size_t length) {

    fprintf(stdout, "[SIMHSM-DEBUG] %s %s algorithm=%s origin=%s length=%zu\n",
        operation,
        handle.ToString().c_str(),
        enums::ToString(algorithm),
        enums::ToString(origin),
        length);
    fflush(stdout);
}

inline void LogObjectRemoved(const models::ObjectHandle& handle) {
    SIMHSM_LOG_HANDLE("REMOVE", handle);
}

inline void LogWrap(
    const models::ObjectHandle& wrap_key,
    const models::ObjectHandle& target,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext) {

    SIMHSM_LOG_HANDLE("WRAP key", wrap_key);
    SIMHSM_LOG_HANDLE("WRAP target", target);
    SIMHSM_LOG_BYTES("WRAP", "nonce", nonce);
    SIMHSM_LOG_BYTES("WRAP", "ciphertext", ciphertext);
}

inline void LogUnwrap(
    const models::ObjectHandle& wrap_key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext) {

    SIMHSM_LOG_HANDLE("UNWRAP key", wrap_key);
    SIMHSM_LOG_BYTES("UNWRAP", "nonce", nonce);
    SIMHSM_LOG_BYTES("UNWRAP", "ciphertext", ciphertext);
}

inline void LogFailure(const char* operation, const HsmFailure& failure) {
    fprintf(stdout, "[SIMHSM-DEBUG] %s FAILED %s: %s\n",
        operation,
        ToString(failure.type),
        failure.message.c_str());
    fflush(stdout);
}

#else // !SIMHSM_DEBUG_OBJECTS

#define SIMHSM_LOG_BYTES(operation, name, data) ((void)0)
#define SIMHSM_LOG_HANDLE(operation, handle) ((void)0)

inline void LogObjectInserted(const char*, const models::ObjectHandle&, enums::Algorithm,
                              enums::ObjectOrigin, size_t) {}
inline void LogObjectRemoved(const models::ObjectHandle&) {}
inline void LogWrap(const models::ObjectHandle&, const models::ObjectHandle&,
                    std::span<const uint8_t>, std::span<const uint8_t>) {}
inline void LogUnwrap(const models::ObjectHandle&, std::span<const uint8_t>, std::span<const uint8_t>) {}
inline void LogFailure(const char*, const HsmFailure&) {}

#endif // SIMHSM_DEBUG_OBJECTS

} // namespace simhsm::debug
