#pragma once

#include "simhsm/core/result.hpp"
#include "simhsm/core/failures.hpp"
#include "simhsm/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>

namespace simhsm::crypto {

/**
 * @brief Thin interop layer over libsodium
 *
 * Owns the process-wide libsodium initialisation and exposes the
 * randomness, wiping and guarded-allocation primitives the object store
 * relies on.
 */
class SodiumInterop {
public:
    /**
     * @brief Initialize libsodium
     *
     * Thread-safe and idempotent. Must succeed before any secure memory is
     * allocated.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    /**
     * @brief Zero a buffer in a way the optimizer cannot elide
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    static void FillRandom(std::span<uint8_t> buffer) noexcept;

    /**
     * @brief Allocate guard-paged, mlock'ed memory via sodium_malloc
     *
     * @return nullptr when libsodium is not initialised or allocation fails
     */
    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    static Result<Unit, SodiumFailure> WipeSmallBuffer(std::span<uint8_t> buffer);
    static Result<Unit, SodiumFailure> WipeLargeBuffer(std::span<uint8_t> buffer);

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace simhsm::crypto
