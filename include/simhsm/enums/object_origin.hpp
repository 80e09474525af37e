#pragma once

#include "simhsm/core/option.hpp"

#include <cstdint>

namespace simhsm::enums {

/**
 * @brief Provenance of an object
 *
 * Low nibble records how the key material first entered the device
 * (generated on-device or imported in plaintext). Bit 0x10 is set once the
 * object has crossed a wrap boundary and is never cleared again.
 */
enum class ObjectOrigin : uint8_t {
    Generated = 0x01,
    Imported = 0x02,
    WrappedGenerated = 0x11,
    WrappedImported = 0x12
};

constexpr const char* ToString(ObjectOrigin origin) noexcept {
    switch (origin) {
        case ObjectOrigin::Generated:
            return "Generated";
        case ObjectOrigin::Imported:
            return "Imported";
        case ObjectOrigin::WrappedGenerated:
            return "WrappedGenerated";
        case ObjectOrigin::WrappedImported:
            return "WrappedImported";
        default:
            return "UNKNOWN";
    }
}

/**
 * @brief Origin recorded in a wrapped copy of an object
 *
 * Generated becomes WrappedGenerated, Imported becomes WrappedImported,
 * already-wrapped origins are returned unchanged.
 */
[[nodiscard]] constexpr ObjectOrigin PromoteOnWrap(const ObjectOrigin origin) noexcept {
    switch (origin) {
        case ObjectOrigin::Generated:
            return ObjectOrigin::WrappedGenerated;
        case ObjectOrigin::Imported:
            return ObjectOrigin::WrappedImported;
        case ObjectOrigin::WrappedGenerated:
        case ObjectOrigin::WrappedImported:
            return origin;
    }
    return origin;
}

[[nodiscard]] constexpr Option<ObjectOrigin> ObjectOriginFromU8(const uint8_t value) noexcept {
    switch (value) {
        case static_cast<uint8_t>(ObjectOrigin::Generated):
        case static_cast<uint8_t>(ObjectOrigin::Imported):
        case static_cast<uint8_t>(ObjectOrigin::WrappedGenerated):
        case static_cast<uint8_t>(ObjectOrigin::WrappedImported):
            return static_cast<ObjectOrigin>(value);
        default:
            return None<ObjectOrigin>();
    }
}

} // namespace simhsm::enums
