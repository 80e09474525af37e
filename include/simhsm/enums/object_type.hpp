#pragma once

#include "simhsm/core/option.hpp"

#include <cstdint>

namespace simhsm::enums {

/**
 * @brief Kind of object stored on the device
 *
 * Together with the 16-bit object id, the type forms the object handle.
 * The same id may be used once per type.
 */
enum class ObjectType : uint8_t {
    Opaque = 0x01,
    AuthenticationKey = 0x02,
    AsymmetricKey = 0x03,
    WrapKey = 0x04,
    HmacKey = 0x05,
    Template = 0x06,
    OtpAeadKey = 0x07,
    SymmetricKey = 0x08
};

constexpr const char* ToString(ObjectType type) noexcept {
    switch (type) {
        case ObjectType::Opaque:
            return "Opaque";
        case ObjectType::AuthenticationKey:
            return "AuthenticationKey";
        case ObjectType::AsymmetricKey:
            return "AsymmetricKey";
        case ObjectType::WrapKey:
            return "WrapKey";
        case ObjectType::HmacKey:
            return "HmacKey";
        case ObjectType::Template:
            return "Template";
        case ObjectType::OtpAeadKey:
            return "OtpAeadKey";
        case ObjectType::SymmetricKey:
            return "SymmetricKey";
        default:
            return "UNKNOWN";
    }
}

[[nodiscard]] constexpr Option<ObjectType> ObjectTypeFromU8(const uint8_t value) noexcept {
    if (value < static_cast<uint8_t>(ObjectType::Opaque) ||
        value > static_cast<uint8_t>(ObjectType::SymmetricKey)) {
        return None<ObjectType>();
    }
    return static_cast<ObjectType>(value);
}

} // namespace simhsm::enums
