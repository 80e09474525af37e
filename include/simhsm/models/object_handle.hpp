#pragma once

#include "simhsm/enums/object_type.hpp"

#include <compare>
#include <cstdint>
#include <string>

namespace simhsm::models {

using ObjectId = uint16_t;

/**
 * @brief Primary key of the object store
 *
 * Ordered by id first, then by type, which is the traversal order of the
 * store.
 */
struct ObjectHandle {
    ObjectId object_id{0};
    enums::ObjectType object_type{enums::ObjectType::Opaque};

    constexpr ObjectHandle() noexcept = default;
    constexpr ObjectHandle(const ObjectId id, const enums::ObjectType type) noexcept
        : object_id(id)
        , object_type(type) {}

    constexpr auto operator<=>(const ObjectHandle&) const noexcept = default;
    constexpr bool operator==(const ObjectHandle&) const noexcept = default;

    [[nodiscard]] std::string ToString() const;
};

} // namespace simhsm::models
