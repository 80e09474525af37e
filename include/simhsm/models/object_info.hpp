#pragma once

#include "simhsm/core/constants.hpp"
#include "simhsm/enums/algorithm.hpp"
#include "simhsm/enums/object_origin.hpp"
#include "simhsm/enums/object_type.hpp"
#include "simhsm/models/capability.hpp"
#include "simhsm/models/domain.hpp"
#include "simhsm/models/object_handle.hpp"
#include "simhsm/models/object_label.hpp"

#include <cstdint>

namespace simhsm::models {

/**
 * @brief Metadata of one stored object
 *
 * `length` mirrors the payload byte length and is filled in by Object;
 * `sequence` starts at 1 and no store operation changes it.
 */
struct ObjectInfo {
    ObjectId object_id{0};
    enums::ObjectType object_type{enums::ObjectType::Opaque};
    enums::Algorithm algorithm{enums::Algorithm::OpaqueData};
    Capability capabilities;
    Capability delegated_capabilities;
    Domain domains;
    uint16_t length{0};
    uint16_t sequence{ObjectConstants::INITIAL_SEQUENCE};
    enums::ObjectOrigin origin{enums::ObjectOrigin::Generated};
    ObjectLabel label;

    [[nodiscard]] ObjectHandle Handle() const noexcept {
        return ObjectHandle(object_id, object_type);
    }

    bool operator==(const ObjectInfo&) const = default;
};

} // namespace simhsm::models
