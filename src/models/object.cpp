#include "simhsm/models/object.hpp"
#include "simhsm/core/format.hpp"

namespace simhsm::models {

Result<Object, HsmFailure> Object::Create(ObjectInfo info, Payload payload) {
    if (enums::ObjectTypeFor(info.algorithm) != info.object_type) {
        return Result<Object, HsmFailure>::Err(
            HsmFailure::InvalidInput(
                compat::format("Algorithm {} cannot be stored as {}",
                    enums::ToString(info.algorithm), enums::ToString(info.object_type))));
    }
    if (payload.GetAlgorithm() != info.algorithm) {
        return Result<Object, HsmFailure>::Err(
            HsmFailure::InvalidInput(
                compat::format("Payload algorithm {} does not match declared {}",
                    enums::ToString(payload.GetAlgorithm()), enums::ToString(info.algorithm))));
    }

    info.length = static_cast<uint16_t>(payload.Length());
    return Result<Object, HsmFailure>::Ok(Object(std::move(info), std::move(payload)));
}

} // namespace simhsm::models
