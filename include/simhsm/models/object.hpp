#pragma once

#include "simhsm/core/result.hpp"
#include "simhsm/core/failures.hpp"
#include "simhsm/models/object_info.hpp"
#include "simhsm/models/payload.hpp"

namespace simhsm::models {

/**
 * @brief Unit of storage: metadata plus the material it describes
 *
 * Create() rejects an algorithm that does not belong to the object type or
 * does not match the payload, and sets info.length from the payload.
 */
class Object {
public:
    [[nodiscard]] static Result<Object, HsmFailure> Create(ObjectInfo info, Payload payload);

    Object(Object&&) noexcept = default;
    Object& operator=(Object&&) noexcept = default;
    Object(const Object&) = delete;
    Object& operator=(const Object&) = delete;

    [[nodiscard]] ObjectHandle Handle() const noexcept {
        return info_.Handle();
    }

    [[nodiscard]] const ObjectInfo& Info() const noexcept {
        return info_;
    }

    [[nodiscard]] const Payload& GetPayload() const noexcept {
        return payload_;
    }

    [[nodiscard]] enums::Algorithm GetAlgorithm() const noexcept {
        return info_.algorithm;
    }

private:
    Object(ObjectInfo info, Payload payload)
        : info_(std::move(info))
        , payload_(std::move(payload)) {}

    ObjectInfo info_;
    Payload payload_;
};

} // namespace simhsm::models
