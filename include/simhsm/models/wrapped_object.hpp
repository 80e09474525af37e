#pragma once

#include "simhsm/core/result.hpp"
#include "simhsm/core/failures.hpp"
#include "simhsm/models/object_info.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace simhsm::models {

/// Plaintext form of an exported object. Only lives for the duration of a
/// wrap or unwrap call; `data` holds secret material.
struct WrappedObject {
    ObjectInfo object_info;
    std::vector<uint8_t> data;
};

/**
 * @brief Protobuf encoding of WrappedObject
 *
 * Decode validates every field against the domain types: enum values must
 * be known, id/domains/sequence must fit 16 bits, the label must fit 40
 * bytes and `length` must equal the size of `data`.
 */
class WrappedObjectCodec {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, HsmFailure> Encode(const WrappedObject& wrapped);

    [[nodiscard]] static Result<WrappedObject, HsmFailure> Decode(std::span<const uint8_t> encoded);

private:
    WrappedObjectCodec() = delete;
};

} // namespace simhsm::models
