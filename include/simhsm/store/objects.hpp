#pragma once

#include "simhsm/core/result.hpp"
#include "simhsm/core/failures.hpp"
#include "simhsm/core/option.hpp"
#include "simhsm/configuration/store_config.hpp"
#include "simhsm/crypto/aes_gcm.hpp"
#include "simhsm/models/object.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <ranges>
#include <span>
#include <vector>

namespace simhsm::store {

/**
 * @brief Object inventory of one simulated device
 *
 * Ordered by handle (id, then type). A fresh store holds exactly the
 * bootstrap authentication key described by its StoreConfig.
 *
 * Not internally synchronized: one caller at a time per instance.
 * Independent instances share no state.
 *
 * Every failed operation leaves the store unchanged.
 */
class Objects {
public:
    using Map = std::map<models::ObjectHandle, models::Object>;
    using Range = std::ranges::subrange<Map::const_iterator>;

    [[nodiscard]] static Result<Objects, HsmFailure> Create();

    [[nodiscard]] static Result<Objects, HsmFailure> Create(const configuration::StoreConfig& config);

    Objects(Objects&&) noexcept = default;
    Objects& operator=(Objects&&) noexcept = default;
    Objects(const Objects&) = delete;
    Objects& operator=(const Objects&) = delete;

    /**
     * @brief Insert an object with freshly generated material
     *
     * Origin is Generated, sequence 1. AlreadyExists when the handle is
     * taken; InvalidInput when @p algorithm does not belong to @p object_type;
     * UnsupportedAlgorithm when the simulator cannot generate it.
     */
    [[nodiscard]] Result<models::ObjectHandle, HsmFailure> Generate(
        models::ObjectId object_id,
        enums::ObjectType object_type,
        enums::Algorithm algorithm,
        models::ObjectLabel label,
        models::Capability capabilities,
        models::Capability delegated_capabilities,
        models::Domain domains);

    /// Like Generate, but the material is @p data and origin is Imported
    [[nodiscard]] Result<models::ObjectHandle, HsmFailure> Put(
        models::ObjectId object_id,
        enums::ObjectType object_type,
        enums::Algorithm algorithm,
        models::ObjectLabel label,
        models::Capability capabilities,
        models::Capability delegated_capabilities,
        models::Domain domains,
        std::span<const uint8_t> data);

    /// Borrowed until the next mutating call; nullptr when absent
    [[nodiscard]] const models::Object* Get(models::ObjectId object_id, enums::ObjectType object_type) const;

    [[nodiscard]] Option<models::Object> Remove(models::ObjectId object_id, enums::ObjectType object_type);

    /// Objects in handle order; every call starts a fresh traversal
    [[nodiscard]] Range Iter() const noexcept {
        return Range(objects_.cbegin(), objects_.cend());
    }

    [[nodiscard]] size_t Size() const noexcept {
        return objects_.size();
    }

    [[nodiscard]] bool Contains(models::ObjectId object_id, enums::ObjectType object_type) const;

    /**
     * @brief Export an object sealed under a stored wrap key
     *
     * Output is [serialized WrappedObject][16-byte tag], sealed with the
     * first 12 bytes of @p nonce and empty associated data. The stored
     * object is left in place with its origin untouched; only the exported
     * copy carries the promoted origin.
     */
    [[nodiscard]] Result<std::vector<uint8_t>, HsmFailure> Wrap(
        models::ObjectId wrap_key_id,
        models::ObjectId object_id,
        enums::ObjectType object_type,
        std::span<const uint8_t> nonce) const;

    /**
     * @brief Import an object previously produced by Wrap
     *
     * Any authentication failure, whatever its cause, is reported as the
     * same DecryptionFailed error.
     */
    [[nodiscard]] Result<models::ObjectHandle, HsmFailure> Unwrap(
        models::ObjectId wrap_key_id,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext);

private:
    explicit Objects(Map objects) : objects_(std::move(objects)) {}

    [[nodiscard]] Result<models::ObjectHandle, HsmFailure> Insert(
        const char* operation,
        models::ObjectInfo info,
        models::Payload payload);

    struct WrapKey {
        const models::Object* object;
        crypto::AeadCipher cipher;
    };

    [[nodiscard]] Result<WrapKey, HsmFailure> ResolveWrapKey(models::ObjectId wrap_key_id) const;

    Map objects_;
};

} // namespace simhsm::store
