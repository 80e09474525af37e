#pragma once

#include "simhsm/core/constants.hpp"
#include "simhsm/core/result.hpp"
#include "simhsm/core/failures.hpp"
#include "simhsm/core/format.hpp"
#include "simhsm/models/object_handle.hpp"

#include <string>
#include <string_view>

namespace simhsm::configuration {

/**
 * @brief Factory state of a simulated device
 *
 * Describes the bootstrap authentication key a fresh store is created
 * with. Default() reproduces a device straight out of the box: key id 1,
 * derived from the password "password".
 *
 * **Usage Example**:
 * ```cpp
 * auto config = StoreConfig::Default()
 *     .WithAuthenticationKeyId(2)
 *     .WithPassword("correct horse");
 * auto store = store::Objects::Create(config);
 * ```
 */
class StoreConfig {
public:
    [[nodiscard]] static StoreConfig Default() {
        return StoreConfig(
            ObjectConstants::DEFAULT_AUTHENTICATION_KEY_ID,
            std::string(ObjectConstants::DEFAULT_AUTHENTICATION_KEY_LABEL),
            std::string(ObjectConstants::DEFAULT_PASSWORD));
    }

    [[nodiscard]] StoreConfig WithAuthenticationKeyId(const models::ObjectId id) const {
        StoreConfig copy = *this;
        copy.authentication_key_id_ = id;
        return copy;
    }

    [[nodiscard]] StoreConfig WithAuthenticationKeyLabel(std::string label) const {
        StoreConfig copy = *this;
        copy.authentication_key_label_ = std::move(label);
        return copy;
    }

    [[nodiscard]] StoreConfig WithPassword(std::string password) const {
        StoreConfig copy = *this;
        copy.password_ = std::move(password);
        return copy;
    }

    /// InvalidInput for a label over 40 bytes or an empty password
    [[nodiscard]] Result<Unit, HsmFailure> Validate() const {
        if (authentication_key_label_.size() > ObjectConstants::LABEL_SIZE) {
            return Result<Unit, HsmFailure>::Err(
                HsmFailure::InvalidInput(
                    compat::format("Authentication key label is {} bytes, limit is {}",
                        authentication_key_label_.size(), ObjectConstants::LABEL_SIZE)));
        }
        if (password_.empty()) {
            return Result<Unit, HsmFailure>::Err(
                HsmFailure::InvalidInput("Authentication key password must not be empty"));
        }
        return Result<Unit, HsmFailure>::Ok(unit);
    }

    [[nodiscard]] models::ObjectId GetAuthenticationKeyId() const noexcept {
        return authentication_key_id_;
    }

    [[nodiscard]] const std::string& GetAuthenticationKeyLabel() const noexcept {
        return authentication_key_label_;
    }

    [[nodiscard]] std::string_view GetPassword() const noexcept {
        return password_;
    }

    [[nodiscard]] bool operator==(const StoreConfig& other) const noexcept = default;

private:
    StoreConfig(models::ObjectId id, std::string label, std::string password)
        : authentication_key_id_(id)
        , authentication_key_label_(std::move(label))
        , password_(std::move(password)) {}

    models::ObjectId authentication_key_id_;
    std::string authentication_key_label_;
    std::string password_;
};

} // namespace simhsm::configuration
