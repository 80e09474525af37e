#pragma once

#include "simhsm/core/result.hpp"
#include "simhsm/core/failures.hpp"

#include <string>
#include <string_view>

namespace simhsm::models {

/// Human-readable object label: valid UTF-8, at most 40 bytes
class ObjectLabel {
public:
    ObjectLabel() = default;

    [[nodiscard]] static Result<ObjectLabel, HsmFailure> FromString(std::string_view label);

    [[nodiscard]] const std::string& Value() const noexcept {
        return value_;
    }

    bool operator==(const ObjectLabel&) const = default;

private:
    explicit ObjectLabel(std::string value) : value_(std::move(value)) {}

    std::string value_;
};

} // namespace simhsm::models
