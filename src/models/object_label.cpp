#include "simhsm/models/object_label.hpp"
#include "simhsm/core/constants.hpp"
#include "simhsm/core/format.hpp"

#include <cstddef>
#include <cstdint>

namespace simhsm::models {

namespace {

// Strict UTF-8: no overlong forms, no surrogates, nothing above U+10FFFF.
Option<size_t> FindInvalidUtf8(std::string_view text) {
    size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<uint8_t>(text[i]);
        size_t continuation_count = 0;
        uint8_t min_second = 0x80;
        uint8_t max_second = 0xBF;
        if (lead < 0x80) {
            ++i;
            continue;
        } else if (lead >= 0xC2 && lead <= 0xDF) {
            continuation_count = 1;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            continuation_count = 2;
            if (lead == 0xE0) {
                min_second = 0xA0;
            } else if (lead == 0xED) {
                max_second = 0x9F;
            }
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            continuation_count = 3;
            if (lead == 0xF0) {
                min_second = 0x90;
            } else if (lead == 0xF4) {
                max_second = 0x8F;
            }
        } else {
            return Some(i);
        }

        if (i + continuation_count >= text.size()) {
            return Some(i);
        }
        for (size_t k = 1; k <= continuation_count; ++k) {
            const auto byte = static_cast<uint8_t>(text[i + k]);
            const uint8_t low = k == 1 ? min_second : 0x80;
            const uint8_t high = k == 1 ? max_second : 0xBF;
            if (byte < low || byte > high) {
                return Some(i);
            }
        }
        i += continuation_count + 1;
    }
    return None<size_t>();
}

} // namespace

Result<ObjectLabel, HsmFailure> ObjectLabel::FromString(std::string_view label) {
    if (label.size() > ObjectConstants::LABEL_SIZE) {
        return Result<ObjectLabel, HsmFailure>::Err(
            HsmFailure::InvalidInput(
                compat::format("Label is {} bytes, limit is {}", label.size(), ObjectConstants::LABEL_SIZE)));
    }
    if (const auto offset = FindInvalidUtf8(label); offset.has_value()) {
        return Result<ObjectLabel, HsmFailure>::Err(
            HsmFailure::InvalidInput(
                compat::format("Label is not valid UTF-8 at byte {}", *offset)));
    }
    return Result<ObjectLabel, HsmFailure>::Ok(ObjectLabel(std::string(label)));
}

} // namespace simhsm::models
