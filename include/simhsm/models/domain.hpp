#pragma once

#include "simhsm/core/result.hpp"
#include "simhsm/core/failures.hpp"

#include <cstdint>

namespace simhsm::models {

/**
 * @brief Set of the 16 logical compartments an object belongs to
 */
class Domain {
public:
    static constexpr uint8_t DOMAIN_COUNT = 16;

    constexpr Domain() noexcept : bits_(0) {}
    explicit constexpr Domain(const uint16_t bits) noexcept : bits_(bits) {}

    static const Domain DOM1;
    static const Domain DOM2;
    static const Domain DOM3;
    static const Domain DOM4;
    static const Domain DOM5;
    static const Domain DOM6;
    static const Domain DOM7;
    static const Domain DOM8;
    static const Domain DOM9;
    static const Domain DOM10;
    static const Domain DOM11;
    static const Domain DOM12;
    static const Domain DOM13;
    static const Domain DOM14;
    static const Domain DOM15;
    static const Domain DOM16;

    [[nodiscard]] static constexpr Domain None() noexcept {
        return Domain(0);
    }

    [[nodiscard]] static constexpr Domain All() noexcept {
        return Domain(0xFFFF);
    }

    /// Domain with 1-based index @p number (1..16)
    [[nodiscard]] static Result<Domain, HsmFailure> At(uint8_t number);

    [[nodiscard]] constexpr uint16_t Bits() const noexcept {
        return bits_;
    }

    [[nodiscard]] constexpr bool IsEmpty() const noexcept {
        return bits_ == 0;
    }

    [[nodiscard]] constexpr bool Contains(const Domain other) const noexcept {
        return (bits_ & other.bits_) == other.bits_;
    }

    [[nodiscard]] constexpr bool IsSubsetOf(const Domain other) const noexcept {
        return other.Contains(*this);
    }

    [[nodiscard]] constexpr bool Intersects(const Domain other) const noexcept {
        return (bits_ & other.bits_) != 0;
    }

    [[nodiscard]] constexpr Domain Union(const Domain other) const noexcept {
        return Domain(static_cast<uint16_t>(bits_ | other.bits_));
    }

    constexpr Domain operator|(const Domain other) const noexcept {
        return Union(other);
    }

    constexpr Domain operator&(const Domain other) const noexcept {
        return Domain(static_cast<uint16_t>(bits_ & other.bits_));
    }

    constexpr bool operator==(const Domain&) const noexcept = default;

private:
    uint16_t bits_;
};

inline constexpr Domain Domain::DOM1{0x0001};
inline constexpr Domain Domain::DOM2{0x0002};
inline constexpr Domain Domain::DOM3{0x0004};
inline constexpr Domain Domain::DOM4{0x0008};
inline constexpr Domain Domain::DOM5{0x0010};
inline constexpr Domain Domain::DOM6{0x0020};
inline constexpr Domain Domain::DOM7{0x0040};
inline constexpr Domain Domain::DOM8{0x0080};
inline constexpr Domain Domain::DOM9{0x0100};
inline constexpr Domain Domain::DOM10{0x0200};
inline constexpr Domain Domain::DOM11{0x0400};
inline constexpr Domain Domain::DOM12{0x0800};
inline constexpr Domain Domain::DOM13{0x1000};
inline constexpr Domain Domain::DOM14{0x2000};
inline constexpr Domain Domain::DOM15{0x4000};
inline constexpr Domain Domain::DOM16{0x8000};

} // namespace simhsm::models
