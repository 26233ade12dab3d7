#pragma once
#include <stdint.h>
#include <algorithm>
#include <compare>

// Unsigned integer truncated to N bits. Every constructor and operator
// re-masks, so arithmetic wraps modulo 2^N like the hardware does.
template <unsigned N>
class UInt {
    static_assert(N >= 1 && N <= 16, "Bit width must be between 1 and 16");

public:
    static constexpr unsigned BITS = N;
    static constexpr uint16_t MASK = uint16_t((1U << N) - 1);

    constexpr UInt() = default;
    constexpr explicit UInt(uint32_t value) : value_(uint16_t(value & MASK)) {}

    static constexpr UInt max() { return UInt(MASK); }

    constexpr uint16_t get() const { return value_; }

    constexpr bool operator==(const UInt&) const = default;
    constexpr auto operator<=>(const UInt&) const = default;

    // Different widths compare on the overlapping low-order bits
    template <unsigned M> requires (M != N)
    constexpr bool operator==(const UInt<M>& other) const {
        return compare_lower_bits(other);
    }

    template <unsigned M>
    constexpr bool compare_lower_bits(const UInt<M>& other) const {
        constexpr uint16_t mask = uint16_t((1U << std::min(N, M)) - 1);
        return (value_ & mask) == (other.get() & mask);
    }

    // Same comparison as compare_lower_bits: both operands are cut to the
    // min(N, M) low-order bits, whichever side is wider
    template <unsigned M>
    constexpr bool compare_upper_bits(const UInt<M>& other) const {
        return other.compare_lower_bits(*this);
    }

    constexpr UInt operator+(UInt rhs) const { return UInt(uint32_t(value_) + rhs.value_); }
    constexpr UInt operator-(UInt rhs) const { return UInt(uint32_t(value_) - rhs.value_); }
    constexpr UInt operator&(UInt rhs) const { return UInt(value_ & rhs.value_); }
    constexpr UInt operator|(UInt rhs) const { return UInt(value_ | rhs.value_); }
    constexpr UInt operator^(UInt rhs) const { return UInt(value_ ^ rhs.value_); }
    constexpr UInt operator~() const { return UInt(~uint32_t(value_)); }
    constexpr UInt operator<<(unsigned n) const { return UInt(n >= N ? 0 : uint32_t(value_) << n); }
    constexpr UInt operator>>(unsigned n) const { return UInt(n >= N ? 0 : value_ >> n); }

    constexpr bool bit(unsigned n) const { return (value_ >> n) & 1; }

private:
    uint16_t value_ = 0;
};

using u1 = UInt<1>;
using u2 = UInt<2>;
using u3 = UInt<3>;
using u4 = UInt<4>;
using u5 = UInt<5>;
using u7 = UInt<7>;
using u8 = UInt<8>;
using u9 = UInt<9>;
using u12 = UInt<12>;
