#pragma once

#include <bit>
#include <concepts>
#include <limits>
#include <type_traits>
#include "common/Types.hpp"

// ── Integer helpers ───────────────────────────────────────────────────────────
// Small pure functions shared by the CPU, the co-processors and the bus.
// All of them are constexpr so decoder and GTE constants can use them.
namespace bits {

// Shift right without dragging the sign bit in, whatever the operand type.
template<std::integral T>
[[nodiscard]] constexpr T logical_rshift(T value, unsigned amount) noexcept {
    using U = std::make_unsigned_t<T>;
    if (amount >= std::numeric_limits<U>::digits) return T{0};
    return static_cast<T>(static_cast<U>(value) >> amount);
}

// Sign-extend the low `Bits` bits of `value` into a full s32.
template<unsigned Bits>
[[nodiscard]] constexpr s32 sign_extend(u32 value) noexcept {
    static_assert(Bits > 0 && Bits <= 32);
    if constexpr (Bits == 32) {
        return static_cast<s32>(value);
    } else {
        const u32 shift = 32u - Bits;
        return static_cast<s32>(value << shift) >> shift;
    }
}

[[nodiscard]] constexpr s32 sext16(u32 value) noexcept { return sign_extend<16>(value); }
[[nodiscard]] constexpr s32 sext8 (u32 value) noexcept { return sign_extend<8>(value); }

[[nodiscard]] constexpr bool bit_test(u32 value, unsigned bit) noexcept {
    return ((value >> bit) & 1u) != 0;
}

[[nodiscard]] constexpr u32 set_bit(u32 value, unsigned bit, bool on) noexcept {
    return on ? (value | (1u << bit)) : (value & ~(1u << bit));
}

[[nodiscard]] constexpr int count_leading_zeros(u32 value) noexcept {
    return std::countl_zero(value);
}

// Length of the run of bits equal to the sign bit (the GTE LZCR result).
[[nodiscard]] constexpr int count_leading_sign_bits(u32 value) noexcept {
    return (value & 0x8000'0000u) ? std::countl_one(value) : std::countl_zero(value);
}

template<typename T>
[[nodiscard]] constexpr T clamp_range(T value, T lo, T hi) noexcept {
    return value < lo ? lo : (value > hi ? hi : value);
}

template<typename T>
[[nodiscard]] constexpr T min_of(T a, T b) noexcept { return b < a ? b : a; }

// Byte reversal between the CPU's little-endian registers and the
// big-endian words the bus bridge exchanges.
[[nodiscard]] constexpr u32 swap_word(u32 value) noexcept {
    return  (value >> 24)
         | ((value >>  8) & 0x0000'FF00u)
         | ((value <<  8) & 0x00FF'0000u)
         |  (value << 24);
}

} // namespace bits
