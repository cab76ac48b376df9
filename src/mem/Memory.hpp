#pragma once

#include <array>
#include <span>
#include "common/Types.hpp"

// ── MemoryBlock ───────────────────────────────────────────────────────────────
// Fixed-size byte array in console (little-endian) order.  Offsets wrap at
// Size, which gives the RAM mirrors for free; Size must be a power of two.
template<u32 Size>
class MemoryBlock {
    static_assert((Size & (Size - 1u)) == 0, "MemoryBlock size must be a power of two");

public:
    static constexpr u32 SIZE = Size;

    [[nodiscard]] u8 read_byte(u32 offset) const noexcept { return data_[offset & MASK]; }
    void write_byte(u32 offset, u8 value) noexcept { data_[offset & MASK] = value; }

    // Little-endian word at a 4-byte aligned offset.
    [[nodiscard]] u32 read_word(u32 offset) const noexcept {
        const u32 base = offset & MASK & ~3u;
        return  u32{data_[base]}
             | (u32{data_[base + 1]} <<  8)
             | (u32{data_[base + 2]} << 16)
             | (u32{data_[base + 3]} << 24);
    }

    void write_word(u32 offset, u32 value) noexcept {
        const u32 base = offset & MASK & ~3u;
        data_[base]     = static_cast<u8>(value);
        data_[base + 1] = static_cast<u8>(value >> 8);
        data_[base + 2] = static_cast<u8>(value >> 16);
        data_[base + 3] = static_cast<u8>(value >> 24);
    }

    void clear() noexcept { data_.fill(0); }

    [[nodiscard]] std::span<const u8> view() const noexcept { return data_; }
    [[nodiscard]] std::span<u8>       view()       noexcept { return data_; }

private:
    static constexpr u32 MASK = Size - 1u;

    std::array<u8, Size> data_{};
};

using Ram        = MemoryBlock<PSX::RAM_SIZE>;
using Scratchpad = MemoryBlock<PSX::SCRATCH_SIZE>;
