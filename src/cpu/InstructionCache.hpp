#pragma once

#include <array>
#include "common/Types.hpp"

class CP0;
class CpuBridge;

// ── Instruction cache ─────────────────────────────────────────────────────────
// 4 KiB direct-mapped, 16-byte lines.  All addresses here are physical.
//
//   data index  address & 0xFFF
//   line index  (address >> 4) & 0xFF
//   tag         (address >> 12) & 0xFFFFF
//
// With Status.IsC set the CPU's loads and stores land in this array instead
// of memory, which is how the BIOS flushes it.  Such stores clear the valid
// bit of the line they touch.
class InstructionCache {
public:
    static constexpr u32 SIZE       = 4096;
    static constexpr u32 LINE_SIZE  = 16;
    static constexpr u32 LINE_COUNT = SIZE / LINE_SIZE;

    explicit InstructionCache(const CP0& cp0) noexcept : cp0_(cp0) {}

    [[nodiscard]] bool check_hit(u32 address) const noexcept;

    // Words use the bus convention: byte at `address` in bits [31:24].
    [[nodiscard]] u32 read_word(u32 address) const noexcept;
    [[nodiscard]] u8  read_byte(u32 address) const noexcept;

    void write_word(u32 address, u32 value) noexcept;
    void write_byte(u32 address, u8 value) noexcept;

    // Loads the whole line holding `address` through the bus and marks it
    // valid.  Does nothing while the cache is isolated.
    void refill_line(CpuBridge& bridge, u32 address);

    void invalidate_all() noexcept { valid_.fill(false); }

    [[nodiscard]] bool line_valid(u32 address) const noexcept { return valid_[line_index(address)]; }

private:
    [[nodiscard]] static constexpr u32 line_index(u32 address) noexcept { return (address >> 4) & 0xFFu; }
    [[nodiscard]] static constexpr u32 tag_of(u32 address)     noexcept { return (address >> 12) & 0xF'FFFFu; }

    void invalidate_if_isolated(u32 address) noexcept;

    const CP0& cp0_;

    std::array<u8,   SIZE>       data_{};
    std::array<u32,  LINE_COUNT> tags_{};
    std::array<bool, LINE_COUNT> valid_{};
};
