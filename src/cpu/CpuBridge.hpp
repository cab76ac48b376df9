#pragma once

#include "common/Types.hpp"

// Which agent currently drives the shared system bus.  DMA takes the bus
// away from the CPU for the duration of a block transfer.
enum class SystemBusHolder : u32 {
    CPU,
    DMA,
};

// ── CpuBridge ─────────────────────────────────────────────────────────────────
// Everything the R3051 needs from the rest of the console.  The motherboard
// aggregate implements it; the CPU borrows it for the length of one
// execute_instructions() call and never stores it.
//
// Word transfers are big-endian from the CPU's point of view: the byte at
// `address` is bits [31:24] of the returned word.  The CPU byte-swaps on its
// side of the interface.
class CpuBridge {
public:
    virtual ~CpuBridge() = default;

    // Cycles the just-finished instruction consumed.  Peripherals are
    // time-stepped by this amount.
    virtual void append_sync_cycles(s32 cycles) = 0;

    // Wait states of the next timed access to `address`.
    [[nodiscard]] virtual s32 how_many_stall_cycles(u32 address) = 0;

    // False when the device at `address` does not advance between the byte
    // transfers of a multi-byte access.
    [[nodiscard]] virtual bool ok_to_increment(u32 address) = 0;

    [[nodiscard]] virtual bool scratchpad_enabled() = 0;
    [[nodiscard]] virtual bool instruction_cache_enabled() = 0;

    [[nodiscard]] virtual u8  read_byte(u32 address) = 0;
    [[nodiscard]] virtual u32 read_word(u32 address) = 0;
    virtual void write_byte(u32 address, u8 value) = 0;
    virtual void write_word(u32 address, u32 value) = 0;

    // Called once before every interrupt poll.
    virtual void increment_interrupt_counters() = 0;
};
