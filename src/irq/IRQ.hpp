#pragma once

#include "common/Types.hpp"

// ── Interrupt sources ─────────────────────────────────────────────────────────
// Bit positions in I_STAT / I_MASK.
enum class IRQSource : u32 {
    VBlank   = 0,
    GPU      = 1,
    CDROM    = 2,
    DMA      = 3,
    TMR0     = 4,
    TMR1     = 5,
    TMR2     = 6,
    Ctrl     = 7,   // controller and memory card
    SIO      = 8,
    SPU      = 9,
    LightPen = 10,
};

// ── Interrupt controller ──────────────────────────────────────────────────────
//   0x1F80_1070  I_STAT  read: latched requests; write: AND (0 acknowledges)
//   0x1F80_1074  I_MASK  read/write, 11 bits
//
// The CPU reads both registers on every interrupt poll and drives Cause.IP2
// from (I_STAT & I_MASK).
class InterruptController {
public:
    static constexpr u32 LINE_MASK = 0x7FFu;

    void raise(IRQSource src) noexcept { stat_ |= 1u << static_cast<u32>(src); }

    [[nodiscard]] u32 stat() const noexcept { return stat_; }
    [[nodiscard]] u32 mask() const noexcept { return mask_; }

    void acknowledge(u32 value) noexcept { stat_ &= value & LINE_MASK; }
    void set_mask(u32 value)    noexcept { mask_ = value & LINE_MASK; }

    [[nodiscard]] bool line_asserted() const noexcept { return (stat_ & mask_) != 0; }

    void reset() noexcept { stat_ = 0; mask_ = 0; }

private:
    u32 stat_ = 0;
    u32 mask_ = 0;
};
