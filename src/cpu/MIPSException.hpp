#pragma once

#include "common/Types.hpp"

// ── Exception reasons ─────────────────────────────────────────────────────────
// Discriminants are the Cause.ExcCode values written on exception entry.
// Reset and Null never reach Cause: Reset reinitialises the CPU and Null
// marks an empty exception latch.
enum class ExceptionReason : u32 {
    Int     = 0x00,  // hardware interrupt
    AdEL    = 0x04,  // address error, load or fetch
    AdES    = 0x05,  // address error, store
    IBE     = 0x06,  // bus error, fetch
    DBE     = 0x07,  // bus error, data
    Syscall = 0x08,
    Bp      = 0x09,  // breakpoint
    RI      = 0x0A,  // reserved instruction
    CpU     = 0x0B,  // co-processor unusable
    Ov      = 0x0C,  // arithmetic overflow
    Reset   = 0x0D,
    Null    = 0x0E,
};

[[nodiscard]] const char* exception_reason_name(ExceptionReason reason) noexcept;

// ── Pending exception latch ───────────────────────────────────────────────────
// One record per CPU.  Any fault detected during an instruction step
// overwrites it; the step's exception handler consumes it and resets it.
class MIPSException {
public:
    void raise(ExceptionReason reason, u32 origin_pc, bool in_delay_slot,
               u32 bad_address = 0, u32 cop_num = 0) noexcept;
    void reset() noexcept;

    [[nodiscard]] bool pending() const noexcept { return reason_ != ExceptionReason::Null; }

    [[nodiscard]] ExceptionReason reason()            const noexcept { return reason_; }
    [[nodiscard]] u32             program_counter_origin() const noexcept { return origin_pc_; }
    [[nodiscard]] u32             bad_address()       const noexcept { return bad_address_; }
    [[nodiscard]] u32             co_processor_num()  const noexcept { return cop_num_; }
    [[nodiscard]] bool            in_branch_delay_slot() const noexcept { return in_delay_slot_; }

private:
    ExceptionReason reason_        = ExceptionReason::Null;
    u32             origin_pc_     = 0;
    u32             bad_address_   = 0;
    u32             cop_num_       = 0;
    bool            in_delay_slot_ = false;
};
