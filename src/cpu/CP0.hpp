#pragma once

#include <array>
#include "common/Bits.hpp"
#include "common/Types.hpp"

// ── CP0: System Control Co-processor ──────────────────────────────────────────
//
// The PSX build of the R3051 has no TLB, so CP0 is reduced to the exception
// machinery (Status, Cause, EPC, BadVAddr), the processor ID and a couple of
// cache-control bits in Status.
//
//   r1   Random   (only the reset value is modelled)
//   r8   BadVAddr
//   r12  Status   CU[31:28] RE[25] BEV[22] TS[21] CM[19] SwC[17] IsC[16]
//                 IM[15:8]  KUo IEo KUp IEp KUc IEc [5:0]
//   r13  Cause    BD[31] CE[29:28] IP[15:8] ExcCode[6:2]
//   r14  EPC
//   r15  PRId     always 2
//
class CP0 {
public:
    static constexpr u32 RANDOM   = 1;
    static constexpr u32 BADVADDR = 8;
    static constexpr u32 STATUS   = 12;
    static constexpr u32 CAUSE    = 13;
    static constexpr u32 EPC      = 14;
    static constexpr u32 PRID     = 15;

    // Bits that read back from Status / Cause; everything else reads 0.
    static constexpr u32 STATUS_READ_MASK  = 0xF27F'FF3Fu;
    static constexpr u32 CAUSE_READ_MASK   = 0xB000'FF7Cu;
    // Bits software may change through MTC0.
    static constexpr u32 STATUS_WRITE_MASK = 0xF24B'FF3Fu;
    static constexpr u32 CAUSE_WRITE_MASK  = 0x0000'0300u;

    static constexpr u32 PRID_VALUE = 0x0000'0002u;

    CP0() noexcept { reset(); }

    void reset() noexcept;

    // ── Register access (MFC0 / MTC0 and exception entry) ─────────────────────
    // Throw std::out_of_range for reg > 31.
    [[nodiscard]] u32 read_reg(u32 reg) const;
    void write_reg(u32 reg, u32 value, bool override_mask);

    // ── Address translation and checks ────────────────────────────────────────
    [[nodiscard]] static constexpr u32 virtual_to_physical(u32 vaddr) noexcept {
        if (vaddr >= PSX::KSEG0_BASE && vaddr < PSX::KSEG1_BASE) return vaddr - PSX::KSEG0_BASE;
        if (vaddr >= PSX::KSEG1_BASE && vaddr < PSX::KSEG2_BASE) return vaddr - PSX::KSEG1_BASE;
        return vaddr;
    }

    [[nodiscard]] static constexpr bool is_cacheable(u32 vaddr) noexcept {
        return vaddr < PSX::KSEG1_BASE;
    }

    [[nodiscard]] bool is_address_allowed(u32 vaddr) const noexcept {
        return (vaddr & 0x8000'0000u) == 0 || are_we_in_kernel_mode();
    }

    // ── Status bit tests ──────────────────────────────────────────────────────
    [[nodiscard]] bool are_we_in_kernel_mode() const noexcept { return (regs_[STATUS] & 0x2u) == 0; }
    [[nodiscard]] bool interrupts_enabled()    const noexcept { return (regs_[STATUS] & 0x1u) != 0; }
    [[nodiscard]] bool is_data_cache_isolated() const noexcept { return bits::bit_test(regs_[STATUS], 16); }
    [[nodiscard]] bool user_mode_opposite_byte_ordering() const noexcept {
        return bits::bit_test(regs_[STATUS], 25);
    }
    // SwC has no effect on this part: the data cache is the scratchpad.
    [[nodiscard]] static constexpr bool are_caches_swapped() noexcept { return false; }
    [[nodiscard]] bool boot_exception_vectors() const noexcept { return bits::bit_test(regs_[STATUS], 22); }

    [[nodiscard]] bool is_co_processor_usable(u32 cop) const noexcept {
        return bits::bit_test(regs_[STATUS], 28u + (cop & 3u));
    }

    // Status.CM: result of the last load that went to the isolated cache.
    void set_cache_miss(bool miss) noexcept;

    // ── Exception support ─────────────────────────────────────────────────────
    // Shift the KU/IE stack left on exception entry and right on RFE.
    void push_mode_stack() noexcept;
    void rfe() noexcept;

    // Cause.IP2: level of the interrupt controller's output line.
    void set_interrupt_line(bool asserted) noexcept;

    // Interrupt pending bits (Cause.IP) masked by Status.IM.
    [[nodiscard]] u32 masked_interrupts() const noexcept {
        return regs_[STATUS] & regs_[CAUSE] & 0xFF00u;
    }

    [[nodiscard]] static constexpr u32 get_reset_exception_vector() noexcept { return PSX::RESET_VECTOR; }
    [[nodiscard]] u32 get_general_exception_vector() const noexcept {
        return boot_exception_vectors() ? PSX::BOOT_EXC_VECTOR : PSX::GENERAL_EXC_VECTOR;
    }

    [[nodiscard]] bool condition_line() const noexcept { return condition_line_; }

private:
    std::array<u32, 32> regs_{};
    bool condition_line_ = false;
};
