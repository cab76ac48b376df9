#pragma once

#include <array>
#include "common/Types.hpp"
#include "cpu/CP0.hpp"
#include "cpu/CpuBridge.hpp"
#include "cpu/Instruction.hpp"
#include "cpu/InstructionCache.hpp"
#include "cpu/MIPSException.hpp"
#include "gte/GTE.hpp"

// ── Core configuration ────────────────────────────────────────────────────────
struct CpuConfig {
    // Log every exception entry other than SYSCALL, BREAK and interrupts.
    bool trace_exceptions = false;
    // Log reserved-instruction decodes with their PC.
    bool log_reserved_instructions = true;
    // PC after construction and reset.
    u32  reset_pc = PSX::RESET_VECTOR;
};

enum class DataWidth : u32 {
    Byte = 1,
    Half = 2,
    Word = 4,
};

// ── R3051 ─────────────────────────────────────────────────────────────────────
//
// The PSX CPU: an R3000A core with CP0, the GTE as CP2 and a 4 KiB
// instruction cache.  Work is handed out in blocks: execute_instructions()
// runs until the delay slot of a branch or jump has completed (or an
// exception is taken, or the bus is busy), and returns the cycles spent.
//
// There is no load delay slot: loaded values are visible to the next
// instruction.
class R3051 {
public:
    static constexpr u32 REGISTER_COUNT = 32;

    explicit R3051(const CpuConfig& config = CpuConfig{});

    // The instruction cache holds a reference to cp0_.
    R3051(const R3051&) = delete;
    R3051& operator=(const R3051&) = delete;

    // Runs one block and returns its cycle count.  Every instruction's
    // cycles are also reported through bridge.append_sync_cycles().
    s32 execute_instructions(CpuBridge& bridge);

    // Power-on state: PC at the reset vector, CP0/CP2 reset, caches cold.
    void reset() noexcept;

    void set_system_bus_holder(SystemBusHolder holder) noexcept { bus_holder_ = holder; }
    [[nodiscard]] SystemBusHolder system_bus_holder() const noexcept { return bus_holder_; }

    // ── Single-step pieces of a block ─────────────────────────────────────────
    // Decodes and runs one instruction word as if it were at pc().
    void execute_opcode(CpuBridge& bridge, u32 instruction);

    // Consumes the pending exception, if any.  Returns true when one was
    // taken (or a reset performed).
    bool handle_exception();

    // -1 when the fetch faulted or the bus is held by DMA.
    [[nodiscard]] s64 read_instruction_word(CpuBridge& bridge, u32 address);

    // Aligned, permission-checked data accesses.  Loads return the
    // zero-extended value or -1 when the access did not happen; stores
    // return whether the write was performed.
    [[nodiscard]] s64 read_data_value(CpuBridge& bridge, DataWidth width, u32 address);
    bool write_data_value(CpuBridge& bridge, DataWidth width, u32 address, u32 value);

    // ── Inspection ────────────────────────────────────────────────────────────
    [[nodiscard]] u32 reg(u32 idx) const noexcept { return gpr_[idx & 31u]; }
    [[nodiscard]] u32 pc()         const noexcept { return pc_; }
    [[nodiscard]] u32 hi()         const noexcept { return hi_; }
    [[nodiscard]] u32 lo()         const noexcept { return lo_; }
    [[nodiscard]] s64 total_cycles() const noexcept { return total_cycles_; }
    [[nodiscard]] s32 cycles()       const noexcept { return cycles_; }
    [[nodiscard]] s32 gte_cycles()   const noexcept { return gte_cycles_; }
    [[nodiscard]] bool jump_pending()    const noexcept { return jump_pending_; }
    [[nodiscard]] u32  jump_address()    const noexcept { return jump_address_; }
    [[nodiscard]] bool prev_was_branch() const noexcept { return prev_was_branch_; }

    [[nodiscard]] CP0&              cp0()       noexcept { return cp0_; }
    [[nodiscard]] const CP0&        cp0() const noexcept { return cp0_; }
    [[nodiscard]] GTE&              gte()       noexcept { return gte_; }
    [[nodiscard]] const GTE&        gte() const noexcept { return gte_; }
    [[nodiscard]] InstructionCache& instruction_cache() noexcept { return icache_; }
    [[nodiscard]] MIPSException&    exception() noexcept { return exception_; }
    [[nodiscard]] const MIPSException& exception() const noexcept { return exception_; }

    // ── Sideload / test set-up ────────────────────────────────────────────────
    void set_pc(u32 addr) noexcept { pc_ = addr; jump_pending_ = false; prev_was_branch_ = false; }
    void set_reg(u32 idx, u32 val) noexcept { gpr_[idx & 31u] = val; gpr_[0] = 0; }
    void set_hi(u32 val) noexcept { hi_ = val; }
    void set_lo(u32 val) noexcept { lo_ = val; }

private:
    // ── Register file ─────────────────────────────────────────────────────────
    std::array<u32, REGISTER_COUNT> gpr_{};
    u32 pc_ = PSX::RESET_VECTOR;
    u32 hi_ = 0;
    u32 lo_ = 0;

    u32  jump_address_ = 0;
    bool jump_pending_ = false;

    CP0              cp0_{};
    GTE              gte_{};
    InstructionCache icache_{cp0_};

    SystemBusHolder bus_holder_ = SystemBusHolder::CPU;
    MIPSException   exception_{};

    // prev_was_branch_: the instruction at pc_ sits in a delay slot.
    // is_branch_: the instruction being executed is a branch or jump.
    bool prev_was_branch_ = false;
    bool is_branch_       = false;
    // Set when an access found the bus held by DMA; the step is abandoned.
    bool bus_stalled_     = false;

    s32 cycles_       = 0;
    s32 gte_cycles_   = 0;
    s64 total_cycles_ = 0;

    CpuConfig config_;

    // ── Helpers ───────────────────────────────────────────────────────────────
    void write_reg(u32 idx, u32 val) noexcept { gpr_[idx] = val; gpr_[0] = 0; }
    [[nodiscard]] bool holds_bus() const noexcept { return bus_holder_ == SystemBusHolder::CPU; }

    void raise(ExceptionReason reason, u32 bad_address = 0, u32 cop_num = 0) noexcept;

    // Marks this instruction as a branch; a taken branch resolves after
    // the delay slot.
    void branch(bool taken, u32 target) noexcept;
    void advance_pc(bool was_delay_slot) noexcept;

    void check_interrupts(CpuBridge& bridge);
    void wait_for_gte() noexcept;

    [[nodiscard]] s64 load(CpuBridge& bridge, DataWidth width, u32 address);
    bool store(CpuBridge& bridge, DataWidth width, u32 address, u32 value);
    // Writes bytes [first, last] of `merged` (byte n at aligned + n) as one
    // timed access.
    void store_lanes(CpuBridge& bridge, u32 aligned, u32 first, u32 last, u32 merged);
    [[nodiscard]] u32 bus_read(CpuBridge& bridge, DataWidth width, u32 paddr);
    void bus_write(CpuBridge& bridge, DataWidth width, u32 paddr, u32 value);

    [[nodiscard]] u32 effective_address(Instruction i) const noexcept {
        return gpr_[i.rs()] + static_cast<u32>(i.simm16());
    }

    // ── Instruction group handlers ────────────────────────────────────────────
    void op_special(Instruction i);
    void op_bcond  (Instruction i);
    void op_cop0   (Instruction i);
    void op_cop2   (Instruction i);
    void op_missing_cop(Instruction i);
    void reserved_instruction(Instruction i);

    void op_add  (Instruction i);
    void op_addi (Instruction i);
    void op_sub  (Instruction i);
    void op_mult (Instruction i);
    void op_multu(Instruction i);
    void op_div  (Instruction i);
    void op_divu (Instruction i);

    // Loads
    void op_lb(CpuBridge& bridge, Instruction i);
    void op_lbu(CpuBridge& bridge, Instruction i);
    void op_lh(CpuBridge& bridge, Instruction i);
    void op_lhu(CpuBridge& bridge, Instruction i);
    void op_lw(CpuBridge& bridge, Instruction i);
    void op_lwl(CpuBridge& bridge, Instruction i);
    void op_lwr(CpuBridge& bridge, Instruction i);
    void op_lwc2(CpuBridge& bridge, Instruction i);

    // Stores
    void op_sb(CpuBridge& bridge, Instruction i);
    void op_sh(CpuBridge& bridge, Instruction i);
    void op_sw(CpuBridge& bridge, Instruction i);
    void op_swl(CpuBridge& bridge, Instruction i);
    void op_swr(CpuBridge& bridge, Instruction i);
    void op_swc2(CpuBridge& bridge, Instruction i);
};
