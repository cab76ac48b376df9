#include "R3051.hpp"

#include <cstdio>

#include "common/Bits.hpp"

namespace {

[[nodiscard]] constexpr bool in_scratchpad(u32 paddr) noexcept {
    return paddr >= PSX::SCRATCH_BASE && paddr < PSX::SCRATCH_BASE + PSX::SCRATCH_SIZE;
}

// Wait states of a cache line refill on top of the first access.
constexpr s32 REFILL_EXTRA_CYCLES = 4;

} // namespace

R3051::R3051(const CpuConfig& config) : config_(config) {
    reset();
}

void R3051::reset() noexcept {
    pc_              = config_.reset_pc;
    jump_address_    = 0;
    jump_pending_    = false;
    prev_was_branch_ = false;
    is_branch_       = false;
    bus_stalled_     = false;
    bus_holder_      = SystemBusHolder::CPU;
    gte_cycles_      = 0;
    cp0_.reset();
    gte_.reset();
    icache_.invalidate_all();
    exception_.reset();
}

// ── Block loop ────────────────────────────────────────────────────────────────
//
// One step is: fetch, execute, take a pending exception, poll interrupts if
// the instruction was a branch, then move the PC on (to the branch target
// when the step was a delay slot).  The block ends after a delay slot, after
// an exception, or when an access found the bus held by DMA; in the last case
// the PC is left alone so the instruction is retried on the next call.
s32 R3051::execute_instructions(CpuBridge& bridge) {
    s32 block_cycles = 0;

    for (;;) {
        cycles_      = 0;
        is_branch_   = false;
        bus_stalled_ = false;
        const bool delay_slot = prev_was_branch_;

        const s64 word = read_instruction_word(bridge, pc_);
        cycles_ += 1;
        if (word != -1) {
            execute_opcode(bridge, static_cast<u32>(word));
        }

        bool block_over = true;
        if (handle_exception() || bus_stalled_) {
            // PC already points at the vector, or stays put for the retry.
        } else {
            if (is_branch_) {
                check_interrupts(bridge);
            }
            if (!handle_exception()) {
                advance_pc(delay_slot);
                prev_was_branch_ = is_branch_;
                block_over = delay_slot;
            }
        }

        gte_cycles_ = gte_cycles_ > cycles_ ? gte_cycles_ - cycles_ : 0;
        total_cycles_ += cycles_;
        block_cycles  += cycles_;
        bridge.append_sync_cycles(cycles_);

        if (block_over) return block_cycles;
    }
}

void R3051::advance_pc(bool was_delay_slot) noexcept {
    if (was_delay_slot && jump_pending_) {
        pc_ = jump_address_;
        jump_pending_ = false;
    } else {
        pc_ += 4;
    }
}

void R3051::branch(bool taken, u32 target) noexcept {
    is_branch_ = true;
    if (taken) {
        jump_address_ = target;
        jump_pending_ = true;
    }
}

// ── Exceptions ────────────────────────────────────────────────────────────────

void R3051::raise(ExceptionReason reason, u32 bad_address, u32 cop_num) noexcept {
    exception_.raise(reason, pc_, prev_was_branch_, bad_address, cop_num);
}

bool R3051::handle_exception() {
    if (!exception_.pending()) return false;

    const ExceptionReason reason = exception_.reason();
    if (reason == ExceptionReason::Reset) {
        reset();
        return true;
    }

    const u32  origin   = exception_.program_counter_origin();
    const bool in_delay = exception_.in_branch_delay_slot();

    if (config_.trace_exceptions && reason != ExceptionReason::Syscall
        && reason != ExceptionReason::Int && reason != ExceptionReason::Bp) {
        std::fprintf(stderr, "[CPU] exception %s at PC=0x%08X bad=0x%08X%s\n",
                     exception_reason_name(reason), origin, exception_.bad_address(),
                     in_delay ? " (delay slot)" : "");
    }

    jump_pending_    = false;
    prev_was_branch_ = false;
    is_branch_       = false;

    u32 cause = cp0_.read_reg(CP0::CAUSE);
    cause &= ~(0x8000'0000u | 0x7Cu);
    cause |= static_cast<u32>(reason) << 2;
    if (in_delay) cause |= 0x8000'0000u;
    if (reason == ExceptionReason::CpU) {
        cause = (cause & ~0x3000'0000u) | ((exception_.co_processor_num() & 3u) << 28);
    }
    cp0_.write_reg(CP0::CAUSE, cause, true);
    cp0_.write_reg(CP0::EPC, in_delay ? origin - 4 : origin, true);

    if (reason == ExceptionReason::AdEL || reason == ExceptionReason::AdES) {
        cp0_.write_reg(CP0::BADVADDR, exception_.bad_address(), true);
    }

    cp0_.push_mode_stack();
    pc_ = cp0_.get_general_exception_vector();
    exception_.reset();
    return true;
}

// The interrupt controller registers are words on the bus like any other,
// so they come back big-endian and are swapped here.
void R3051::check_interrupts(CpuBridge& bridge) {
    bridge.increment_interrupt_counters();
    const u32 stat = bits::swap_word(bridge.read_word(PSX::I_STAT_ADDR));
    const u32 mask = bits::swap_word(bridge.read_word(PSX::I_MASK_ADDR));
    cp0_.set_interrupt_line((stat & mask) != 0);

    if (cp0_.interrupts_enabled() && cp0_.masked_interrupts() != 0) {
        raise(ExceptionReason::Int);
    }
}

void R3051::wait_for_gte() noexcept {
    cycles_    += gte_cycles_;
    gte_cycles_ = 0;
}

// ── Fetch ─────────────────────────────────────────────────────────────────────

s64 R3051::read_instruction_word(CpuBridge& bridge, u32 address) {
    if ((address & 3u) != 0 || !cp0_.is_address_allowed(address)) {
        raise(ExceptionReason::AdEL, address);
        return -1;
    }

    const u32 paddr = CP0::virtual_to_physical(address);
    // With IsC set a missed line is not refilled; the fetch returns whatever
    // the cache array holds.
    const bool cached = CP0::is_cacheable(address) && bridge.instruction_cache_enabled();

    if (cached) {
        if (!icache_.check_hit(paddr)) {
            if (!holds_bus()) {
                bus_stalled_ = true;
                return -1;
            }
            cycles_ += bridge.how_many_stall_cycles(paddr) + REFILL_EXTRA_CYCLES;
            icache_.refill_line(bridge, paddr);
        }
        return bits::swap_word(icache_.read_word(paddr));
    }

    if (!holds_bus()) {
        bus_stalled_ = true;
        return -1;
    }
    cycles_ += bridge.how_many_stall_cycles(paddr);
    return bits::swap_word(bridge.read_word(paddr));
}

// ── Data accesses ─────────────────────────────────────────────────────────────

s64 R3051::read_data_value(CpuBridge& bridge, DataWidth width, u32 address) {
    const u32 size = static_cast<u32>(width);
    if ((address & (size - 1)) != 0 || !cp0_.is_address_allowed(address)) {
        raise(ExceptionReason::AdEL, address);
        return -1;
    }
    return load(bridge, width, address);
}

bool R3051::write_data_value(CpuBridge& bridge, DataWidth width, u32 address, u32 value) {
    const u32 size = static_cast<u32>(width);
    if ((address & (size - 1)) != 0 || !cp0_.is_address_allowed(address)) {
        raise(ExceptionReason::AdES, address);
        return false;
    }
    return store(bridge, width, address, value);
}

// Routing: isolated cache first, then the scratchpad window, then a timed
// bus transaction.
s64 R3051::load(CpuBridge& bridge, DataWidth width, u32 address) {
    const u32 paddr = CP0::virtual_to_physical(address);

    if (cp0_.is_data_cache_isolated()) {
        cp0_.set_cache_miss(!icache_.check_hit(paddr));
        switch (width) {
            case DataWidth::Byte: return icache_.read_byte(paddr);
            case DataWidth::Half: return u32{icache_.read_byte(paddr)} | (u32{icache_.read_byte(paddr + 1)} << 8);
            case DataWidth::Word: return bits::swap_word(icache_.read_word(paddr));
        }
    }

    if (in_scratchpad(paddr) && bridge.scratchpad_enabled()) {
        return bus_read(bridge, width, paddr);
    }

    if (!holds_bus()) {
        bus_stalled_ = true;
        return -1;
    }
    cycles_ += bridge.how_many_stall_cycles(paddr);
    return bus_read(bridge, width, paddr);
}

bool R3051::store(CpuBridge& bridge, DataWidth width, u32 address, u32 value) {
    const u32 paddr = CP0::virtual_to_physical(address);

    if (cp0_.is_data_cache_isolated()) {
        switch (width) {
            case DataWidth::Byte:
                icache_.write_byte(paddr, static_cast<u8>(value));
                break;
            case DataWidth::Half:
                icache_.write_byte(paddr,     static_cast<u8>(value));
                icache_.write_byte(paddr + 1, static_cast<u8>(value >> 8));
                break;
            case DataWidth::Word:
                icache_.write_word(paddr, bits::swap_word(value));
                break;
        }
        return true;
    }

    if (in_scratchpad(paddr) && bridge.scratchpad_enabled()) {
        bus_write(bridge, width, paddr, value);
        return true;
    }

    if (!holds_bus()) {
        bus_stalled_ = true;
        return false;
    }
    cycles_ += bridge.how_many_stall_cycles(paddr);
    bus_write(bridge, width, paddr, value);
    return true;
}

void R3051::store_lanes(CpuBridge& bridge, u32 aligned, u32 first, u32 last, u32 merged) {
    const u32 paddr = CP0::virtual_to_physical(aligned);

    if (cp0_.is_data_cache_isolated()) {
        for (u32 n = first; n <= last; ++n) {
            icache_.write_byte(paddr + n, static_cast<u8>(merged >> (8 * n)));
        }
        return;
    }

    if (!(in_scratchpad(paddr) && bridge.scratchpad_enabled())) {
        if (!holds_bus()) {
            bus_stalled_ = true;
            return;
        }
        cycles_ += bridge.how_many_stall_cycles(paddr);
    }
    for (u32 n = first; n <= last; ++n) {
        bridge.write_byte(paddr + n, static_cast<u8>(merged >> (8 * n)));
    }
}

u32 R3051::bus_read(CpuBridge& bridge, DataWidth width, u32 paddr) {
    switch (width) {
        case DataWidth::Byte:
            return bridge.read_byte(paddr);
        case DataWidth::Half: {
            const u32 low  = bridge.read_byte(paddr);
            const u32 next = bridge.ok_to_increment(paddr) ? paddr + 1 : paddr;
            return low | (u32{bridge.read_byte(next)} << 8);
        }
        case DataWidth::Word:
            return bits::swap_word(bridge.read_word(paddr));
    }
    return 0;
}

void R3051::bus_write(CpuBridge& bridge, DataWidth width, u32 paddr, u32 value) {
    switch (width) {
        case DataWidth::Byte:
            bridge.write_byte(paddr, static_cast<u8>(value));
            break;
        case DataWidth::Half: {
            bridge.write_byte(paddr, static_cast<u8>(value));
            const u32 next = bridge.ok_to_increment(paddr) ? paddr + 1 : paddr;
            bridge.write_byte(next, static_cast<u8>(value >> 8));
            break;
        }
        case DataWidth::Word:
            bridge.write_word(paddr, bits::swap_word(value));
            break;
    }
}
