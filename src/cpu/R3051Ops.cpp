#include "R3051.hpp"

#include <cstdio>
#include <limits>

#include "common/Bits.hpp"

namespace {

// Early-out multiplier: the cost depends on how many significant bits rs has.
[[nodiscard]] s32 mult_cycles(u32 rs, bool is_signed) noexcept {
    const u32 magnitude = (is_signed && static_cast<s32>(rs) < 0) ? ~rs : rs;
    if (magnitude < 0x800u)     return 6;
    if (magnitude < 0x10'0000u) return 9;
    return 13;
}

constexpr s32 DIV_CYCLES = 36;

[[nodiscard]] constexpr bool add_overflows(u32 a, u32 b, u32 r) noexcept {
    return ((~(a ^ b) & (a ^ r)) & 0x8000'0000u) != 0;
}

[[nodiscard]] constexpr bool sub_overflows(u32 a, u32 b, u32 r) noexcept {
    return (((a ^ b) & (a ^ r)) & 0x8000'0000u) != 0;
}

} // namespace

// ── Primary dispatch ──────────────────────────────────────────────────────────
void R3051::execute_opcode(CpuBridge& bridge, u32 instruction) {
    const Instruction i{instruction};
    const u32 rs = gpr_[i.rs()];
    const u32 rt = gpr_[i.rt()];
    const u32 branch_target = pc_ + 4 + (static_cast<u32>(i.simm16()) << 2);
    const u32 jump_target   = ((pc_ + 4) & 0xF000'0000u) | (i.target26() << 2);

    switch (i.opcode()) {
    case Op::SPECIAL: op_special(i); break;
    case Op::BCOND:   op_bcond(i);   break;

    // ── Jumps and branches ────────────────────────────────────────────────────
    case Op::J:    branch(true, jump_target); break;
    case Op::JAL:  write_reg(31, pc_ + 8); branch(true, jump_target); break;
    case Op::BEQ:  branch(rs == rt, branch_target); break;
    case Op::BNE:  branch(rs != rt, branch_target); break;
    case Op::BLEZ: branch(static_cast<s32>(rs) <= 0, branch_target); break;
    case Op::BGTZ: branch(static_cast<s32>(rs) > 0, branch_target); break;

    // ── Immediate ALU ─────────────────────────────────────────────────────────
    case Op::ADDI:  op_addi(i); break;
    case Op::ADDIU: write_reg(i.rt(), rs + static_cast<u32>(i.simm16())); break;
    case Op::SLTI:  write_reg(i.rt(), static_cast<s32>(rs) < i.simm16() ? 1u : 0u); break;
    case Op::SLTIU: write_reg(i.rt(), rs < static_cast<u32>(i.simm16()) ? 1u : 0u); break;
    case Op::ANDI:  write_reg(i.rt(), rs & i.uimm16()); break;
    case Op::ORI:   write_reg(i.rt(), rs | i.uimm16()); break;
    case Op::XORI:  write_reg(i.rt(), rs ^ i.uimm16()); break;
    case Op::LUI:   write_reg(i.rt(), i.uimm16() << 16); break;

    // ── Co-processors ─────────────────────────────────────────────────────────
    case Op::COP0: op_cop0(i); break;
    case Op::COP2: op_cop2(i); break;
    case Op::COP1:
    case Op::COP3:
    case Op::LWC1:
    case Op::LWC3:
    case Op::SWC1:
    case Op::SWC3:
        op_missing_cop(i);
        break;

    // ── Loads / stores ────────────────────────────────────────────────────────
    case Op::LB:   op_lb(bridge, i);   break;
    case Op::LH:   op_lh(bridge, i);   break;
    case Op::LWL:  op_lwl(bridge, i);  break;
    case Op::LW:   op_lw(bridge, i);   break;
    case Op::LBU:  op_lbu(bridge, i);  break;
    case Op::LHU:  op_lhu(bridge, i);  break;
    case Op::LWR:  op_lwr(bridge, i);  break;
    case Op::SB:   op_sb(bridge, i);   break;
    case Op::SH:   op_sh(bridge, i);   break;
    case Op::SWL:  op_swl(bridge, i);  break;
    case Op::SW:   op_sw(bridge, i);   break;
    case Op::SWR:  op_swr(bridge, i);  break;
    case Op::LWC2: op_lwc2(bridge, i); break;
    case Op::SWC2: op_swc2(bridge, i); break;

    default:
        reserved_instruction(i);
        break;
    }
}

void R3051::reserved_instruction(Instruction i) {
    if (config_.log_reserved_instructions) {
        std::fprintf(stderr, "[CPU] reserved instruction 0x%08X at PC=0x%08X\n", i.raw, pc_);
    }
    raise(ExceptionReason::RI);
}

// ── SPECIAL (opcode 0x00) ─────────────────────────────────────────────────────
void R3051::op_special(Instruction i) {
    const u32 rs = gpr_[i.rs()];
    const u32 rt = gpr_[i.rt()];

    switch (i.funct()) {
    case Funct::SLL:  write_reg(i.rd(), rt << i.shamt()); break;
    case Funct::SRL:  write_reg(i.rd(), bits::logical_rshift(rt, i.shamt())); break;
    case Funct::SRA:  write_reg(i.rd(), static_cast<u32>(static_cast<s32>(rt) >> i.shamt())); break;
    case Funct::SLLV: write_reg(i.rd(), rt << (rs & 0x1Fu)); break;
    case Funct::SRLV: write_reg(i.rd(), bits::logical_rshift(rt, rs & 0x1Fu)); break;
    case Funct::SRAV: write_reg(i.rd(), static_cast<u32>(static_cast<s32>(rt) >> (rs & 0x1Fu))); break;

    case Funct::JR:
        branch(true, rs);
        break;
    case Funct::JALR:
        write_reg(i.rd(), pc_ + 8);
        branch(true, rs);
        break;

    case Funct::SYSCALL: raise(ExceptionReason::Syscall); break;
    case Funct::BREAK:   raise(ExceptionReason::Bp);      break;

    case Funct::MFHI: write_reg(i.rd(), hi_); break;
    case Funct::MTHI: hi_ = rs; break;
    case Funct::MFLO: write_reg(i.rd(), lo_); break;
    case Funct::MTLO: lo_ = rs; break;

    case Funct::MULT:  op_mult(i);  break;
    case Funct::MULTU: op_multu(i); break;
    case Funct::DIV:   op_div(i);   break;
    case Funct::DIVU:  op_divu(i);  break;

    case Funct::ADD:  op_add(i); break;
    case Funct::ADDU: write_reg(i.rd(), rs + rt); break;
    case Funct::SUB:  op_sub(i); break;
    case Funct::SUBU: write_reg(i.rd(), rs - rt); break;
    case Funct::AND:  write_reg(i.rd(), rs & rt); break;
    case Funct::OR:   write_reg(i.rd(), rs | rt); break;
    case Funct::XOR:  write_reg(i.rd(), rs ^ rt); break;
    case Funct::NOR:  write_reg(i.rd(), ~(rs | rt)); break;
    case Funct::SLT:  write_reg(i.rd(), static_cast<s32>(rs) < static_cast<s32>(rt) ? 1u : 0u); break;
    case Funct::SLTU: write_reg(i.rd(), rs < rt ? 1u : 0u); break;

    default:
        reserved_instruction(i);
        break;
    }
}

// ── Trapping arithmetic ───────────────────────────────────────────────────────
// On overflow the destination is left untouched.

void R3051::op_add(Instruction i) {
    const u32 a = gpr_[i.rs()];
    const u32 b = gpr_[i.rt()];
    const u32 r = a + b;
    if (add_overflows(a, b, r)) {
        raise(ExceptionReason::Ov);
        return;
    }
    write_reg(i.rd(), r);
}

void R3051::op_addi(Instruction i) {
    const u32 a = gpr_[i.rs()];
    const u32 b = static_cast<u32>(i.simm16());
    const u32 r = a + b;
    if (add_overflows(a, b, r)) {
        raise(ExceptionReason::Ov);
        return;
    }
    write_reg(i.rt(), r);
}

void R3051::op_sub(Instruction i) {
    const u32 a = gpr_[i.rs()];
    const u32 b = gpr_[i.rt()];
    const u32 r = a - b;
    if (sub_overflows(a, b, r)) {
        raise(ExceptionReason::Ov);
        return;
    }
    write_reg(i.rd(), r);
}

// ── Multiply / divide ─────────────────────────────────────────────────────────

void R3051::op_mult(Instruction i) {
    const u32 rs = gpr_[i.rs()];
    const s64 result = s64{static_cast<s32>(rs)} * s64{static_cast<s32>(gpr_[i.rt()])};
    lo_ = static_cast<u32>(result);
    hi_ = static_cast<u32>(static_cast<u64>(result) >> 32);
    cycles_ += mult_cycles(rs, true);
}

void R3051::op_multu(Instruction i) {
    const u32 rs = gpr_[i.rs()];
    const u64 result = u64{rs} * u64{gpr_[i.rt()]};
    lo_ = static_cast<u32>(result);
    hi_ = static_cast<u32>(result >> 32);
    cycles_ += mult_cycles(rs, false);
}

void R3051::op_div(Instruction i) {
    const s32 n = static_cast<s32>(gpr_[i.rs()]);
    const s32 d = static_cast<s32>(gpr_[i.rt()]);
    if (d == 0) {
        lo_ = n >= 0 ? 0xFFFF'FFFFu : 1u;
        hi_ = static_cast<u32>(n);
    } else if (n == std::numeric_limits<s32>::min() && d == -1) {
        lo_ = 0x8000'0000u;
        hi_ = 0;
    } else {
        lo_ = static_cast<u32>(n / d);
        hi_ = static_cast<u32>(n % d);
    }
    cycles_ += DIV_CYCLES;
}

void R3051::op_divu(Instruction i) {
    const u32 n = gpr_[i.rs()];
    const u32 d = gpr_[i.rt()];
    if (d == 0) {
        lo_ = 0xFFFF'FFFFu;
        hi_ = n;
    } else {
        lo_ = n / d;
        hi_ = n % d;
    }
    cycles_ += DIV_CYCLES;
}

// ── BCOND (opcode 0x01) ───────────────────────────────────────────────────────
// The link register is written whether or not the branch is taken.
void R3051::op_bcond(Instruction i) {
    const s32 value = static_cast<s32>(gpr_[i.rs()]);
    const bool taken = BCond::is_gez(i.rt()) ? value >= 0 : value < 0;
    if (BCond::is_link(i.rt())) {
        write_reg(31, pc_ + 8);
    }
    branch(taken, pc_ + 4 + (static_cast<u32>(i.simm16()) << 2));
}

// ── COP0 (opcode 0x10) ────────────────────────────────────────────────────────
void R3051::op_cop0(Instruction i) {
    if (!cp0_.are_we_in_kernel_mode() && !cp0_.is_co_processor_usable(0)) {
        raise(ExceptionReason::CpU, 0, 0);
        return;
    }

    if (i.is_cop_cmd()) {
        if (i.funct() == CopOp::RFE) {
            cp0_.rfe();
        } else {
            reserved_instruction(i);
        }
        return;
    }

    switch (i.cop_op()) {
    case CopOp::MF:
        write_reg(i.rt(), cp0_.read_reg(i.rd()));
        break;
    case CopOp::MT:
        cp0_.write_reg(i.rd(), gpr_[i.rt()], false);
        break;
    case CopOp::BC: {
        const bool want = (i.rt() & 1u) != 0;
        branch(cp0_.condition_line() == want, pc_ + 4 + (static_cast<u32>(i.simm16()) << 2));
        break;
    }
    default:
        reserved_instruction(i);
        break;
    }
}

// ── COP2 / GTE (opcode 0x12) ─────────────────────────────────────────────────
// Any access while a GTE command is still running waits for it.
void R3051::op_cop2(Instruction i) {
    if (!cp0_.is_co_processor_usable(2)) {
        raise(ExceptionReason::CpU, 0, 2);
        return;
    }

    if (i.is_cop_cmd()) {
        wait_for_gte();
        gte_cycles_ = gte_.gte_function(i.cop_cmd());
        return;
    }

    switch (i.cop_op()) {
    case CopOp::MF:
        wait_for_gte();
        write_reg(i.rt(), gte_.read_data_reg(i.rd()));
        break;
    case CopOp::CF:
        wait_for_gte();
        write_reg(i.rt(), gte_.read_control_reg(i.rd()));
        break;
    case CopOp::MT:
        wait_for_gte();
        gte_.write_data_reg(i.rd(), gpr_[i.rt()], false);
        break;
    case CopOp::CT:
        wait_for_gte();
        gte_.write_control_reg(i.rd(), gpr_[i.rt()], false);
        break;
    case CopOp::BC: {
        const bool want = (i.rt() & 1u) != 0;
        branch(gte_.condition_line() == want, pc_ + 4 + (static_cast<u32>(i.simm16()) << 2));
        break;
    }
    default:
        reserved_instruction(i);
        break;
    }
}

// COP1 and COP3 are not fitted.
void R3051::op_missing_cop(Instruction i) {
    raise(ExceptionReason::CpU, 0, i.cop_num());
}

// ── Loads ─────────────────────────────────────────────────────────────────────
// A load that faulted or found the bus busy leaves rt untouched.

void R3051::op_lb(CpuBridge& bridge, Instruction i) {
    const s64 value = read_data_value(bridge, DataWidth::Byte, effective_address(i));
    if (value == -1) return;
    write_reg(i.rt(), static_cast<u32>(bits::sext8(static_cast<u32>(value))));
}

void R3051::op_lbu(CpuBridge& bridge, Instruction i) {
    const s64 value = read_data_value(bridge, DataWidth::Byte, effective_address(i));
    if (value == -1) return;
    write_reg(i.rt(), static_cast<u32>(value));
}

void R3051::op_lh(CpuBridge& bridge, Instruction i) {
    const s64 value = read_data_value(bridge, DataWidth::Half, effective_address(i));
    if (value == -1) return;
    write_reg(i.rt(), static_cast<u32>(bits::sext16(static_cast<u32>(value))));
}

void R3051::op_lhu(CpuBridge& bridge, Instruction i) {
    const s64 value = read_data_value(bridge, DataWidth::Half, effective_address(i));
    if (value == -1) return;
    write_reg(i.rt(), static_cast<u32>(value));
}

void R3051::op_lw(CpuBridge& bridge, Instruction i) {
    const s64 value = read_data_value(bridge, DataWidth::Word, effective_address(i));
    if (value == -1) return;
    write_reg(i.rt(), static_cast<u32>(value));
}

// LWL/LWR merge part of the aligned word into rt.  Only the privilege check
// applies; the address is unaligned by definition.
void R3051::op_lwl(CpuBridge& bridge, Instruction i) {
    const u32 addr = effective_address(i);
    if (!cp0_.is_address_allowed(addr)) {
        raise(ExceptionReason::AdEL, addr);
        return;
    }
    const s64 word = load(bridge, DataWidth::Word, addr & ~3u);
    if (word == -1) return;

    static constexpr u32 keep[4]  = {0x00FF'FFFFu, 0x0000'FFFFu, 0x0000'00FFu, 0x0000'0000u};
    static constexpr u32 shift[4] = {24, 16, 8, 0};
    const u32 lane = addr & 3u;
    write_reg(i.rt(), (gpr_[i.rt()] & keep[lane]) | (static_cast<u32>(word) << shift[lane]));
}

void R3051::op_lwr(CpuBridge& bridge, Instruction i) {
    const u32 addr = effective_address(i);
    if (!cp0_.is_address_allowed(addr)) {
        raise(ExceptionReason::AdEL, addr);
        return;
    }
    const s64 word = load(bridge, DataWidth::Word, addr & ~3u);
    if (word == -1) return;

    static constexpr u32 keep[4]  = {0x0000'0000u, 0xFF00'0000u, 0xFFFF'0000u, 0xFFFF'FF00u};
    static constexpr u32 shift[4] = {0, 8, 16, 24};
    const u32 lane = addr & 3u;
    write_reg(i.rt(), (gpr_[i.rt()] & keep[lane]) | (static_cast<u32>(word) >> shift[lane]));
}

void R3051::op_lwc2(CpuBridge& bridge, Instruction i) {
    if (!cp0_.is_co_processor_usable(2)) {
        raise(ExceptionReason::CpU, 0, 2);
        return;
    }
    wait_for_gte();
    const s64 value = read_data_value(bridge, DataWidth::Word, effective_address(i));
    if (value == -1) return;
    gte_.write_data_reg(i.rt(), static_cast<u32>(value), false);
}

// ── Stores ────────────────────────────────────────────────────────────────────

void R3051::op_sb(CpuBridge& bridge, Instruction i) {
    write_data_value(bridge, DataWidth::Byte, effective_address(i), gpr_[i.rt()]);
}

void R3051::op_sh(CpuBridge& bridge, Instruction i) {
    write_data_value(bridge, DataWidth::Half, effective_address(i), gpr_[i.rt()]);
}

void R3051::op_sw(CpuBridge& bridge, Instruction i) {
    write_data_value(bridge, DataWidth::Word, effective_address(i), gpr_[i.rt()]);
}

// SWL/SWR write only the byte lanes they own; the other bytes of the
// aligned word are never read or touched.
void R3051::op_swl(CpuBridge& bridge, Instruction i) {
    const u32 addr = effective_address(i);
    if (!cp0_.is_address_allowed(addr)) {
        raise(ExceptionReason::AdES, addr);
        return;
    }
    static constexpr u32 shift[4] = {24, 16, 8, 0};
    const u32 lane = addr & 3u;
    store_lanes(bridge, addr & ~3u, 0, lane, gpr_[i.rt()] >> shift[lane]);
}

void R3051::op_swr(CpuBridge& bridge, Instruction i) {
    const u32 addr = effective_address(i);
    if (!cp0_.is_address_allowed(addr)) {
        raise(ExceptionReason::AdES, addr);
        return;
    }
    static constexpr u32 shift[4] = {0, 8, 16, 24};
    const u32 lane = addr & 3u;
    store_lanes(bridge, addr & ~3u, lane, 3, gpr_[i.rt()] << shift[lane]);
}

void R3051::op_swc2(CpuBridge& bridge, Instruction i) {
    if (!cp0_.is_co_processor_usable(2)) {
        raise(ExceptionReason::CpU, 0, 2);
        return;
    }
    wait_for_gte();
    write_data_value(bridge, DataWidth::Word, effective_address(i), gte_.read_data_reg(i.rt()));
}
