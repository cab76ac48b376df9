#pragma once

#include "common/Types.hpp"

// ── R3051 instruction word ────────────────────────────────────────────────────
//
//  R-type  [31:26] op=0   [25:21] rs   [20:16] rt   [15:11] rd
//          [10:6]  shamt  [5:0]   funct
//
//  I-type  [31:26] op     [25:21] rs   [20:16] rt   [15:0]  imm16
//
//  J-type  [31:26] op     [25:0]  target26
//
//  COPz    [31:26] 0x10+z [25]    1 = co-processor command, [24:0] command word
//          otherwise      [25:21] sub-op (MF/CF/MT/CT/BC), rt, rd as R-type
//
struct Instruction {
    u32 raw;

    [[nodiscard]] constexpr u32 opcode() const noexcept { return raw >> 26; }
    [[nodiscard]] constexpr u32 rs()     const noexcept { return (raw >> 21) & 0x1Fu; }
    [[nodiscard]] constexpr u32 rt()     const noexcept { return (raw >> 16) & 0x1Fu; }
    [[nodiscard]] constexpr u32 rd()     const noexcept { return (raw >> 11) & 0x1Fu; }
    [[nodiscard]] constexpr u32 shamt()  const noexcept { return (raw >>  6) & 0x1Fu; }
    [[nodiscard]] constexpr u32 funct()  const noexcept { return raw & 0x3Fu; }

    [[nodiscard]] constexpr u32 uimm16() const noexcept { return raw & 0xFFFFu; }
    [[nodiscard]] constexpr s32 simm16() const noexcept {
        return static_cast<s32>(static_cast<s16>(raw & 0xFFFFu));
    }

    [[nodiscard]] constexpr u32 target26() const noexcept { return raw & 0x3FF'FFFFu; }

    // Co-processor number of a COPz / LWCz / SWCz instruction.
    [[nodiscard]] constexpr u32 cop_num()     const noexcept { return (raw >> 26) & 3u; }
    [[nodiscard]] constexpr u32 cop_op()      const noexcept { return (raw >> 21) & 0x1Fu; }
    [[nodiscard]] constexpr bool is_cop_cmd() const noexcept { return (raw >> 25) & 1u; }
    [[nodiscard]] constexpr u32 cop_cmd()     const noexcept { return raw & 0x1FF'FFFFu; }
};

// ── Primary opcode table ──────────────────────────────────────────────────────
namespace Op {
    inline constexpr u32 SPECIAL = 0x00;  // dispatch on funct
    inline constexpr u32 BCOND   = 0x01;  // dispatch on rt
    inline constexpr u32 J       = 0x02;
    inline constexpr u32 JAL     = 0x03;
    inline constexpr u32 BEQ     = 0x04;
    inline constexpr u32 BNE     = 0x05;
    inline constexpr u32 BLEZ    = 0x06;
    inline constexpr u32 BGTZ    = 0x07;
    inline constexpr u32 ADDI    = 0x08;
    inline constexpr u32 ADDIU   = 0x09;
    inline constexpr u32 SLTI    = 0x0A;
    inline constexpr u32 SLTIU   = 0x0B;
    inline constexpr u32 ANDI    = 0x0C;
    inline constexpr u32 ORI     = 0x0D;
    inline constexpr u32 XORI    = 0x0E;
    inline constexpr u32 LUI     = 0x0F;
    inline constexpr u32 COP0    = 0x10;
    inline constexpr u32 COP1    = 0x11;  // absent on this CPU
    inline constexpr u32 COP2    = 0x12;  // GTE
    inline constexpr u32 COP3    = 0x13;  // absent on this CPU
    inline constexpr u32 LB      = 0x20;
    inline constexpr u32 LH      = 0x21;
    inline constexpr u32 LWL     = 0x22;
    inline constexpr u32 LW      = 0x23;
    inline constexpr u32 LBU     = 0x24;
    inline constexpr u32 LHU     = 0x25;
    inline constexpr u32 LWR     = 0x26;
    inline constexpr u32 SB      = 0x28;
    inline constexpr u32 SH      = 0x29;
    inline constexpr u32 SWL     = 0x2A;
    inline constexpr u32 SW      = 0x2B;
    inline constexpr u32 SWR     = 0x2E;
    inline constexpr u32 LWC0    = 0x30;
    inline constexpr u32 LWC1    = 0x31;
    inline constexpr u32 LWC2    = 0x32;
    inline constexpr u32 LWC3    = 0x33;
    inline constexpr u32 SWC0    = 0x38;
    inline constexpr u32 SWC1    = 0x39;
    inline constexpr u32 SWC2    = 0x3A;
    inline constexpr u32 SWC3    = 0x3B;
} // namespace Op

// ── SPECIAL funct codes ───────────────────────────────────────────────────────
namespace Funct {
    inline constexpr u32 SLL     = 0x00;
    inline constexpr u32 SRL     = 0x02;
    inline constexpr u32 SRA     = 0x03;
    inline constexpr u32 SLLV    = 0x04;
    inline constexpr u32 SRLV    = 0x06;
    inline constexpr u32 SRAV    = 0x07;
    inline constexpr u32 JR      = 0x08;
    inline constexpr u32 JALR    = 0x09;
    inline constexpr u32 SYSCALL = 0x0C;
    inline constexpr u32 BREAK   = 0x0D;
    inline constexpr u32 MFHI    = 0x10;
    inline constexpr u32 MTHI    = 0x11;
    inline constexpr u32 MFLO    = 0x12;
    inline constexpr u32 MTLO    = 0x13;
    inline constexpr u32 MULT    = 0x18;
    inline constexpr u32 MULTU   = 0x19;
    inline constexpr u32 DIV     = 0x1A;
    inline constexpr u32 DIVU    = 0x1B;
    inline constexpr u32 ADD     = 0x20;
    inline constexpr u32 ADDU    = 0x21;
    inline constexpr u32 SUB     = 0x22;
    inline constexpr u32 SUBU    = 0x23;
    inline constexpr u32 AND     = 0x24;
    inline constexpr u32 OR      = 0x25;
    inline constexpr u32 XOR     = 0x26;
    inline constexpr u32 NOR     = 0x27;
    inline constexpr u32 SLT     = 0x2A;
    inline constexpr u32 SLTU    = 0x2B;
} // namespace Funct

// ── BCOND rt decode ───────────────────────────────────────────────────────────
// The hardware only looks at rt bit 0 (GEZ vs LTZ) and rt[4:1] == 0b1000
// (link).  Every other rt value still executes as plain BLTZ/BGEZ.
namespace BCond {
    inline constexpr u32 BLTZ    = 0x00;
    inline constexpr u32 BGEZ    = 0x01;
    inline constexpr u32 BLTZAL  = 0x10;
    inline constexpr u32 BGEZAL  = 0x11;

    [[nodiscard]] constexpr bool is_gez(u32 rt)  noexcept { return (rt & 1u) != 0; }
    [[nodiscard]] constexpr bool is_link(u32 rt) noexcept { return (rt & 0x1Eu) == 0x10u; }
} // namespace BCond

// ── COPz sub-opcodes (rs field) ───────────────────────────────────────────────
namespace CopOp {
    inline constexpr u32 MF  = 0x00;  // move from data register
    inline constexpr u32 CF  = 0x02;  // move from control register
    inline constexpr u32 MT  = 0x04;  // move to data register
    inline constexpr u32 CT  = 0x06;  // move to control register
    inline constexpr u32 BC  = 0x08;  // branch on condition line (rt = 0 false, 1 true)
    inline constexpr u32 RFE = 0x10;  // COP0 command, funct = 0x10
} // namespace CopOp
