#pragma once

#include <array>
#include "common/Types.hpp"
#include "gte/GTEMath.hpp"

// ── GTE (Geometry Transformation Engine), COP2 ────────────────────────────────
//
// Fixed-function vector unit wired as co-processor 2.  It owns two banks of
// 32 registers that the CPU reaches with MFC2/MTC2/LWC2/SWC2 (data) and
// CFC2/CTC2 (control), plus a set of commands issued through COP2 imm25.
//
// Data registers:
//
//   0-5   VXY0 VZ0 VXY1 VZ1 VXY2 VZ2   input vectors (s16 lanes)
//   6     RGBC                          colour + GPU code byte
//   7     OTZ                           average Z (u16)
//   8-11  IR0..IR3                      16-bit saturated results
//   12-15 SXY0 SXY1 SXY2 SXYP          screen XY FIFO, SXYP pushes
//   16-19 SZ0..SZ3                      screen Z FIFO (u16)
//   20-22 RGB0..RGB2                    colour FIFO
//   23    RES1
//   24-27 MAC0..MAC3                    accumulators
//   28    IRGB                          5:5:5 write into IR1..IR3
//   29    ORGB                          5:5:5 view of IR1..IR3
//   30    LZCS                          leading-bit count source
//   31    LZCR                          leading-bit count result
//
// Control registers:
//
//   0-4   rotation matrix RT            5-7   translation TRX/TRY/TRZ
//   8-12  light matrix LLM              13-15 background colour RBK/GBK/BBK
//   16-20 light colour matrix LCM       21-23 far colour RFC/GFC/BFC
//   24-25 screen offset OFX/OFY         26    projection distance H
//   27    DQA                           28    DQB
//   29-30 ZSF3 ZSF4                     31    FLAG
//
// Matrices pack two s16 elements per register, low half first, row-major;
// the ninth element sits alone in the low half of the fifth register.
//
// ── Number formats ────────────────────────────────────────────────────────────
//
//   matrix elements, IR1..IR3    s16, 12 fraction bits (-8 .. +7.9998)
//   IR0                          0 .. 0x1000 (0.0 .. 1.0)
//   TR, BK, FC, OFX/OFY, DQB     s32; TR/BK/FC are scaled << 12 before use
//   MAC1..MAC3                   44-bit signed internally, s32 when stored
//   MAC0                         32-bit signed
//
// A product of two 12-bit-fraction values carries 24 fraction bits.  With
// sf set the sum is shifted right by 12 on its way into MAC1..MAC3; with sf
// clear it keeps all 24 and IR clamping usually saturates.
//
// The MAC1..MAC3 overflow flags test the full sum against [-2^43, 2^43 - 1]
// before the sf shift.  A host s64 holds three 16 x 16-bit products plus a
// shifted translation without wrapping, so the test is exact.

// ── FLAG bits ─────────────────────────────────────────────────────────────────
namespace Flag {
    inline constexpr u32 MAC1_POS  = 1u << 30;
    inline constexpr u32 MAC2_POS  = 1u << 29;
    inline constexpr u32 MAC3_POS  = 1u << 28;
    inline constexpr u32 MAC1_NEG  = 1u << 27;
    inline constexpr u32 MAC2_NEG  = 1u << 26;
    inline constexpr u32 MAC3_NEG  = 1u << 25;
    inline constexpr u32 IR1_SAT   = 1u << 24;
    inline constexpr u32 IR2_SAT   = 1u << 23;
    inline constexpr u32 IR3_SAT   = 1u << 22;
    inline constexpr u32 RGB_R_SAT = 1u << 21;
    inline constexpr u32 RGB_G_SAT = 1u << 20;
    inline constexpr u32 RGB_B_SAT = 1u << 19;
    inline constexpr u32 SZ3_SAT   = 1u << 18;  // also OTZ
    inline constexpr u32 DIV_OVF   = 1u << 17;
    inline constexpr u32 MAC0_POS  = 1u << 16;
    inline constexpr u32 MAC0_NEG  = 1u << 15;
    inline constexpr u32 SX2_SAT   = 1u << 14;
    inline constexpr u32 SY2_SAT   = 1u << 13;
    inline constexpr u32 IR0_SAT   = 1u << 12;

    // Bit 31 is the OR of these; IR3, the colour bits and IR0 are left out.
    inline constexpr u32 ERROR_MASK    = 0x7F87'E000u;
    inline constexpr u32 WRITABLE_MASK = 0x7FFF'F000u;
    inline constexpr u32 ERROR         = 1u << 31;
} // namespace Flag

namespace gte {

// ── Command word ──────────────────────────────────────────────────────────────
struct Cmd {
    u32 raw;

    [[nodiscard]] constexpr u32  func()  const noexcept { return raw & 0x3Fu; }
    // lm: clamp IR1..IR3 at 0 instead of -0x8000
    [[nodiscard]] constexpr bool lm()    const noexcept { return (raw >> 10) & 1u; }
    // sf: shift products right by 12 before they land in MAC1..MAC3
    [[nodiscard]] constexpr bool sf()    const noexcept { return (raw >> 19) & 1u; }
    [[nodiscard]] constexpr int  shift() const noexcept { return sf() ? 12 : 0; }
    // MVMVA operand selectors
    [[nodiscard]] constexpr u32  mx()    const noexcept { return (raw >> 17) & 3u; }
    [[nodiscard]] constexpr u32  vx()    const noexcept { return (raw >> 15) & 3u; }
    [[nodiscard]] constexpr u32  tx()    const noexcept { return (raw >> 13) & 3u; }
};

// ── Command numbers ───────────────────────────────────────────────────────────
namespace Command {
    inline constexpr u32 RTPS  = 0x01;
    inline constexpr u32 NCLIP = 0x06;
    inline constexpr u32 OP    = 0x0C;
    inline constexpr u32 DPCS  = 0x10;
    inline constexpr u32 INTPL = 0x11;
    inline constexpr u32 MVMVA = 0x12;
    inline constexpr u32 NCDS  = 0x13;
    inline constexpr u32 CDP   = 0x14;
    inline constexpr u32 NCDT  = 0x16;
    inline constexpr u32 NCCS  = 0x1B;
    inline constexpr u32 CC    = 0x1C;
    inline constexpr u32 NCS   = 0x1E;
    inline constexpr u32 NCT   = 0x20;
    inline constexpr u32 SQR   = 0x28;
    inline constexpr u32 DCPL  = 0x29;
    inline constexpr u32 DPCT  = 0x2A;
    inline constexpr u32 AVSZ3 = 0x2D;
    inline constexpr u32 AVSZ4 = 0x2E;
    inline constexpr u32 RTPT  = 0x30;
    inline constexpr u32 GPF   = 0x3D;
    inline constexpr u32 GPL   = 0x3E;
    inline constexpr u32 NCCT  = 0x3F;
} // namespace Command

// Cycle cost of a command, 0 for numbers that decode to nothing.
[[nodiscard]] s32 command_cycles(u32 func) noexcept;

// Unsigned Newton-Raphson divide used by RTPS/RTPT: (h * 0x20000 / sz3 + 1) / 2
// rounded the way the hardware rounds it.  Sets Flag::DIV_OVF and returns
// 0x1FFFF when h >= 2 * sz3.
[[nodiscard]] u32 unr_divide(u32 h, u32 sz3, u32& flag) noexcept;

} // namespace gte

// ── GTE ───────────────────────────────────────────────────────────────────────
class GTE {
public:
    GTE() noexcept = default;

    void reset() noexcept;

    // ── Register access ───────────────────────────────────────────────────────
    // Indices above 31 throw std::out_of_range.
    [[nodiscard]] u32 read_control_reg(u32 reg) const;
    [[nodiscard]] u32 read_data_reg(u32 reg) const;

    // With override_rules the value is stored verbatim and none of the
    // register side effects (FIFO pushes, IRGB unpacking) happen.
    void write_control_reg(u32 reg, u32 value, bool override_rules);
    void write_data_reg(u32 reg, u32 value, bool override_rules);

    // Stored register contents, bypassing the read-side views.
    [[nodiscard]] u32 raw_control(u32 reg) const noexcept { return control_[reg & 31u]; }
    [[nodiscard]] u32 raw_data(u32 reg)    const noexcept { return data_[reg & 31u]; }

    // ── Commands ──────────────────────────────────────────────────────────────
    // Executes the command in bits [24:0] and returns its cycle cost.
    // Unknown command numbers cost nothing and change nothing.
    s32 gte_function(u32 command);

    [[nodiscard]] bool condition_line() const noexcept { return condition_line_; }

private:
    // ── Operand access ────────────────────────────────────────────────────────
    [[nodiscard]] gte::Matrix3 matrix(u32 base) const noexcept;
    [[nodiscard]] gte::Vector3 control_vector(u32 base) const noexcept;
    [[nodiscard]] gte::Vector3 vertex(u32 n) const noexcept;
    [[nodiscard]] gte::Vector3 ir_vector() const noexcept;
    [[nodiscard]] gte::Vector3 rgb_vector(u32 reg) const noexcept;
    [[nodiscard]] s64 ir(u32 i) const noexcept;
    [[nodiscard]] s64 ir0() const noexcept;

    // ── Result writers ────────────────────────────────────────────────────────
    // set_mac checks the unshifted value against the 44-bit range, stores
    // it shifted, and returns what was stored (before 32-bit truncation).
    // The value is not clamped; only the flag records the overflow.
    s64  set_mac(u32 i, s64 value, int shift) noexcept;
    void set_mac0(s64 value) noexcept;
    void set_ir(u32 i, s64 value, bool lm) noexcept;
    void set_ir0(s64 value) noexcept;
    void set_mac_ir(const gte::Vector3& sums, int shift, bool lm) noexcept;
    void push_sxy(s64 x, s64 y) noexcept;
    void push_sz(s64 z) noexcept;
    void push_color(s64 r, s64 g, s64 b) noexcept;
    void push_color_from_mac() noexcept;
    void finish_flag() noexcept;
    [[nodiscard]] u32& flag() noexcept { return control_[31]; }

    [[nodiscard]] gte::Vector3 mac_vector() const noexcept;

    // ── Command bodies ────────────────────────────────────────────────────────
    void rtp(gte::Cmd c, u32 n, bool last);
    void op_nclip();
    void op_op(gte::Cmd c);
    void op_dpcs(gte::Cmd c);
    void op_dpct(gte::Cmd c);
    void op_intpl(gte::Cmd c);
    void op_mvmva(gte::Cmd c);
    void op_sqr(gte::Cmd c);
    void op_dcpl(gte::Cmd c);
    void op_avsz3();
    void op_avsz4();
    void op_gpf(gte::Cmd c);
    void op_gpl(gte::Cmd c);

    // Shared lighting stages.  The NC family runs the light matrix on a
    // vertex, then the background/colour matrix stage, then optionally a
    // colour multiply (CC) or colour multiply plus far-colour blend (CD).
    void light_vertex(gte::Cmd c, u32 n);
    void background_color(gte::Cmd c);
    void handle_common_nc(gte::Cmd c, u32 n);
    void handle_common_ncc(gte::Cmd c, u32 n);
    void handle_common_ncd(gte::Cmd c, u32 n);
    void handle_cc(gte::Cmd c);
    void handle_cdp(gte::Cmd c);
    // MAC = mac_in + (FC - mac_in) * IR0, then IR and colour FIFO.
    void depth_cue(gte::Cmd c, const gte::Vector3& mac_in);

    std::array<u32, 32> control_{};
    std::array<u32, 32> data_{};
    bool condition_line_ = false;
};
