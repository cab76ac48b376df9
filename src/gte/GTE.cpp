#include "GTE.hpp"

#include <cstdio>
#include <stdexcept>
#include <string>

#include "common/Bits.hpp"

using gte::Cmd;
using gte::Matrix3;
using gte::Vector3;

namespace gte {

// 257-entry reciprocal seed table, indexed by the top bits of the
// normalised divisor (d - 0x7FC0) >> 7.
static const u8 kUNR_TABLE[257] = {
    0xFF,0xFD,0xFB,0xF9,0xF7,0xF5,0xF3,0xF1,0xEF,0xEE,0xEC,0xEA,0xE8,0xE6,0xE4,0xE3,
    0xE1,0xDF,0xDD,0xDC,0xDA,0xD8,0xD6,0xD5,0xD3,0xD1,0xD0,0xCE,0xCD,0xCB,0xC9,0xC8,
    0xC6,0xC5,0xC3,0xC1,0xC0,0xBE,0xBD,0xBB,0xBA,0xB8,0xB7,0xB5,0xB4,0xB2,0xB1,0xB0,
    0xAE,0xAD,0xAB,0xAA,0xA9,0xA7,0xA6,0xA4,0xA3,0xA2,0xA0,0x9F,0x9E,0x9C,0x9B,0x9A,
    0x99,0x97,0x96,0x95,0x94,0x92,0x91,0x90,0x8F,0x8D,0x8C,0x8B,0x8A,0x89,0x87,0x86,
    0x85,0x84,0x83,0x82,0x81,0x7F,0x7E,0x7D,0x7C,0x7B,0x7A,0x79,0x78,0x77,0x75,0x74,
    0x73,0x72,0x71,0x70,0x6F,0x6E,0x6D,0x6C,0x6B,0x6A,0x69,0x68,0x67,0x66,0x65,0x64,
    0x63,0x62,0x61,0x60,0x5F,0x5E,0x5D,0x5D,0x5C,0x5B,0x5A,0x59,0x58,0x57,0x56,0x55,
    0x54,0x53,0x53,0x52,0x51,0x50,0x4F,0x4E,0x4D,0x4D,0x4C,0x4B,0x4A,0x49,0x48,0x48,
    0x47,0x46,0x45,0x44,0x43,0x43,0x42,0x41,0x40,0x3F,0x3F,0x3E,0x3D,0x3C,0x3C,0x3B,
    0x3A,0x39,0x39,0x38,0x37,0x36,0x36,0x35,0x34,0x33,0x33,0x32,0x31,0x31,0x30,0x2F,
    0x2E,0x2E,0x2D,0x2C,0x2C,0x2B,0x2A,0x2A,0x29,0x28,0x28,0x27,0x26,0x26,0x25,0x24,
    0x24,0x23,0x22,0x22,0x21,0x20,0x20,0x1F,0x1E,0x1E,0x1D,0x1D,0x1C,0x1B,0x1B,0x1A,
    0x19,0x19,0x18,0x18,0x17,0x16,0x16,0x15,0x15,0x14,0x14,0x13,0x12,0x12,0x11,0x11,
    0x10,0x0F,0x0F,0x0E,0x0E,0x0D,0x0D,0x0C,0x0C,0x0B,0x0A,0x0A,0x09,0x09,0x08,0x08,
    0x07,0x07,0x06,0x06,0x05,0x05,0x04,0x04,0x03,0x03,0x02,0x02,0x01,0x01,0x00,0x00,
    0x00
};

s32 command_cycles(u32 func) noexcept {
    switch (func) {
        case Command::RTPS:  return 15;
        case Command::NCLIP: return 8;
        case Command::OP:    return 6;
        case Command::DPCS:  return 8;
        case Command::INTPL: return 8;
        case Command::MVMVA: return 8;
        case Command::NCDS:  return 19;
        case Command::CDP:   return 13;
        case Command::NCDT:  return 44;
        case Command::NCCS:  return 17;
        case Command::CC:    return 11;
        case Command::NCS:   return 14;
        case Command::NCT:   return 30;
        case Command::SQR:   return 5;
        case Command::DCPL:  return 8;
        case Command::DPCT:  return 17;
        case Command::AVSZ3: return 5;
        case Command::AVSZ4: return 6;
        case Command::RTPT:  return 23;
        case Command::GPF:   return 5;
        case Command::GPL:   return 5;
        case Command::NCCT:  return 39;
        default:             return 0;
    }
}

u32 unr_divide(u32 h, u32 sz3, u32& flag) noexcept {
    if (h >= sz3 * 2) {
        flag |= Flag::DIV_OVF;
        return 0x1'FFFFu;
    }

    // Normalise so the divisor has bit 15 set.
    const int z = bits::count_leading_zeros(sz3 & 0xFFFFu) - 16;
    const u64 n = u64{h} << z;
    u64 d = u64{sz3} << z;
    const u64 u = u64{kUNR_TABLE[(d - 0x7FC0u) >> 7]} + 0x101u;
    d = (0x200'0080u - d * u) >> 8;
    d = (0x80u + d * u) >> 8;
    return static_cast<u32>(bits::min_of<u64>(0x1'FFFFu, (n * d + 0x8000u) >> 16));
}

} // namespace gte

namespace {

constexpr s64 MAC_MAX  = (s64{1} << 43) - 1;
constexpr s64 MAC_MIN  = -(s64{1} << 43);
constexpr s64 MAC0_MAX = 0x7FFF'FFFFll;
constexpr s64 MAC0_MIN = -0x8000'0000ll;

constexpr u32 MAC_POS[4] = {Flag::MAC0_POS, Flag::MAC1_POS, Flag::MAC2_POS, Flag::MAC3_POS};
constexpr u32 MAC_NEG[4] = {Flag::MAC0_NEG, Flag::MAC1_NEG, Flag::MAC2_NEG, Flag::MAC3_NEG};
constexpr u32 IR_SAT[4]  = {Flag::IR0_SAT,  Flag::IR1_SAT,  Flag::IR2_SAT,  Flag::IR3_SAT};

void check_index(const char* bank, u32 reg) {
    if (reg >= 32) {
        throw std::out_of_range(std::string("[GTE] ") + bank + " register index "
                                + std::to_string(reg) + " out of range");
    }
}

[[nodiscard]] s64 lo16(u32 word) noexcept { return bits::sext16(word); }
[[nodiscard]] s64 hi16(u32 word) noexcept { return bits::sext16(word >> 16); }

} // namespace

void GTE::reset() noexcept {
    control_.fill(0);
    data_.fill(0);
    condition_line_ = false;
}

// ── Register access ───────────────────────────────────────────────────────────

u32 GTE::read_control_reg(u32 reg) const {
    check_index("control", reg);
    switch (reg) {
        // RT33, L33, LB3 and H..ZSF4 come back sign-extended from bit 15,
        // H included even though the GTE itself treats it as unsigned.
        case 4: case 12: case 20:
        case 26: case 27: case 28: case 29: case 30:
            return static_cast<u32>(bits::sext16(control_[reg]));
        default:
            return control_[reg];
    }
}

u32 GTE::read_data_reg(u32 reg) const {
    check_index("data", reg);
    switch (reg) {
        case 1: case 3: case 5:
        case 8: case 9: case 10: case 11:
            return static_cast<u32>(bits::sext16(data_[reg]));
        case 7: case 16: case 17: case 18: case 19:
            return data_[reg] & 0xFFFFu;
        case 23:
        case 28:
            return 0;
        case 29: {
            u32 orgb = 0;
            for (u32 i = 0; i < 3; ++i) {
                const s32 c = bits::clamp_range(bits::sext16(data_[9 + i]) >> 7, 0, 0x1F);
                orgb |= static_cast<u32>(c) << (5 * i);
            }
            return orgb;
        }
        case 31:
            return static_cast<u32>(bits::count_leading_sign_bits(data_[30]));
        default:
            return data_[reg];
    }
}

void GTE::write_control_reg(u32 reg, u32 value, bool override_rules) {
    check_index("control", reg);
    if (reg == 31 && !override_rules) {
        control_[31] = value & Flag::WRITABLE_MASK;
        return;
    }
    control_[reg] = value;
}

void GTE::write_data_reg(u32 reg, u32 value, bool override_rules) {
    check_index("data", reg);
    if (override_rules) {
        data_[reg] = value;
        return;
    }
    switch (reg) {
        case 7: case 23: case 29: case 31:
            break;
        case 14:
            data_[14] = value;
            data_[15] = value;
            break;
        case 15:
            data_[12] = data_[13];
            data_[13] = data_[14];
            data_[14] = value;
            data_[15] = value;
            break;
        case 28:
            data_[28] = value;
            data_[9]  = (value & 0x1Fu) << 7;
            data_[10] = ((value >> 5) & 0x1Fu) << 7;
            data_[11] = ((value >> 10) & 0x1Fu) << 7;
            break;
        default:
            data_[reg] = value;
            break;
    }
}

// ── Operand access ────────────────────────────────────────────────────────────

Matrix3 GTE::matrix(u32 base) const noexcept {
    Matrix3 m;
    for (u32 k = 0; k < 9; ++k) {
        const u32 word = control_[base + k / 2];
        m.rows[k / 3][k % 3] = (k & 1u) ? hi16(word) : lo16(word);
    }
    return m;
}

Vector3 GTE::control_vector(u32 base) const noexcept {
    return {static_cast<s32>(control_[base]),
            static_cast<s32>(control_[base + 1]),
            static_cast<s32>(control_[base + 2])};
}

Vector3 GTE::vertex(u32 n) const noexcept {
    const u32 xy = data_[2 * n];
    return {lo16(xy), hi16(xy), lo16(data_[2 * n + 1])};
}

Vector3 GTE::ir_vector() const noexcept { return {ir(1), ir(2), ir(3)}; }

Vector3 GTE::rgb_vector(u32 reg) const noexcept {
    const u32 c = data_[reg];
    return {c & 0xFFu, (c >> 8) & 0xFFu, (c >> 16) & 0xFFu};
}

s64 GTE::ir(u32 i) const noexcept { return lo16(data_[8 + i]); }
s64 GTE::ir0() const noexcept     { return lo16(data_[8]); }

Vector3 GTE::mac_vector() const noexcept {
    return {static_cast<s32>(data_[25]), static_cast<s32>(data_[26]), static_cast<s32>(data_[27])};
}

// ── Result writers ────────────────────────────────────────────────────────────

s64 GTE::set_mac(u32 i, s64 value, int shift) noexcept {
    if (value > MAC_MAX)      flag() |= MAC_POS[i];
    else if (value < MAC_MIN) flag() |= MAC_NEG[i];
    const s64 shifted = value >> shift;
    data_[24 + i] = static_cast<u32>(shifted);
    return shifted;
}

void GTE::set_mac0(s64 value) noexcept {
    if (value > MAC0_MAX)      flag() |= Flag::MAC0_POS;
    else if (value < MAC0_MIN) flag() |= Flag::MAC0_NEG;
    data_[24] = static_cast<u32>(value);
}

void GTE::set_ir(u32 i, s64 value, bool lm) noexcept {
    const s64 lo = lm ? 0 : -0x8000;
    const s64 clamped = bits::clamp_range<s64>(value, lo, 0x7FFF);
    if (clamped != value) flag() |= IR_SAT[i];
    data_[8 + i] = static_cast<u32>(clamped);
}

void GTE::set_ir0(s64 value) noexcept {
    const s64 clamped = bits::clamp_range<s64>(value, 0, 0x1000);
    if (clamped != value) flag() |= Flag::IR0_SAT;
    data_[8] = static_cast<u32>(clamped);
}

void GTE::set_mac_ir(const Vector3& sums, int shift, bool lm) noexcept {
    for (u32 i = 1; i <= 3; ++i) {
        set_ir(i, set_mac(i, sums[static_cast<int>(i) - 1], shift), lm);
    }
}

void GTE::push_sxy(s64 x, s64 y) noexcept {
    const s64 cx = bits::clamp_range<s64>(x, -0x400, 0x3FF);
    const s64 cy = bits::clamp_range<s64>(y, -0x400, 0x3FF);
    if (cx != x) flag() |= Flag::SX2_SAT;
    if (cy != y) flag() |= Flag::SY2_SAT;
    data_[12] = data_[13];
    data_[13] = data_[14];
    data_[14] = (static_cast<u32>(cx) & 0xFFFFu) | (static_cast<u32>(cy) << 16);
    data_[15] = data_[14];
}

void GTE::push_sz(s64 z) noexcept {
    const s64 cz = bits::clamp_range<s64>(z, 0, 0xFFFF);
    if (cz != z) flag() |= Flag::SZ3_SAT;
    data_[16] = data_[17];
    data_[17] = data_[18];
    data_[18] = data_[19];
    data_[19] = static_cast<u32>(cz);
}

void GTE::push_color(s64 r, s64 g, s64 b) noexcept {
    const s64 cr = bits::clamp_range<s64>(r, 0, 0xFF);
    const s64 cg = bits::clamp_range<s64>(g, 0, 0xFF);
    const s64 cb = bits::clamp_range<s64>(b, 0, 0xFF);
    if (cr != r) flag() |= Flag::RGB_R_SAT;
    if (cg != g) flag() |= Flag::RGB_G_SAT;
    if (cb != b) flag() |= Flag::RGB_B_SAT;
    const u32 code = data_[6] & 0xFF00'0000u;
    data_[20] = data_[21];
    data_[21] = data_[22];
    data_[22] = static_cast<u32>(cr) | (static_cast<u32>(cg) << 8) | (static_cast<u32>(cb) << 16) | code;
}

void GTE::push_color_from_mac() noexcept {
    const Vector3 mac = mac_vector();
    push_color(mac.x >> 4, mac.y >> 4, mac.z >> 4);
}

void GTE::finish_flag() noexcept {
    u32& f = flag();
    f &= Flag::WRITABLE_MASK;
    if (f & Flag::ERROR_MASK) f |= Flag::ERROR;
}

// ── Dispatch ──────────────────────────────────────────────────────────────────

s32 GTE::gte_function(u32 command) {
    const Cmd c{command & 0x1FF'FFFFu};
    const s32 cycles = gte::command_cycles(c.func());
    if (cycles == 0) {
        std::fprintf(stderr, "[GTE] unknown command 0x%02X (word 0x%07X)\n", c.func(), c.raw);
        return 0;
    }

    flag() = 0;
    switch (c.func()) {
        case gte::Command::RTPS:  rtp(c, 0, true); break;
        case gte::Command::RTPT:  rtp(c, 0, false); rtp(c, 1, false); rtp(c, 2, true); break;
        case gte::Command::NCLIP: op_nclip(); break;
        case gte::Command::OP:    op_op(c); break;
        case gte::Command::DPCS:  op_dpcs(c); break;
        case gte::Command::DPCT:  op_dpct(c); break;
        case gte::Command::INTPL: op_intpl(c); break;
        case gte::Command::MVMVA: op_mvmva(c); break;
        case gte::Command::NCDS:  handle_common_ncd(c, 0); break;
        case gte::Command::NCDT:  for (u32 n = 0; n < 3; ++n) handle_common_ncd(c, n); break;
        case gte::Command::CDP:   handle_cdp(c); break;
        case gte::Command::NCCS:  handle_common_ncc(c, 0); break;
        case gte::Command::NCCT:  for (u32 n = 0; n < 3; ++n) handle_common_ncc(c, n); break;
        case gte::Command::CC:    handle_cc(c); break;
        case gte::Command::NCS:   handle_common_nc(c, 0); break;
        case gte::Command::NCT:   for (u32 n = 0; n < 3; ++n) handle_common_nc(c, n); break;
        case gte::Command::SQR:   op_sqr(c); break;
        case gte::Command::DCPL:  op_dcpl(c); break;
        case gte::Command::AVSZ3: op_avsz3(); break;
        case gte::Command::AVSZ4: op_avsz4(); break;
        case gte::Command::GPF:   op_gpf(c); break;
        case gte::Command::GPL:   op_gpl(c); break;
        default: break;
    }
    finish_flag();
    return cycles;
}

// ── Perspective transform ─────────────────────────────────────────────────────
//
//   MAC = (TR << 12) + RT * V                  (shifted by sf)
//   IR1/IR2 = lim(MAC1/MAC2, lm)
//   IR3 = MAC3 clamped to -0x8000..0x7FFF whatever lm says; the saturation
//         flag however is judged on raw >> 12, so with sf=0 the two can disagree
//   SZ3 = raw3 >> 12, pushed
//   n = H / SZ3 (UNR)
//   SX2 = (n * IR1 + OFX) >> 16, SY2 = (n * IR2 + OFY) >> 16, pushed
//   last vertex only: MAC0 = n * DQA + DQB, IR0 = MAC0 >> 12
void GTE::rtp(Cmd c, u32 n, bool last) {
    const Vector3 raw = (control_vector(5) << 12) + matrix(0) * vertex(n);
    const int shift = c.shift();

    const s64 mac1 = set_mac(1, raw.x, shift);
    const s64 mac2 = set_mac(2, raw.y, shift);
    const s64 mac3 = set_mac(3, raw.z, shift);
    set_ir(1, mac1, c.lm());
    set_ir(2, mac2, c.lm());

    const s64 ir3_check = raw.z >> 12;
    if (ir3_check < -0x8000 || ir3_check > 0x7FFF) flag() |= Flag::IR3_SAT;
    data_[11] = static_cast<u32>(bits::clamp_range<s64>(mac3, -0x8000, 0x7FFF));

    push_sz(raw.z >> 12);

    const u32 h   = control_[26] & 0xFFFFu;
    const u32 sz3 = data_[19] & 0xFFFFu;
    const s64 q   = gte::unr_divide(h, sz3, flag());

    const s64 sx = q * ir(1) + static_cast<s32>(control_[24]);
    set_mac0(sx);
    const s64 sy = q * ir(2) + static_cast<s32>(control_[25]);
    set_mac0(sy);
    push_sxy(sx >> 16, sy >> 16);

    if (last) {
        const s64 depth = q * lo16(control_[27]) + static_cast<s32>(control_[28]);
        set_mac0(depth);
        set_ir0(depth >> 12);
    }
}

void GTE::op_nclip() {
    const s64 sx0 = lo16(data_[12]), sy0 = hi16(data_[12]);
    const s64 sx1 = lo16(data_[13]), sy1 = hi16(data_[13]);
    const s64 sx2 = lo16(data_[14]), sy2 = hi16(data_[14]);
    set_mac0(sx0 * sy1 + sx1 * sy2 + sx2 * sy0 - sx0 * sy2 - sx1 * sy0 - sx2 * sy1);
}

// Outer product of IR with the rotation matrix diagonal.
void GTE::op_op(Cmd c) {
    const s64 d1 = lo16(control_[0]);
    const s64 d2 = lo16(control_[2]);
    const s64 d3 = lo16(control_[4]);
    const s64 i1 = ir(1), i2 = ir(2), i3 = ir(3);
    set_mac_ir({i3 * d2 - i2 * d3, i1 * d3 - i3 * d1, i2 * d1 - i1 * d2}, c.shift(), c.lm());
}

void GTE::depth_cue(Cmd c, const Vector3& mac_in) {
    const Vector3 fc = control_vector(21);
    const int shift = c.shift();
    for (u32 i = 1; i <= 3; ++i) {
        const int k = static_cast<int>(i) - 1;
        set_ir(i, set_mac(i, (fc[k] << 12) - mac_in[k], shift), false);
    }
    const s64 f = ir0();
    set_mac_ir({ir(1) * f + mac_in.x, ir(2) * f + mac_in.y, ir(3) * f + mac_in.z}, shift, c.lm());
    push_color_from_mac();
}

void GTE::op_dpcs(Cmd c) { depth_cue(c, rgb_vector(6) << 16); }

// Each pass consumes RGB0; the push shifts the next entry into place.
void GTE::op_dpct(Cmd c) {
    for (int pass = 0; pass < 3; ++pass) depth_cue(c, rgb_vector(20) << 16);
}

void GTE::op_intpl(Cmd c) { depth_cue(c, ir_vector() << 12); }

void GTE::op_dcpl(Cmd c) { depth_cue(c, rgb_vector(6).scale(ir_vector()) << 4); }

void GTE::op_mvmva(Cmd c) {
    Matrix3 m;
    switch (c.mx()) {
        case 0: m = matrix(0);  break;
        case 1: m = matrix(8);  break;
        case 2: m = matrix(16); break;
        default: {
            // Selector 3 reads a matrix of stray internal values.
            const s64 r = data_[6] & 0xFFu;
            const s64 rt13 = lo16(control_[1]);
            const s64 rt22 = lo16(control_[2]);
            m.rows = {{{-(r << 4), r << 4, ir0()}, {rt13, rt13, rt13}, {rt22, rt22, rt22}}};
            break;
        }
    }

    const Vector3 v = c.vx() == 3 ? ir_vector() : vertex(c.vx());
    Vector3 t;
    switch (c.tx()) {
        case 0: t = control_vector(5);  break;
        case 1: t = control_vector(13); break;
        case 2: t = control_vector(21); break;
        default: break;
    }

    const int shift = c.shift();
    if (c.tx() == 2) {
        // The far-colour translation is broken in hardware: the first column
        // term only contributes flags and the result uses columns 2 and 3.
        for (u32 i = 1; i <= 3; ++i) {
            const int r = static_cast<int>(i) - 1;
            const s64 partial = set_mac(i, (t[r] << 12) + m.at(r, 0) * v.x, shift);
            set_ir(i, partial, false);
        }
        set_mac_ir({m.at(0, 1) * v.y + m.at(0, 2) * v.z,
                    m.at(1, 1) * v.y + m.at(1, 2) * v.z,
                    m.at(2, 1) * v.y + m.at(2, 2) * v.z}, shift, c.lm());
        return;
    }
    set_mac_ir((t << 12) + m * v, shift, c.lm());
}

void GTE::op_sqr(Cmd c) {
    const Vector3 v = ir_vector();
    set_mac_ir(v.scale(v), c.shift(), c.lm());
}

void GTE::op_avsz3() {
    const s64 sum = lo16(control_[29]) * (s64{data_[17] & 0xFFFFu} + (data_[18] & 0xFFFFu) + (data_[19] & 0xFFFFu));
    set_mac0(sum);
    const s64 otz = bits::clamp_range<s64>(sum >> 12, 0, 0xFFFF);
    if (otz != (sum >> 12)) flag() |= Flag::SZ3_SAT;
    data_[7] = static_cast<u32>(otz);
}

void GTE::op_avsz4() {
    const s64 sum = lo16(control_[30]) * (s64{data_[16] & 0xFFFFu} + (data_[17] & 0xFFFFu)
                                          + (data_[18] & 0xFFFFu) + (data_[19] & 0xFFFFu));
    set_mac0(sum);
    const s64 otz = bits::clamp_range<s64>(sum >> 12, 0, 0xFFFF);
    if (otz != (sum >> 12)) flag() |= Flag::SZ3_SAT;
    data_[7] = static_cast<u32>(otz);
}

void GTE::op_gpf(Cmd c) {
    const s64 f = ir0();
    set_mac_ir({ir(1) * f, ir(2) * f, ir(3) * f}, c.shift(), c.lm());
    push_color_from_mac();
}

void GTE::op_gpl(Cmd c) {
    const s64 f = ir0();
    const Vector3 base = mac_vector() << c.shift();
    set_mac_ir({base.x + ir(1) * f, base.y + ir(2) * f, base.z + ir(3) * f}, c.shift(), c.lm());
    push_color_from_mac();
}

// ── Lighting ──────────────────────────────────────────────────────────────────

// IR = lim(LLM * V)
void GTE::light_vertex(Cmd c, u32 n) {
    set_mac_ir(matrix(8) * vertex(n), c.shift(), c.lm());
}

// IR = lim((BK << 12) + LCM * IR)
void GTE::background_color(Cmd c) {
    set_mac_ir((control_vector(13) << 12) + matrix(16) * ir_vector(), c.shift(), c.lm());
}

void GTE::handle_common_nc(Cmd c, u32 n) {
    light_vertex(c, n);
    background_color(c);
    push_color_from_mac();
}

void GTE::handle_common_ncc(Cmd c, u32 n) {
    light_vertex(c, n);
    handle_cc(c);
}

void GTE::handle_common_ncd(Cmd c, u32 n) {
    light_vertex(c, n);
    handle_cdp(c);
}

void GTE::handle_cc(Cmd c) {
    background_color(c);
    set_mac_ir(rgb_vector(6).scale(ir_vector()) << 4, c.shift(), c.lm());
    push_color_from_mac();
}

void GTE::handle_cdp(Cmd c) {
    background_color(c);
    depth_cue(c, rgb_vector(6).scale(ir_vector()) << 4);
}
