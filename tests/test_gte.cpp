#include "TestHarness.hpp"

#include <stdexcept>

#include "gte/GTE.hpp"

namespace {

constexpr u32 SF = 1u << 19;
constexpr u32 LM = 1u << 10;

constexpr u32 mvmva(u32 mx, u32 v, u32 tx, bool sf) {
    return gte::Command::MVMVA | (mx << 17) | (v << 15) | (tx << 13) | (sf ? SF : 0u);
}

// RT = identity in 4.12 fixed point.
void load_identity_rotation(GTE& gte) {
    gte.write_control_reg(0, 0x0000'1000u, false);
    gte.write_control_reg(1, 0, false);
    gte.write_control_reg(2, 0x0000'1000u, false);
    gte.write_control_reg(3, 0, false);
    gte.write_control_reg(4, 0x0000'1000u, false);
}

void set_vertex0(GTE& gte, u16 x, u16 y, u16 z) {
    gte.write_data_reg(0, (u32{y} << 16) | x, false);
    gte.write_data_reg(1, z, false);
}

// Light and light-colour matrices = identity.
void load_identity_lighting(GTE& gte) {
    for (u32 base : {8u, 16u}) {
        gte.write_control_reg(base,     0x0000'1000u, false);
        gte.write_control_reg(base + 1, 0, false);
        gte.write_control_reg(base + 2, 0x0000'1000u, false);
        gte.write_control_reg(base + 3, 0, false);
        gte.write_control_reg(base + 4, 0x0000'1000u, false);
    }
}

void set_ir(GTE& gte, u32 ir1, u32 ir2, u32 ir3) {
    gte.write_data_reg(9,  ir1, false);
    gte.write_data_reg(10, ir2, false);
    gte.write_data_reg(11, ir3, false);
}

void set_far_color(GTE& gte, u32 value) {
    for (u32 r : {21u, 22u, 23u}) gte.write_control_reg(r, value, false);
}

void load_three_vertices(GTE& gte) {
    set_vertex0(gte, 0x800, 0x1000, 0x400);
    gte.write_data_reg(2, 0x1000'1000u, false);
    gte.write_data_reg(3, 0x1000, false);
    gte.write_data_reg(4, 0, false);
    gte.write_data_reg(5, 0, false);
}

} // namespace

// ── Register views ────────────────────────────────────────────────────────────

static bool test_control_reads() {
    GTE gte;
    for (u32 r = 0; r < 32; ++r) gte.write_control_reg(r, 0x8000u, true);
    CHECK(gte.read_control_reg(25) == 0x8000u);
    CHECK(gte.read_control_reg(31) == 0x8000u);
    CHECK(gte.read_control_reg(0)  == 0x8000u);
    for (u32 r : {4u, 12u, 20u, 26u, 27u, 28u, 29u, 30u}) {
        CHECK(gte.read_control_reg(r) == 0xFFFF'8000u);
    }

    for (u32 r = 0; r < 32; ++r) gte.write_control_reg(r, 0x7000u, true);
    for (u32 r : {26u, 27u, 28u, 29u, 30u}) {
        CHECK(gte.read_control_reg(r) == 0x7000u);
    }
    return true;
}

static bool test_control_writes() {
    GTE gte;
    for (u32 r = 0; r < 32; ++r) {
        gte.write_control_reg(r, 0x8000u, false);
        CHECK(gte.raw_control(r) == 0x8000u);
        gte.write_control_reg(r, 0x8000u, true);
        CHECK(gte.raw_control(r) == 0x8000u);
    }
    // FLAG keeps only bits 12..30 from software.
    gte.write_control_reg(31, 0xFFFF'FFFFu, false);
    CHECK(gte.raw_control(31) == 0x7FFF'F000u);
    return true;
}

static bool test_data_reads() {
    GTE gte;
    for (u32 r = 0; r < 32; ++r) gte.write_data_reg(r, 0x8000u, true);
    for (u32 r : {1u, 3u, 5u, 8u, 9u, 10u, 11u}) {
        CHECK(gte.read_data_reg(r) == 0xFFFF'8000u);
    }
    CHECK(gte.read_data_reg(2) == 0x8000u);

    for (u32 r : {16u, 17u, 18u, 19u, 7u}) {
        gte.write_data_reg(r, 0xABCD'1234u, true);
        CHECK(gte.read_data_reg(r) == 0x1234u);
    }

    gte.write_data_reg(23, 1, true);
    gte.write_data_reg(28, 1, true);
    CHECK(gte.read_data_reg(23) == 0u);
    CHECK(gte.read_data_reg(28) == 0u);

    for (u32 r : {9u, 10u, 11u}) gte.write_data_reg(r, 0xF80u, true);
    CHECK(gte.read_data_reg(29) == 0x7FFFu);
    // Negative IR clamps to 0 in ORGB.
    gte.write_data_reg(9, 0xFFFF'8000u, true);
    CHECK((gte.read_data_reg(29) & 0x1Fu) == 0u);

    gte.write_data_reg(30, 0xFFFE'7FFFu, false);
    CHECK(gte.read_data_reg(31) == 15u);
    gte.write_data_reg(30, 0x0000'7FFFu, false);
    CHECK(gte.read_data_reg(31) == 17u);
    return true;
}

static bool test_data_writes() {
    GTE gte;
    gte.write_data_reg(8, 0x8000u, true);
    CHECK(gte.raw_data(8) == 0x8000u);
    gte.write_data_reg(8, 0x8000u, false);
    CHECK(gte.raw_data(8) == 0x8000u);

    for (u32 r : {7u, 23u, 29u, 31u}) {
        gte.write_data_reg(r, 0x1234u, false);
        CHECK(gte.raw_data(r) == 0u);
    }

    gte.write_data_reg(14, 0x55u, false);
    CHECK(gte.raw_data(15) == 0x55u);

    gte.write_data_reg(13, 1, false);
    gte.write_data_reg(14, 2, false);
    gte.write_data_reg(15, 0x8000u, false);
    CHECK(gte.raw_data(15) == 0x8000u);
    CHECK(gte.raw_data(14) == 0x8000u);
    CHECK(gte.raw_data(13) == 2u);
    CHECK(gte.raw_data(12) == 1u);

    gte.write_data_reg(28, 0x7FFFu, false);
    CHECK(gte.raw_data(9)  == 0xF80u);
    CHECK(gte.raw_data(10) == 0xF80u);
    CHECK(gte.raw_data(11) == 0xF80u);

    // Override writes have no side effects.
    gte.write_data_reg(15, 0x1111u, true);
    CHECK(gte.raw_data(14) == 0x8000u);
    return true;
}

static bool test_index_out_of_range() {
    GTE gte;
    bool threw = false;
    try {
        (void)gte.read_data_reg(32);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    CHECK(threw);

    threw = false;
    try {
        gte.write_control_reg(99, 0, false);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    CHECK(threw);
    return true;
}

// ── Commands ──────────────────────────────────────────────────────────────────

static bool test_cycle_table() {
    struct Entry { u32 func; s32 cycles; };
    const Entry table[] = {
        {0x01, 15}, {0x06, 8},  {0x0C, 6},  {0x10, 8},  {0x11, 8},  {0x12, 8},
        {0x13, 19}, {0x14, 13}, {0x16, 44}, {0x1B, 17}, {0x1C, 11}, {0x1E, 14},
        {0x20, 30}, {0x28, 5},  {0x29, 8},  {0x2A, 17}, {0x2D, 5},  {0x2E, 6},
        {0x30, 23}, {0x3D, 5},  {0x3E, 5},  {0x3F, 39},
    };
    for (const auto& e : table) {
        CHECK(gte::command_cycles(e.func) == e.cycles);
        GTE gte;
        CHECK(gte.gte_function(e.func) == e.cycles);
    }
    CHECK(gte::command_cycles(0x00) == 0);
    CHECK(gte::command_cycles(0x3C) == 0);
    return true;
}

static bool test_unknown_command_is_inert() {
    GTE gte;
    gte.write_data_reg(9, 0x123u, false);
    gte.write_control_reg(31, 0x1000u, false);
    CHECK(gte.gte_function(0x02) == 0);
    CHECK(gte.raw_data(9) == 0x123u);
    CHECK(gte.raw_control(31) == 0x1000u);
    return true;
}

static bool test_unr_divide() {
    u32 flag = 0;
    CHECK(gte::unr_divide(0x1000, 0x1000, flag) == 0x1'0000u);
    CHECK(flag == 0);
    CHECK(gte::unr_divide(0x1000, 0x2000, flag) == 0x8000u);
    CHECK(flag == 0);
    CHECK(gte::unr_divide(0x1000, 0x800, flag) == 0x1'FFFFu);
    CHECK(flag == Flag::DIV_OVF);
    return true;
}

static bool test_rtps() {
    GTE gte;
    load_identity_rotation(gte);
    set_vertex0(gte, 0x100, 0x80, 0x1000);
    gte.write_control_reg(24, 10u << 16, false);     // OFX = 10.0
    gte.write_control_reg(25, 0, false);
    gte.write_control_reg(26, 0x1000, false);        // H
    gte.write_control_reg(27, 0x100, false);         // DQA
    gte.write_control_reg(28, 0x10'0000, false);     // DQB

    CHECK(gte.gte_function(gte::Command::RTPS | SF) == 15);

    CHECK(gte.raw_data(25) == 0x100u);
    CHECK(gte.raw_data(26) == 0x80u);
    CHECK(gte.raw_data(27) == 0x1000u);
    CHECK(gte.read_data_reg(9)  == 0x100u);
    CHECK(gte.read_data_reg(10) == 0x80u);
    CHECK(gte.read_data_reg(11) == 0x1000u);
    CHECK(gte.read_data_reg(19) == 0x1000u);
    CHECK(gte.raw_data(14) == 0x0080'010Au);
    CHECK(gte.raw_data(24) == 0x0110'0000u);
    // IR0 = 0x1100 saturates to 0x1000; not an error bit.
    CHECK(gte.read_data_reg(8) == 0x1000u);
    CHECK(gte.read_control_reg(31) == Flag::IR0_SAT);
    return true;
}

static bool test_rtps_divide_overflow() {
    GTE gte;
    load_identity_rotation(gte);
    set_vertex0(gte, 0x100, 0, 0x10);
    gte.write_control_reg(26, 0x1000, false);

    gte.gte_function(gte::Command::RTPS | SF);
    CHECK(gte.read_data_reg(19) == 0x10u);
    CHECK((gte.raw_data(14) & 0xFFFFu) == 0x1FFu);
    CHECK(gte.read_control_reg(31) == (Flag::ERROR | Flag::DIV_OVF));
    return true;
}

// With sf=0 IR3 is clamped from MAC3 but flagged from MAC3 >> 12.
static bool test_rtps_ir3_flag_uses_shifted_value() {
    GTE gte;
    load_identity_rotation(gte);
    gte.write_control_reg(7, 0x10, false);           // TRZ

    gte.gte_function(gte::Command::RTPS);
    CHECK(gte.raw_data(27) == 0x1'0000u);
    CHECK(gte.read_data_reg(11) == 0x7FFFu);
    CHECK(gte.read_data_reg(19) == 0x10u);
    CHECK((gte.read_control_reg(31) & Flag::IR3_SAT) == 0);
    CHECK(gte.read_control_reg(31) == 0u);
    return true;
}

// lm does not apply to IR3 in RTPS.
static bool test_rtps_ir3_ignores_lm() {
    GTE gte;
    load_identity_rotation(gte);
    set_vertex0(gte, 0, 0, 0xFF00);                  // VZ0 = -0x100

    gte.gte_function(gte::Command::RTPS | SF | LM);
    CHECK(gte.read_data_reg(11) == 0xFFFF'FF00u);
    CHECK(gte.read_data_reg(19) == 0u);
    CHECK(gte.read_control_reg(31) == (Flag::ERROR | Flag::SZ3_SAT | Flag::DIV_OVF));
    return true;
}

static bool test_rtpt_pushes_three() {
    GTE gte;
    load_identity_rotation(gte);
    gte.write_control_reg(26, 0x1000, false);
    for (u32 n = 0; n < 3; ++n) {
        gte.write_data_reg(2 * n, (n + 1) * 0x10, false);
        gte.write_data_reg(2 * n + 1, 0x1000, false);
    }
    CHECK(gte.gte_function(gte::Command::RTPT | SF) == 23);
    CHECK((gte.raw_data(12) & 0xFFFFu) == 0x10u);
    CHECK((gte.raw_data(13) & 0xFFFFu) == 0x20u);
    CHECK((gte.raw_data(14) & 0xFFFFu) == 0x30u);
    CHECK(gte.read_data_reg(17) == 0x1000u);
    CHECK(gte.read_data_reg(18) == 0x1000u);
    CHECK(gte.read_data_reg(19) == 0x1000u);
    return true;
}

static bool test_nclip() {
    GTE gte;
    gte.write_data_reg(12, 0x0000'0000u, false);
    gte.write_data_reg(13, 0x0000'000Au, false);    // (10, 0)
    gte.write_data_reg(14, 0x000A'0000u, false);    // (0, 10)
    CHECK(gte.gte_function(gte::Command::NCLIP) == 8);
    CHECK(gte.raw_data(24) == 100u);
    CHECK(gte.read_control_reg(31) == 0u);
    return true;
}

static bool test_avsz3() {
    GTE gte;
    gte.write_control_reg(29, 0x555, false);
    gte.write_data_reg(17, 0x300, false);
    gte.write_data_reg(18, 0x300, false);
    gte.write_data_reg(19, 0x300, false);
    CHECK(gte.gte_function(gte::Command::AVSZ3) == 5);
    CHECK(gte.raw_data(24) == 3'144'960u);
    CHECK(gte.read_data_reg(7) == 0x2FFu);
    return true;
}

static bool test_sqr() {
    GTE gte;
    gte.write_data_reg(9,  0xB5u, false);
    gte.write_data_reg(10, 0xB5u, false);
    gte.write_data_reg(11, 0xFFFu, false);
    CHECK(gte.gte_function(gte::Command::SQR) == 5);
    CHECK(gte.read_data_reg(9)  == 0x7FF9u);
    CHECK(gte.read_data_reg(10) == 0x7FF9u);
    CHECK(gte.read_data_reg(11) == 0x7FFFu);
    CHECK(gte.raw_data(27) == 0xFF'E001u);
    CHECK(gte.read_control_reg(31) == 0x40'0000u);
    return true;
}

static bool test_ncs_background_only() {
    GTE gte;
    gte.write_control_reg(13, 0x10, false);
    gte.write_control_reg(14, 0x20, false);
    gte.write_control_reg(15, 0x30, false);
    gte.write_data_reg(6, 0xAB00'0000u, false);
    CHECK(gte.gte_function(gte::Command::NCS | SF) == 14);
    CHECK(gte.raw_data(22) == 0xAB03'0201u);
    CHECK(gte.read_data_reg(9)  == 0x10u);
    CHECK(gte.read_data_reg(11) == 0x30u);
    return true;
}

static bool test_ncds() {
    GTE gte;
    for (u32 r : {13u, 14u, 15u, 21u, 22u, 23u}) gte.write_control_reg(r, 0x800, false);
    gte.write_data_reg(8, 0x800, false);              // IR0 = 0.5
    gte.write_data_reg(6, 0x2A80'8080u, false);
    CHECK(gte.gte_function(gte::Command::NCDS | SF) == 19);
    CHECK(gte.read_data_reg(9)  == 0x600u);
    CHECK(gte.read_data_reg(10) == 0x600u);
    CHECK(gte.read_data_reg(11) == 0x600u);
    CHECK(gte.raw_data(22) == 0x2A60'6060u);
    CHECK(gte.read_control_reg(31) == 0u);
    return true;
}

static bool test_mvmva() {
    GTE gte;
    load_identity_rotation(gte);
    set_vertex0(gte, 0x100, 0x80, 0x1000);
    gte.write_control_reg(5, 1, false);
    gte.write_control_reg(6, 2, false);
    gte.write_control_reg(7, 3, false);
    CHECK(gte.gte_function(mvmva(0, 0, 0, true)) == 8);
    CHECK(gte.raw_data(25) == 0x101u);
    CHECK(gte.raw_data(26) == 0x82u);
    CHECK(gte.raw_data(27) == 0x1003u);
    return true;
}

static bool test_mvmva_far_color_translation() {
    GTE gte;
    load_identity_rotation(gte);
    set_vertex0(gte, 0x100, 0x80, 0x1000);
    for (u32 r : {21u, 22u, 23u}) gte.write_control_reg(r, 5, false);
    gte.gte_function(mvmva(0, 0, 2, true));
    // Only the second and third matrix columns reach the result.
    CHECK(gte.read_data_reg(9)  == 0u);
    CHECK(gte.read_data_reg(10) == 0x80u);
    CHECK(gte.read_data_reg(11) == 0x1000u);
    return true;
}

static bool test_lm_clamps_at_zero() {
    GTE gte;
    gte.write_data_reg(8, 0x1000, false);
    gte.write_data_reg(9, static_cast<u32>(-0x100), false);
    gte.gte_function(gte::Command::GPF | SF | LM);
    CHECK(gte.read_data_reg(9) == 0u);
    CHECK((gte.read_control_reg(31) & Flag::IR1_SAT) != 0);
    CHECK((gte.read_control_reg(31) & Flag::ERROR) != 0);
    return true;
}

static bool test_op() {
    GTE gte;
    gte.write_control_reg(0, 0x1000, false);         // RT11
    gte.write_control_reg(2, 0x2000, false);         // RT22
    gte.write_control_reg(4, 0x3000, false);         // RT33
    set_ir(gte, 0x100, 0x200, 0x400);

    CHECK(gte.gte_function(gte::Command::OP | SF | LM) == 6);
    CHECK(gte.raw_data(25) == 0x200u);
    CHECK(gte.raw_data(26) == 0xFFFF'FF00u);
    CHECK(gte.raw_data(27) == 0u);
    CHECK(gte.read_data_reg(9)  == 0x200u);
    CHECK(gte.read_data_reg(10) == 0u);
    CHECK(gte.read_data_reg(11) == 0u);
    CHECK(gte.read_control_reg(31) == (Flag::ERROR | Flag::IR2_SAT));
    return true;
}

// Halfway from RGBC towards the far colour.
static bool test_dpcs() {
    GTE gte;
    set_far_color(gte, 0x1000);
    gte.write_data_reg(8, 0x800, false);
    gte.write_data_reg(6, 0x12C0'8040u, false);

    CHECK(gte.gte_function(gte::Command::DPCS | SF) == 8);
    CHECK(gte.read_data_reg(9)  == 0xA00u);
    CHECK(gte.read_data_reg(10) == 0xC00u);
    CHECK(gte.read_data_reg(11) == 0xE00u);
    CHECK(gte.raw_data(22) == 0x12E0'C0A0u);
    CHECK(gte.read_control_reg(31) == 0u);
    return true;
}

// Every pass reads RGB0; each push moves the next entry into that slot.
static bool test_dpct_walks_the_fifo() {
    GTE gte;
    set_far_color(gte, 0x1000);
    gte.write_data_reg(8, 0x800, false);
    gte.write_data_reg(6, 0x7700'0000u, false);
    gte.write_data_reg(20, 0x0000'0040u, false);
    gte.write_data_reg(21, 0x0000'8000u, false);
    gte.write_data_reg(22, 0x00C0'0000u, false);

    CHECK(gte.gte_function(gte::Command::DPCT | SF) == 17);
    CHECK(gte.raw_data(20) == 0x7780'80A0u);
    CHECK(gte.raw_data(21) == 0x7780'C080u);
    CHECK(gte.raw_data(22) == 0x77E0'8080u);
    CHECK(gte.read_data_reg(9)  == 0x800u);
    CHECK(gte.read_data_reg(11) == 0xE00u);
    CHECK(gte.read_control_reg(31) == 0u);
    return true;
}

static bool test_intpl() {
    GTE gte;
    set_far_color(gte, 0x800);
    gte.write_data_reg(8, 0x800, false);
    set_ir(gte, 0x400, 0x800, 0xC00);

    CHECK(gte.gte_function(gte::Command::INTPL | SF) == 8);
    CHECK(gte.read_data_reg(9)  == 0x600u);
    CHECK(gte.read_data_reg(10) == 0x800u);
    CHECK(gte.read_data_reg(11) == 0xA00u);
    CHECK(gte.raw_data(22) == 0x00A0'8060u);
    CHECK(gte.read_control_reg(31) == 0u);
    return true;
}

static bool test_dcpl() {
    GTE gte;
    set_far_color(gte, 0x100);
    gte.write_data_reg(8, 0x800, false);
    gte.write_data_reg(6, 0x0080'8080u, false);
    set_ir(gte, 0x1000, 0x800, 0);

    CHECK(gte.gte_function(gte::Command::DCPL | SF) == 8);
    CHECK(gte.read_data_reg(9)  == 0x480u);
    CHECK(gte.read_data_reg(10) == 0x280u);
    CHECK(gte.read_data_reg(11) == 0x80u);
    CHECK(gte.raw_data(22) == 0x0008'2848u);
    CHECK(gte.read_control_reg(31) == 0u);
    return true;
}

// Background colour only (LCM = 0), then colour multiply and depth cue.
static bool test_cdp() {
    GTE gte;
    gte.write_control_reg(13, 0x800, false);
    gte.write_control_reg(14, 0x1000, false);
    gte.write_control_reg(15, 0x400, false);
    gte.write_data_reg(8, 0x800, false);
    gte.write_data_reg(6, 0x3C80'8080u, false);

    CHECK(gte.gte_function(gte::Command::CDP | SF) == 13);
    CHECK(gte.read_data_reg(9)  == 0x200u);
    CHECK(gte.read_data_reg(10) == 0x400u);
    CHECK(gte.read_data_reg(11) == 0x100u);
    CHECK(gte.raw_data(22) == 0x3C10'4020u);
    CHECK(gte.read_control_reg(31) == 0u);
    return true;
}

static bool test_cc() {
    GTE gte;
    load_identity_lighting(gte);
    set_ir(gte, 0x800, 0x1000, 0x400);
    gte.write_data_reg(6, 0x3C80'8080u, false);

    CHECK(gte.gte_function(gte::Command::CC | SF) == 11);
    CHECK(gte.read_data_reg(9)  == 0x400u);
    CHECK(gte.read_data_reg(10) == 0x800u);
    CHECK(gte.read_data_reg(11) == 0x200u);
    CHECK(gte.raw_data(22) == 0x3C20'8040u);
    CHECK(gte.read_control_reg(31) == 0u);
    return true;
}

static bool test_nccs() {
    GTE gte;
    load_identity_lighting(gte);
    set_vertex0(gte, 0x800, 0x1000, 0x400);
    gte.write_data_reg(6, 0x3C80'8080u, false);

    CHECK(gte.gte_function(gte::Command::NCCS | SF) == 17);
    CHECK(gte.raw_data(22) == 0x3C20'8040u);
    CHECK(gte.read_control_reg(31) == 0u);
    return true;
}

static bool test_ncct() {
    GTE gte;
    load_identity_lighting(gte);
    load_three_vertices(gte);
    gte.write_data_reg(6, 0x3C80'8080u, false);

    CHECK(gte.gte_function(gte::Command::NCCT | SF) == 39);
    CHECK(gte.raw_data(20) == 0x3C20'8040u);
    CHECK(gte.raw_data(21) == 0x3C80'8080u);
    CHECK(gte.raw_data(22) == 0x3C00'0000u);
    CHECK(gte.read_control_reg(31) == 0u);
    return true;
}

static bool test_ncdt() {
    GTE gte;
    load_identity_lighting(gte);
    load_three_vertices(gte);
    gte.write_data_reg(8, 0x800, false);
    gte.write_data_reg(6, 0x3C80'8080u, false);

    CHECK(gte.gte_function(gte::Command::NCDT | SF) == 44);
    CHECK(gte.raw_data(20) == 0x3C10'4020u);
    CHECK(gte.raw_data(21) == 0x3C40'4040u);
    CHECK(gte.raw_data(22) == 0x3C00'0000u);
    CHECK(gte.read_control_reg(31) == 0u);
    return true;
}

// Colour saturation is flagged but is not an error.
static bool test_nct() {
    GTE gte;
    load_identity_lighting(gte);
    set_vertex0(gte, 0x800, 0x1000, 0x400);
    gte.write_data_reg(2, 0x0200'0100u, false);
    gte.write_data_reg(3, 0x300, false);
    gte.write_data_reg(6, 0x3C00'0000u, false);

    CHECK(gte.gte_function(gte::Command::NCT | SF) == 30);
    CHECK(gte.raw_data(20) == 0x3C40'FF80u);
    CHECK(gte.raw_data(21) == 0x3C30'2010u);
    CHECK(gte.raw_data(22) == 0x3C00'0000u);
    CHECK(gte.read_control_reg(31) == Flag::RGB_G_SAT);
    return true;
}

static bool test_avsz4() {
    GTE gte;
    gte.write_control_reg(30, 0x400, false);
    gte.write_data_reg(16, 0x100, false);
    gte.write_data_reg(17, 0x200, false);
    gte.write_data_reg(18, 0x300, false);
    gte.write_data_reg(19, 0x400, false);
    CHECK(gte.gte_function(gte::Command::AVSZ4) == 6);
    CHECK(gte.raw_data(24) == 0x28'0000u);
    CHECK(gte.read_data_reg(7) == 0x280u);
    CHECK(gte.read_control_reg(31) == 0u);

    // A negative ZSF4 drives OTZ below zero.
    gte.write_control_reg(30, 0xFC00, false);
    gte.gte_function(gte::Command::AVSZ4);
    CHECK(gte.raw_data(24) == 0xFFD8'0000u);
    CHECK(gte.read_data_reg(7) == 0u);
    CHECK(gte.read_control_reg(31) == (Flag::ERROR | Flag::SZ3_SAT));
    return true;
}

// MAC + IR * IR0, with MAC scaled up by sf first.
static bool test_gpl() {
    GTE gte;
    gte.write_data_reg(25, 0x100, false);
    gte.write_data_reg(26, 0x200, false);
    gte.write_data_reg(27, 0x300, false);
    gte.write_data_reg(8, 0x800, false);
    set_ir(gte, 0x1000, 0x800, 0);

    CHECK(gte.gte_function(gte::Command::GPL | SF) == 5);
    CHECK(gte.raw_data(25) == 0x900u);
    CHECK(gte.raw_data(26) == 0x600u);
    CHECK(gte.raw_data(27) == 0x300u);
    CHECK(gte.read_data_reg(9) == 0x900u);
    CHECK(gte.raw_data(22) == 0x0030'6090u);
    CHECK(gte.read_control_reg(31) == 0u);
    return true;
}

static bool test_reset() {
    GTE gte;
    gte.write_data_reg(9, 5, false);
    gte.write_control_reg(0, 5, false);
    gte.reset();
    CHECK(gte.raw_data(9) == 0u);
    CHECK(gte.raw_control(0) == 0u);
    CHECK(!gte.condition_line());
    return true;
}

int main() {
    return run_tests({
        {"control_reads",          test_control_reads},
        {"control_writes",         test_control_writes},
        {"data_reads",             test_data_reads},
        {"data_writes",            test_data_writes},
        {"index_out_of_range",     test_index_out_of_range},
        {"cycle_table",            test_cycle_table},
        {"unknown_command_inert",  test_unknown_command_is_inert},
        {"unr_divide",             test_unr_divide},
        {"rtps",                   test_rtps},
        {"rtps_divide_overflow",   test_rtps_divide_overflow},
        {"rtps_ir3_flag_shifted",  test_rtps_ir3_flag_uses_shifted_value},
        {"rtps_ir3_ignores_lm",    test_rtps_ir3_ignores_lm},
        {"rtpt_pushes_three",      test_rtpt_pushes_three},
        {"nclip",                  test_nclip},
        {"avsz3",                  test_avsz3},
        {"sqr",                    test_sqr},
        {"ncs_background_only",    test_ncs_background_only},
        {"ncds",                   test_ncds},
        {"mvmva",                  test_mvmva},
        {"mvmva_far_color",        test_mvmva_far_color_translation},
        {"lm_clamps_at_zero",      test_lm_clamps_at_zero},
        {"op",                     test_op},
        {"dpcs",                   test_dpcs},
        {"dpct_walks_the_fifo",    test_dpct_walks_the_fifo},
        {"intpl",                  test_intpl},
        {"dcpl",                   test_dcpl},
        {"cdp",                    test_cdp},
        {"cc",                     test_cc},
        {"nccs",                   test_nccs},
        {"ncct",                   test_ncct},
        {"ncdt",                   test_ncdt},
        {"nct",                    test_nct},
        {"avsz4",                  test_avsz4},
        {"gpl",                    test_gpl},
        {"reset",                  test_reset},
    });
}
