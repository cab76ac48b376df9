#pragma once

#include <cstdint>
#include <cstddef>

// ── Scalar type aliases ────────────────────────────────────────────────────────
using u8  = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using s8  = std::int8_t;
using s16 = std::int16_t;
using s32 = std::int32_t;
using s64 = std::int64_t;

// ── PSX address space constants ───────────────────────────────────────────────
namespace PSX {

// Segments of the R3051 virtual address space.  There is no TLB: KSEG0 and
// KSEG1 are fixed windows onto the first 512 MB of physical memory, and every
// other address is passed to the bus untouched.
//
//   0x0000_0000 .. 0x7FFF_FFFF   KUSEG  user, cached
//   0x8000_0000 .. 0x9FFF_FFFF   KSEG0  kernel, cached
//   0xA000_0000 .. 0xBFFF_FFFF   KSEG1  kernel, uncached
//   0xC000_0000 .. 0xFFFF_FFFF   KSEG2  kernel, uncached (cache control lives here)
inline constexpr u32 KSEG0_BASE = 0x8000'0000u;
inline constexpr u32 KSEG1_BASE = 0xA000'0000u;
inline constexpr u32 KSEG2_BASE = 0xC000'0000u;

// Physical memory map ─────────────────────────────────────────────────────────
inline constexpr u32 RAM_BASE     = 0x0000'0000;
inline constexpr u32 RAM_SIZE     = 2u * 1024u * 1024u;   // 2 MiB
inline constexpr u32 RAM_WINDOW   = 8u * 1024u * 1024u;   // mirrored 4x

inline constexpr u32 SCRATCH_BASE = 0x1F80'0000;
inline constexpr u32 SCRATCH_SIZE = 1024u;                 // 1 KiB scratchpad

inline constexpr u32 IO_BASE      = 0x1F80'1000;
inline constexpr u32 IO_SIZE      = 0x2000u;

inline constexpr u32 I_STAT_ADDR  = 0x1F80'1070;
inline constexpr u32 I_MASK_ADDR  = 0x1F80'1074;

inline constexpr u32 CDROM_BASE   = 0x1F80'1800;
inline constexpr u32 CDROM_SIZE   = 4u;

inline constexpr u32 BIOS_BASE    = 0x1FC0'0000;
inline constexpr u32 BIOS_SIZE    = 512u * 1024u;          // 512 KiB

inline constexpr u32 CACHE_CTL    = 0xFFFE'0130;           // cache-control register

// Exception vectors
inline constexpr u32 RESET_VECTOR       = 0xBFC0'0000;
inline constexpr u32 BOOT_EXC_VECTOR    = 0xBFC0'0180;     // Status.BEV = 1
inline constexpr u32 GENERAL_EXC_VECTOR = 0x8000'0080;     // Status.BEV = 0

} // namespace PSX
