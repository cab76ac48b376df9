#pragma once

#include <array>
#include <bitset>
#include <filesystem>
#include <memory>
#include <span>
#include "common/Types.hpp"
#include "cpu/CpuBridge.hpp"
#include "irq/IRQ.hpp"
#include "mem/Bios.hpp"
#include "mem/Memory.hpp"

// Wait states charged per timed access, by region.
struct BusTimings {
    s32 ram        = 4;
    s32 bios       = 22;
    s32 scratchpad = 0;
    s32 io         = 2;
    s32 other      = 1;
};

// ── Bus ───────────────────────────────────────────────────────────────────────
// Minimal console interconnect: enough memory and I/O for the R3051 to run
// standalone.  The CPU hands over physical addresses.
//
// Physical memory map
// ──────────────────────────────────────────────────────────────────────────────
// 0x0000_0000 .. 0x007F_FFFF   RAM (2 MiB), mirrored x4
// 0x1F80_0000 .. 0x1F80_03FF   Scratchpad (1 KiB)
// 0x1F80_1070 / 0x1F80_1074    I_STAT / I_MASK
// 0x1F80_1800 .. 0x1F80_1803   CD-ROM byte ports (no auto-increment)
// 0x1FC0_0000 .. 0x1FC7_FFFF   BIOS ROM (512 KiB)
// 0xFFFE_0130                  Cache control
// ──────────────────────────────────────────────────────────────────────────────
//
// Memory is held little-endian; words cross the CpuBridge big-endian.
class Bus final : public CpuBridge {
public:
    // Cache-control bits
    static constexpr u32 CACHE_CTL_SCRATCH_MASK = (1u << 3) | (1u << 7);
    static constexpr u32 CACHE_CTL_ICACHE       = 1u << 11;

    explicit Bus(const BusTimings& timings = BusTimings{});

    [[nodiscard]] bool load_bios(const std::filesystem::path& path) { return bios_->load(path); }
    [[nodiscard]] bool load_bios(std::span<const u8> image) noexcept { return bios_->load(image); }

    void raise_irq(IRQSource src) noexcept { irq_.raise(src); }

    // Interrupt-counter calls between VBlank requests; 0 disables them.
    void set_vblank_period(u32 calls) noexcept { vblank_period_ = calls; vblank_counter_ = 0; }

    [[nodiscard]] s64 synced_cycles() const noexcept { return synced_cycles_; }
    [[nodiscard]] u32 cache_control() const noexcept { return cache_control_; }
    void set_cache_control(u32 value) noexcept { cache_control_ = value; }

    [[nodiscard]] Ram&                 ram()        noexcept { return *ram_; }
    [[nodiscard]] Scratchpad&          scratchpad() noexcept { return scratch_; }
    [[nodiscard]] Bios&                bios()       noexcept { return *bios_; }
    [[nodiscard]] InterruptController& irq()        noexcept { return irq_; }
    [[nodiscard]] const BusTimings&    timings() const noexcept { return timings_; }

    // ── CpuBridge ─────────────────────────────────────────────────────────────
    void append_sync_cycles(s32 cycles) override { synced_cycles_ += cycles; }
    [[nodiscard]] s32  how_many_stall_cycles(u32 address) override;
    [[nodiscard]] bool ok_to_increment(u32 address) override;
    [[nodiscard]] bool scratchpad_enabled() override {
        return (cache_control_ & CACHE_CTL_SCRATCH_MASK) == CACHE_CTL_SCRATCH_MASK;
    }
    [[nodiscard]] bool instruction_cache_enabled() override {
        return (cache_control_ & CACHE_CTL_ICACHE) != 0;
    }

    [[nodiscard]] u8  read_byte(u32 address) override;
    [[nodiscard]] u32 read_word(u32 address) override;
    void write_byte(u32 address, u8 value) override;
    void write_word(u32 address, u32 value) override;

    void increment_interrupt_counters() override;

private:
    enum class Region {
        Ram,
        Scratchpad,
        InterruptControl,
        CdromPorts,
        Bios,
        CacheControl,
        Unmapped,
    };

    [[nodiscard]] static Region classify(u32 address) noexcept;

    // Little-endian word views of the register-backed regions.
    [[nodiscard]] u32 read_register(Region region, u32 address) const noexcept;
    void write_register(Region region, u32 address, u32 value) noexcept;

    void log_unmapped(const char* what, u32 address) noexcept;

    BusTimings timings_;

    // Heap-allocated: RAM (2 MiB) and BIOS (512 KiB) do not belong on the stack.
    std::unique_ptr<Ram>  ram_;
    std::unique_ptr<Bios> bios_;
    Scratchpad            scratch_{};
    InterruptController   irq_{};

    // Latches standing in for the CD-ROM controller's four byte ports.
    std::array<u8, PSX::CDROM_SIZE> cdrom_ports_{};

    u32 cache_control_ = 0;

    u32 vblank_period_  = 0;
    u32 vblank_counter_ = 0;

    s64 synced_cycles_ = 0;

    // One diagnostic per 64 KiB page.
    std::bitset<0x1'0000> logged_pages_{};
};
