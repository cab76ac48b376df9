#include "Bus.hpp"

#include <cstdio>

#include "common/Bits.hpp"

namespace {

[[nodiscard]] constexpr bool in_range(u32 address, u32 base, u32 size) noexcept {
    return address >= base && address - base < size;
}

[[nodiscard]] constexpr u32 lane_shift(u32 address) noexcept { return (address & 3u) * 8u; }

} // namespace

Bus::Bus(const BusTimings& timings)
    : timings_(timings)
    , ram_    (std::make_unique<Ram>())
    , bios_   (std::make_unique<Bios>())
{}

Bus::Region Bus::classify(u32 address) noexcept {
    if (address < PSX::RAM_WINDOW)                                return Region::Ram;
    if (in_range(address, PSX::SCRATCH_BASE, PSX::SCRATCH_SIZE))  return Region::Scratchpad;
    if (in_range(address, PSX::I_STAT_ADDR, 8))                   return Region::InterruptControl;
    if (in_range(address, PSX::CDROM_BASE, PSX::CDROM_SIZE))      return Region::CdromPorts;
    if (in_range(address, PSX::BIOS_BASE, PSX::BIOS_SIZE))        return Region::Bios;
    if ((address & ~3u) == PSX::CACHE_CTL)                        return Region::CacheControl;
    return Region::Unmapped;
}

// ── Timing ────────────────────────────────────────────────────────────────────

s32 Bus::how_many_stall_cycles(u32 address) {
    if (address < PSX::RAM_WINDOW)                                return timings_.ram;
    if (in_range(address, PSX::SCRATCH_BASE, PSX::SCRATCH_SIZE))  return timings_.scratchpad;
    if (in_range(address, PSX::IO_BASE, PSX::IO_SIZE))            return timings_.io;
    if (in_range(address, PSX::BIOS_BASE, PSX::BIOS_SIZE))        return timings_.bios;
    return timings_.other;
}

bool Bus::ok_to_increment(u32 address) {
    return !in_range(address, PSX::CDROM_BASE, PSX::CDROM_SIZE);
}

void Bus::increment_interrupt_counters() {
    if (vblank_period_ == 0) return;
    if (++vblank_counter_ >= vblank_period_) {
        vblank_counter_ = 0;
        irq_.raise(IRQSource::VBlank);
    }
}

// ── Register-backed regions ───────────────────────────────────────────────────

u32 Bus::read_register(Region region, u32 address) const noexcept {
    switch (region) {
        case Region::InterruptControl:
            return (address & ~3u) == PSX::I_STAT_ADDR ? irq_.stat() : irq_.mask();
        case Region::CdromPorts:
            return  u32{cdrom_ports_[0]}
                 | (u32{cdrom_ports_[1]} <<  8)
                 | (u32{cdrom_ports_[2]} << 16)
                 | (u32{cdrom_ports_[3]} << 24);
        case Region::CacheControl:
            return cache_control_;
        default:
            return 0;
    }
}

void Bus::write_register(Region region, u32 address, u32 value) noexcept {
    switch (region) {
        case Region::InterruptControl:
            if ((address & ~3u) == PSX::I_STAT_ADDR) irq_.acknowledge(value);
            else                                     irq_.set_mask(value);
            break;
        case Region::CdromPorts:
            for (u32 n = 0; n < PSX::CDROM_SIZE; ++n) {
                cdrom_ports_[n] = static_cast<u8>(value >> (n * 8u));
            }
            break;
        case Region::CacheControl:
            cache_control_ = value;
            break;
        default:
            break;
    }
}

void Bus::log_unmapped(const char* what, u32 address) noexcept {
    const u32 page = address >> 16;
    if (logged_pages_.test(page)) return;
    logged_pages_.set(page);
    std::fprintf(stderr, "[Bus] unmapped %s at 0x%08X\n", what, address);
}

// ── CpuBridge accesses ────────────────────────────────────────────────────────

u8 Bus::read_byte(u32 address) {
    const Region region = classify(address);
    switch (region) {
        case Region::Ram:        return ram_->read_byte(address);
        case Region::Scratchpad: return scratch_.read_byte(address - PSX::SCRATCH_BASE);
        case Region::Bios:       return bios_->read_byte(address - PSX::BIOS_BASE);
        case Region::CdromPorts: return cdrom_ports_[address - PSX::CDROM_BASE];
        case Region::InterruptControl:
        case Region::CacheControl:
            return static_cast<u8>(read_register(region, address) >> lane_shift(address));
        case Region::Unmapped:
            break;
    }
    log_unmapped("read8", address);
    return 0;
}

u32 Bus::read_word(u32 address) {
    const Region region = classify(address);
    u32 value = 0;
    switch (region) {
        case Region::Ram:        value = ram_->read_word(address); break;
        case Region::Scratchpad: value = scratch_.read_word(address - PSX::SCRATCH_BASE); break;
        case Region::Bios:       value = bios_->read_word(address - PSX::BIOS_BASE); break;
        case Region::InterruptControl:
        case Region::CdromPorts:
        case Region::CacheControl:
            value = read_register(region, address);
            break;
        case Region::Unmapped:
            log_unmapped("read32", address);
            return 0;
    }
    return bits::swap_word(value);
}

void Bus::write_byte(u32 address, u8 value) {
    const Region region = classify(address);
    switch (region) {
        case Region::Ram:
            ram_->write_byte(address, value);
            return;
        case Region::Scratchpad:
            scratch_.write_byte(address - PSX::SCRATCH_BASE, value);
            return;
        case Region::CdromPorts:
            cdrom_ports_[address - PSX::CDROM_BASE] = value;
            return;
        case Region::InterruptControl:
        case Region::CacheControl: {
            // Merge the byte into its lane and write the whole register.
            const u32 shift = lane_shift(address);
            u32 reg = read_register(region, address);
            if (region == Region::InterruptControl && (address & ~3u) == PSX::I_STAT_ADDR) {
                // Untouched lanes of an acknowledge must not clear anything.
                reg = 0xFFFF'FFFFu;
            }
            reg = (reg & ~(0xFFu << shift)) | (u32{value} << shift);
            write_register(region, address, reg);
            return;
        }
        case Region::Bios:
            return;
        case Region::Unmapped:
            break;
    }
    log_unmapped("write8", address);
}

void Bus::write_word(u32 address, u32 value) {
    const u32 le_value = bits::swap_word(value);
    const Region region = classify(address);
    switch (region) {
        case Region::Ram:
            ram_->write_word(address, le_value);
            return;
        case Region::Scratchpad:
            scratch_.write_word(address - PSX::SCRATCH_BASE, le_value);
            return;
        case Region::InterruptControl:
        case Region::CdromPorts:
        case Region::CacheControl:
            write_register(region, address, le_value);
            return;
        case Region::Bios:
            return;
        case Region::Unmapped:
            break;
    }
    log_unmapped("write32", address);
}
