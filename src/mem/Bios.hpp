#pragma once

#include <filesystem>
#include <span>
#include "common/Types.hpp"
#include "mem/Memory.hpp"

// ── BIOS ROM ──────────────────────────────────────────────────────────────────
// 512 KiB image mapped at physical 0x1FC0_0000 (the reset vector sits at its
// KSEG1 alias 0xBFC0_0000).  Writes from the CPU are ignored by the bus.
class Bios {
public:
    static constexpr u32 SIZE = PSX::BIOS_SIZE;

    // Both loaders return false and leave the current image untouched when
    // the source is unreadable or not exactly SIZE bytes.
    [[nodiscard]] bool load(const std::filesystem::path& path);
    [[nodiscard]] bool load(std::span<const u8> image) noexcept;

    [[nodiscard]] u8  read_byte(u32 offset) const noexcept { return rom_.read_byte(offset); }
    [[nodiscard]] u32 read_word(u32 offset) const noexcept { return rom_.read_word(offset); }

    [[nodiscard]] bool loaded() const noexcept { return loaded_; }
    [[nodiscard]] std::span<const u8> view() const noexcept { return rom_.view(); }

private:
    MemoryBlock<SIZE> rom_{};
    bool loaded_ = false;
};
