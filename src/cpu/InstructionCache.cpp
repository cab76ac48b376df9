#include "InstructionCache.hpp"

#include "cpu/CP0.hpp"
#include "cpu/CpuBridge.hpp"

bool InstructionCache::check_hit(u32 address) const noexcept {
    const u32 line = line_index(address);
    return valid_[line] && tags_[line] == tag_of(address);
}

u32 InstructionCache::read_word(u32 address) const noexcept {
    const u32 base = address & 0xFFCu;
    return (u32{data_[base]}     << 24)
         | (u32{data_[base + 1]} << 16)
         | (u32{data_[base + 2]} <<  8)
         |  u32{data_[base + 3]};
}

u8 InstructionCache::read_byte(u32 address) const noexcept {
    return data_[address & 0xFFFu];
}

void InstructionCache::write_word(u32 address, u32 value) noexcept {
    const u32 base = address & 0xFFCu;
    data_[base]     = static_cast<u8>(value >> 24);
    data_[base + 1] = static_cast<u8>(value >> 16);
    data_[base + 2] = static_cast<u8>(value >>  8);
    data_[base + 3] = static_cast<u8>(value);
    invalidate_if_isolated(address);
}

void InstructionCache::write_byte(u32 address, u8 value) noexcept {
    data_[address & 0xFFFu] = value;
    invalidate_if_isolated(address);
}

void InstructionCache::refill_line(CpuBridge& bridge, u32 address) {
    if (cp0_.is_data_cache_isolated()) return;

    const u32 line_base = address & ~(LINE_SIZE - 1);
    const u32 data_base = line_base & 0xFF0u;
    for (u32 i = 0; i < LINE_SIZE; i += 4) {
        const u32 word = bridge.read_word(line_base + i);
        data_[data_base + i]     = static_cast<u8>(word >> 24);
        data_[data_base + i + 1] = static_cast<u8>(word >> 16);
        data_[data_base + i + 2] = static_cast<u8>(word >>  8);
        data_[data_base + i + 3] = static_cast<u8>(word);
    }
    tags_[line_index(address)]  = tag_of(address);
    valid_[line_index(address)] = true;
}

void InstructionCache::invalidate_if_isolated(u32 address) noexcept {
    if (cp0_.is_data_cache_isolated()) {
        valid_[line_index(address)] = false;
    }
}
