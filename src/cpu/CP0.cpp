#include "CP0.hpp"

#include <stdexcept>
#include <string>

#include "common/Bits.hpp"

namespace {

void check_index(u32 reg) {
    if (reg >= 32) {
        throw std::out_of_range("[CP0] register index " + std::to_string(reg) + " out of range");
    }
}

} // namespace

void CP0::reset() noexcept {
    regs_[RANDOM] = 63u << 8;
    // BEV, TS off
    regs_[STATUS] &= 0xFF9F'FFFFu;
    // SwC, KUc, IEc off
    regs_[STATUS] &= 0xFFFD'FFFCu;
    condition_line_ = false;
}

u32 CP0::read_reg(u32 reg) const {
    check_index(reg);
    switch (reg) {
        case RANDOM:
        case BADVADDR:
        case EPC:      return regs_[reg];
        case STATUS:   return regs_[STATUS] & STATUS_READ_MASK;
        case CAUSE:    return regs_[CAUSE] & CAUSE_READ_MASK;
        case PRID:     return PRID_VALUE;
        default:       return 0;
    }
}

void CP0::write_reg(u32 reg, u32 value, bool override_mask) {
    check_index(reg);
    if (override_mask) {
        regs_[reg] = value;
        return;
    }
    switch (reg) {
        case STATUS:
            regs_[STATUS] = (regs_[STATUS] & ~STATUS_WRITE_MASK) | (value & STATUS_WRITE_MASK);
            break;
        case CAUSE:
            regs_[CAUSE] = (regs_[CAUSE] & ~CAUSE_WRITE_MASK) | (value & CAUSE_WRITE_MASK);
            break;
        default:
            regs_[reg] = value;
            break;
    }
}

void CP0::set_cache_miss(bool miss) noexcept {
    regs_[STATUS] = bits::set_bit(regs_[STATUS], 19, miss);
}

void CP0::set_interrupt_line(bool asserted) noexcept {
    regs_[CAUSE] = bits::set_bit(regs_[CAUSE], 10, asserted);
}

// Bits [5:0] = {KUo,IEo, KUp,IEp, KUc,IEc}
void CP0::push_mode_stack() noexcept {
    const u32 sr = regs_[STATUS];
    regs_[STATUS] = (sr & ~0x3Fu) | ((sr << 2) & 0x3Fu);
}

void CP0::rfe() noexcept {
    const u32 sr = regs_[STATUS];
    regs_[STATUS] = (sr & ~0x0Fu) | ((sr >> 2) & 0x0Fu);
}
