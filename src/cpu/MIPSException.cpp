#include "MIPSException.hpp"

const char* exception_reason_name(ExceptionReason reason) noexcept {
    switch (reason) {
        case ExceptionReason::Int:     return "INT";
        case ExceptionReason::AdEL:    return "ADEL";
        case ExceptionReason::AdES:    return "ADES";
        case ExceptionReason::IBE:     return "IBE";
        case ExceptionReason::DBE:     return "DBE";
        case ExceptionReason::Syscall: return "SYS";
        case ExceptionReason::Bp:      return "BP";
        case ExceptionReason::RI:      return "RI";
        case ExceptionReason::CpU:     return "CPU";
        case ExceptionReason::Ov:      return "OVF";
        case ExceptionReason::Reset:   return "RESET";
        case ExceptionReason::Null:    return "NULL";
    }
    return "?";
}

void MIPSException::raise(ExceptionReason reason, u32 origin_pc, bool in_delay_slot,
                          u32 bad_address, u32 cop_num) noexcept {
    reason_        = reason;
    origin_pc_     = origin_pc;
    in_delay_slot_ = in_delay_slot;
    bad_address_   = bad_address;
    cop_num_       = cop_num;
}

void MIPSException::reset() noexcept {
    reason_        = ExceptionReason::Null;
    origin_pc_     = 0;
    bad_address_   = 0;
    cop_num_       = 0;
    in_delay_slot_ = false;
}
