#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>

#include "bus/Bus.hpp"
#include "cpu/R3051.hpp"

// ── Register dump ─────────────────────────────────────────────────────────────
static void dump_state(const R3051& cpu) noexcept {
    std::fprintf(stdout, "PC=0x%08X HI=0x%08X LO=0x%08X cycles=%lld\n",
                 cpu.pc(), cpu.hi(), cpu.lo(), static_cast<long long>(cpu.total_cycles()));
    for (u32 r = 0; r < R3051::REGISTER_COUNT; r += 4) {
        std::fprintf(stdout, "r%-2u=0x%08X r%-2u=0x%08X r%-2u=0x%08X r%-2u=0x%08X\n",
                     r, cpu.reg(r), r + 1, cpu.reg(r + 1), r + 2, cpu.reg(r + 2), r + 3, cpu.reg(r + 3));
    }
    std::fprintf(stdout, "SR=0x%08X CAUSE=0x%08X EPC=0x%08X\n",
                 cpu.cp0().read_reg(CP0::STATUS), cpu.cp0().read_reg(CP0::CAUSE),
                 cpu.cp0().read_reg(CP0::EPC));
}

// ── main ──────────────────────────────────────────────────────────────────────
int main(int argc, char* argv[]) {
    // ── Parse flags ───────────────────────────────────────────────────────────
    long long max_cycles    = 0;   // 0 = unlimited
    unsigned  vblank_period = 0;
    CpuConfig config;

    int positional = 0;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--cycles") == 0 && i + 1 < argc) {
            max_cycles = std::strtoll(argv[++i], nullptr, 10);
        } else if (std::strcmp(argv[i], "--vblank") == 0 && i + 1 < argc) {
            vblank_period = static_cast<unsigned>(std::strtoul(argv[++i], nullptr, 10));
        } else if (std::strcmp(argv[i], "--trace-exceptions") == 0) {
            config.trace_exceptions = true;
        } else if (positional == 0) {
            positional = i;
        }
    }

    if (positional == 0) {
        std::fprintf(stderr,
            "Usage: r3051_run [--cycles N] [--vblank N] [--trace-exceptions] <bios.bin>\n");
        return EXIT_FAILURE;
    }

    // ── Build the system ──────────────────────────────────────────────────────
    // Heap-allocated: RAM and BIOS are too large for the stack.
    auto bus = std::make_unique<Bus>();
    if (!bus->load_bios(argv[positional])) {
        std::fprintf(stderr, "Failed to load BIOS from '%s' (expected %u bytes)\n",
                     argv[positional], Bios::SIZE);
        return EXIT_FAILURE;
    }
    std::fprintf(stdout, "BIOS loaded (%u KiB)\n", Bios::SIZE / 1024u);
    bus->set_vblank_period(vblank_period);

    auto cpu = std::make_unique<R3051>(config);

    // ── Run loop ──────────────────────────────────────────────────────────────
    // A block that starts and ends on the same PC is a branch-to-self with
    // nothing left to wait for.
    int same_pc = 0;
    while (max_cycles == 0 || cpu->total_cycles() < max_cycles) {
        const u32 start_pc = cpu->pc();
        cpu->execute_instructions(*bus);
        if (cpu->pc() == start_pc && vblank_period == 0) {
            if (++same_pc >= 4) {
                std::fprintf(stdout, "[HALT] PC=0x%08X after %lld cycles\n",
                             cpu->pc(), static_cast<long long>(cpu->total_cycles()));
                break;
            }
        } else {
            same_pc = 0;
        }
    }

    dump_state(*cpu);
    return EXIT_SUCCESS;
}
