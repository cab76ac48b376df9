#include "TestHarness.hpp"

#include "RecordingBridge.hpp"
#include "common/Bits.hpp"
#include "cpu/CP0.hpp"
#include "cpu/InstructionCache.hpp"

static bool test_cold_cache_misses() {
    CP0 cp0;
    InstructionCache cache{cp0};
    CHECK(!cache.check_hit(0x0000'0000u));
    CHECK(!cache.check_hit(0x0000'0FF0u));
    CHECK(!cache.line_valid(0x0000'0100u));
    return true;
}

static bool test_refill_loads_whole_line() {
    CP0 cp0;
    InstructionCache cache{cp0};
    RecordingBridge bridge;
    bridge.load_program(0x100, {0x1122'3344u, 0x5566'7788u, 0x99AA'BBCCu, 0xDDEE'FF00u});

    cache.refill_line(bridge, 0x108);
    CHECK(bridge.word_reads == 4);
    CHECK(cache.check_hit(0x100));
    CHECK(cache.check_hit(0x10C));
    CHECK(!cache.check_hit(0x110));

    // Bus word order out, memory byte order inside.
    CHECK(bits::swap_word(cache.read_word(0x100)) == 0x1122'3344u);
    CHECK(bits::swap_word(cache.read_word(0x10C)) == 0xDDEE'FF00u);
    CHECK(cache.read_byte(0x100) == 0x44);
    CHECK(cache.read_byte(0x107) == 0x55);
    return true;
}

static bool test_tag_mismatch() {
    CP0 cp0;
    InstructionCache cache{cp0};
    RecordingBridge bridge;
    cache.refill_line(bridge, 0x0000'0200u);
    CHECK(cache.check_hit(0x0000'0200u));
    // Same line index, different tag.
    CHECK(!cache.check_hit(0x0000'1200u));
    CHECK(!cache.check_hit(0x0010'0200u));
    return true;
}

static bool test_isolated_refill_is_ignored() {
    CP0 cp0;
    cp0.write_reg(CP0::STATUS, 1u << 16, true);
    InstructionCache cache{cp0};
    RecordingBridge bridge;
    cache.refill_line(bridge, 0x300);
    CHECK(bridge.word_reads == 0);
    CHECK(!cache.check_hit(0x300));
    return true;
}

static bool test_isolated_store_invalidates_line() {
    CP0 cp0;
    InstructionCache cache{cp0};
    RecordingBridge bridge;
    cache.refill_line(bridge, 0x400);
    CHECK(cache.check_hit(0x400));

    cp0.write_reg(CP0::STATUS, 1u << 16, true);
    cache.write_word(0x404, 0xCAFE'BABEu);
    CHECK(!cache.line_valid(0x400));
    CHECK(cache.read_word(0x404) == 0xCAFE'BABEu);

    cache.write_byte(0x500, 0x5A);
    CHECK(!cache.line_valid(0x500));
    CHECK(cache.read_byte(0x500) == 0x5A);
    return true;
}

static bool test_invalidate_all() {
    CP0 cp0;
    InstructionCache cache{cp0};
    RecordingBridge bridge;
    cache.refill_line(bridge, 0x000);
    cache.refill_line(bridge, 0xFF0);
    cache.invalidate_all();
    CHECK(!cache.check_hit(0x000));
    CHECK(!cache.check_hit(0xFF0));
    return true;
}

int main() {
    return run_tests({
        {"cold_cache_misses",          test_cold_cache_misses},
        {"refill_loads_whole_line",    test_refill_loads_whole_line},
        {"tag_mismatch",               test_tag_mismatch},
        {"isolated_refill_is_ignored", test_isolated_refill_is_ignored},
        {"isolated_store_invalidates", test_isolated_store_invalidates_line},
        {"invalidate_all",             test_invalidate_all},
    });
}
