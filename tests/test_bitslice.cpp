/**
 * Bit-slice Codec Tests
 *
 * Verifies the (low, high) trit mapping, lane seeding and the texel upload
 * layout used by both backends.
 */

#include "core/bitslice.hpp"
#include "gpu/kernel_math.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <set>
#include <stdexcept>
#include <vector>

using namespace tritpow;

static Trits pattern_state() {
    Trits trits(STATE_LENGTH);
    for (int i = 0; i < STATE_LENGTH; i++) {
        trits[i] = static_cast<int8_t>(((i * 5 + 1) % 3) - 1);
    }
    return trits;
}

void test_cell_mapping() {
    SearchStates states = bitslice::encode_plain({0, 1, -1});
    assert(states.low[0] == -1 && states.high[0] == -1);
    assert(states.low[1] == 0 && states.high[1] == -1);
    assert(states.low[2] == -1 && states.high[2] == 0);
    std::cout << "[PASS] Trit to word mapping\n";
}

void test_round_trip() {
    Trits trits = pattern_state();
    SearchStates states = bitslice::encode_plain(trits);
    assert(bitslice::decode(states) == trits);
    for (int lane = 0; lane < LANES_PER_WORD; lane++) {
        assert(bitslice::decode_lane(states, lane) == trits);
    }
    std::cout << "[PASS] encode_plain/decode round trip\n";
}

void test_encode_seeds_lanes() {
    Trits trits = pattern_state();
    SearchStates states = bitslice::encode(trits);

    assert(states.size() == static_cast<size_t>(STATE_LENGTH));
    assert(bitslice::is_well_formed(states));

    // Outside the seed cells every lane is unchanged
    for (int lane = 0; lane < LANES_PER_WORD; lane++) {
        Trits decoded = bitslice::decode_lane(states, lane);
        for (int i = 0; i < STATE_LENGTH; i++) {
            if (i >= LANE_SEED_START && i < LANE_SEED_START + LANE_SEED_COUNT) continue;
            assert(decoded[i] == trits[i]);
        }
    }

    // The seed cells give each lane a distinct 4-trit pattern
    std::set<std::vector<int8_t>> patterns;
    for (int lane = 0; lane < LANES_PER_WORD; lane++) {
        Trits decoded = bitslice::decode_lane(states, lane);
        patterns.insert(std::vector<int8_t>(decoded.begin() + LANE_SEED_START,
                                            decoded.begin() + LANE_SEED_START + LANE_SEED_COUNT));
    }
    assert(patterns.size() == static_cast<size_t>(LANES_PER_WORD));
    std::cout << "[PASS] Lane seeds distinct\n";
}

void test_encode_rejects_wrong_length() {
    bool threw = false;
    try {
        bitslice::encode(Trits(HASH_LENGTH, 0));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] encode length check\n";
}

void test_invalid_cell() {
    SearchStates states = bitslice::encode_plain(Trits(8, 0));
    assert(bitslice::is_well_formed(states));

    states.low[5] = 0x0000FFFF;
    states.high[5] = 0x00FF00FF;    // lanes 24..31 are (0,0)
    assert(!bitslice::is_well_formed(states));

    // Lane 0 is still (1,1)
    bitslice::decode_lane(states, 0);

    bool threw = false;
    try {
        bitslice::decode_lane(states, 30);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] (0,0) cell detected\n";
}

void test_texel_layout() {
    SearchStates states = bitslice::encode(pattern_state());
    std::vector<int32_t> flat = bitslice::pack_texels(states);

    assert(flat.size() == static_cast<size_t>(STATE_LENGTH) * TEXEL_SIZE);
    for (int i = 0; i < STATE_LENGTH; i++) {
        assert(flat[i * TEXEL_SIZE + 0] == states.low[i]);
        assert(flat[i * TEXEL_SIZE + 1] == states.high[i]);
        assert(flat[i * TEXEL_SIZE + 2] == states.low[i]);
        assert(flat[i * TEXEL_SIZE + 3] == states.high[i]);
    }

    // Trailing flag cell of a readback is ignored
    flat.insert(flat.end(), {1, 2, 3, 4});
    SearchStates back = bitslice::unpack_texels(flat);
    assert(back.low == states.low);
    assert(back.high == states.high);
    std::cout << "[PASS] Texel pack/unpack\n";
}

void test_balanced_trit() {
    // Digits across the row field rebuild the value
    for (int64_t value : {0LL, 1LL, -1LL, 13LL, -13LL, 1000LL, -98765LL, 3486784400LL}) {
        int64_t rebuilt = 0;
        int64_t power = 1;
        for (int k = 0; k < ROW_FIELD_END - ROW_FIELD_START; k++) {
            int8_t t = gpu::balanced_trit(value, k);
            assert(t >= -1 && t <= 1);
            rebuilt += t * power;
            power *= 3;
        }
        assert(rebuilt == value);
    }
    assert(gpu::balanced_trit(2, 0) == -1);
    assert(gpu::balanced_trit(2, 1) == 1);

    // The row field spans exactly [-ROW_COUNTER_MAX, ROW_COUNTER_MAX]
    for (int k = 0; k < ROW_FIELD_END - ROW_FIELD_START; k++) {
        assert(gpu::balanced_trit(ROW_COUNTER_MAX, k) == 1);
        assert(gpu::balanced_trit(-ROW_COUNTER_MAX, k) == -1);
        assert(gpu::balanced_trit(2 * ROW_COUNTER_MAX + 1, k) == 0);    // 3^27 aliases 0
    }
    assert(row_offset_fits(ROW_COUNTER_MAX, 1));
    assert(!row_offset_fits(ROW_COUNTER_MAX, 2));
    assert(row_offset_fits(-ROW_COUNTER_MAX, 64));
    assert(!row_offset_fits(-ROW_COUNTER_MAX - 1, 1));
    assert(!row_offset_fits(0, 0));
    std::cout << "[PASS] Balanced ternary digits\n";
}

int main() {
    std::cout << "=== Bit-slice Codec Tests ===\n\n";

    try {
        test_cell_mapping();
        test_round_trip();
        test_encode_seeds_lanes();
        test_encode_rejects_wrong_length();
        test_invalid_cell();
        test_texel_layout();
        test_balanced_trit();

        std::cout << "\n=== All bit-slice tests passed! ===\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\nTest FAILED: " << e.what() << "\n";
        return 1;
    }
}
