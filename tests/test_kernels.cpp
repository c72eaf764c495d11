/**
 * Search Grid Kernel Tests
 *
 * Runs the passes on the CPU backend and checks them against the scalar
 * Curl permutation and the nonce-space layout.
 */

#include "core/bitslice.hpp"
#include "core/curl.hpp"
#include "gpu/kernels.hpp"
#include "platform/backend.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <set>
#include <vector>

using namespace tritpow;
using namespace tritpow::platform;

static Trits pattern_state(int seed) {
    Trits trits(STATE_LENGTH);
    uint32_t x = static_cast<uint32_t>(seed) * 2654435761u + 1;
    for (int i = 0; i < STATE_LENGTH; i++) {
        x = x * 1103515245u + 12345u;
        trits[i] = static_cast<int8_t>(static_cast<int>((x >> 16) % 3) - 1);
    }
    return trits;
}

static std::unique_ptr<IComputeBackend> make_backend(int rows) {
    auto backend = create_cpu_backend(2);
    GridSpec spec;
    spec.height = rows;
    Result result = backend->initialize(spec);
    assert(result.ok());
    result = gpu::register_kernels(*backend);
    assert(result.ok());
    return backend;
}

// One channel pair of one row as SearchStates
static SearchStates row_states(const std::vector<int32_t>& flat, int row, int channel) {
    SearchStates states(STATE_LENGTH);
    size_t base = static_cast<size_t>(row) * GRID_WIDTH * TEXEL_SIZE;
    for (int i = 0; i < STATE_LENGTH; i++) {
        states.low[i] = flat[base + i * TEXEL_SIZE + channel];
        states.high[i] = flat[base + i * TEXEL_SIZE + channel + 1];
    }
    return states;
}

static int64_t counter_value(const Trits& trits) {
    int64_t value = 0;
    for (int i = COUNTER_END - 1; i >= COUNTER_START; i--) {
        value = value * 3 + trits[i];
    }
    return value;
}

void test_backend_contract() {
    auto backend = create_cpu_backend(1);

    std::vector<int32_t> out;
    assert(backend->run_program(gpu::PROGRAM_TWIST, 1).code == ErrorCode::NotInitialized);
    assert(backend->read_data(0, 0, 1, 1, out).code == ErrorCode::NotInitialized);

    GridSpec spec;
    spec.height = 2;
    assert(backend->initialize(spec).ok());
    assert(backend->get_dimensions().x == GRID_WIDTH);
    assert(backend->get_dimensions().y == 2);
    assert(gpu::register_kernels(*backend).ok());

    assert(backend->run_program("missing", 1).code == ErrorCode::InvalidArgument);
    assert(backend->run_program(gpu::PROGRAM_CHECK, 1, {{"bogus", 1}}).code == ErrorCode::InvalidArgument);
    assert(backend->read_data(GRID_WIDTH - 1, 0, 2, 1, out).code == ErrorCode::InvalidArgument);
    assert(backend->write_data(std::vector<int32_t>(3)).code == ErrorCode::InvalidArgument);

    backend->shutdown();
    assert(!backend->is_initialized());
    std::cout << "[PASS] Backend contract\n";
}

void test_twist_matches_scalar_curl() {
    auto backend = make_backend(1);

    Trits trits = pattern_state(1);
    assert(backend->write_data(bitslice::pack_texels(bitslice::encode_plain(trits))).ok());
    assert(backend->run_program(gpu::PROGRAM_TWIST, NUMBER_OF_ROUNDS).ok());

    std::vector<int32_t> flat;
    assert(backend->read_data(0, 0, GRID_WIDTH, 1, flat).ok());
    SearchStates working = row_states(flat, 0, 2);
    assert(bitslice::is_well_formed(working));

    cpu::Curl curl;
    std::copy(trits.begin(), trits.end(), curl.state().begin());
    curl.transform();
    Trits expected(curl.state().begin(), curl.state().end());

    for (int lane = 0; lane < LANES_PER_WORD; lane++) {
        assert(bitslice::decode_lane(working, lane) == expected);
    }

    // Mid channels untouched by the permutation
    assert(bitslice::decode(row_states(flat, 0, 0)) == trits);
    std::cout << "[PASS] twist x81 equals Curl transform\n";
}

void test_permutation_repeatable() {
    std::vector<int32_t> first;
    std::vector<int32_t> second;

    for (auto* out : {&first, &second}) {
        auto backend = make_backend(3);
        assert(backend->write_data(bitslice::pack_texels(bitslice::encode(pattern_state(2)))).ok());
        assert(backend->run_program(gpu::PROGRAM_INIT, 1, {{gpu::UNIFORM_OFFSET, 5}}).ok());
        assert(backend->run_program(gpu::PROGRAM_INCREMENT, 1).ok());
        assert(backend->run_program(gpu::PROGRAM_TWIST, NUMBER_OF_ROUNDS).ok());
        assert(backend->read_data(0, 0, GRID_WIDTH, 3, *out).ok());
    }

    assert(first == second);
    std::cout << "[PASS] Passes are bit-for-bit repeatable\n";
}

void test_lanes_unique_across_rows() {
    const int rows = 8;
    auto backend = make_backend(rows);

    assert(backend->write_data(bitslice::pack_texels(bitslice::encode(pattern_state(3)))).ok());
    assert(backend->run_program(gpu::PROGRAM_INIT, 1, {{gpu::UNIFORM_OFFSET, 40}}).ok());

    std::vector<int32_t> flat;
    assert(backend->read_data(0, 0, GRID_WIDTH, rows, flat).ok());

    std::set<Trits> nonces;
    for (int row = 0; row < rows; row++) {
        SearchStates mid = row_states(flat, row, 0);
        assert(bitslice::is_well_formed(mid));
        assert(bitslice::is_well_formed(row_states(flat, row, 2)));

        for (int lane = 0; lane < LANES_PER_WORD; lane++) {
            Trits trits = bitslice::decode_lane(mid, lane);
            nonces.insert(Trits(trits.begin() + NONCE_START, trits.begin() + HASH_LENGTH));
        }

        // Flag cell reset
        size_t flag = (static_cast<size_t>(row) * GRID_WIDTH + FLAG_COLUMN) * TEXEL_SIZE;
        assert(flat[flag + 2] == SEARCH_PENDING);
    }
    assert(nonces.size() == static_cast<size_t>(rows) * LANES_PER_WORD);
    std::cout << "[PASS] " << nonces.size() << " distinct nonces per round\n";
}

void test_increment_adds_one() {
    auto backend = make_backend(2);

    assert(backend->write_data(bitslice::pack_texels(bitslice::encode(pattern_state(4)))).ok());
    assert(backend->run_program(gpu::PROGRAM_INIT, 1, {{gpu::UNIFORM_OFFSET, 0}}).ok());

    std::vector<int32_t> before;
    assert(backend->read_data(0, 0, GRID_WIDTH, 2, before).ok());

    for (int step = 1; step <= 5; step++) {
        assert(backend->run_program(gpu::PROGRAM_INCREMENT, 1).ok());
    }

    std::vector<int32_t> after;
    assert(backend->read_data(0, 0, GRID_WIDTH, 2, after).ok());

    for (int row = 0; row < 2; row++) {
        SearchStates mid_before = row_states(before, row, 0);
        SearchStates mid_after = row_states(after, row, 0);
        assert(bitslice::is_well_formed(mid_after));

        for (int lane = 0; lane < LANES_PER_WORD; lane++) {
            Trits a = bitslice::decode_lane(mid_before, lane);
            Trits b = bitslice::decode_lane(mid_after, lane);
            assert(counter_value(b) == counter_value(a) + 5);
            for (int i = 0; i < COUNTER_START; i++) {
                assert(a[i] == b[i]);
            }
        }

        // Working state mirrors mid after an increment
        assert(row_states(after, row, 2).low == mid_after.low);
        assert(row_states(after, row, 2).high == mid_after.high);
    }
    std::cout << "[PASS] increment adds one per dispatch\n";
}

void test_check_and_column_check() {
    auto backend = make_backend(1);

    // All-zero working state: every lane passes any difficulty
    assert(backend->write_data(bitslice::pack_texels(bitslice::encode_plain(Trits(STATE_LENGTH, 0)))).ok());
    assert(backend->run_program(gpu::PROGRAM_CHECK, 1, {{gpu::UNIFORM_MIN_WEIGHT, 50}}).ok());
    assert(backend->run_program(gpu::PROGRAM_COL_CHECK, 1).ok());

    std::vector<int32_t> flag;
    assert(backend->read_data(FLAG_COLUMN, 0, 1, 1, flag).ok());
    assert(flag[0] == HIGH_BITS);
    assert(flag[2] == 0);
    assert(flag[3] == HIGH_BITS);

    // Last hash trit +1 in every lane: nothing passes
    Trits trits(STATE_LENGTH, 0);
    trits[HASH_LENGTH - 1] = 1;
    assert(backend->write_data(bitslice::pack_texels(bitslice::encode_plain(trits))).ok());
    assert(backend->run_program(gpu::PROGRAM_CHECK, 1, {{gpu::UNIFORM_MIN_WEIGHT, 1}}).ok());
    assert(backend->run_program(gpu::PROGRAM_COL_CHECK, 1).ok());
    assert(backend->read_data(FLAG_COLUMN, 0, 1, 1, flag).ok());
    assert(flag[0] == 0);
    assert(flag[2] == SEARCH_PENDING);
    std::cout << "[PASS] check / col_check flags\n";
}

int main() {
    std::cout << "=== Search Grid Kernel Tests ===\n\n";

    try {
        test_backend_contract();
        test_twist_matches_scalar_curl();
        test_permutation_repeatable();
        test_lanes_unique_across_rows();
        test_increment_adds_one();
        test_check_and_column_check();

        std::cout << "\n=== All kernel tests passed! ===\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\nTest FAILED: " << e.what() << "\n";
        return 1;
    }
}
