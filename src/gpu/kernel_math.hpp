/**
 * Search Grid Kernels - per-cell math
 *
 * Every pass of the search is a pure function of the previous grid:
 *
 *   out(x, y) = pass(in, x, y, uniform)
 *
 * Backends evaluate these for every cell, writing into a second grid, and
 * swap the two afterwards. Because no pass reads what it writes, cells can be
 * evaluated in any order or all at once.
 *
 * Compiled for the host (CPU backend, tests) and for the device (CUDA).
 */

#pragma once

#include <cstdint>

#include "../core/types.hpp"

#if defined(__CUDACC__)
#define TRITPOW_HD __host__ __device__ __forceinline__
#else
#define TRITPOW_HD inline
#endif

namespace tritpow {
namespace gpu {

/**
 * Read-only view over one grid buffer.
 */
struct GridView {
    const Texel* cells;
    int width;
    int height;

    TRITPOW_HD const Texel& at(int x, int y) const { return cells[y * width + x]; }
};

/**
 * k-th balanced-ternary digit of value, least significant first.
 */
TRITPOW_HD int8_t balanced_trit(int64_t value, int k) {
    int64_t rem = 0;
    for (int i = 0; i <= k; i++) {
        rem = value % 3;
        if (rem == 2) rem = -1;
        if (rem == -2) rem = 1;
        value = (value - rem) / 3;
    }
    return static_cast<int8_t>(rem);
}

/**
 * Lane-uniform encoding of one trit as (low, high).
 */
TRITPOW_HD void uniform_trit(int8_t trit, int32_t& low, int32_t& high) {
    low = trit == 1 ? LOW_BITS : HIGH_BITS;
    high = trit == -1 ? LOW_BITS : HIGH_BITS;
}

/**
 * Source cells of output cell j for one permutation round.
 */
TRITPOW_HD int twist_source_a(int j) {
    return j == 0 ? 0 : (((j - 1) % 2) + 1) * HALF_LENGTH - ((j - 1) >> 1);
}

TRITPOW_HD int twist_source_b(int j) {
    return ((j % 2) + 1) * HALF_LENGTH - (j >> 1);
}

// -----------------------------------------------------------------------------
// Passes
// -----------------------------------------------------------------------------

/**
 * initialize: broadcast row 0, stamp the row counter (offset + row) into the
 * row field, copy mid into working state and reset the flags.
 */
TRITPOW_HD Texel init_cell(const GridView& in, int x, int y, int64_t offset) {
    Texel out = in.at(x, 0);

    if (x == FLAG_COLUMN) {
        out.mid_low = 0;
        out.mid_high = 0;
        out.low = SEARCH_PENDING;
        out.high = 0;
        return out;
    }

    if (x >= ROW_FIELD_START && x < ROW_FIELD_END) {
        uniform_trit(balanced_trit(offset + y, x - ROW_FIELD_START), out.mid_low, out.mid_high);
    }
    out.low = out.mid_low;
    out.high = out.mid_high;
    return out;
}

/**
 * increment: add one to the counter field of every lane.
 *
 * The carry into cell x is set for the lanes whose cells COUNTER_START..x-1
 * all hold +1. Per lane: +1 -> -1 (carry on), -1 -> 0, 0 -> +1.
 */
TRITPOW_HD Texel increment_cell(const GridView& in, int x, int y) {
    Texel out = in.at(x, y);
    if (x == FLAG_COLUMN) return out;

    if (x >= COUNTER_START && x < COUNTER_END) {
        int32_t carry = HIGH_BITS;
        for (int i = COUNTER_START; i < x; i++) {
            const Texel& c = in.at(i, y);
            carry &= ~c.mid_low & c.mid_high;
        }

        int32_t low = out.mid_low;
        int32_t high = out.mid_high;
        out.mid_low = (carry & ~(low & high)) | (~carry & low);
        out.mid_high = (carry & low) | (~carry & high);
    }

    out.low = out.mid_low;
    out.high = out.mid_high;
    return out;
}

/**
 * twist: one round of the Curl substitution.
 */
TRITPOW_HD Texel twist_cell(const GridView& in, int x, int y) {
    Texel out = in.at(x, y);
    if (x == FLAG_COLUMN) return out;

    const Texel& a = in.at(twist_source_a(x), y);
    const Texel& b = in.at(twist_source_b(x), y);

    int32_t alpha = a.low;
    int32_t beta = a.high;
    int32_t gamma = b.high;
    int32_t delta = (alpha | ~gamma) & (b.low ^ beta);

    out.low = ~delta;
    out.high = (alpha ^ gamma) | delta;
    return out;
}

/**
 * check: lanes of row y whose last `min_weight` hash trits are all zero.
 */
TRITPOW_HD Texel check_cell(const GridView& in, int x, int y, int64_t min_weight) {
    Texel out = in.at(x, y);
    if (x != FLAG_COLUMN) return out;

    int32_t mask = HIGH_BITS;
    for (int i = 0; i < min_weight && mask != 0; i++) {
        const Texel& c = in.at(HASH_LENGTH - 1 - i, y);
        mask &= ~(c.low ^ c.high);
    }
    out.mid_low = mask;
    return out;
}

/**
 * column_check: first row with a passing lane, into row 0's flag cell.
 */
TRITPOW_HD Texel column_check_cell(const GridView& in, int x, int y) {
    Texel out = in.at(x, y);
    if (x != FLAG_COLUMN || y != 0) return out;

    out.low = SEARCH_PENDING;
    out.high = 0;
    for (int row = 0; row < in.height; row++) {
        int32_t mask = in.at(FLAG_COLUMN, row).mid_low;
        if (mask != 0) {
            out.low = row;
            out.high = mask;
            break;
        }
    }
    return out;
}

/**
 * finalize: copy the winning row's candidate hash block into the working
 * channels of row 0 for readback.
 */
TRITPOW_HD Texel finalize_cell(const GridView& in, int x, int y) {
    Texel out = in.at(x, y);
    if (y != 0 || x >= HASH_LENGTH) return out;

    int32_t row = in.at(FLAG_COLUMN, 0).low;
    if (row < 0 || row >= in.height) return out;

    const Texel& src = in.at(x, row);
    out.low = src.mid_low;
    out.high = src.mid_high;
    return out;
}

}  // namespace gpu
}  // namespace tritpow
