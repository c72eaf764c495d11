/**
 * tritpow Core Types
 *
 * Common type definitions for the host search pipeline and device kernels.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "constants.hpp"

namespace tritpow {

// -----------------------------------------------------------------------------
// Ternary Types
// -----------------------------------------------------------------------------

/**
 * Ternary digits, each in {-1, 0, +1}.
 */
using Trits = std::vector<int8_t>;

/**
 * Bit-sliced sponge state.
 *
 * Each of the 32 bit positions of a (low, high) word pair carries one trit
 * of one candidate:
 *   (1,1) -> 0, (0,1) -> +1, (1,0) -> -1, (0,0) never occurs.
 */
struct SearchStates {
    std::vector<int32_t> low;
    std::vector<int32_t> high;

    SearchStates() = default;
    explicit SearchStates(size_t length) : low(length, 0), high(length, 0) {}

    size_t size() const { return low.size(); }
    bool empty() const { return low.empty(); }
};

// -----------------------------------------------------------------------------
// Grid Types
// -----------------------------------------------------------------------------

/**
 * One grid cell, four int32 channels.
 *
 * State columns:
 *   mid_low/mid_high  candidate state before the permutation
 *   low/high          permutation working state
 *
 * Flag column (x == FLAG_COLUMN):
 *   mid_low           per-row mask of passing lanes
 *   low               row 0 only: winning row, or SEARCH_PENDING
 *   high              row 0 only: winning row's lane mask
 */
struct Texel {
    int32_t mid_low;
    int32_t mid_high;
    int32_t low;
    int32_t high;
};

static_assert(sizeof(Texel) == TEXEL_SIZE * sizeof(int32_t), "Texel must pack to 4 channels");

/**
 * Grid extent in cells.
 */
struct GridDims {
    int x = 0;
    int y = 0;
};

}  // namespace tritpow
