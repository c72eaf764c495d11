/**
 * tritpow Structural Constants
 *
 * Curl-P-81 sponge dimensions and the nonce layout used by the search grid.
 * Shared by host code and device kernels, so keep this header free of
 * anything a CUDA translation unit cannot digest.
 */

#pragma once

#include <cstdint>

namespace tritpow {

// Curl-P-81
constexpr int HASH_LENGTH = 243;
constexpr int STATE_LENGTH = 3 * HASH_LENGTH;     // 729
constexpr int HALF_LENGTH = 364;
constexpr int NUMBER_OF_ROUNDS = 81;

// Transaction framing
constexpr int TRANSACTION_LENGTH = HASH_LENGTH * 33;        // 8019 trits
constexpr int TRANSACTION_TRYTES = TRANSACTION_LENGTH / 3;  // 2673 trytes

// Nonce layout inside the first HASH_LENGTH cells of the search state
constexpr int NONCE_LENGTH = HASH_LENGTH / 3;               // 81
constexpr int NONCE_START = HASH_LENGTH - NONCE_LENGTH;     // 162
constexpr int NONCE_TRYTES = NONCE_LENGTH / 3;              // 27

constexpr int LANE_SEED_START = NONCE_START;                // 4 seed cells
constexpr int LANE_SEED_COUNT = 4;
constexpr int ROW_FIELD_START = NONCE_START + HASH_LENGTH / 9;        // 189
constexpr int ROW_FIELD_END = NONCE_START + (HASH_LENGTH / 9) * 2;    // 216
constexpr int COUNTER_START = ROW_FIELD_END;                          // 216
constexpr int COUNTER_END = HASH_LENGTH;                              // 243

// Largest magnitude the 27-trit row field holds: (3^27 - 1) / 2
constexpr int64_t ROW_COUNTER_MAX = 3812798742493LL;

/**
 * True if every row counter offset .. offset + rows - 1 fits the row field.
 * Counters outside that range would wrap onto other rows' nonces.
 */
constexpr bool row_offset_fits(int64_t offset, int rows) {
    return rows >= 1 && offset >= -ROW_COUNTER_MAX && offset <= ROW_COUNTER_MAX - (rows - 1);
}

// Search grid
constexpr int TEXEL_SIZE = 4;
constexpr int GRID_WIDTH = STATE_LENGTH + 1;    // last column holds the flags
constexpr int FLAG_COLUMN = STATE_LENGTH;
constexpr int LANES_PER_WORD = 32;

// Bit-sliced words
constexpr int32_t LOW_BITS = 0;
constexpr int32_t HIGH_BITS = -1;

// Column-check sentinel: no row has a passing lane yet
constexpr int32_t SEARCH_PENDING = -1;

}  // namespace tritpow
