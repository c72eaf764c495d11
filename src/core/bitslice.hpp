/**
 * Bit-slice Codec
 *
 * Packs a ternary sponge state into (low, high) word pairs so that each of
 * the 32 bit positions of a word tests a different candidate nonce:
 *
 *   trit  0 -> (low=1, high=1)
 *   trit +1 -> (low=0, high=1)
 *   trit -1 -> (low=1, high=0)
 *
 * encode() also seeds the four lane-seed cells with constants that give
 * every lane a distinct starting nonce.
 */

#pragma once

#include <array>
#include <cstdint>

#include "types.hpp"

namespace tritpow {
namespace bitslice {

// Lane seed words written at LANE_SEED_START .. LANE_SEED_START + 3
constexpr std::array<uint32_t, LANE_SEED_COUNT> LANE_SEED_LOW = {
    0xDB6DB6DBu, 0xF1F8FC7Eu, 0x7FFFE00Fu, 0xFFC00000u
};
constexpr std::array<uint32_t, LANE_SEED_COUNT> LANE_SEED_HIGH = {
    0xB6DB6DB6u, 0x8FC7E3F1u, 0xFFC01FFFu, 0x003FFFFFu
};

/**
 * Map a trit onto lane-uniform (low, high) words.
 */
inline void encode_trit(int8_t trit, int32_t& low, int32_t& high) {
    switch (trit) {
        case 0:
            low = HIGH_BITS;
            high = HIGH_BITS;
            break;
        case 1:
            low = LOW_BITS;
            high = HIGH_BITS;
            break;
        default:
            low = HIGH_BITS;
            high = LOW_BITS;
            break;
    }
}

/**
 * Encode trits without touching the lane seeds.
 */
SearchStates encode_plain(const Trits& trits);

/**
 * Encode a full sponge state and seed the nonce lanes.
 * Throws std::invalid_argument unless trits.size() == STATE_LENGTH.
 */
SearchStates encode(const Trits& trits);

/**
 * Overwrite the lane-seed cells of an encoded state.
 */
void seed_lanes(SearchStates& states);

/**
 * Recover one lane's trits from word pairs.
 * Throws std::invalid_argument on an invalid (0,0) lane.
 */
Trits decode_lane(const int32_t* low, const int32_t* high, size_t length, int lane);
Trits decode_lane(const SearchStates& states, int lane);

/**
 * Decode lane 0. Round-trips encode_plain() for every input.
 */
Trits decode(const SearchStates& states);

/**
 * True if no cell of `states` has a (0,0) lane.
 */
bool is_well_formed(const SearchStates& states);

/**
 * Row-major texel upload for the first STATE_LENGTH cells of row 0.
 * Both channel pairs carry the state.
 */
std::vector<int32_t> pack_texels(const SearchStates& states);

/**
 * Inverse of pack_texels() for the mid channels of row 0.
 * `flat` holds TEXEL_SIZE int32 per cell; only the first STATE_LENGTH cells
 * are read.
 */
SearchStates unpack_texels(const std::vector<int32_t>& flat);

}  // namespace bitslice
}  // namespace tritpow
