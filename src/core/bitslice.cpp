/**
 * Bit-slice Codec - implementation
 */

#include "bitslice.hpp"

#include <stdexcept>
#include <string>

namespace tritpow {
namespace bitslice {

SearchStates encode_plain(const Trits& trits) {
    SearchStates states(trits.size());
    for (size_t i = 0; i < trits.size(); i++) {
        encode_trit(trits[i], states.low[i], states.high[i]);
    }
    return states;
}

SearchStates encode(const Trits& trits) {
    if (trits.size() != static_cast<size_t>(STATE_LENGTH)) {
        throw std::invalid_argument("Search state must hold " + std::to_string(STATE_LENGTH) +
                                    " trits, got " + std::to_string(trits.size()));
    }
    SearchStates states = encode_plain(trits);
    seed_lanes(states);
    return states;
}

void seed_lanes(SearchStates& states) {
    if (states.size() < static_cast<size_t>(LANE_SEED_START + LANE_SEED_COUNT)) {
        throw std::invalid_argument("Search state too short for lane seeds");
    }
    for (int i = 0; i < LANE_SEED_COUNT; i++) {
        states.low[LANE_SEED_START + i] = static_cast<int32_t>(LANE_SEED_LOW[i]);
        states.high[LANE_SEED_START + i] = static_cast<int32_t>(LANE_SEED_HIGH[i]);
    }
}

Trits decode_lane(const int32_t* low, const int32_t* high, size_t length, int lane) {
    if (lane < 0 || lane >= LANES_PER_WORD) {
        throw std::invalid_argument("Lane out of range: " + std::to_string(lane));
    }

    const uint32_t bit = 1u << lane;
    Trits trits(length);

    for (size_t i = 0; i < length; i++) {
        bool l = (static_cast<uint32_t>(low[i]) & bit) != 0;
        bool h = (static_cast<uint32_t>(high[i]) & bit) != 0;
        if (l && h) {
            trits[i] = 0;
        } else if (h) {
            trits[i] = 1;
        } else if (l) {
            trits[i] = -1;
        } else {
            throw std::invalid_argument("Invalid (0,0) cell at index " + std::to_string(i) +
                                        ", lane " + std::to_string(lane));
        }
    }
    return trits;
}

Trits decode_lane(const SearchStates& states, int lane) {
    return decode_lane(states.low.data(), states.high.data(), states.size(), lane);
}

Trits decode(const SearchStates& states) {
    return decode_lane(states, 0);
}

bool is_well_formed(const SearchStates& states) {
    for (size_t i = 0; i < states.size(); i++) {
        if ((states.low[i] | states.high[i]) != HIGH_BITS) {
            return false;
        }
    }
    return true;
}

std::vector<int32_t> pack_texels(const SearchStates& states) {
    std::vector<int32_t> flat(states.size() * TEXEL_SIZE);
    for (size_t i = 0; i < states.size(); i++) {
        flat[i * TEXEL_SIZE + 0] = states.low[i];
        flat[i * TEXEL_SIZE + 1] = states.high[i];
        flat[i * TEXEL_SIZE + 2] = states.low[i];
        flat[i * TEXEL_SIZE + 3] = states.high[i];
    }
    return flat;
}

SearchStates unpack_texels(const std::vector<int32_t>& flat) {
    if (flat.size() < static_cast<size_t>(STATE_LENGTH) * TEXEL_SIZE) {
        throw std::invalid_argument("Texel snapshot shorter than one state row");
    }
    SearchStates states(STATE_LENGTH);
    for (int i = 0; i < STATE_LENGTH; i++) {
        states.low[i] = flat[i * TEXEL_SIZE + 0];
        states.high[i] = flat[i * TEXEL_SIZE + 1];
    }
    return states;
}

}  // namespace bitslice
}  // namespace tritpow
