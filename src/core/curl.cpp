/**
 * CPU Reference Curl-P-81 - implementation
 */

#include "curl.hpp"

#include <algorithm>
#include <stdexcept>

#include "trytes.hpp"

namespace tritpow {
namespace cpu {

Curl::Curl(int rounds) : rounds_(rounds) {
    reset();
}

void Curl::reset() {
    state_.fill(0);
}

void Curl::absorb(const Trits& trits, size_t offset, size_t length) {
    if (offset + length > trits.size()) {
        throw std::out_of_range("Curl::absorb past end of input");
    }

    while (length > 0) {
        size_t chunk = std::min<size_t>(length, HASH_LENGTH);
        std::copy(trits.begin() + offset, trits.begin() + offset + chunk, state_.begin());
        transform();
        offset += chunk;
        length -= chunk;
    }
}

void Curl::squeeze(Trits& out, size_t offset, size_t length) {
    if (out.size() < offset + length) {
        out.resize(offset + length);
    }

    while (length > 0) {
        size_t chunk = std::min<size_t>(length, HASH_LENGTH);
        std::copy(state_.begin(), state_.begin() + chunk, out.begin() + offset);
        transform();
        offset += chunk;
        length -= chunk;
    }
}

Trits Curl::squeeze() {
    Trits out(HASH_LENGTH);
    squeeze(out, 0, HASH_LENGTH);
    return out;
}

void Curl::transform() {
    State scratchpad;

    for (int round = 0; round < rounds_; round++) {
        scratchpad = state_;
        int index = 0;
        for (int i = 0; i < STATE_LENGTH; i++) {
            int a = scratchpad[index];
            index += (index < 365 ? 364 : -365);
            int b = scratchpad[index];
            state_[i] = TRUTH_TABLE[a + b * 4 + 5];
        }
    }
}

std::string Curl::hash_trytes(const std::string& trytes) {
    Curl curl;
    curl.absorb(trits_from_trytes(trytes));
    return trytes_from_trits(curl.squeeze());
}

}  // namespace cpu
}  // namespace tritpow
