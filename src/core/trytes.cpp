/**
 * Tryte Codec - implementation
 */

#include "trytes.hpp"

#include <cstring>
#include <stdexcept>

namespace tritpow {

namespace {

// Balanced value of each alphabet letter: 9=0, A..M=1..13, N..Z=-13..-1
int tryte_value(char c) {
    const char* pos = std::strchr(TRYTE_ALPHABET, c);
    if (c == '\0' || pos == nullptr) {
        throw std::invalid_argument(std::string("Invalid tryte character: '") + c + "'");
    }
    int value = static_cast<int>(pos - TRYTE_ALPHABET);
    return value > 13 ? value - 27 : value;
}

}  // namespace

bool is_trytes(const std::string& trytes) {
    for (char c : trytes) {
        if (c == '\0' || std::strchr(TRYTE_ALPHABET, c) == nullptr) {
            return false;
        }
    }
    return true;
}

Trits trits_from_trytes(const std::string& trytes) {
    Trits trits;
    trits.reserve(trytes.size() * 3);

    for (char c : trytes) {
        int value = tryte_value(c);
        for (int i = 0; i < 3; i++) {
            int rem = value % 3;
            if (rem == 2) rem = -1;
            if (rem == -2) rem = 1;
            trits.push_back(static_cast<int8_t>(rem));
            value = (value - rem) / 3;
        }
    }
    return trits;
}

std::string trytes_from_trits(const Trits& trits) {
    if (trits.size() % 3 != 0) {
        throw std::invalid_argument("Trit count must be a multiple of 3, got " +
                                    std::to_string(trits.size()));
    }

    std::string trytes;
    trytes.reserve(trits.size() / 3);

    for (size_t i = 0; i < trits.size(); i += 3) {
        int value = 0;
        for (int k = 2; k >= 0; k--) {
            int8_t t = trits[i + k];
            if (t < -1 || t > 1) {
                throw std::invalid_argument("Trit out of range at index " + std::to_string(i + k));
            }
            value = value * 3 + t;
        }
        trytes.push_back(TRYTE_ALPHABET[(value + 27) % 27]);
    }
    return trytes;
}

}  // namespace tritpow
