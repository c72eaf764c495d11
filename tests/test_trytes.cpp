/**
 * Tryte Codec Tests
 *
 * Alphabet mapping, balanced-ternary digit order and rejection of bad input.
 */

#include "core/trytes.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>

using namespace tritpow;

void test_known_values() {
    Trits trits = trits_from_trytes("9ANMZ");
    Trits expected = {0, 0, 0,  1, 0, 0,  -1, -1, -1,  1, 1, 1,  -1, 0, 0};
    assert(trits == expected);
    assert(trytes_from_trits(expected) == "9ANMZ");
    std::cout << "[PASS] Known tryte values\n";
}

void test_full_alphabet() {
    std::string alphabet = TRYTE_ALPHABET;
    Trits trits = trits_from_trytes(alphabet);
    assert(trits.size() == alphabet.size() * 3);
    for (int8_t t : trits) {
        assert(t >= -1 && t <= 1);
    }
    assert(trytes_from_trits(trits) == alphabet);
    std::cout << "[PASS] Every letter survives trits and back\n";
}

void test_is_trytes() {
    assert(is_trytes(""));
    assert(is_trytes("ABC9XYZ"));
    assert(!is_trytes("abc"));
    assert(!is_trytes("AB C"));
    assert(!is_trytes("AB1"));
    std::cout << "[PASS] Alphabet membership\n";
}

void test_rejects_bad_input() {
    bool threw = false;
    try {
        trits_from_trytes("AB!");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        trytes_from_trits({1, 0});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        trytes_from_trits({1, 2, 0});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Invalid input rejected\n";
}

int main() {
    std::cout << "=== Tryte Codec Tests ===\n\n";

    test_known_values();
    test_full_alphabet();
    test_is_trytes();
    test_rejects_bad_input();

    std::cout << "\n=== All tryte tests passed! ===\n";
    return 0;
}
