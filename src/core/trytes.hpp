/**
 * Tryte Codec
 *
 * Converts between trit vectors and the 27-letter tryte alphabet
 * "9ABCDEFGHIJKLMNOPQRSTUVWXYZ". Each tryte holds three little-endian trits.
 */

#pragma once

#include <string>

#include "types.hpp"

namespace tritpow {

constexpr const char* TRYTE_ALPHABET = "9ABCDEFGHIJKLMNOPQRSTUVWXYZ";

/**
 * True if every character belongs to the tryte alphabet.
 */
bool is_trytes(const std::string& trytes);

/**
 * Expand trytes into trits (3 per tryte).
 * Throws std::invalid_argument on a character outside the alphabet.
 */
Trits trits_from_trytes(const std::string& trytes);

/**
 * Pack trits into trytes. Length must be a multiple of 3.
 * Throws std::invalid_argument otherwise, or on a trit outside {-1, 0, 1}.
 */
std::string trytes_from_trits(const Trits& trits);

}  // namespace tritpow
