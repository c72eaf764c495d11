/**
 * Proof-of-Work Verifier
 *
 * Host-side check of nonces returned by the search grid.
 *
 * Pipeline:
 *   Grid Match -> Rebuild Transaction -> CPU Curl -> Trailing Zeros >= MWM
 *
 * The grid never reports a lane that failed its check pass, so a mismatch
 * here means a backend fault rather than bad luck.
 */

#pragma once

#include <stdexcept>
#include <string>

#include "curl.hpp"
#include "trytes.hpp"
#include "types.hpp"

namespace tritpow {

/**
 * Number of consecutive zero trits at the end of a hash.
 */
inline int trailing_zeros(const Trits& hash) {
    int zeros = 0;
    for (auto it = hash.rbegin(); it != hash.rend() && *it == 0; ++it) {
        zeros++;
    }
    return zeros;
}

/**
 * Transaction trytes with the last NONCE_TRYTES replaced by `nonce_trytes`.
 * Throws std::invalid_argument on malformed input.
 */
inline std::string attach_nonce(const std::string& transaction_trytes, const std::string& nonce_trytes) {
    if (transaction_trytes.size() != static_cast<size_t>(TRANSACTION_TRYTES)) {
        throw std::invalid_argument("Transaction must be " + std::to_string(TRANSACTION_TRYTES) + " trytes");
    }
    if (nonce_trytes.size() != static_cast<size_t>(NONCE_TRYTES) || !is_trytes(nonce_trytes)) {
        throw std::invalid_argument("Nonce must be " + std::to_string(NONCE_TRYTES) + " trytes");
    }
    return transaction_trytes.substr(0, TRANSACTION_TRYTES - NONCE_TRYTES) + nonce_trytes;
}

/**
 * True if the transaction carrying `nonce_trytes` hashes to at least
 * `difficulty` trailing zero trits.
 */
inline bool verify_nonce(const std::string& transaction_trytes, const std::string& nonce_trytes, int difficulty) {
    Trits trits = trits_from_trytes(attach_nonce(transaction_trytes, nonce_trytes));

    cpu::Curl curl;
    curl.absorb(trits);
    return trailing_zeros(curl.squeeze()) >= difficulty;
}

}  // namespace tritpow
