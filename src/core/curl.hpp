/**
 * CPU Reference Curl-P-81
 *
 * Scalar ternary sponge used to:
 * - Prepare the mid-state handed to the search grid
 * - Verify nonces returned by the device kernels
 * - Cross-check the bit-sliced permutation in tests
 *
 * Note: one trit per byte, no bit-slicing. Use the search grid for throughput.
 */

#pragma once

#include <array>
#include <string>

#include "types.hpp"

namespace tritpow {
namespace cpu {

class Curl {
public:
    using State = std::array<int8_t, STATE_LENGTH>;

    explicit Curl(int rounds = NUMBER_OF_ROUNDS);

    /**
     * Zero the sponge state.
     */
    void reset();

    /**
     * Absorb `length` trits starting at `offset`, HASH_LENGTH at a time.
     * A trailing partial block is copied in before the final transform.
     */
    void absorb(const Trits& trits, size_t offset, size_t length);
    void absorb(const Trits& trits) { absorb(trits, 0, trits.size()); }

    /**
     * Squeeze `length` trits into `out` starting at `offset`.
     */
    void squeeze(Trits& out, size_t offset, size_t length);

    /**
     * Squeeze one HASH_LENGTH block.
     */
    Trits squeeze();

    /**
     * Apply the permutation to the current state.
     */
    void transform();

    const State& state() const { return state_; }
    State& state() { return state_; }

    /**
     * Curl hash of a tryte string (one squeezed block, as trytes).
     */
    static std::string hash_trytes(const std::string& trytes);

    /**
     * Truth table indexed by a + 4*b + 5.
     */
    static constexpr int8_t TRUTH_TABLE[11] = {1, 0, -1, 2, 1, -1, 0, 2, -1, 1, 0};

private:
    int rounds_;
    State state_;
};

}  // namespace cpu
}  // namespace tritpow
