/**
 * Search State Persistence
 *
 * Saves and restores a parked (interrupted) search so it can be resumed
 * after the process exits.
 *
 * SAFETY FEATURES:
 * - Atomic saves: write to a temp file, fsync, then rename
 * - XXH3-64 checksum over the whole record: detects corruption
 * - Shape checks: lengths, difficulty range, no (0,0) cells
 *
 * File layout (little-endian):
 *   magic "TPCK", version, difficulty, reserved, offset, rounds, length,
 *   low[length], high[length], checksum
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "types.hpp"

namespace tritpow {

/**
 * Snapshot of one interrupted search.
 */
struct SearchCheckpoint {
    int difficulty = 0;
    int64_t offset = 0;        // row counter offset the job ran with
    uint64_t rounds = 0;       // rounds completed before parking
    SearchStates states;       // mid state, counter field advanced

    bool valid = false;        // Was the checkpoint loaded successfully?
    std::string error;         // Why not, if it wasn't
};

class CheckpointStore {
public:
    static constexpr uint32_t MAGIC = 0x4B435054;   // "TPCK"
    static constexpr uint32_t VERSION = 1;

    /**
     * Checkpoint path for a job inside a directory.
     */
    static std::string path_for(const std::string& dir, const std::string& name);

    /**
     * Save with atomic write. Returns false (and logs) on failure.
     */
    static bool save(const SearchCheckpoint& checkpoint, const std::string& path);

    /**
     * Load and validate. `valid` is false and `error` set on any problem.
     */
    static SearchCheckpoint load(const std::string& path);

    /**
     * Remove a checkpoint and any leftover temp file.
     */
    static void clear(const std::string& path);

    static bool exists(const std::string& path);

    /**
     * Serialized record, checksum included.
     */
    static std::vector<uint8_t> serialize(const SearchCheckpoint& checkpoint);

    /**
     * Parse a serialized record.
     */
    static SearchCheckpoint deserialize(const std::vector<uint8_t>& bytes);
};

}  // namespace tritpow
