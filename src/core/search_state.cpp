/**
 * Search State Persistence - implementation
 */

#include "search_state.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>

#ifndef _WIN32
#include <unistd.h>
#endif

#define XXH_INLINE_ALL
#include "xxhash.h"

#include "bitslice.hpp"
#include "logger.hpp"

namespace tritpow {

namespace {

constexpr size_t HEADER_SIZE = 4 + 4 + 4 + 4 + 8 + 8 + 4;
constexpr size_t CHECKSUM_SIZE = 8;

template<typename T>
void put(std::vector<uint8_t>& out, T value) {
    for (size_t i = 0; i < sizeof(T); i++) {
        out.push_back(static_cast<uint8_t>(static_cast<uint64_t>(value) >> (i * 8)));
    }
}

template<typename T>
T get(const uint8_t* in) {
    uint64_t value = 0;
    for (size_t i = 0; i < sizeof(T); i++) {
        value |= static_cast<uint64_t>(in[i]) << (i * 8);
    }
    return static_cast<T>(value);
}

SearchCheckpoint fail(SearchCheckpoint checkpoint, const std::string& error) {
    checkpoint.valid = false;
    checkpoint.error = error;
    return checkpoint;
}

}  // namespace

std::string CheckpointStore::path_for(const std::string& dir, const std::string& name) {
    return (std::filesystem::path(dir) / (name + ".tpck")).string();
}

std::vector<uint8_t> CheckpointStore::serialize(const SearchCheckpoint& checkpoint) {
    const auto& states = checkpoint.states;
    std::vector<uint8_t> out;
    out.reserve(HEADER_SIZE + states.size() * 8 + CHECKSUM_SIZE);

    put<uint32_t>(out, MAGIC);
    put<uint32_t>(out, VERSION);
    put<int32_t>(out, checkpoint.difficulty);
    put<int32_t>(out, 0);
    put<int64_t>(out, checkpoint.offset);
    put<uint64_t>(out, checkpoint.rounds);
    put<uint32_t>(out, static_cast<uint32_t>(states.size()));
    for (int32_t word : states.low) put<int32_t>(out, word);
    for (int32_t word : states.high) put<int32_t>(out, word);

    put<uint64_t>(out, XXH3_64bits(out.data(), out.size()));
    return out;
}

SearchCheckpoint CheckpointStore::deserialize(const std::vector<uint8_t>& bytes) {
    SearchCheckpoint checkpoint;

    if (bytes.size() < HEADER_SIZE + CHECKSUM_SIZE) {
        return fail(checkpoint, "Checkpoint truncated");
    }

    const uint8_t* p = bytes.data();
    size_t body_size = bytes.size() - CHECKSUM_SIZE;

    uint64_t stored = get<uint64_t>(p + body_size);
    uint64_t computed = XXH3_64bits(p, body_size);
    if (stored != computed) {
        return fail(checkpoint, "Checkpoint checksum mismatch - file may be corrupted");
    }

    if (get<uint32_t>(p) != MAGIC) {
        return fail(checkpoint, "Not a checkpoint file");
    }
    uint32_t version = get<uint32_t>(p + 4);
    if (version != VERSION) {
        return fail(checkpoint, "Unsupported checkpoint version " + std::to_string(version));
    }

    checkpoint.difficulty = get<int32_t>(p + 8);
    checkpoint.offset = get<int64_t>(p + 16);
    checkpoint.rounds = get<uint64_t>(p + 24);
    uint32_t length = get<uint32_t>(p + 32);

    if (length != static_cast<uint32_t>(STATE_LENGTH)) {
        return fail(checkpoint, "State length " + std::to_string(length) + " != " +
                                std::to_string(STATE_LENGTH));
    }
    if (body_size != HEADER_SIZE + static_cast<size_t>(length) * 8) {
        return fail(checkpoint, "Checkpoint size does not match state length");
    }
    if (checkpoint.difficulty <= 0 || checkpoint.difficulty >= HASH_LENGTH) {
        return fail(checkpoint, "Difficulty out of range: " + std::to_string(checkpoint.difficulty));
    }

    checkpoint.states = SearchStates(length);
    const uint8_t* words = p + HEADER_SIZE;
    for (uint32_t i = 0; i < length; i++) {
        checkpoint.states.low[i] = get<int32_t>(words + i * 4);
        checkpoint.states.high[i] = get<int32_t>(words + (length + i) * 4);
    }

    if (!bitslice::is_well_formed(checkpoint.states)) {
        return fail(checkpoint, "Checkpoint holds an invalid (0,0) cell");
    }

    checkpoint.valid = true;
    return checkpoint;
}

bool CheckpointStore::save(const SearchCheckpoint& checkpoint, const std::string& path) {
    std::filesystem::path dir = std::filesystem::path(path).parent_path();
    if (!dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            LOG_ERROR("Failed to create checkpoint directory " + dir.string() + ": " + ec.message());
            return false;
        }
    }

    std::vector<uint8_t> bytes = serialize(checkpoint);
    std::string temp_path = path + ".tmp";

    // Write to temporary file first
    {
        std::ofstream file(temp_path, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            LOG_ERROR("Failed to create temp checkpoint: " + temp_path);
            return false;
        }
        file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        file.flush();
        if (!file) {
            LOG_ERROR("Failed to write checkpoint: " + temp_path);
            return false;
        }
    }

    // Sync to disk before rename
#ifndef _WIN32
    {
        FILE* f = std::fopen(temp_path.c_str(), "r");
        if (f) {
            if (fsync(fileno(f)) != 0) {
                LOG_WARN("fsync failed for " + temp_path);
            }
            std::fclose(f);
        }
    }
#endif

    std::error_code ec;
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        // Windows refuses to rename over an existing file
        std::filesystem::remove(path, ec);
        std::filesystem::rename(temp_path, path, ec);
        if (ec) {
            LOG_ERROR("Failed to save checkpoint " + path + ": " + ec.message());
            return false;
        }
    }

    LOG_INFO("CHECKPOINT_SAVE: " + path + ", Rounds=" + std::to_string(checkpoint.rounds));
    return true;
}

SearchCheckpoint CheckpointStore::load(const std::string& path) {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        return fail(SearchCheckpoint{}, "No checkpoint at " + path);
    }

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    SearchCheckpoint checkpoint = deserialize(bytes);
    if (!checkpoint.valid) {
        LOG_WARN("CHECKPOINT_REJECTED: " + path + " - " + checkpoint.error);
    }
    return checkpoint;
}

void CheckpointStore::clear(const std::string& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    std::filesystem::remove(path + ".tmp", ec);
}

bool CheckpointStore::exists(const std::string& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

}  // namespace tritpow
