#pragma once

/**
 * Transposition table for (self action, opponent action) pair values.
 *
 * Sharded so the determinization workers can share it: each shard is an
 * unordered_map behind its own mutex. Concurrent writers of the same key
 * store the same deterministic value, so last writer wins.
 * Cleared at the start of every turn.
 */

#include "vgc/core/hash.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace vgc {

struct TTKey {
    int turn = 0;
    uint64_t self_action = 0;
    uint64_t opp_action = 0;
    uint64_t hypothesis = 0;
    uint64_t state = 0;       // Node position, so equal action pairs at different nodes differ
    int depth = 0;

    bool operator==(const TTKey& o) const {
        return turn == o.turn && self_action == o.self_action && opp_action == o.opp_action &&
               hypothesis == o.hypothesis && state == o.state && depth == o.depth;
    }

    uint64_t hash() const {
        uint64_t h = mix64(static_cast<uint64_t>(turn));
        h = hash_combine(h, self_action);
        h = hash_combine(h, opp_action);
        h = hash_combine(h, hypothesis);
        h = hash_combine(h, state);
        return hash_combine(h, static_cast<uint64_t>(depth));
    }
};

struct TTKeyHash {
    size_t operator()(const TTKey& key) const {
        return static_cast<size_t>(key.hash());
    }
};

// Sample statistics of one pair's utility
struct TTEntry {
    float mean = 0.0f;
    float variance = 0.0f;
    float min = 0.0f;
    float max = 0.0f;
};

class TranspositionTable {
public:
    explicit TranspositionTable(int num_shards = 16);

    /**
     * Look up a key. Counts a hit or a miss.
     */
    std::optional<TTEntry> lookup(const TTKey& key);

    void store(const TTKey& key, const TTEntry& entry);

    // Drop every entry and reset the counters
    void clear();

    size_t size() const;
    uint64_t hits() const { return hits_.load(); }
    uint64_t misses() const { return misses_.load(); }

private:
    struct Shard {
        std::mutex mutex;
        std::unordered_map<TTKey, TTEntry, TTKeyHash> entries;
    };

    Shard& shard_for(const TTKey& key);

    std::vector<std::unique_ptr<Shard>> shards_;
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
};

}  // namespace vgc
