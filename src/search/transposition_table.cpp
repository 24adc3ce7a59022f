#include "vgc/search/transposition_table.hpp"
#include <algorithm>

namespace vgc {

TranspositionTable::TranspositionTable(int num_shards) {
    num_shards = std::max(1, num_shards);
    shards_.reserve(num_shards);
    for (int i = 0; i < num_shards; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
}

TranspositionTable::Shard& TranspositionTable::shard_for(const TTKey& key) {
    // High bits pick the shard, the map uses the full hash
    return *shards_[(key.hash() >> 40) % shards_.size()];
}

std::optional<TTEntry> TranspositionTable::lookup(const TTKey& key) {
    Shard& shard = shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto it = shard.entries.find(key);
    if (it == shard.entries.end()) {
        misses_++;
        return std::nullopt;
    }
    hits_++;
    return it->second;
}

void TranspositionTable::store(const TTKey& key, const TTEntry& entry) {
    Shard& shard = shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    shard.entries[key] = entry;
}

void TranspositionTable::clear() {
    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        shard->entries.clear();
    }
    hits_ = 0;
    misses_ = 0;
}

size_t TranspositionTable::size() const {
    size_t total = 0;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        total += shard->entries.size();
    }
    return total;
}

}  // namespace vgc
