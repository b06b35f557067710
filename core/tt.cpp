#include "tt.hpp"

#include <algorithm>

namespace cubefour {

static inline uint64_t splitmix64(uint64_t x) {
    x += 0x9E3779B97F4A7C15ULL;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
    return x ^ (x >> 31);
}

size_t TTKeyHash::operator()(const TTKey& k) const {
    uint64_t h = splitmix64(k.p1);
    h = splitmix64(h ^ k.p2);
    h ^= (uint64_t)k.side * 0x632BE59BD9B4E019ULL;
    return (size_t)h;
}

TranspositionTable::TranspositionTable(size_t max_entries)
    : max_entries_(max_entries > 0 ? max_entries : 1) {
    table_.reserve(std::min<size_t>(max_entries_, 1 << 16));
}

const TTEntry* TranspositionTable::probe(const TTKey& key) const {
    auto it = table_.find(key);
    return it == table_.end() ? nullptr : &it->second;
}

void TranspositionTable::store(const TTKey& key, int depth, int score, uint8_t flag, int best_col) {
    auto it = table_.find(key);
    if (it != table_.end()) {
        // Depth-preferred replacement.
        if (depth < it->second.depth) return;
        it->second = TTEntry{score, depth, flag, (int8_t)best_col};
        return;
    }
    if (table_.size() >= max_entries_) {
        table_.clear();
        overflow_clears_++;
    }
    table_.emplace(key, TTEntry{score, depth, flag, (int8_t)best_col});
}

void TranspositionTable::clear() {
    table_.clear();
}

void TranspositionTable::set_max_entries(size_t n) {
    max_entries_ = n > 0 ? n : 1;
    if (table_.size() > max_entries_) clear();
}

} // namespace cubefour
