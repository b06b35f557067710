#pragma once

#include <cstddef>
#include <cstdint>
#include <unordered_map>

#include "board.hpp"

namespace cubefour {

enum : uint8_t { TT_EXACT = 0, TT_LOWER = 1, TT_UPPER = 2 };

constexpr size_t TT_DEFAULT_MAX_ENTRIES = 200000;

// The two occupancy masks identify a position exactly, so the key cannot
// collide.
struct TTKey {
    uint64_t p1 = 0;
    uint64_t p2 = 0;
    int side = 0;

    bool operator==(const TTKey& o) const { return p1 == o.p1 && p2 == o.p2 && side == o.side; }
};

struct TTKeyHash {
    size_t operator()(const TTKey& k) const;
};

struct TTEntry {
    int score = 0;
    int depth = 0;
    uint8_t flag = TT_EXACT;
    int8_t best_col = -1;
};

inline TTKey make_tt_key(const Board& b, int side) {
    return TTKey{b.bits[0], b.bits[1], side};
}

// Bounded position cache. Once it holds max_entries positions the whole
// table is dropped before the next insert.
class TranspositionTable {
public:
    explicit TranspositionTable(size_t max_entries = TT_DEFAULT_MAX_ENTRIES);

    const TTEntry* probe(const TTKey& key) const;
    void store(const TTKey& key, int depth, int score, uint8_t flag, int best_col);
    void clear();

    void set_max_entries(size_t n);
    size_t size() const { return table_.size(); }
    size_t max_entries() const { return max_entries_; }
    uint64_t overflow_clears() const { return overflow_clears_; }

private:
    std::unordered_map<TTKey, TTEntry, TTKeyHash> table_;
    size_t max_entries_;
    uint64_t overflow_clears_ = 0;
};

} // namespace cubefour
