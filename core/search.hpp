#pragma once

#include <chrono>
#include <cstdint>

#include "board.hpp"
#include "tt.hpp"

namespace cubefour {

using Clock = std::chrono::steady_clock;

// Shared depth cap; a game never lasts longer than CELLS plies.
constexpr int SEARCH_MAX_DEPTH = CELLS;

struct SearchLimits {
    int max_depth = SEARCH_MAX_DEPTH;
    Clock::time_point deadline = Clock::time_point::max();
    uint64_t max_nodes = 0;     // 0 = no node cap
};

struct SearchResult {
    bool found = false;
    Move move{};
    int score = 0;
    int depth = 0;          // last fully completed iteration
    bool partial = false;   // move came from an interrupted deeper pass
    uint64_t nodes = 0;
};

// Negamax with alpha-beta pruning, iterative deepening and a transposition
// table. The table lives as long as the engine and is reused across turns.
class SearchEngine {
public:
    explicit SearchEngine(size_t tt_max_entries = TT_DEFAULT_MAX_ENTRIES);

    // Searches a private copy of `board`; the caller's board is never touched.
    SearchResult search(const Board& board, int player, const SearchLimits& limits);

    // Score of `b` for `side` to move. `last_cell` is the cell of the move
    // that produced `b` (or -1) and speeds up the terminal check.
    int negamax(Board& b, int depth, int alpha, int beta, int side, int last_cell = -1);

    TranspositionTable& tt() { return tt_; }
    const TranspositionTable& tt() const { return tt_; }

    void set_verbose(bool v) { verbose_ = v; }
    void set_deadline(Clock::time_point deadline);
    void set_max_nodes(uint64_t n) { max_nodes_ = n; }
    uint64_t nodes() const { return nodes_; }

private:
    bool time_up();

    TranspositionTable tt_;
    Clock::time_point deadline_ = Clock::time_point::max();
    uint64_t max_nodes_ = 0;
    bool time_up_cache_ = false;
    uint64_t nodes_ = 0;
    bool verbose_ = false;
};

} // namespace cubefour
