#pragma once

#include <cstddef>
#include <cstdint>

#include "board.hpp"
#include "mcts.hpp"
#include "search.hpp"

namespace cubefour {

enum class EngineKind { NEGAMAX, MCTS };

struct EngineConfig {
    int time_limit_ms = 1000;
    int safety_margin_ms = 25;          // kept back from the budget for the reply
    int max_depth = 24;
    EngineKind engine = EngineKind::NEGAMAX;
    bool use_opening_book = true;
    int opening_book_max_pieces = 4;
    double mcts_exploration = MCTS_EXPLORATION;
    int mcts_max_iterations = 0;        // 0 = bounded by time only
    uint32_t seed = 0;
    size_t tt_max_entries = TT_DEFAULT_MAX_ENTRIES;
    bool verbose = false;
};

// Which stage produced the last decision.
enum class Stage {
    NONE,
    IMMEDIATE_WIN,
    IMMEDIATE_BLOCK,
    OPENING_BOOK,
    DOUBLE_THREAT,
    BLOCK_DOUBLE_THREAT,
    SEARCH,
    MCTS,
    FALLBACK,
};

const char* stage_name(Stage s);

// Orchestrates one decision: forced tactics first, then the configured
// engine, then a guaranteed legal fallback. The board passed in is never
// modified.
class DecisionPolicy {
public:
    explicit DecisionPolicy(const EngineConfig& cfg = EngineConfig());

    Move decide(const Board& board, int player, const Cell& last_move);
    Move decide(const Grid& grid, int player, const Cell& last_move);

    Stage last_stage() const { return last_stage_; }
    const EngineConfig& config() const { return cfg_; }
    void set_config(const EngineConfig& cfg);

    SearchEngine& search_engine() { return search_; }

private:
    Move run_stages(Board& work, int player, const Cell& last_move, Clock::time_point deadline);
    Move run_engine(const Board& work, int player, Clock::time_point deadline);
    Move finish(const Board& board, int player, Move m, Stage stage);

    EngineConfig cfg_;
    SearchEngine search_;
    MCTSEngine mcts_;
    Stage last_stage_ = Stage::NONE;
};

} // namespace cubefour
