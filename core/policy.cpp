#include "policy.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <string>

#include "tactics.hpp"

namespace cubefour {

const char* stage_name(Stage s) {
    switch (s) {
        case Stage::IMMEDIATE_WIN:       return "immediate_win";
        case Stage::IMMEDIATE_BLOCK:     return "immediate_block";
        case Stage::OPENING_BOOK:        return "opening_book";
        case Stage::DOUBLE_THREAT:       return "double_threat";
        case Stage::BLOCK_DOUBLE_THREAT: return "block_double_threat";
        case Stage::SEARCH:              return "search";
        case Stage::MCTS:                return "mcts";
        case Stage::FALLBACK:            return "fallback";
        default:                         return "none";
    }
}

DecisionPolicy::DecisionPolicy(const EngineConfig& cfg)
    : cfg_(cfg), search_(cfg.tt_max_entries), mcts_(cfg.seed, cfg.mcts_exploration) {
    search_.set_verbose(cfg_.verbose);
    mcts_.set_verbose(cfg_.verbose);
}

void DecisionPolicy::set_config(const EngineConfig& cfg) {
    cfg_ = cfg;
    search_.tt().set_max_entries(cfg_.tt_max_entries);
    search_.set_verbose(cfg_.verbose);
    mcts_.set_exploration(cfg_.mcts_exploration);
    mcts_.set_seed(cfg_.seed);
    mcts_.set_verbose(cfg_.verbose);
}

Move DecisionPolicy::finish(const Board& board, int player, Move m, Stage stage) {
    if (drop_height(board, m.x, m.y) < 0) {
        m = fallback_move(board, player);
        stage = Stage::FALLBACK;
    }
    last_stage_ = is_no_move(m) ? Stage::NONE : stage;
    if (cfg_.verbose) {
        std::cerr << "[policy] player " << player << " plays " << m.x << "," << m.y
                  << " (" << stage_name(last_stage_) << ")\n";
    }
    return m;
}

Move DecisionPolicy::decide(const Grid& grid, int player, const Cell& last_move) {
    Board b;
    std::string reason;
    if (!board_from_grid(grid, b, &reason) && cfg_.verbose) {
        std::cerr << "[policy] malformed board: " << reason << "\n";
    }
    return decide(b, player, last_move);
}

Move DecisionPolicy::decide(const Board& board, int player, const Cell& last_move) {
    const Clock::time_point start = Clock::now();
    const int budget_ms = std::max(1, cfg_.time_limit_ms - cfg_.safety_margin_ms);
    const Clock::time_point deadline = start + std::chrono::milliseconds(budget_ms);

    if (!valid_player(player)) {
        if (cfg_.verbose) std::cerr << "[policy] invalid player " << player << "\n";
        return finish(board, player, fallback_move(board, player), Stage::FALLBACK);
    }
    if (legal_moves(board).empty()) {
        last_stage_ = Stage::NONE;
        return Move{};
    }

    Board work = board;
    try {
        return run_stages(work, player, last_move, deadline);
    } catch (const std::exception& ex) {
        if (cfg_.verbose) std::cerr << "[policy] search failed: " << ex.what() << "\n";
    } catch (...) {
        if (cfg_.verbose) std::cerr << "[policy] search failed: unknown error\n";
    }
    return finish(board, player, fallback_move(board, player), Stage::FALLBACK);
}

Move DecisionPolicy::run_stages(Board& work, int player, const Cell& last_move,
                                Clock::time_point deadline) {
    const int opp = opponent_of(player);

    Move m = find_winning_move(work, player);
    if (!is_no_move(m)) return finish(work, player, m, Stage::IMMEDIATE_WIN);

    m = find_winning_move(work, opp);
    if (!is_no_move(m)) return finish(work, player, m, Stage::IMMEDIATE_BLOCK);

    if (cfg_.use_opening_book) {
        m = opening_book_move(work, player, last_move, cfg_.opening_book_max_pieces);
        if (!is_no_move(m)) return finish(work, player, m, Stage::OPENING_BOOK);
    }

    m = find_double_threat_move(work, player);
    if (!is_no_move(m)) return finish(work, player, m, Stage::DOUBLE_THREAT);

    m = find_double_threat_block(work, player);
    if (!is_no_move(m)) return finish(work, player, m, Stage::BLOCK_DOUBLE_THREAT);

    m = run_engine(work, player, deadline);
    if (!is_no_move(m)) {
        return finish(work, player, m,
                      cfg_.engine == EngineKind::MCTS ? Stage::MCTS : Stage::SEARCH);
    }
    return finish(work, player, fallback_move(work, player), Stage::FALLBACK);
}

Move DecisionPolicy::run_engine(const Board& work, int player, Clock::time_point deadline) {
    if (cfg_.engine == EngineKind::MCTS) {
        MCTSResult r = mcts_.search(work, player, deadline, cfg_.mcts_max_iterations);
        return r.found ? r.move : Move{};
    }
    SearchLimits lim;
    lim.max_depth = cfg_.max_depth;
    lim.deadline = deadline;
    SearchResult r = search_.search(work, player, lim);
    return r.found ? r.move : Move{};
}

} // namespace cubefour
