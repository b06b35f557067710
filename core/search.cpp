#include "search.hpp"

#include <algorithm>
#include <iostream>

#include "eval.hpp"
#include "movegen.hpp"

namespace cubefour {

SearchEngine::SearchEngine(size_t tt_max_entries) : tt_(tt_max_entries) {}

void SearchEngine::set_deadline(Clock::time_point deadline) {
    deadline_ = deadline;
    time_up_cache_ = false;
}

// Polled once per node; sticks once the deadline or the node cap is hit.
bool SearchEngine::time_up() {
    if (time_up_cache_) return true;
    if (max_nodes_ > 0 && nodes_ >= max_nodes_) time_up_cache_ = true;
    else if (Clock::now() >= deadline_) time_up_cache_ = true;
    return time_up_cache_;
}

int SearchEngine::negamax(Board& b, int depth, int alpha, int beta, int side, int last_cell) {
    nodes_++;
    if (time_up()) return evaluate(b, side);

    const int alpha_orig = alpha;

    // ── TT lookup ─────────────────────────────────────────────────────────
    const TTKey key = make_tt_key(b, side);
    int hash_col = -1;
    if (const TTEntry* tte = tt_.probe(key)) {
        hash_col = tte->best_col;
        if (tte->depth >= depth) {
            if (tte->flag == TT_EXACT) return tte->score;
            if (tte->flag == TT_LOWER && tte->score >= beta) return tte->score;
            if (tte->flag == TT_UPPER && tte->score <= alpha) return tte->score;
        }
    }

    // ── Terminal ──────────────────────────────────────────────────────────
    int w = NO_WINNER;
    if (last_cell >= 0) {
        int mover = b.cells[last_cell];
        if (valid_player(mover) && wins_through(b, last_cell, mover)) w = mover;
        else if (!has_room(b)) w = DRAW;
    } else {
        w = winner(b);
    }
    if (w == DRAW) return 0;
    if (w != NO_WINNER) return (w == side) ? SCORE_WIN + depth : -(SCORE_WIN + depth);

    if (depth <= 0) return evaluate(b, side);

    // ── Children ──────────────────────────────────────────────────────────
    const MoveList moves = order_moves(b, side, hash_col);
    const int opp = opponent_of(side);
    int best = -SCORE_INF;
    int best_col = -1;
    for (const Move& m : moves) {
        int z = apply_move(b, m.x, m.y, side);
        if (z < 0) continue;
        int score = -negamax(b, depth - 1, -beta, -alpha, opp, cell_index(m.x, m.y, z));
        undo_move(b, m.x, m.y, z);

        if (score > best) {
            best = score;
            best_col = column_index(m.x, m.y);
        }
        if (best > alpha) alpha = best;
        if (alpha >= beta) break;
    }
    if (best_col < 0) return evaluate(b, side);

    // A pass cut short by the deadline holds static scores; keep it out of the table.
    if (!time_up_cache_) {
        uint8_t flag = TT_EXACT;
        if (best <= alpha_orig) flag = TT_UPPER;
        else if (best >= beta) flag = TT_LOWER;
        tt_.store(key, depth, best, flag, best_col);
    }
    return best;
}

SearchResult SearchEngine::search(const Board& board, int player, const SearchLimits& limits) {
    SearchResult result;
    set_deadline(limits.deadline);
    set_max_nodes(limits.max_nodes);
    nodes_ = 0;
    if (!valid_player(player)) return result;

    Board work = board;
    MoveList root_moves = order_moves(work, player);
    if (root_moves.empty()) return result;

    result.found = true;
    result.move = root_moves[0];
    result.score = -SCORE_INF;
    if (root_moves.count == 1) return result;

    const int empty_cells = CELLS - work.piece_count();
    const int max_depth = std::max(1, std::min({limits.max_depth, empty_cells, SEARCH_MAX_DEPTH}));
    const int opp = opponent_of(player);

    int root_scores[COLUMNS];
    for (int depth = 1; depth <= max_depth; depth++) {
        if (time_up()) break;

        int alpha = -SCORE_INF;
        const int beta = SCORE_INF;
        Move cur_best = root_moves[0];
        int cur_best_score = -SCORE_INF;
        int searched = 0;
        bool aborted = false;

        for (int i = 0; i < root_moves.count; i++) {
            const Move& m = root_moves[i];
            int z = apply_move(work, m.x, m.y, player);
            if (z < 0) {
                root_scores[i] = -SCORE_INF;
                continue;
            }
            int score = -negamax(work, depth - 1, -beta, -alpha, opp, cell_index(m.x, m.y, z));
            undo_move(work, m.x, m.y, z);
            if (time_up()) {
                aborted = true;
                break;
            }
            root_scores[i] = score;
            searched++;
            if (score > cur_best_score) {
                cur_best_score = score;
                cur_best = m;
            }
            if (score > alpha) alpha = score;
        }

        if (aborted) {
            // The earliest moves of a new pass are the best ranked ones.
            if (searched > 0 && cur_best_score > result.score) {
                result.move = cur_best;
                result.score = cur_best_score;
                result.partial = true;
            }
            if (verbose_) {
                std::cerr << "[search] depth " << depth << " interrupted after "
                          << searched << "/" << root_moves.count << " root moves\n";
            }
            break;
        }

        result.move = cur_best;
        result.score = cur_best_score;
        result.depth = depth;
        result.partial = false;
        if (verbose_) {
            std::cerr << "[search] depth " << depth << " best " << cur_best.x << "," << cur_best.y
                      << " score " << cur_best_score << " nodes " << nodes_ << "\n";
        }

        // Re-rank the root by this pass; fail-low scores are upper bounds,
        // which still sorts them behind the exact best.
        for (int i = 1; i < root_moves.count; i++) {
            Move m = root_moves[i];
            int k = root_scores[i];
            int j = i - 1;
            while (j >= 0 && root_scores[j] < k) {
                root_moves[j + 1] = root_moves[j];
                root_scores[j + 1] = root_scores[j];
                j--;
            }
            root_moves[j + 1] = m;
            root_scores[j + 1] = k;
        }

        if (cur_best_score >= SCORE_WIN || cur_best_score <= -SCORE_WIN) break;  // decided
    }

    if (result.depth == 0 && !result.partial) result.score = 0;  // orderer's first choice
    result.nodes = nodes_;
    return result;
}

} // namespace cubefour
