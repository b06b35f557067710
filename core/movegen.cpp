#include "movegen.hpp"

#include "eval.hpp"

namespace cubefour {

static const int LINE_ORDER_SCORE[SIZE] = {0, 2, 8, 10000};
static const int BLOCK_ORDER_SCORE[SIZE] = {0, 1, 6, 5000};
static const int UNSAFE_DROP_PENALTY = 3000;

int quick_move_score(const Board& b, int x, int y, int player) {
    int z = drop_height(b, x, y);
    if (z < 0) return -SCORE_INF;
    const int cell = cell_index(x, y, z);
    const uint64_t mine = b.pieces(player);
    const uint64_t theirs = b.pieces(opponent_of(player));
    const std::vector<Line>& lines = all_lines();

    int score = 0;
    for (int li : lines_through(cell)) {
        uint64_t m = mine & lines[li].mask;
        uint64_t t = theirs & lines[li].mask;
        if (m && t) continue;
        if (!t) score += LINE_ORDER_SCORE[popcount64(m)];
        else    score += BLOCK_ORDER_SCORE[popcount64(t)];
    }
    if (z + 1 < SIZE && is_threat_cell(b, cell_index(x, y, z + 1), opponent_of(player)))
        score -= UNSAFE_DROP_PENALTY;
    if (is_center_column(x, y)) score += CENTER_ORDER_BONUS;
    return score;
}

MoveList order_moves(const Board& b, int player, int hash_col) {
    MoveList out = center_first_moves(b);
    int keys[COLUMNS];
    for (int i = 0; i < out.count; i++) {
        const Move& m = out[i];
        keys[i] = (column_index(m.x, m.y) == hash_col) ? SCORE_INF
                                                        : quick_move_score(b, m.x, m.y, player);
    }
    // Insertion sort: at most 16 entries and stable, so ties keep center-first order.
    for (int i = 1; i < out.count; i++) {
        Move m = out[i];
        int k = keys[i];
        int j = i - 1;
        while (j >= 0 && keys[j] < k) {
            out[j + 1] = out[j];
            keys[j + 1] = keys[j];
            j--;
        }
        out[j + 1] = m;
        keys[j + 1] = k;
    }
    return out;
}

MoveList center_first_moves(const Board& b) {
    MoveList out;
    for (int pass = 0; pass < 2; pass++) {
        for (int y = 0; y < SIZE; y++) {
            for (int x = 0; x < SIZE; x++) {
                if (is_center_column(x, y) != (pass == 0)) continue;
                if (drop_height(b, x, y) >= 0) out.push(Move{x, y});
            }
        }
    }
    return out;
}

} // namespace cubefour
