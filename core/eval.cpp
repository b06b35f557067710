#include "eval.hpp"

namespace cubefour {

int line_score(const Board& b, const Line& line, int count, uint64_t own) {
    if (count != SIZE - 1) return LINE_WEIGHT[count];
    // Only a three whose hole is the next drop in its column is a real threat.
    for (uint8_t c : line.cells) {
        if (own & cell_bit(c)) continue;
        int z = cell_z(c);
        int h = b.heights[column_index(cell_x(c), cell_y(c))];
        return (h == z) ? LINE_WEIGHT[SIZE - 1] : LATENT_THREE_WEIGHT;
    }
    return LINE_WEIGHT[SIZE - 1];
}

int evaluate(const Board& b, int perspective) {
    const uint64_t mine = b.pieces(perspective);
    const uint64_t theirs = b.pieces(opponent_of(perspective));

    int score = 0;
    for (const Line& ln : all_lines()) {
        uint64_t m = mine & ln.mask;
        uint64_t t = theirs & ln.mask;
        if (m && t) continue;  // blocked
        if (m) {
            int k = popcount64(m);
            if (k == SIZE) return SCORE_WIN;
            score += line_score(b, ln, k, mine);
        } else if (t) {
            int k = popcount64(t);
            if (k == SIZE) return -SCORE_WIN;
            score -= line_score(b, ln, k, theirs);
        }
    }

    for (int y = 0; y < SIZE; y++) {
        for (int x = 0; x < SIZE; x++) {
            int h = b.heights[column_index(x, y)];
            if (is_center_column(x, y)) {
                for (int z = 0; z < h; z++) {
                    int v = b.at(x, y, z);
                    if (v == perspective) score += CENTER_HEIGHT_BONUS[z];
                    else if (v != EMPTY) score -= CENTER_HEIGHT_BONUS[z];
                }
            }
            if (h > 0) {
                int top = b.at(x, y, h - 1);
                if (top == perspective) score += COLUMN_TOP_BONUS;
                else if (top != EMPTY) score -= COLUMN_TOP_BONUS;
            }
        }
    }
    return score;
}

bool is_threat_cell(const Board& b, int cell, int player) {
    if (b.cells[cell] != EMPTY) return false;
    const uint64_t own = b.pieces(player);
    const std::vector<Line>& lines = all_lines();
    for (int li : lines_through(cell)) {
        if (popcount64(own & lines[li].mask) == SIZE - 1) return true;
    }
    return false;
}

} // namespace cubefour
