#include "tactics.hpp"

#include "eval.hpp"
#include "movegen.hpp"

namespace cubefour {

static const Move BOOK_COLUMNS[] = {{1, 1}, {2, 2}, {1, 2}, {2, 1}};
static const Move FALLBACK_COLUMNS[] = {
    {1, 1}, {2, 2}, {1, 2}, {2, 1}, {0, 0}, {3, 3}, {0, 3}, {3, 0}};

bool is_winning_drop(const Board& b, int x, int y, int player) {
    int z = drop_height(b, x, y);
    if (z < 0) return false;
    return is_threat_cell(b, cell_index(x, y, z), player);
}

Move find_winning_move(const Board& b, int player) {
    for (const Move& m : legal_moves(b)) {
        if (is_winning_drop(b, m.x, m.y, player)) return m;
    }
    return Move{};
}

int count_playable_threats(const Board& b, int player) {
    int n = 0;
    for (const Move& m : legal_moves(b)) {
        if (is_winning_drop(b, m.x, m.y, player)) n++;
    }
    return n;
}

bool is_unsafe_drop(const Board& b, int x, int y, int player) {
    int z = drop_height(b, x, y);
    if (z < 0 || z + 1 >= SIZE) return false;
    return is_threat_cell(b, cell_index(x, y, z + 1), opponent_of(player));
}

static bool has_stacked_threat(const Board& b, int player) {
    for (const Move& m : legal_moves(b)) {
        int z = drop_height(b, m.x, m.y);
        if (z + 1 >= SIZE) continue;
        if (is_threat_cell(b, cell_index(m.x, m.y, z), player) &&
            is_threat_cell(b, cell_index(m.x, m.y, z + 1), player))
            return true;
    }
    return false;
}

bool creates_double_threat(Board& b, int x, int y, int player) {
    int z = apply_move(b, x, y, player);
    if (z < 0) return false;
    bool result = false;
    if (!wins_through(b, cell_index(x, y, z), player) &&
        find_winning_move(b, opponent_of(player)).x < 0) {
        result = count_playable_threats(b, player) >= 2 || has_stacked_threat(b, player);
    }
    undo_move(b, x, y, z);
    return result;
}

Move find_double_threat_move(Board& b, int player) {
    for (const Move& m : center_first_moves(b)) {
        if (creates_double_threat(b, m.x, m.y, player)) return m;
    }
    return Move{};
}

Move find_double_threat_block(Board& b, int player) {
    const int opp = opponent_of(player);
    Move fallback{};
    for (const Move& m : center_first_moves(b)) {
        if (!creates_double_threat(b, m.x, m.y, opp)) continue;
        if (!is_unsafe_drop(b, m.x, m.y, player)) return m;
        if (is_no_move(fallback)) fallback = m;
    }
    return fallback;
}

Move opening_book_move(const Board& b, int player, const Cell& last_move, int max_pieces) {
    if (b.piece_count() >= max_pieces) return Move{};

    if (has_cell(last_move) && is_center_column(last_move.x, last_move.y)) {
        Move reply{SIZE - 1 - last_move.x, SIZE - 1 - last_move.y};
        if (drop_height(b, reply.x, reply.y) >= 0 && !is_unsafe_drop(b, reply.x, reply.y, player))
            return reply;
    }
    for (const Move& m : BOOK_COLUMNS) {
        if (drop_height(b, m.x, m.y) >= 0 && !is_unsafe_drop(b, m.x, m.y, player)) return m;
    }
    return Move{};
}

Move fallback_move(const Board& b, int player) {
    const bool check_safety = valid_player(player);
    for (int pass = 0; pass < 2; pass++) {
        const bool want_safe = (pass == 0) && check_safety;
        for (const Move& m : FALLBACK_COLUMNS) {
            if (drop_height(b, m.x, m.y) < 0) continue;
            if (want_safe && is_unsafe_drop(b, m.x, m.y, player)) continue;
            return m;
        }
        for (const Move& m : legal_moves(b)) {
            if (want_safe && is_unsafe_drop(b, m.x, m.y, player)) continue;
            return m;
        }
    }
    return Move{};
}

} // namespace cubefour
