#pragma once

#include "board.hpp"

namespace cubefour {

// True if dropping `player` into (x, y) completes a line.
bool is_winning_drop(const Board& b, int x, int y, int player);

// First column (row-major) where `player` wins at once, or no move.
Move find_winning_move(const Board& b, int player);

// Columns whose drop cell currently wins for `player`.
int count_playable_threats(const Board& b, int player);

// True if the cell right above the drop cell of (x, y) is a threat for the
// opponent, i.e. playing here lets them win next turn.
bool is_unsafe_drop(const Board& b, int x, int y, int player);

// After `player` drops into (x, y): two playable threats in different
// columns, or a playable threat with another threat stacked directly on it,
// while the opponent has no immediate win. Leaves `b` unchanged.
bool creates_double_threat(Board& b, int x, int y, int player);

Move find_double_threat_move(Board& b, int player);

// A column that takes away a cell the opponent needs for a double threat.
Move find_double_threat_block(Board& b, int player);

// Early-game reply, or no move when the book has nothing to say.
Move opening_book_move(const Board& b, int player, const Cell& last_move, int max_pieces);

// Always a legal column while any column has room: a fixed near-center and
// corner priority list (safe drops first), then any column.
Move fallback_move(const Board& b, int player);

} // namespace cubefour
