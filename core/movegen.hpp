#pragma once

#include "board.hpp"

namespace cubefour {

// Ordering bonus that puts the central columns ahead of equally scored ones.
constexpr int CENTER_ORDER_BONUS = 40;

// Cheap one-ply desirability of dropping `player` into (x, y). Completing a
// line dominates, then blocking one; handing the opponent the cell above a
// threat is penalised.
int quick_move_score(const Board& b, int x, int y, int player);

// Legal columns, central first, then by quick_move_score descending. The
// column `hash_col` (column_index, or -1) is moved to the front.
MoveList order_moves(const Board& b, int player, int hash_col = -1);

// Legal columns ordered center-first only (stable, row-major otherwise).
MoveList center_first_moves(const Board& b);

} // namespace cubefour
