#pragma once

#include "board.hpp"

namespace cubefour {

// Line weights by piece count for an unblocked line.
constexpr int LINE_WEIGHT[SIZE + 1] = {0, 5, 50, 500, SCORE_WIN};
// A three whose empty cell is not yet the column's drop position.
constexpr int LATENT_THREE_WEIGHT = 120;
// Per-piece bonus in the central columns, indexed by height.
constexpr int CENTER_HEIGHT_BONUS[SIZE] = {3, 5, 5, 3};
// Owning the top piece of a column.
constexpr int COLUMN_TOP_BONUS = 2;

// Static score of `b` from `perspective`'s point of view. Positive favours
// `perspective`. A completed line returns +/-SCORE_WIN.
int evaluate(const Board& b, int perspective);

// Weight of a single unblocked line holding `count` pieces of one side.
int line_score(const Board& b, const Line& line, int count, uint64_t own);

// True if empty `cell` would complete a line for `player`.
bool is_threat_cell(const Board& b, int cell, int player);

} // namespace cubefour
