#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "lines.hpp"
#include "types.hpp"

namespace cubefour {

// Host layout: grid[z][y][x], values 0 = empty, 1, 2.
using Grid = std::array<std::array<std::array<int, SIZE>, SIZE>, SIZE>;

struct Board {
    std::array<int8_t, CELLS> cells{};
    // Next free height per column; SIZE means the column has no room.
    std::array<int8_t, COLUMNS> heights{};
    uint64_t bits[2] = {0, 0};

    int at(int x, int y, int z) const { return cells[cell_index(x, y, z)]; }
    uint64_t pieces(int player) const { return bits[player - 1]; }
    uint64_t occupied() const { return bits[0] | bits[1]; }
    int piece_count() const { return popcount64(occupied()); }

    bool operator==(const Board& o) const {
        return cells == o.cells && heights == o.heights &&
               bits[0] == o.bits[0] && bits[1] == o.bits[1];
    }
    bool operator!=(const Board& o) const { return !(*this == o); }
};

// Fixed-capacity column list; keeps move generation off the heap.
struct MoveList {
    Move moves[COLUMNS];
    int count = 0;

    void push(const Move& m) { moves[count++] = m; }
    bool empty() const { return count == 0; }
    const Move& operator[](int i) const { return moves[i]; }
    Move& operator[](int i) { return moves[i]; }
    const Move* begin() const { return moves; }
    const Move* end() const { return moves + count; }
};

// Converts the host grid. Returns false if anything was malformed; `out` is
// still usable: cells with unknown values read as empty and any column that
// broke gravity or held such a value is reported as having no room.
bool board_from_grid(const Grid& grid, Board& out, std::string* reason = nullptr);
Grid board_to_grid(const Board& b);

// Lowest empty height in the column, or -1 (full, malformed or off-board).
int drop_height(const Board& b, int x, int y);

// Places `player` at the column's drop height and returns that height,
// or -1 when the column is full or the arguments are out of range.
int apply_move(Board& b, int x, int y, int player);

// Clears (x, y, height); must mirror a prior apply_move on the same column.
void undo_move(Board& b, int x, int y, int height);

// Player owning all four cells of `line`, or NO_WINNER.
int winner_at(const Board& b, const Line& line);

// A player id, DRAW (no line won and no room left) or NO_WINNER.
int winner(const Board& b);

// True if `player` holds a complete line through `cell`.
bool wins_through(const Board& b, int cell, int player);

bool has_room(const Board& b);
MoveList legal_moves(const Board& b);

std::string board_to_string(const Board& b);

} // namespace cubefour
