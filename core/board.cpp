#include "board.hpp"

#include <sstream>

namespace cubefour {

bool board_from_grid(const Grid& grid, Board& out, std::string* reason) {
    Board b;
    bool ok = true;
    auto fail = [&](const std::string& why) {
        if (ok && reason) *reason = why;
        ok = false;
    };

    for (int y = 0; y < SIZE; y++) {
        for (int x = 0; x < SIZE; x++) {
            int col = column_index(x, y);
            int height = 0;
            bool gap = false;
            bool dead = false;
            for (int z = 0; z < SIZE; z++) {
                int v = grid[z][y][x];
                if (v == EMPTY) {
                    gap = true;
                    continue;
                }
                if (!valid_player(v)) {
                    fail("cell value out of range at (" + std::to_string(x) + "," +
                         std::to_string(y) + "," + std::to_string(z) + ")");
                    dead = true;
                    continue;
                }
                if (gap) {
                    fail("floating piece at (" + std::to_string(x) + "," +
                         std::to_string(y) + "," + std::to_string(z) + ")");
                    dead = true;
                }
                int c = cell_index(x, y, z);
                b.cells[c] = (int8_t)v;
                b.bits[v - 1] |= cell_bit(c);
                height = z + 1;
            }
            b.heights[col] = (int8_t)(dead ? SIZE : height);
        }
    }
    out = b;
    return ok;
}

Grid board_to_grid(const Board& b) {
    Grid g{};
    for (int z = 0; z < SIZE; z++)
        for (int y = 0; y < SIZE; y++)
            for (int x = 0; x < SIZE; x++)
                g[z][y][x] = b.at(x, y, z);
    return g;
}

int drop_height(const Board& b, int x, int y) {
    if (!on_board(x, y)) return -1;
    int h = b.heights[column_index(x, y)];
    return h < SIZE ? h : -1;
}

int apply_move(Board& b, int x, int y, int player) {
    if (!valid_player(player)) return -1;
    int z = drop_height(b, x, y);
    if (z < 0) return -1;
    int c = cell_index(x, y, z);
    b.cells[c] = (int8_t)player;
    b.bits[player - 1] |= cell_bit(c);
    b.heights[column_index(x, y)] = (int8_t)(z + 1);
    return z;
}

void undo_move(Board& b, int x, int y, int height) {
    if (!on_board(x, y) || height < 0 || height >= SIZE) return;
    int c = cell_index(x, y, height);
    b.cells[c] = EMPTY;
    b.bits[0] &= ~cell_bit(c);
    b.bits[1] &= ~cell_bit(c);
    b.heights[column_index(x, y)] = (int8_t)height;
}

int winner_at(const Board& b, const Line& line) {
    if ((b.bits[0] & line.mask) == line.mask) return PLAYER1;
    if ((b.bits[1] & line.mask) == line.mask) return PLAYER2;
    return NO_WINNER;
}

int winner(const Board& b) {
    for (const Line& ln : all_lines()) {
        int w = winner_at(b, ln);
        if (w != NO_WINNER) return w;
    }
    return has_room(b) ? NO_WINNER : DRAW;
}

bool wins_through(const Board& b, int cell, int player) {
    const uint64_t own = b.pieces(player);
    const std::vector<Line>& lines = all_lines();
    for (int li : lines_through(cell)) {
        if ((own & lines[li].mask) == lines[li].mask) return true;
    }
    return false;
}

bool has_room(const Board& b) {
    for (int8_t h : b.heights) if (h < SIZE) return true;
    return false;
}

MoveList legal_moves(const Board& b) {
    MoveList out;
    for (int y = 0; y < SIZE; y++)
        for (int x = 0; x < SIZE; x++)
            if (b.heights[column_index(x, y)] < SIZE) out.push(Move{x, y});
    return out;
}

std::string board_to_string(const Board& b) {
    std::ostringstream oss;
    for (int z = SIZE - 1; z >= 0; z--) {
        oss << "z=" << z << ":";
        for (int y = 0; y < SIZE; y++) {
            oss << ' ';
            for (int x = 0; x < SIZE; x++) {
                int v = b.at(x, y, z);
                oss << (v == PLAYER1 ? 'X' : v == PLAYER2 ? 'O' : '.');
            }
        }
        oss << '\n';
    }
    return oss.str();
}

} // namespace cubefour
