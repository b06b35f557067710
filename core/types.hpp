#pragma once

#include <cstdint>

namespace cubefour {

// Board geometry: x = column, y = row, z = height (gravity runs towards z = 0).
constexpr int SIZE    = 4;
constexpr int COLUMNS = SIZE * SIZE;        // 16 drop columns
constexpr int CELLS   = COLUMNS * SIZE;     // 64 cells, one bit each
constexpr int LINE_COUNT = 76;

constexpr int EMPTY   = 0;
constexpr int PLAYER1 = 1;
constexpr int PLAYER2 = 2;

// winner() results besides a player id.
constexpr int NO_WINNER = 0;
constexpr int DRAW      = 3;

// ── Score conventions ────────────────────────────────────────────────────
// Terminal wins score SCORE_WIN + remaining depth, so every heuristic score
// stays strictly inside (-SCORE_WIN, SCORE_WIN).
constexpr int SCORE_INF = 1000000;
constexpr int SCORE_WIN = 100000;

inline constexpr int opponent_of(int player) { return 3 - player; }
inline constexpr bool valid_player(int player) { return player == PLAYER1 || player == PLAYER2; }

inline constexpr bool on_board(int x, int y) { return x >= 0 && x < SIZE && y >= 0 && y < SIZE; }
inline constexpr int column_index(int x, int y) { return y * SIZE + x; }
inline constexpr int cell_index(int x, int y, int z) { return z * COLUMNS + y * SIZE + x; }
inline constexpr int cell_x(int cell) { return cell % SIZE; }
inline constexpr int cell_y(int cell) { return (cell / SIZE) % SIZE; }
inline constexpr int cell_z(int cell) { return cell / COLUMNS; }
inline constexpr uint64_t cell_bit(int cell) { return uint64_t(1) << cell; }

inline int popcount64(uint64_t v) {
#if defined(__GNUC__) || defined(__clang__)
    return __builtin_popcountll(v);
#else
    int n = 0;
    while (v) { v &= v - 1; n++; }
    return n;
#endif
}

// A drop column. {-1,-1} means "no move".
struct Move {
    int x = -1;
    int y = -1;
};

// A concrete cell, used for the host's last move. {-1,-1,-1} means absent.
struct Cell {
    int x = -1;
    int y = -1;
    int z = -1;
};

inline bool same_move(const Move& a, const Move& b) { return a.x == b.x && a.y == b.y; }
inline bool is_no_move(const Move& m) { return !on_board(m.x, m.y); }
inline bool has_cell(const Cell& c) { return on_board(c.x, c.y) && c.z >= 0 && c.z < SIZE; }

// The four columns whose cells take part in the most lines.
inline constexpr bool is_center_column(int x, int y) {
    return (x == 1 || x == 2) && (y == 1 || y == 2);
}

} // namespace cubefour
