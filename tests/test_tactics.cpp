#include "test_helpers.hpp"

#include "core/movegen.hpp"
#include "core/tactics.hpp"

using namespace cubefour;

// Player 1 to move: (0,0) completes two open threes at once, (3,0) and (0,3).
static Board double_threat_board() {
    return test::board_with({{1, 0, 1}, {3, 3, 2}, {2, 0, 1}, {1, 2, 2},
                             {0, 1, 1}, {2, 1, 2}, {0, 2, 1}});
}

static void test_winning_drop_detection() {
    Board b = test::board_with({{0, 0, 1}, {1, 0, 1}, {2, 0, 1}});
    assert(is_winning_drop(b, 3, 0, PLAYER1));
    assert(!is_winning_drop(b, 3, 0, PLAYER2));
    assert(!is_winning_drop(b, 3, 1, PLAYER1));
    Move m = find_winning_move(b, PLAYER1);
    assert(m.x == 3 && m.y == 0);
    assert(is_no_move(find_winning_move(b, PLAYER2)));
    assert(count_playable_threats(b, PLAYER1) == 1);
}

static void test_double_threat_found() {
    Board b = double_threat_board();
    const Board before = b;
    assert(is_no_move(find_winning_move(b, PLAYER1)));
    assert(is_no_move(find_winning_move(b, PLAYER2)));
    assert(creates_double_threat(b, 0, 0, PLAYER1));
    assert(!creates_double_threat(b, 3, 0, PLAYER1));
    Move m = find_double_threat_move(b, PLAYER1);
    assert(m.x == 0 && m.y == 0);
    assert(b == before);
}

static void test_double_threat_blocked() {
    Board b = double_threat_board();
    Move m = find_double_threat_block(b, PLAYER2);
    assert(m.x == 0 && m.y == 0 && "take the cell the opponent needs");
    assert(is_no_move(find_double_threat_move(b, PLAYER2)));
}

static void test_stacked_threat_counts_as_double() {
    // Row y=0 at height 1 already misses only (3,0,1); taking (3,3) opens
    // (3,0,0) underneath it.
    Board b = test::board_with({{0, 0, 2}, {1, 0, 2}, {2, 0, 1}, {0, 0, 1},
                                {1, 0, 1}, {2, 0, 1}, {3, 1, 1}, {3, 2, 1}});
    assert(is_no_move(find_winning_move(b, PLAYER1)));
    assert(count_playable_threats(b, PLAYER1) == 0);
    assert(creates_double_threat(b, 3, 3, PLAYER1));

    assert(apply_move(b, 3, 3, PLAYER1) == 0);
    assert(count_playable_threats(b, PLAYER1) == 1 && "second threat is not yet playable");
}

static void test_unsafe_drop() {
    // Player 2 needs (1,1,1); whoever fills (1,1,0) hands it over.
    Board b = test::board_with({{0, 1, 1}, {0, 1, 2}, {2, 1, 2}, {2, 1, 2}, {3, 1, 1}, {3, 1, 2}});
    assert(is_unsafe_drop(b, 1, 1, PLAYER1));
    assert(!is_unsafe_drop(b, 1, 1, PLAYER2));
    assert(!is_unsafe_drop(b, 2, 2, PLAYER1));

    Move m = opening_book_move(b, PLAYER1, Cell{}, 10);
    assert(m.x == 2 && m.y == 2 && "book skips the poisoned centre");
}

static void test_opening_book() {
    Board empty;
    Move m = opening_book_move(empty, PLAYER1, Cell{}, 4);
    assert(m.x == 1 && m.y == 1);

    Board b = test::board_with({{1, 1, 1}});
    m = opening_book_move(b, PLAYER2, Cell{1, 1, 0}, 4);
    assert(m.x == 2 && m.y == 2 && "mirror a central opening");

    Board late = test::board_with({{1, 1, 1}, {2, 2, 2}, {1, 2, 1}, {2, 1, 2}});
    assert(is_no_move(opening_book_move(late, PLAYER1, Cell{2, 1, 0}, 4)));
}

static void test_fallback_priority() {
    Board empty;
    Move m = fallback_move(empty, PLAYER1);
    assert(m.x == 1 && m.y == 1);

    Board b = test::board_with({{1, 1, 1}, {1, 1, 2}, {1, 1, 1}, {1, 1, 2}});
    m = fallback_move(b, PLAYER1);
    assert(m.x == 2 && m.y == 2);

    Board one;
    for (auto& h : one.heights) h = SIZE;
    one.heights[column_index(0, 1)] = 0;
    m = fallback_move(one, PLAYER1);
    assert(m.x == 0 && m.y == 1);

    Board none;
    for (auto& h : none.heights) h = SIZE;
    assert(is_no_move(fallback_move(none, PLAYER1)));
}

static void test_move_ordering_keeps_every_column() {
    std::mt19937 rng(3);
    for (int i = 0; i < 50; i++) {
        int to_move = PLAYER1;
        Board b = test::random_position(rng, i, to_move);
        MoveList ordered = order_moves(b, to_move);
        assert(ordered.count == legal_moves(b).count);
        for (const Move& m : ordered) assert(drop_height(b, m.x, m.y) >= 0);
    }

    Board empty;
    MoveList center = center_first_moves(empty);
    for (int i = 0; i < 4; i++) assert(is_center_column(center[i].x, center[i].y));
    MoveList ordered = order_moves(empty, PLAYER1);
    for (int i = 0; i < 4; i++) assert(is_center_column(ordered[i].x, ordered[i].y));

    Board threat = test::board_with({{3, 0, 1}, {3, 0, 1}, {3, 0, 1}});
    assert(same_move(order_moves(threat, PLAYER1)[0], Move{3, 0}) && "winning drop first");
    assert(same_move(order_moves(threat, PLAYER2)[0], Move{3, 0}) && "blocking drop first");
    assert(same_move(order_moves(empty, PLAYER1, column_index(0, 3))[0], Move{0, 3}));
}

int main() {
    test_winning_drop_detection();
    test_double_threat_found();
    test_double_threat_blocked();
    test_stacked_threat_counts_as_double();
    test_unsafe_drop();
    test_opening_book();
    test_fallback_priority();
    test_move_ordering_keeps_every_column();
    std::cout << "All tactics tests passed\n";
    return 0;
}
