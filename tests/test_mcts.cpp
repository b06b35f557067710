#include "test_helpers.hpp"

#include <chrono>
#include <cmath>

#include "core/eval.hpp"
#include "core/mcts.hpp"

using namespace cubefour;

static Clock::time_point far_deadline() {
    return Clock::now() + std::chrono::seconds(30);
}

static void test_runs_requested_iterations() {
    Board b;
    MCTSEngine engine(1);
    MCTSResult r = engine.search(b, PLAYER1, far_deadline(), 500);
    assert(r.found);
    assert(r.iterations == 500);
    assert(r.visits > 0);
    assert(r.win_rate >= 0.0 && r.win_rate <= 1.0);
    assert(drop_height(b, r.move.x, r.move.y) >= 0);
}

static void test_no_time_means_no_decision() {
    Board b = test::board_with({{1, 1, 1}});
    MCTSEngine engine(1);
    MCTSResult r = engine.search(b, PLAYER2, Clock::now() - std::chrono::milliseconds(1));
    assert(!r.found);
    assert(r.iterations == 0);
}

static void test_prefers_immediate_win() {
    Board b = test::board_with({{2, 2, 1}, {0, 3, 2}, {2, 2, 1}, {3, 0, 2}, {2, 2, 1}, {3, 3, 2}});
    const Board before = b;
    MCTSEngine engine(3);
    MCTSResult r = engine.search(b, PLAYER1, far_deadline(), 3000);
    assert(r.found);
    assert(r.move.x == 2 && r.move.y == 2);
    assert(r.win_rate == 1.0);
    assert(b == before && "tree works on its own snapshot");
}

static void test_playout_policy_wins_then_blocks() {
    MCTSEngine engine(5);
    Board win = test::board_with({{1, 0, 1}, {1, 0, 1}, {1, 0, 1}, {3, 3, 2}, {3, 3, 2}, {3, 3, 2}});
    Move m = engine.playout_move(win, PLAYER1);
    assert(m.x == 1 && m.y == 0 && "own win comes before the block");

    Board block = test::board_with({{3, 3, 2}, {3, 3, 2}, {3, 3, 2}, {0, 0, 1}});
    m = engine.playout_move(block, PLAYER1);
    assert(m.x == 3 && m.y == 3);

    Board quiet = test::board_with({{0, 0, 1}});
    for (int i = 0; i < 50; i++) {
        m = engine.playout_move(quiet, PLAYER2);
        assert(is_center_column(m.x, m.y));
    }
}

static void test_simulation_reports_outcome() {
    MCTSEngine engine(9);
    Board won = test::board_with({{0, 1, 2}, {0, 1, 2}, {0, 1, 2}, {0, 1, 2}});
    assert(engine.simulate(won, PLAYER1) == PLAYER2);

    Board b;
    for (int i = 0; i < 20; i++) {
        int r = engine.simulate(b, PLAYER1);
        assert(r == PLAYER1 || r == PLAYER2 || r == DRAW);
    }
}

static void test_ucb1_prefers_unvisited_and_flips_for_opponent() {
    MCTSEngine engine(0, 1.0);
    MCTSNode fresh;
    assert(std::isinf(engine.ucb1(fresh, 10, true)));

    MCTSNode good;
    good.visits = 10;
    good.wins = 8.0;
    const double explore = std::sqrt(std::log(100.0) / 10.0);
    assert(std::fabs(engine.ucb1(good, 100, true) - (0.8 + explore)) < 1e-9);
    assert(std::fabs(engine.ucb1(good, 100, false) - (0.2 + explore)) < 1e-9);
}

int main() {
    test_runs_requested_iterations();
    test_no_time_means_no_decision();
    test_prefers_immediate_win();
    test_playout_policy_wins_then_blocks();
    test_simulation_reports_outcome();
    test_ucb1_prefers_unvisited_and_flips_for_opponent();
    std::cout << "All mcts tests passed\n";
    return 0;
}
