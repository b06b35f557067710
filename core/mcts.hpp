#pragma once

#include <cstdint>
#include <memory>
#include <random>
#include <vector>

#include "board.hpp"
#include "search.hpp"

namespace cubefour {

constexpr double MCTS_EXPLORATION = 1.41421356;

// A tree node. Children are owned; `parent` is a plain back-reference used
// only while backpropagating.
struct MCTSNode {
    Board board;
    MCTSNode* parent = nullptr;
    std::vector<std::unique_ptr<MCTSNode>> children;
    MoveList untried;
    Move move{};                // move that led here from the parent
    int to_move = PLAYER1;      // side to move in `board`
    int outcome = NO_WINNER;    // winner(board) once known terminal
    int visits = 0;
    double wins = 0.0;          // from the root player's point of view

    bool is_terminal() const { return outcome != NO_WINNER; }
    bool fully_expanded() const { return untried.empty(); }
    double win_rate() const { return visits > 0 ? wins / (double)visits : 0.0; }
};

struct MCTSResult {
    bool found = false;
    Move move{};
    double win_rate = 0.0;
    int visits = 0;         // visits of the chosen child
    int iterations = 0;
};

class MCTSEngine {
public:
    explicit MCTSEngine(uint32_t seed = 0, double exploration = MCTS_EXPLORATION);

    // Runs until `deadline` (or `max_iterations` when > 0). The tree is built
    // from a snapshot of `board` and discarded before returning. Reports no
    // decision if not a single iteration completed.
    MCTSResult search(const Board& board, int player, Clock::time_point deadline,
                      int max_iterations = 0);

    void set_exploration(double c) { exploration_ = c; }
    void set_seed(uint32_t seed) { rng_.seed(seed); }
    void set_verbose(bool v) { verbose_ = v; }

    // Exposed for tests.
    double ucb1(const MCTSNode& child, int parent_visits, bool root_player_chooses) const;
    int simulate(const Board& board, int to_move);
    Move playout_move(const Board& b, int player);

private:
    MCTSNode* select(MCTSNode* node);
    MCTSNode* expand(MCTSNode* node);
    void backpropagate(MCTSNode* node, int result);

    std::mt19937 rng_;
    double exploration_;
    int root_player_ = PLAYER1;
    bool verbose_ = false;
};

} // namespace cubefour
