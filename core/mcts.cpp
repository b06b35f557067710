#include "mcts.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>

#include "eval.hpp"

namespace cubefour {

MCTSEngine::MCTSEngine(uint32_t seed, double exploration)
    : rng_(seed), exploration_(exploration) {}

static std::unique_ptr<MCTSNode> make_node(const Board& board, int to_move, int outcome) {
    auto n = std::make_unique<MCTSNode>();
    n->board = board;
    n->to_move = to_move;
    n->outcome = outcome;
    if (outcome == NO_WINNER) n->untried = legal_moves(board);
    return n;
}

double MCTSEngine::ucb1(const MCTSNode& child, int parent_visits, bool root_player_chooses) const {
    if (child.visits == 0) return std::numeric_limits<double>::infinity();
    double rate = child.win_rate();
    if (!root_player_chooses) rate = 1.0 - rate;
    return rate + exploration_ * std::sqrt(std::log((double)std::max(1, parent_visits)) /
                                           (double)child.visits);
}

MCTSNode* MCTSEngine::select(MCTSNode* node) {
    while (!node->is_terminal() && node->fully_expanded() && !node->children.empty()) {
        const bool root_player_chooses = (node->to_move == root_player_);
        MCTSNode* best = nullptr;
        double best_val = -std::numeric_limits<double>::infinity();
        for (auto& c : node->children) {
            double v = ucb1(*c, node->visits, root_player_chooses);
            if (!best || v > best_val) {
                best_val = v;
                best = c.get();
            }
        }
        node = best;
    }
    return node;
}

MCTSNode* MCTSEngine::expand(MCTSNode* node) {
    if (node->is_terminal() || node->untried.empty()) return node;

    std::uniform_int_distribution<int> pick(0, node->untried.count - 1);
    int i = pick(rng_);
    Move m = node->untried[i];
    node->untried[i] = node->untried[node->untried.count - 1];
    node->untried.count--;

    Board next = node->board;
    int z = apply_move(next, m.x, m.y, node->to_move);
    if (z < 0) return node;
    int outcome = NO_WINNER;
    if (wins_through(next, cell_index(m.x, m.y, z), node->to_move)) outcome = node->to_move;
    else if (!has_room(next)) outcome = DRAW;

    std::unique_ptr<MCTSNode> child = make_node(next, opponent_of(node->to_move), outcome);
    child->parent = node;
    child->move = m;
    node->children.push_back(std::move(child));
    return node->children.back().get();
}

Move MCTSEngine::playout_move(const Board& b, int player) {
    const MoveList moves = legal_moves(b);
    if (moves.empty()) return Move{};

    // Win now, else block the opponent's win.
    for (int side : {player, opponent_of(player)}) {
        for (const Move& m : moves) {
            int z = drop_height(b, m.x, m.y);
            if (is_threat_cell(b, cell_index(m.x, m.y, z), side)) return m;
        }
    }

    MoveList center;
    for (const Move& m : moves) if (is_center_column(m.x, m.y)) center.push(m);
    const MoveList& pool = center.empty() ? moves : center;
    std::uniform_int_distribution<int> pick(0, pool.count - 1);
    return pool[pick(rng_)];
}

int MCTSEngine::simulate(const Board& board, int to_move) {
    Board b = board;
    int side = to_move;
    int w = winner(b);
    for (int ply = 0; w == NO_WINNER && ply < CELLS; ply++) {
        Move m = playout_move(b, side);
        int z = apply_move(b, m.x, m.y, side);
        if (z < 0) return DRAW;
        if (wins_through(b, cell_index(m.x, m.y, z), side)) return side;
        if (!has_room(b)) return DRAW;
        side = opponent_of(side);
    }
    return w == NO_WINNER ? DRAW : w;
}

void MCTSEngine::backpropagate(MCTSNode* node, int result) {
    double reward = 0.0;
    if (result == root_player_) reward = 1.0;
    else if (result == DRAW) reward = 0.5;
    for (MCTSNode* n = node; n != nullptr; n = n->parent) {
        n->visits++;
        n->wins += reward;
    }
}

MCTSResult MCTSEngine::search(const Board& board, int player, Clock::time_point deadline,
                              int max_iterations) {
    MCTSResult res;
    if (!valid_player(player)) return res;
    root_player_ = player;

    std::unique_ptr<MCTSNode> root = make_node(board, player, winner(board));
    if (root->is_terminal()) return res;

    while (Clock::now() < deadline) {
        if (max_iterations > 0 && res.iterations >= max_iterations) break;
        MCTSNode* leaf = select(root.get());
        leaf = expand(leaf);
        int result = leaf->is_terminal() ? leaf->outcome : simulate(leaf->board, leaf->to_move);
        backpropagate(leaf, result);
        res.iterations++;
    }

    const MCTSNode* best = nullptr;
    for (const auto& c : root->children) {
        if (c->visits == 0) continue;
        if (!best || c->win_rate() > best->win_rate() ||
            (c->win_rate() == best->win_rate() && c->visits > best->visits))
            best = c.get();
    }
    if (verbose_) {
        std::cerr << "[mcts] iterations " << res.iterations << " children "
                  << root->children.size() << "\n";
    }
    if (!best) return res;

    res.found = true;
    res.move = best->move;
    res.win_rate = best->win_rate();
    res.visits = best->visits;
    return res;
}

} // namespace cubefour
