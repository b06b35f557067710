#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/board.hpp"
#include "core/policy.hpp"

namespace cubefour {

struct GameState {
    Grid board{};
    int current = PLAYER1;

    bool game_over = false;
    std::string result;
    int winner = NO_WINNER;

    bool has_last_move = false;
    Cell last_move{};
    int last_move_player = PLAYER1;
    int move_count = 0;

    // Frontend defaults: human player 1 vs bot player 2.
    int human_player = PLAYER1;
    int bot_player = PLAYER2;
    std::string difficulty = "medium"; // easy | medium | hard
    std::string engine = "negamax";    // negamax | mcts

    int bot_depth = 12;
    double bot_time_limit = 1.0;
};

struct ActionStatus {
    bool ok = false;
    std::string error;
    bool game_over = false;
    std::string result;
};

struct SerializedState {
    int turn = PLAYER1;
    bool game_over = false;
    std::string result;
    int winner = NO_WINNER;

    bool has_last_move = false;
    Cell last_move{};
    int last_move_player = PLAYER1;
    int move_count = 0;
    std::string difficulty = "medium";
    std::string engine = "negamax";

    Grid board{};
    std::vector<Move> legal_moves;
};

struct Decision {
    Move move{};
    Stage stage = Stage::NONE;
};

std::string normalize_difficulty(const std::string& difficulty);
std::string normalize_engine(const std::string& engine);

// Engine settings for a difficulty preset and engine name.
EngineConfig config_for(const std::string& difficulty, const std::string& engine);

// "Player N wins." or the draw message.
std::string result_text(int winner);

// Process-wide engine logging switch.
void set_engine_verbose(bool v);

GameState new_game(const std::string& difficulty = "medium",
                   const std::string& engine = "negamax");
ActionStatus apply_move(GameState& state, const Move& move);
Move bot_move(GameState& state);              // returns {-1,-1} on failure
Move hint_move(const GameState& state);       // does not modify the game
SerializedState serialize_state(const GameState& state);

// Stateless host contract: the move for `player` on `board`. Never throws;
// {-1,-1} only when no column has room. `time_ms` <= 0 keeps the preset budget.
Decision decide_move(const Grid& board, int player, const Cell& last_move,
                     int time_ms = 0, const std::string& engine = "negamax", int depth = 0);

} // namespace cubefour
