#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "engine.hpp"

namespace cubefour {

using json = nlohmann::json;

// Upper bound on a requested thinking time.
constexpr int MAX_REQUEST_TIME_MS = 60000;

// Body of a stateless decide request.
struct DecideRequest {
    Grid board{};
    int player = PLAYER1;
    Cell last_move{};
    int time_ms = 0;                    // 0 = preset budget
    std::string engine = "negamax";
    int depth = 0;
};

json move_to_json(const Move& m);
json cell_to_json(const Cell& c);           // [x,y,z] or null
json grid_to_json(const Grid& g);           // board[z][y][x]
json decision_to_json(const Decision& d);
json state_to_json(const SerializedState& s);

// Accepts {"x":..,"y":..} or [x, y].
bool parse_move(const json& j, Move& out);
// Accepts null (absent), [x, y, z] or {"x":..,"y":..,"z":..}.
bool parse_cell(const json& j, Cell& out);
// Requires a 4x4x4 nested array of integers; values are not range checked.
bool parse_grid(const json& j, Grid& out, std::string* error = nullptr);
bool parse_decide_request(const json& j, DecideRequest& out, std::string* error = nullptr);
bool parse_state_json(const json& root, GameState& out, std::string* error = nullptr);

// Parses a move given either as JSON or as "x,y".
bool parse_move_string(const std::string& s, Move& out);

} // namespace cubefour
