#include "json_codec.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdio>

namespace cubefour {

static void set_error(std::string* error, const std::string& msg) {
    if (error) *error = msg;
}

// Integer field clamped to [0, hi]; negative values read as 0 ("use the default").
static int clamp_request_int(const json& v, int hi) {
    if (v.is_number_unsigned()) {
        return (int)std::min<uint64_t>(v.get<uint64_t>(), (uint64_t)hi);
    }
    const int64_t n = v.get<int64_t>();
    return (int)std::max<int64_t>(0, std::min<int64_t>(n, hi));
}

json move_to_json(const Move& m) {
    return json{{"x", m.x}, {"y", m.y}};
}

json cell_to_json(const Cell& c) {
    if (!has_cell(c)) return json(nullptr);
    return json::array({c.x, c.y, c.z});
}

json grid_to_json(const Grid& g) {
    json out = json::array();
    for (int z = 0; z < SIZE; z++) {
        json layer = json::array();
        for (int y = 0; y < SIZE; y++) {
            json row = json::array();
            for (int x = 0; x < SIZE; x++) row.push_back(g[z][y][x]);
            layer.push_back(row);
        }
        out.push_back(layer);
    }
    return out;
}

json decision_to_json(const Decision& d) {
    json out = move_to_json(d.move);
    out["stage"] = stage_name(d.stage);
    return out;
}

json state_to_json(const SerializedState& s) {
    json legal = json::array();
    for (const auto& m : s.legal_moves) legal.push_back(move_to_json(m));

    return json{
        {"turn", s.turn},
        {"game_over", s.game_over},
        {"result", s.result},
        {"winner", s.winner},
        {"board", grid_to_json(s.board)},
        {"legal_moves", legal},
        {"has_last_move", s.has_last_move},
        {"last_move", cell_to_json(s.last_move)},
        {"last_move_player", s.last_move_player},
        {"move_count", s.move_count},
        {"difficulty", s.difficulty},
        {"engine", s.engine},
        {"size", SIZE}
    };
}

bool parse_move(const json& j, Move& out) {
    try {
        if (j.is_object() && j.contains("x") && j.contains("y")) {
            out = Move{j.at("x").get<int>(), j.at("y").get<int>()};
            return true;
        }
        if (j.is_array() && j.size() == 2) {
            out = Move{j.at(0).get<int>(), j.at(1).get<int>()};
            return true;
        }
    } catch (const json::exception&) {
        return false;
    }
    return false;
}

bool parse_cell(const json& j, Cell& out) {
    if (j.is_null()) {
        out = Cell{};
        return true;
    }
    try {
        if (j.is_array() && j.size() == 3) {
            out = Cell{j.at(0).get<int>(), j.at(1).get<int>(), j.at(2).get<int>()};
            return true;
        }
        if (j.is_object() && j.contains("x") && j.contains("y") && j.contains("z")) {
            out = Cell{j.at("x").get<int>(), j.at("y").get<int>(), j.at("z").get<int>()};
            return true;
        }
    } catch (const json::exception&) {
        return false;
    }
    return false;
}

bool parse_grid(const json& j, Grid& out, std::string* error) {
    if (!j.is_array() || j.size() != SIZE) {
        set_error(error, "board must be a 4x4x4 array");
        return false;
    }
    Grid g{};
    for (int z = 0; z < SIZE; z++) {
        const json& layer = j[z];
        if (!layer.is_array() || layer.size() != SIZE) {
            set_error(error, "board layer " + std::to_string(z) + " must be 4x4");
            return false;
        }
        for (int y = 0; y < SIZE; y++) {
            const json& row = layer[y];
            if (!row.is_array() || row.size() != SIZE) {
                set_error(error, "board row " + std::to_string(z) + "," + std::to_string(y) +
                                 " must have 4 cells");
                return false;
            }
            for (int x = 0; x < SIZE; x++) {
                if (!row[x].is_number_integer()) {
                    set_error(error, "board cells must be integers");
                    return false;
                }
                g[z][y][x] = row[x].get<int>();
            }
        }
    }
    out = g;
    return true;
}

bool parse_decide_request(const json& j, DecideRequest& out, std::string* error) {
    if (!j.is_object()) {
        set_error(error, "request must be a JSON object");
        return false;
    }
    if (!j.contains("board")) {
        set_error(error, "missing board");
        return false;
    }
    DecideRequest req;
    if (!parse_grid(j.at("board"), req.board, error)) return false;

    if (!j.contains("player") || !j.at("player").is_number_integer()) {
        set_error(error, "missing/invalid player");
        return false;
    }
    req.player = j.at("player").get<int>();
    if (!valid_player(req.player)) {
        set_error(error, "player must be 1 or 2");
        return false;
    }

    if (j.contains("last_move") && !parse_cell(j.at("last_move"), req.last_move)) {
        set_error(error, "invalid last_move");
        return false;
    }
    if (j.contains("time_ms") && j.at("time_ms").is_number_integer()) {
        req.time_ms = clamp_request_int(j.at("time_ms"), MAX_REQUEST_TIME_MS);
    }
    if (j.contains("depth") && j.at("depth").is_number_integer()) {
        req.depth = clamp_request_int(j.at("depth"), SEARCH_MAX_DEPTH);
    }
    if (j.contains("engine") && j.at("engine").is_string()) {
        req.engine = normalize_engine(j.at("engine").get<std::string>());
    }
    out = req;
    return true;
}

bool parse_state_json(const json& root, GameState& out, std::string* error) {
    if (!root.is_object() || !root.contains("board")) {
        set_error(error, "state must be an object with a board");
        return false;
    }

    GameState tmp;
    if (!parse_grid(root.at("board"), tmp.board, error)) return false;

    Board b;
    std::string reason;
    if (!board_from_grid(tmp.board, b, &reason)) {
        set_error(error, reason);
        return false;
    }

    try {
        tmp.current = root.value("turn", PLAYER1);
        if (!valid_player(tmp.current)) tmp.current = PLAYER1;
        tmp.human_player = root.value("human_player", PLAYER1);
        if (!valid_player(tmp.human_player)) tmp.human_player = PLAYER1;
        tmp.bot_player = opponent_of(tmp.human_player);
        tmp.difficulty = normalize_difficulty(root.value("difficulty", std::string("medium")));
        tmp.engine = normalize_engine(root.value("engine", std::string("negamax")));
        tmp.last_move_player = root.value("last_move_player", opponent_of(tmp.current));
    } catch (const json::exception& ex) {
        set_error(error, ex.what());
        return false;
    }

    if (root.contains("last_move") && parse_cell(root.at("last_move"), tmp.last_move)) {
        tmp.has_last_move = has_cell(tmp.last_move);
    }
    tmp.move_count = b.piece_count();

    // Outcome is derived from the board rather than trusted from the payload.
    tmp.winner = winner(b);
    tmp.game_over = tmp.winner != NO_WINNER;
    if (tmp.game_over) {
        tmp.result = result_text(tmp.winner);
    }
    EngineConfig cfg = config_for(tmp.difficulty, tmp.engine);
    tmp.bot_depth = cfg.max_depth;
    tmp.bot_time_limit = cfg.time_limit_ms / 1000.0;

    out = std::move(tmp);
    return true;
}

bool parse_move_string(const std::string& s, Move& out) {
    if (s.empty()) return false;

    json j = json::parse(s, nullptr, false);
    if (!j.is_discarded()) return parse_move(j, out);

    int x = -1;
    int y = -1;
    if (std::sscanf(s.c_str(), "%d,%d", &x, &y) == 2) {
        out = Move{x, y};
        return true;
    }
    return false;
}

} // namespace cubefour
