#include "test_helpers.hpp"
#include "alloc_failure.hpp"

#include <string>

#include "backend/engine.hpp"
#include "backend/engine_api.h"
#include "backend/json_codec.hpp"

using namespace cubefour;

static json empty_board_json() {
    return grid_to_json(Grid{});
}

static std::string last_error() {
    return std::string(cf_get_last_error());
}

static void test_decide_on_empty_board() {
    json req{{"board", empty_board_json()}, {"player", 1}, {"last_move", nullptr}, {"time_ms", 50}};
    json out = json::parse(cf_decide(req.dump().c_str()));
    assert(out.at("x").get<int>() == 1 && out.at("y").get<int>() == 1);
    assert(out.at("stage").get<std::string>() == "opening_book");
    assert(last_error().empty());
}

static void test_decide_rejects_bad_requests() {
    std::string out = cf_decide("{not json");
    assert(out == "{}");
    assert(!last_error().empty());

    json req{{"board", empty_board_json()}, {"player", 3}};
    out = cf_decide(req.dump().c_str());
    assert(out == "{}");
    assert(last_error() == "player must be 1 or 2");

    json shape{{"board", json::array({1, 2, 3})}, {"player", 1}};
    out = cf_decide(shape.dump().c_str());
    assert(out == "{}");
    assert(last_error().find("4x4x4") != std::string::npos);

    Grid full{};
    for (auto& layer : full)
        for (auto& row : layer)
            for (int& v : row) v = PLAYER1;
    json none{{"board", grid_to_json(full)}, {"player", 2}};
    out = cf_decide(none.dump().c_str());
    assert(out == "{}");
    assert(last_error() == "no column has room");
}

static void test_session_moves() {
    assert(cf_new_game("easy", "negamax", 1) == 1);
    assert(cf_apply_move("1,1") == 1);

    json pos = json::parse(cf_get_position());
    assert(pos.at("turn").get<int>() == 2);
    assert(pos.at("board")[0][1][1].get<int>() == 1);
    assert(pos.at("move_count").get<int>() == 1);
    assert(pos.at("last_move") == json::array({1, 1, 0}));
    assert(pos.at("legal_moves").size() == 16);
    assert(pos.at("difficulty").get<std::string>() == "easy");

    assert(cf_apply_move("[1,1]") == 1);
    assert(cf_apply_move("{\"x\":1,\"y\":1}") == 1);
    assert(cf_apply_move("1,1") == 1);
    assert(cf_apply_move("1,1") == 0);
    assert(last_error() == "column is full");

    assert(cf_apply_move("5,0") == 0);
    assert(last_error() == "column out of range");
    assert(cf_apply_move("nonsense") == 0);

    pos = json::parse(cf_get_position());
    assert(pos.at("legal_moves").size() == 15);
    assert(pos.at("board")[3][1][1].get<int>() == 2);

    json best = json::parse(cf_get_best_move(50, 2));
    assert(on_board(best.at("x").get<int>(), best.at("y").get<int>()));
    assert(!(best.at("x").get<int>() == 1 && best.at("y").get<int>() == 1));
}

static void test_bot_opens_when_human_is_second() {
    assert(cf_new_game("beginner", "negamax", 2) == 1);
    json pos = json::parse(cf_get_position());
    assert(pos.at("move_count").get<int>() == 1);
    assert(pos.at("turn").get<int>() == 2);
    assert(pos.at("last_move_player").get<int>() == 1);
    assert(pos.at("difficulty").get<std::string>() == "easy");
}

static void test_set_position_derives_outcome() {
    Grid g{};
    for (int x = 0; x < SIZE; x++) g[0][0][x] = PLAYER1;
    g[0][1][0] = PLAYER2;
    g[0][1][1] = PLAYER2;
    g[0][1][2] = PLAYER2;
    json state{{"board", grid_to_json(g)}, {"turn", 2}, {"winner", 0}, {"game_over", false}};
    assert(cf_set_position(state.dump().c_str()) == 1);

    json pos = json::parse(cf_get_position());
    assert(pos.at("game_over").get<bool>());
    assert(pos.at("winner").get<int>() == 1);
    assert(pos.at("result").get<std::string>() == "Player 1 wins.");
    assert(pos.at("move_count").get<int>() == 7);
    assert(pos.at("legal_moves").empty());

    assert(cf_apply_move("3,3") == 0);
    assert(last_error() == "game is already over");
    assert(std::string(cf_get_best_move(10, 1)) == "{}");

    g[1][2][2] = PLAYER1;  // floating
    json bad{{"board", grid_to_json(g)}};
    assert(cf_set_position(bad.dump().c_str()) == 0);
    assert(last_error().find("floating") != std::string::npos);
}

static void test_decide_move_direct() {
    Grid g{};
    g[0][0][2] = PLAYER1;
    g[1][0][2] = PLAYER1;
    g[2][0][2] = PLAYER1;
    g[0][3][0] = PLAYER2;
    g[0][1][3] = PLAYER2;
    g[0][3][2] = PLAYER2;
    Decision d = decide_move(g, PLAYER1, Cell{2, 3, 0}, 50);
    assert(d.move.x == 2 && d.move.y == 0);
    assert(d.stage == Stage::IMMEDIATE_WIN);

    d = decide_move(g, PLAYER2, Cell{2, 0, 2}, 50, "mcts");
    assert(d.move.x == 2 && d.move.y == 0);
    assert(d.stage == Stage::IMMEDIATE_BLOCK);
}

static void test_presets() {
    assert(normalize_difficulty("EXPERT") == "hard");
    assert(normalize_difficulty("whatever") == "medium");
    assert(normalize_engine("MCTS") == "mcts");
    assert(normalize_engine("alphabeta") == "negamax");

    EngineConfig easy = config_for("easy", "negamax");
    assert(easy.max_depth == 4 && easy.time_limit_ms == 250);
    EngineConfig hard = config_for("hard", "mcts");
    assert(hard.max_depth == 24 && hard.time_limit_ms == 3000);
    assert(hard.engine == EngineKind::MCTS);
}

static void test_codec_helpers() {
    Move m;
    assert(parse_move(json::array({2, 3}), m) && m.x == 2 && m.y == 3);
    assert(!parse_move(json::array({1, 2, 3}), m));

    Cell c{1, 1, 1};
    assert(parse_cell(json(nullptr), c) && !has_cell(c));
    assert(parse_cell(json::array({3, 2, 1}), c) && c.x == 3 && c.y == 2 && c.z == 1);
    assert(cell_to_json(Cell{}).is_null());

    Grid g;
    std::string err;
    json layer_short = json::array({json::array(), json::array(), json::array(), json::array()});
    assert(!parse_grid(layer_short, g, &err));
    assert(err.find("layer 0") != std::string::npos);

    json text = empty_board_json();
    text[2][1][0] = "x";
    assert(!parse_grid(text, g, &err));
    assert(err == "board cells must be integers");

    json round = empty_board_json();
    round[1][2][3] = 2;
    assert(parse_grid(round, g, &err) && g[1][2][3] == 2);
}

static void test_decide_request_clamps_numbers() {
    json j{{"board", empty_board_json()}, {"player", 1}, {"time_ms", 1e20}, {"depth", 1000}};
    DecideRequest req;
    std::string err;
    assert(parse_decide_request(j, req, &err));
    assert(req.time_ms == 0 && "non-integer time is ignored");
    assert(req.depth == SEARCH_MAX_DEPTH);

    j["time_ms"] = 99999999999LL;
    assert(parse_decide_request(j, req, &err) && req.time_ms == MAX_REQUEST_TIME_MS);
    j["time_ms"] = 99999999999ULL;
    assert(parse_decide_request(j, req, &err) && req.time_ms == MAX_REQUEST_TIME_MS);
    j["time_ms"] = -5;
    j["depth"] = -2;
    assert(parse_decide_request(j, req, &err) && req.time_ms == 0 && req.depth == 0);
    j["time_ms"] = 250.5;
    assert(parse_decide_request(j, req, &err) && req.time_ms == 0);
    j["time_ms"] = 250;
    assert(parse_decide_request(j, req, &err) && req.time_ms == 250);

    json parsed = json::parse(R"({"player": 2, "time_ms": 1e20})");
    parsed["board"] = empty_board_json();
    assert(parse_decide_request(parsed, req, &err) && req.time_ms == 0);
}

static void test_allocation_failures_stay_inside_the_api() {
    json req{{"board", empty_board_json()}, {"player", 1}, {"time_ms", 50}};
    const std::string body = req.dump();

    test::fail_next_allocation();
    const char* raw = cf_decide(body.c_str());
    assert(!test::allocation_failure_pending());
    assert(std::string(raw) == "{}");
    assert(!last_error().empty());
    assert(json::parse(cf_decide(body.c_str())).contains("x"));

    assert(cf_new_game("easy", "negamax", 1) == 1);
    test::fail_next_allocation();
    assert(cf_apply_move("{\"x\":0,\"y\":0}") == 0);
    assert(!test::allocation_failure_pending());
    assert(!last_error().empty());
    assert(json::parse(cf_get_position()).at("move_count").get<int>() == 0);

    json state{{"board", empty_board_json()}, {"turn", 1}};
    const std::string state_body = state.dump();
    test::fail_next_allocation();
    assert(cf_set_position(state_body.c_str()) == 0);
    assert(!test::allocation_failure_pending());
    assert(cf_set_position(state_body.c_str()) == 1);
}

int main() {
    assert(cf_init() == 1);
    test_decide_on_empty_board();
    test_decide_rejects_bad_requests();
    test_session_moves();
    test_bot_opens_when_human_is_second();
    test_set_position_derives_outcome();
    test_decide_move_direct();
    test_presets();
    test_codec_helpers();
    test_decide_request_clamps_numbers();
    test_allocation_failures_stay_inside_the_api();
    std::cout << "All api tests passed\n";
    return 0;
}
