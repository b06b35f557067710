#include "engine_api.h"

#include "engine.hpp"
#include "json_codec.hpp"

#include <algorithm>
#include <exception>
#include <mutex>
#include <string>

#if defined(__EMSCRIPTEN__)
#include <emscripten/emscripten.h>
#define CF_KEEPALIVE EMSCRIPTEN_KEEPALIVE
#else
#define CF_KEEPALIVE
#endif

using cubefour::json;

namespace {

std::mutex g_api_mu;
cubefour::GameState g_state;
bool g_initialized = false;
std::string g_last_error;
std::string g_out;

void set_error(const std::string& msg) {
    g_last_error = msg;
}

void clear_error() {
    g_last_error.clear();
}

const char* set_out_json(const json& body) {
    g_out = body.dump();
    return g_out.c_str();
}

const char* set_out_string(const std::string& body) {
    g_out = body;
    return g_out.c_str();
}

const char* current_state_json_locked() {
    cubefour::SerializedState s = cubefour::serialize_state(g_state);
    return set_out_json(cubefour::state_to_json(s));
}

void ensure_initialized_locked() {
    if (g_initialized) return;
    g_state = cubefour::new_game("medium", "negamax");
    g_state.human_player = cubefour::PLAYER1;
    g_state.bot_player = cubefour::PLAYER2;
    g_initialized = true;
}

} // namespace

extern "C" {

CF_KEEPALIVE int cf_init() {
    std::lock_guard<std::mutex> lk(g_api_mu);
    clear_error();
    ensure_initialized_locked();
    return 1;
}

CF_KEEPALIVE int cf_new_game(const char* difficulty, const char* engine, int human_player) {
    std::lock_guard<std::mutex> lk(g_api_mu);
    clear_error();

    std::string diff = difficulty ? difficulty : "medium";
    std::string eng = engine ? engine : "negamax";
    int human = cubefour::valid_player(human_player) ? human_player : cubefour::PLAYER1;

    try {
        g_state = cubefour::new_game(diff, eng);
        g_state.human_player = human;
        g_state.bot_player = cubefour::opponent_of(human);

        if (g_state.current == g_state.bot_player) {
            cubefour::Move m = cubefour::bot_move(g_state);
            if (cubefour::is_no_move(m)) {
                set_error("bot could not find a legal move");
                return 0;
            }
        }

        g_initialized = true;
        return 1;
    } catch (const std::exception& ex) {
        set_error(ex.what());
        return 0;
    } catch (...) {
        set_error("unknown error");
        return 0;
    }
}

CF_KEEPALIVE int cf_set_position(const char* state_json) {
    std::lock_guard<std::mutex> lk(g_api_mu);
    clear_error();

    if (!state_json) {
        set_error("missing state string");
        return 0;
    }

    try {
        json root = json::parse(state_json, nullptr, false);
        if (root.is_discarded()) {
            set_error("state parse failed; expected JSON serialized state");
            return 0;
        }

        cubefour::GameState parsed;
        std::string err;
        if (!cubefour::parse_state_json(root, parsed, &err)) {
            set_error("invalid state JSON: " + err);
            return 0;
        }

        g_state = std::move(parsed);
        g_initialized = true;
        return 1;
    } catch (const std::exception& ex) {
        set_error(ex.what());
        return 0;
    } catch (...) {
        set_error("unknown error");
        return 0;
    }
}

CF_KEEPALIVE const char* cf_get_position() {
    std::lock_guard<std::mutex> lk(g_api_mu);
    clear_error();
    try {
        ensure_initialized_locked();
        return current_state_json_locked();
    } catch (const std::exception& ex) {
        set_error(ex.what());
    } catch (...) {
        set_error("unknown error");
    }
    return set_out_string("{}");
}

CF_KEEPALIVE const char* cf_decide(const char* request_json) {
    std::lock_guard<std::mutex> lk(g_api_mu);
    clear_error();

    if (!request_json) {
        set_error("missing request");
        return set_out_json(json::object());
    }

    try {
        json in = json::parse(request_json, nullptr, false);
        if (in.is_discarded()) {
            set_error("invalid JSON request");
            return set_out_json(json::object());
        }

        cubefour::DecideRequest req;
        std::string err;
        if (!cubefour::parse_decide_request(in, req, &err)) {
            set_error(err);
            return set_out_json(json::object());
        }

        cubefour::Decision d = cubefour::decide_move(req.board, req.player, req.last_move,
                                                     req.time_ms, req.engine, req.depth);
        if (cubefour::is_no_move(d.move)) {
            set_error("no column has room");
            return set_out_json(json::object());
        }
        return set_out_json(cubefour::decision_to_json(d));
    } catch (const std::exception& ex) {
        set_error(ex.what());
    } catch (...) {
        set_error("unknown error");
    }
    return set_out_string("{}");
}

CF_KEEPALIVE const char* cf_get_best_move(int time_ms, int depth) {
    std::lock_guard<std::mutex> lk(g_api_mu);
    clear_error();

    try {
        ensure_initialized_locked();
        if (g_state.game_over) {
            return set_out_string("{}");
        }

        cubefour::GameState probe = g_state;
        if (time_ms > 0) {
            probe.bot_time_limit = std::max(0.01, (double)time_ms / 1000.0);
        }
        if (depth > 0) {
            probe.bot_depth = std::max(1, depth);
        }

        cubefour::Move m = cubefour::hint_move(probe);
        if (cubefour::is_no_move(m)) {
            set_error("bot could not find a legal move");
            return set_out_string("{}");
        }
        return set_out_json(cubefour::move_to_json(m));
    } catch (const std::exception& ex) {
        set_error(ex.what());
    } catch (...) {
        set_error("unknown error");
    }
    return set_out_string("{}");
}

CF_KEEPALIVE int cf_apply_move(const char* move_json_or_xy) {
    std::lock_guard<std::mutex> lk(g_api_mu);
    clear_error();

    try {
        ensure_initialized_locked();

        cubefour::Move m;
        if (!move_json_or_xy || !cubefour::parse_move_string(move_json_or_xy, m)) {
            set_error("missing/invalid move payload");
            return 0;
        }

        cubefour::ActionStatus st = cubefour::apply_move(g_state, m);
        if (!st.ok) {
            set_error(st.error.empty() ? "illegal move" : st.error);
            return 0;
        }
        return 1;
    } catch (const std::exception& ex) {
        set_error(ex.what());
        return 0;
    } catch (...) {
        set_error("unknown error");
        return 0;
    }
}

CF_KEEPALIVE const char* cf_get_last_error() {
    std::lock_guard<std::mutex> lk(g_api_mu);
    return set_out_string(g_last_error);
}

} // extern "C"
