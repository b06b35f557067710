#include "engine.hpp"
#include "json_codec.hpp"

#include <httplib.h>

#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>
#include <string>
#include <unordered_map>

using cubefour::json;

namespace {

std::unordered_map<std::string, cubefour::GameState> g_sessions;
std::mutex g_sessions_mu;
int g_default_time_ms = 0;

std::string make_game_id() {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dist;
    uint64_t a = dist(rng);
    uint64_t b = dist(rng);
    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(16) << a
        << std::setw(16) << b;
    return oss.str();
}

int env_int(const char* name, int fallback) {
    const char* v = std::getenv(name);
    if (!v || !*v) return fallback;
    char* end = nullptr;
    long n = std::strtol(v, &end, 10);
    if (end == v || *end != '\0') return fallback;
    return (int)n;
}

bool env_flag(const char* name) {
    const char* v = std::getenv(name);
    return v && *v && std::string(v) != "0";
}

void set_json(httplib::Response& res, int status, const json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

template <typename Fn>
void register_post(httplib::Server& svr, const std::string& path, Fn&& fn) {
    svr.Post(path, fn);
    svr.Post("/api" + path, fn);
}

// Parses the body and looks up "game_id"; answers the error itself on failure.
bool parse_session_request(const httplib::Request& req, httplib::Response& res,
                           json& in, std::string& gid) {
    in = json::parse(req.body, nullptr, false);
    if (in.is_discarded() || !in.is_object()) {
        set_json(res, 400, json{{"error", "invalid JSON body"}});
        return false;
    }
    gid = in.value("game_id", "");
    if (gid.empty()) {
        set_json(res, 400, json{{"error", "missing game_id"}});
        return false;
    }
    return true;
}

} // namespace

int main() {
    httplib::Server svr;

    cubefour::set_engine_verbose(env_flag("CUBEFOUR_VERBOSE"));
    g_default_time_ms = env_int("CUBEFOUR_TIME_MS", 0);

    auto health_handler = [](const httplib::Request&, httplib::Response& res) {
        set_json(res, 200, json{{"ok", true}});
    };
    svr.Get("/health", health_handler);
    svr.Get("/api/health", health_handler);

    // Stateless host contract: board + player + last move in, column out.
    register_post(svr, "/decide", [](const httplib::Request& req, httplib::Response& res) {
        json in = json::parse(req.body, nullptr, false);
        if (in.is_discarded()) {
            set_json(res, 400, json{{"error", "invalid JSON body"}});
            return;
        }
        cubefour::DecideRequest dr;
        std::string err;
        if (!cubefour::parse_decide_request(in, dr, &err)) {
            set_json(res, 400, json{{"error", err}});
            return;
        }
        if (dr.time_ms <= 0) dr.time_ms = g_default_time_ms;

        cubefour::Decision d = cubefour::decide_move(dr.board, dr.player, dr.last_move,
                                                     dr.time_ms, dr.engine, dr.depth);
        if (cubefour::is_no_move(d.move)) {
            set_json(res, 400, json{{"error", "no column has room"}});
            return;
        }
        set_json(res, 200, cubefour::decision_to_json(d));
    });

    register_post(svr, "/new", [](const httplib::Request& req, httplib::Response& res) {
        int human = cubefour::PLAYER1;
        std::string difficulty = "medium";
        std::string engine = "negamax";
        if (!req.body.empty()) {
            json in = json::parse(req.body, nullptr, false);
            if (!in.is_discarded() && in.is_object()) {
                if (in.contains("human_player") && in["human_player"].is_number_integer()) {
                    int p = in["human_player"].get<int>();
                    if (cubefour::valid_player(p)) human = p;
                }
                if (in.contains("difficulty") && in["difficulty"].is_string())
                    difficulty = cubefour::normalize_difficulty(in["difficulty"].get<std::string>());
                if (in.contains("engine") && in["engine"].is_string())
                    engine = cubefour::normalize_engine(in["engine"].get<std::string>());
            }
        }

        cubefour::GameState st = cubefour::new_game(difficulty, engine);
        st.human_player = human;
        st.bot_player = cubefour::opponent_of(human);

        // If the human chose player 2, the bot opens.
        if (st.current == st.bot_player && cubefour::is_no_move(cubefour::bot_move(st))) {
            set_json(res, 500, json{{"error", "bot could not open the game"}});
            return;
        }

        std::string gid = make_game_id();
        {
            std::lock_guard<std::mutex> lk(g_sessions_mu);
            g_sessions[gid] = st;
        }

        set_json(res, 200, json{{"game_id", gid},
                                {"state", cubefour::state_to_json(cubefour::serialize_state(st))}});
    });

    register_post(svr, "/move", [](const httplib::Request& req, httplib::Response& res) {
        json in;
        std::string gid;
        if (!parse_session_request(req, res, in, gid)) return;

        cubefour::Move mv;
        if (!in.contains("move") || !cubefour::parse_move(in["move"], mv)) {
            set_json(res, 400, json{{"error", "missing/invalid move"}});
            return;
        }

        std::lock_guard<std::mutex> lk(g_sessions_mu);
        auto it = g_sessions.find(gid);
        if (it == g_sessions.end()) {
            set_json(res, 404, json{{"error", "game_id not found"}});
            return;
        }

        cubefour::ActionStatus st = cubefour::apply_move(it->second, mv);
        if (!st.ok) {
            set_json(res, 400, json{{"error", st.error}});
            return;
        }

        set_json(res, 200, json{{"state", cubefour::state_to_json(cubefour::serialize_state(it->second))}});
    });

    register_post(svr, "/bot", [](const httplib::Request& req, httplib::Response& res) {
        json in;
        std::string gid;
        if (!parse_session_request(req, res, in, gid)) return;

        std::lock_guard<std::mutex> lk(g_sessions_mu);
        auto it = g_sessions.find(gid);
        if (it == g_sessions.end()) {
            set_json(res, 404, json{{"error", "game_id not found"}});
            return;
        }

        if (it->second.game_over) {
            set_json(res, 200, json{{"state", cubefour::state_to_json(cubefour::serialize_state(it->second))}});
            return;
        }

        if (in.contains("difficulty") && in["difficulty"].is_string()) {
            it->second.difficulty = cubefour::normalize_difficulty(in["difficulty"].get<std::string>());
        }

        cubefour::Move m = cubefour::bot_move(it->second);
        if (cubefour::is_no_move(m)) {
            set_json(res, 400, json{{"error", "bot could not find a legal move"}});
            return;
        }

        set_json(res, 200, json{{"move", cubefour::move_to_json(m)},
                                {"state", cubefour::state_to_json(cubefour::serialize_state(it->second))}});
    });

    register_post(svr, "/hint", [](const httplib::Request& req, httplib::Response& res) {
        json in;
        std::string gid;
        if (!parse_session_request(req, res, in, gid)) return;

        std::lock_guard<std::mutex> lk(g_sessions_mu);
        auto it = g_sessions.find(gid);
        if (it == g_sessions.end()) {
            set_json(res, 404, json{{"error", "game_id not found"}});
            return;
        }

        if (it->second.game_over) {
            set_json(res, 400, json{{"error", "game is already over"}});
            return;
        }

        cubefour::GameState probe = it->second;
        if (in.contains("difficulty") && in["difficulty"].is_string()) {
            probe.difficulty = cubefour::normalize_difficulty(in["difficulty"].get<std::string>());
            cubefour::EngineConfig cfg = cubefour::config_for(probe.difficulty, probe.engine);
            probe.bot_depth = cfg.max_depth;
            probe.bot_time_limit = cfg.time_limit_ms / 1000.0;
        }

        cubefour::Move m = cubefour::hint_move(probe);
        if (cubefour::is_no_move(m)) {
            set_json(res, 400, json{{"error", "hint could not find a legal move"}});
            return;
        }

        set_json(res, 200, json{{"move", cubefour::move_to_json(m)}});
    });

    int port = env_int("PORT", 8080);

    std::printf("cubefour API listening on 0.0.0.0:%d\n", port);
    if (!svr.listen("0.0.0.0", port)) {
        std::fprintf(stderr, "cubefour API could not bind port %d\n", port);
        return 1;
    }
    return 0;
}
