#include "engine.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <exception>
#include <iostream>
#include <memory>
#include <mutex>

#include "core/tactics.hpp"

namespace cubefour {
namespace {

// One policy (and so one transposition table) for the whole process.
static std::once_flag g_engine_init_once;
static std::unique_ptr<DecisionPolicy> g_policy;
static std::mutex g_policy_mu;
static std::atomic<bool> g_verbose{false};

static DecisionPolicy& shared_policy() {
    std::call_once(g_engine_init_once, []() {
        g_policy = std::make_unique<DecisionPolicy>(config_for("medium", "negamax"));
    });
    return *g_policy;
}

static std::string to_lower_ascii(std::string s) {
    for (char& ch : s) ch = (char)std::tolower((unsigned char)ch);
    return s;
}

static void apply_difficulty_to_state(GameState& state) {
    state.difficulty = normalize_difficulty(state.difficulty);
    state.engine = normalize_engine(state.engine);
    EngineConfig cfg = config_for(state.difficulty, state.engine);
    state.bot_depth = cfg.max_depth;
    state.bot_time_limit = cfg.time_limit_ms / 1000.0;
}

static Decision run_policy(const Board& board, int player, const Cell& last_move,
                           const EngineConfig& cfg) {
    std::lock_guard<std::mutex> lk(g_policy_mu);
    DecisionPolicy& policy = shared_policy();
    EngineConfig c = cfg;
    c.verbose = c.verbose || g_verbose.load();
    policy.set_config(c);
    Decision d;
    d.move = policy.decide(board, player, last_move);
    d.stage = policy.last_stage();
    return d;
}

static EngineConfig config_for_state(const GameState& state) {
    EngineConfig cfg = config_for(state.difficulty, state.engine);
    cfg.max_depth = std::max(1, state.bot_depth);
    cfg.time_limit_ms = std::max(1, (int)(state.bot_time_limit * 1000.0));
    return cfg;
}

// Malformed grids still load (broken columns read as full); the reason is
// only worth reporting when logging is on.
static Board load_board(const Grid& grid) {
    Board b;
    std::string reason;
    if (!board_from_grid(grid, b, &reason) && g_verbose.load()) {
        std::cerr << "[policy] malformed board: " << reason << "\n";
    }
    return b;
}

} // namespace

std::string result_text(int w) {
    if (w == DRAW) return "Draw — board full.";
    return "Player " + std::to_string(w) + " wins.";
}

std::string normalize_difficulty(const std::string& difficulty) {
    std::string d = to_lower_ascii(difficulty);
    if (d == "easy" || d == "beginner") return "easy";
    if (d == "hard" || d == "expert") return "hard";
    return "medium";
}

std::string normalize_engine(const std::string& engine) {
    std::string e = to_lower_ascii(engine);
    return (e == "mcts") ? "mcts" : "negamax";
}

EngineConfig config_for(const std::string& difficulty, const std::string& engine) {
    EngineConfig cfg;
    const std::string d = normalize_difficulty(difficulty);
    if (d == "easy") {
        cfg.max_depth = 4;
        cfg.time_limit_ms = 250;
    } else if (d == "hard") {
        cfg.max_depth = 24;
        cfg.time_limit_ms = 3000;
    } else {
        cfg.max_depth = 12;
        cfg.time_limit_ms = 1000;
    }
    cfg.engine = (normalize_engine(engine) == "mcts") ? EngineKind::MCTS : EngineKind::NEGAMAX;
    cfg.verbose = g_verbose.load();
    return cfg;
}

void set_engine_verbose(bool v) {
    g_verbose.store(v);
}

GameState new_game(const std::string& difficulty, const std::string& engine) {
    GameState out;
    out.difficulty = difficulty;
    out.engine = engine;
    apply_difficulty_to_state(out);
    out.board = Grid{};
    out.current = PLAYER1;
    out.game_over = false;
    out.result.clear();
    out.winner = NO_WINNER;
    out.has_last_move = false;
    out.last_move = Cell{};
    out.last_move_player = PLAYER1;
    out.move_count = 0;
    return out;
}

ActionStatus apply_move(GameState& state, const Move& move) {
    ActionStatus st;
    st.ok = false;

    if (state.game_over) {
        st.error = "game is already over";
        st.game_over = true;
        st.result = state.result;
        return st;
    }
    if (!on_board(move.x, move.y)) {
        st.error = "column out of range";
        return st;
    }

    Board b;
    std::string reason;
    if (!board_from_grid(state.board, b, &reason)) {
        st.error = "corrupt board: " + reason;
        return st;
    }
    const int mover = state.current;
    int z = cubefour::apply_move(b, move.x, move.y, mover);
    if (z < 0) {
        st.error = "column is full";
        return st;
    }

    state.board = board_to_grid(b);
    state.has_last_move = true;
    state.last_move = Cell{move.x, move.y, z};
    state.last_move_player = mover;
    state.move_count++;
    st.ok = true;

    int w = wins_through(b, cell_index(move.x, move.y, z), mover) ? mover
            : (has_room(b) ? NO_WINNER : DRAW);
    if (w != NO_WINNER) {
        state.game_over = true;
        state.winner = w;
        state.result = result_text(w);
        st.game_over = true;
        st.result = state.result;
        return st;
    }

    state.current = opponent_of(mover);
    return st;
}

Move bot_move(GameState& state) {
    apply_difficulty_to_state(state);
    if (state.game_over) return Move{};

    Move m = hint_move(state);
    if (is_no_move(m)) return Move{};
    ActionStatus st = apply_move(state, m);
    if (!st.ok) return Move{};
    return m;
}

Move hint_move(const GameState& state) {
    if (state.game_over) return Move{};
    Board b = load_board(state.board);
    Cell last = state.has_last_move ? state.last_move : Cell{};
    return run_policy(b, state.current, last, config_for_state(state)).move;
}

SerializedState serialize_state(const GameState& state) {
    SerializedState out;
    out.turn = state.current;
    out.game_over = state.game_over;
    out.result = state.result;
    out.winner = state.winner;
    out.has_last_move = state.has_last_move;
    out.last_move = state.last_move;
    out.last_move_player = state.last_move_player;
    out.move_count = state.move_count;
    out.difficulty = normalize_difficulty(state.difficulty);
    out.engine = normalize_engine(state.engine);
    out.board = state.board;

    if (state.game_over) return out;

    Board b = load_board(state.board);
    for (const Move& m : legal_moves(b)) out.legal_moves.push_back(m);
    return out;
}

Decision decide_move(const Grid& board, int player, const Cell& last_move,
                     int time_ms, const std::string& engine, int depth) {
    Board b = load_board(board);

    EngineConfig cfg = config_for("medium", engine);
    if (time_ms > 0) cfg.time_limit_ms = time_ms;
    if (depth > 0) cfg.max_depth = depth;

    try {
        return run_policy(b, player, last_move, cfg);
    } catch (const std::exception& ex) {
        std::cerr << "[policy] decide failed: " << ex.what() << "\n";
    } catch (...) {
        std::cerr << "[policy] decide failed: unknown error\n";
    }
    Decision d;
    d.move = fallback_move(b, player);
    d.stage = is_no_move(d.move) ? Stage::NONE : Stage::FALLBACK;
    return d;
}

} // namespace cubefour
