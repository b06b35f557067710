#pragma once

#ifdef __cplusplus
extern "C" {
#endif

// Initialize internal engine state. Returns 1 on success.
int cf_init();

// Start a new game with the given difficulty/engine; human_player is 1 or 2.
// If the bot owns the first move it is played immediately. Returns 1 on success.
int cf_new_game(const char* difficulty, const char* engine, int human_player);

// Set full game state from JSON (serialized state format). Returns 1 on success.
int cf_set_position(const char* state_json);

// Get current game state as JSON string.
const char* cf_get_position();

// Stateless host contract. Request:
//   {"board": [[[..]]], "player": 1, "last_move": [x,y,z] | null, "time_ms": 500}
// Returns {"x":..,"y":..,"stage":".."}, or {} with the last error set.
const char* cf_decide(const char* request_json);

// Compute best move for the current game without mutating it.
// Returns JSON object string like {"x":1,"y":2}.
const char* cf_get_best_move(int time_ms, int depth);

// Apply move from JSON ({"x":..,"y":..} or [x,y]) or "x,y". Returns 1 on success.
int cf_apply_move(const char* move_json_or_xy);

// Retrieve last API error string.
const char* cf_get_last_error();

#ifdef __cplusplus
}
#endif
