#ifndef SUDOKU_ENGINE_COMPOSER_H_INCLUDED
#define SUDOKU_ENGINE_COMPOSER_H_INCLUDED

#include "grid.h"
#include "sequence.h"

#include <string>


struct puzzle_result_t {
	std::string seed;
	grid_t puzzle;
	grid_t solution;
	std::string solution_hash; // sha256 hex of the solution digits
};

struct generate_stats_t {
	size_t removal_attempts = 0;
	size_t removals = 0;
	size_t nodes = 0; // visited by the uniqueness checks
};


// random complete grid, digit order at every cell is shuffled with "seq"
grid_t make_solved_grid(sequence_t& seq);

// sha256 of the 81 digits, lowercase hex
std::string solution_hash(const grid_t& solution);

// Same (difficulty, seed) always gives the same result.
// The puzzle has exactly one solution and at most target_givens(d) givens,
// unless no further cell can be removed without losing uniqueness.
puzzle_result_t generate_puzzle(difficulty_t d, const std::string& seed, generate_stats_t* stats = nullptr);
puzzle_result_t generate_puzzle(difficulty_t d);

#endif
