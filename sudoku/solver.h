#ifndef SUDOKU_ENGINE_SOLVER_H_INCLUDED
#define SUDOKU_ENGINE_SOLVER_H_INCLUDED

#include "grid.h"

#include <optional>
#include <stdexcept>


// the grid has no valid completion
class unsolvable_error : public std::runtime_error {
public:
	unsolvable_error() : std::runtime_error("Unsolvable puzzle") {}
};

class search_budget_exceeded : public std::runtime_error {
public:
	explicit search_budget_exceeded(size_t nodes)
		: std::runtime_error("Search budget exceeded after " + std::to_string(nodes) + " nodes")
		{}
};

struct search_limits_t {
	std::optional<size_t> max_nodes; // unlimited by default
};

struct search_stats_t {
	size_t nodes = 0;
};


// Backtracking over empty cells in row-major order, values tried in ascending order.
// The input is copied, never modified.
// Throws unsolvable_error if there is no completion, search_budget_exceeded if limits.max_nodes is hit.
grid_t solve(const grid_t& g, const search_limits_t& limits = {}, search_stats_t* stats = nullptr);

// Number of completions, stops as soon as "limit" of them are found.
// Result is in [0, limit]. Throws std::runtime_error if limit is 0.
size_t count_solutions(const grid_t& g, size_t limit = 2, const search_limits_t& limits = {}, search_stats_t* stats = nullptr);

#endif
