#include "solver.h"

#include <assert.h>


namespace {

class search_t {
public:
	search_t(const grid_t& g, const search_limits_t& limits, search_stats_t* stats)
		: g_(g)
		, limits_(limits)
		, stats_(stats)
		{}

	// returns true if the search must stop, on_complete() decides it for complete grids
	template <typename OnComplete>
	bool run(size_t pos, OnComplete&& on_complete)
	{
		++nodes_;
		if (stats_) {
			stats_->nodes = nodes_;
		}
		if (limits_.max_nodes && nodes_ > limits_.max_nodes.value()) {
			throw search_budget_exceeded(nodes_);
		}

		// skip givens
		while (pos < CELLS && g_[pos / N][pos % N]) {
			++pos;
		}
		if (pos == CELLS) {
			return on_complete(g_);
		}

		size_t const row = pos / N;
		size_t const col = pos % N;
		auto& cell = g_[row][col];
		for (num_t num = 1; num <= N; ++num) {
			if (is_valid_placement(g_, row, col, num)) {
				cell = num;
				if (run(pos + 1, on_complete)) {
					return true;
				}
				cell = std::nullopt;
			}
		}
		return false;
	}

	const grid_t& grid() const { return g_; }

private:
	grid_t g_; // private copy
	const search_limits_t& limits_;
	search_stats_t* const stats_;
	size_t nodes_ = 0;
};

} // namespace


grid_t solve(const grid_t& g, const search_limits_t& limits, search_stats_t* stats)
{
	if (!is_consistent(g)) {
		throw unsolvable_error();
	}

	search_t s(g, limits, stats);
	if (!s.run(0, [](const grid_t&) { return true; })) {
		throw unsolvable_error();
	}
	assert(is_solved(s.grid()));
	return s.grid();
}


size_t count_solutions(const grid_t& g, size_t limit, const search_limits_t& limits, search_stats_t* stats)
{
	if (limit == 0) {
		throw std::runtime_error("count_solutions: limit must be positive");
	}
	if (!is_consistent(g)) {
		return 0;
	}

	size_t count = 0;
	search_t s(g, limits, stats);
	s.run(0, [&count, limit](const grid_t&) {
		++count;
		return count >= limit;
	});
	assert(count <= limit);
	return count;
}
