#include "composer.h"
#include "solver.h"

#include <openssl/evp.h>

#include <iomanip>
#include <numeric>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <assert.h>


namespace {

bool fill(grid_t& g, sequence_t& seq, size_t pos)
{
	if (pos == CELLS) {
		return true;
	}
	size_t const row = pos / N;
	size_t const col = pos % N;

	std::array<num_t, N> nums;
	std::iota(nums.begin(), nums.end(), num_t(1));
	shuffle(nums, seq);

	for (const num_t num : nums) {
		if (is_valid_placement(g, row, col, num)) {
			g[row][col] = num;
			if (fill(g, seq, pos + 1)) {
				return true;
			}
			g[row][col] = std::nullopt;
		}
	}
	return false;
}

} // namespace


grid_t make_solved_grid(sequence_t& seq)
{
	auto g = grid_make_empty();
	if (!fill(g, seq, 0)) {
		// an empty grid always has a completion
		throw std::runtime_error("Failed to build a solved grid");
	}
	assert(is_solved(g));
	return g;
}


std::string solution_hash(const grid_t& solution)
{
	auto const digits = grid_flat(solution);

	unsigned char md[EVP_MAX_MD_SIZE];
	unsigned int md_len = 0;
	if (EVP_Digest(digits.data(), digits.size(), md, &md_len, EVP_sha256(), nullptr) != 1) {
		throw std::runtime_error("sha256 failed");
	}

	std::ostringstream os;
	os << std::hex << std::setfill('0');
	for (unsigned int i = 0; i < md_len; ++i) {
		os << std::setw(2) << static_cast<unsigned>(md[i]);
	}
	return os.str();
}


puzzle_result_t generate_puzzle(difficulty_t d, const std::string& seed, generate_stats_t* stats)
{
	// one stream for both the solved grid and the removal order
	sequence_t seq(seed);

	auto const solution = make_solved_grid(seq);
	auto puzzle = solution;
	size_t const target = target_givens(d);

	std::vector<size_t> cells(CELLS);
	std::iota(cells.begin(), cells.end(), 0);
	shuffle(cells, seq);

	generate_stats_t st;
	size_t givens = CELLS;
	for (const size_t idx : cells) {
		if (givens <= target) {
			break;
		}
		auto& cell = puzzle[idx / N][idx % N];
		auto const backup = cell;
		cell = std::nullopt;

		search_stats_t ss;
		++st.removal_attempts;
		if (count_solutions(puzzle, 2, {}, &ss) == 1) {
			--givens;
			++st.removals;
		} else {
			cell = backup;
		}
		st.nodes += ss.nodes;
	}
	assert(count_givens(puzzle) == givens);

	if (stats) {
		*stats = st;
	}
	return puzzle_result_t{seed, puzzle, solution, solution_hash(solution)};
}

puzzle_result_t generate_puzzle(difficulty_t d)
{
	return generate_puzzle(d, default_seed());
}
