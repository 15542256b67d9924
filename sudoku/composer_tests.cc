#define BOOST_TEST_MODULE composer_tests
#include <boost/test/included/unit_test.hpp>

#include "composer.h"
#include "solver.h"

#include <array>
#include <set>
#include <string>

namespace {

const std::array<difficulty_t, 4> all_difficulties{
	difficulty_t::EASY,
	difficulty_t::MEDIUM,
	difficulty_t::HARD,
	difficulty_t::EXPERT
};

bool is_sub_grid(const grid_t& puzzle, const grid_t& solution)
{
	for (size_t r = 0; r < N; ++r) {
		for (size_t c = 0; c < N; ++c) {
			if (puzzle[r][c] && puzzle[r][c] != solution[r][c]) {
				return false;
			}
		}
	}
	return true;
}

}

BOOST_AUTO_TEST_CASE(test_solution_hash)
{
	auto const g = grid_parse(
		"534678912"
		"672195348"
		"198342567"
		"859761423"
		"426853791"
		"713924856"
		"961537284"
		"287419635"
		"345286179"
	);
	BOOST_TEST(solution_hash(g) == "4c5e72057519c48e1a2430cbedb7cff3a4a1d244eb28b8d865f85141f643017d");
}

BOOST_AUTO_TEST_CASE(test_solved_grid)
{
	for (const auto& seed : {"a", "b", "demo", "1700000000000"}) {
		sequence_t seq{std::string(seed)};
		auto const g = make_solved_grid(seq);
		BOOST_TEST(is_solved(g));
	}
}

BOOST_AUTO_TEST_CASE(test_solved_grids_differ_by_seed)
{
	std::set<std::string> grids;
	for (size_t i = 0; i < 20; ++i) {
		sequence_t seq("seed-" + std::to_string(i));
		grids.insert(grid_flat(make_solved_grid(seq)));
	}
	BOOST_TEST(grids.size() == 20);
}

BOOST_AUTO_TEST_CASE(test_generate_round_trip)
{
	for (const auto d : all_difficulties) {
		BOOST_TEST_CONTEXT("difficulty " << difficulty_name(d)) {
			auto const r = generate_puzzle(d, "demo");
			BOOST_TEST(r.seed == "demo");
			BOOST_TEST(is_solved(r.solution));
			BOOST_TEST(is_consistent(r.puzzle));
			BOOST_TEST(is_sub_grid(r.puzzle, r.solution));
			BOOST_TEST(count_givens(r.puzzle) <= target_givens(d) + 5);
			BOOST_TEST(count_givens(r.puzzle) >= target_givens(d));
			BOOST_TEST(count_solutions(r.puzzle, 2) == 1);
			BOOST_TEST((solve(r.puzzle) == r.solution));
			BOOST_TEST(r.solution_hash == solution_hash(r.solution));
		}
	}
}

BOOST_AUTO_TEST_CASE(test_generate_easy)
{
	for (const auto& seed : {"demo", "seed-1", "seed-2"}) {
		auto const r = generate_puzzle(difficulty_t::EASY, seed);
		BOOST_TEST(count_givens(r.puzzle) <= 40);
		BOOST_TEST(count_solutions(r.puzzle, 2) == 1);
	}
	// plenty of removable cells at this level
	BOOST_TEST(count_givens(generate_puzzle(difficulty_t::EASY, "demo").puzzle) == 40);
}

BOOST_AUTO_TEST_CASE(test_generate_is_deterministic)
{
	for (const auto d : {difficulty_t::EASY, difficulty_t::HARD}) {
		auto const r1 = generate_puzzle(d, "same seed");
		auto const r2 = generate_puzzle(d, "same seed");
		BOOST_TEST((r1.puzzle == r2.puzzle));
		BOOST_TEST((r1.solution == r2.solution));
		BOOST_TEST(r1.solution_hash == r2.solution_hash);
	}

	// the solution depends on the seed only, difficulty changes the carving
	auto const easy = generate_puzzle(difficulty_t::EASY, "shared");
	auto const medium = generate_puzzle(difficulty_t::MEDIUM, "shared");
	BOOST_TEST((easy.solution == medium.solution));
	BOOST_TEST(count_givens(medium.puzzle) < count_givens(easy.puzzle));
}

BOOST_AUTO_TEST_CASE(test_generate_differs_by_seed)
{
	std::set<std::string> hashes;
	for (size_t i = 0; i < 5; ++i) {
		hashes.insert(generate_puzzle(difficulty_t::EASY, "s" + std::to_string(i)).solution_hash);
	}
	BOOST_TEST(hashes.size() == 5);
}

BOOST_AUTO_TEST_CASE(test_generate_stats)
{
	generate_stats_t stats;
	auto const r = generate_puzzle(difficulty_t::MEDIUM, "stats", &stats);
	BOOST_TEST(stats.removals == CELLS - count_givens(r.puzzle));
	BOOST_TEST(stats.removal_attempts >= stats.removals);
	BOOST_TEST(stats.removal_attempts <= CELLS);
	BOOST_TEST(stats.nodes > 0);
}

BOOST_AUTO_TEST_CASE(test_generate_default_seed)
{
	auto const r = generate_puzzle(difficulty_t::EASY);
	BOOST_TEST(!r.seed.empty());
	BOOST_TEST(count_solutions(r.puzzle) == 1);

	auto const again = generate_puzzle(difficulty_t::EASY, r.seed);
	BOOST_TEST((again.puzzle == r.puzzle));
}
