#ifndef SUDOKU_ENGINE_CLI_H_INCLUDED
#define SUDOKU_ENGINE_CLI_H_INCLUDED

#include "composer.h"
#include "solver.h"

#include <iosfwd>
#include <string>
#include <vector>


struct options_t {
	std::string command;
	std::vector<std::string> positional;
	bool verbose = false;
	bool json = false;
	search_limits_t limits;
	size_t limit = 2;
};

// throws std::runtime_error with the usage text on bad arguments
options_t parse_args(int argc, const char* const* argv);

// JSON string body: '"', '\\' and control characters are escaped
std::string json_escape(const std::string& s);

void print_result_json(const puzzle_result_t& r, std::ostream& os);

// Runs one command, grids are read from "in".
// Returns 0 on success, 2 for an unsolvable or incorrect grid, 1 on any error (reported on "err").
int run_command(const options_t& opts, std::istream& in, std::ostream& out, std::ostream& err);

int run_cli(int argc, const char* const* argv, std::istream& in, std::ostream& out, std::ostream& err);

#endif
