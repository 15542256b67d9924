#include "cli.h"
#include "grid.h"

#include <boost/lexical_cast.hpp>

#include <chrono>
#include <cstdio>
#include <iostream>
#include <stdexcept>


namespace {

const char* const usage =
	"Usage:\n"
	"  sudoku_engine_cli generate <easy|medium|hard|expert> [seed] [-v] [--json]\n"
	"  sudoku_engine_cli solve [--max-nodes N] [--json]   < grid\n"
	"  sudoku_engine_cli count [--limit N] [--max-nodes N] < grid\n"
	"  sudoku_engine_cli verify                           < grid\n"
	"Grid: 81 cells, '1'..'9' or '*' for empty, whitespace ignored\n";


int cmd_generate(const options_t& opts, std::ostream& out, std::ostream& err)
{
	if (opts.positional.empty() || opts.positional.size() > 2) {
		throw std::runtime_error(std::string("generate: expected difficulty and optional seed\n") + usage);
	}
	auto const d = difficulty_parse(opts.positional.at(0));
	auto const seed = opts.positional.size() == 2 ? opts.positional.at(1) : default_seed();

	generate_stats_t stats;
	auto const t_start = std::chrono::steady_clock::now();
	auto const r = generate_puzzle(d, seed, &stats);
	auto const elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t_start);

	if (opts.json) {
		print_result_json(r, out);
	} else {
		out << "SEED " << r.seed << "\n";
		out << "DIFFICULTY " << difficulty_name(d) << "\n";
		out << "PUZZLE\n";
		grid_print(r.puzzle, out);
		out << "\nSOLUTION\n";
		grid_print(r.solution, out);
		out << "\nHASH " << r.solution_hash << std::endl;
	}
	if (opts.verbose) {
		err << "givens=" << count_givens(r.puzzle) << " target=" << target_givens(d)
			<< " removals=" << stats.removals << "/" << stats.removal_attempts
			<< " nodes=" << stats.nodes
			<< " elapsed_ms=" << elapsed.count() << "\n";
	}
	return 0;
}

int cmd_solve(const options_t& opts, std::istream& in, std::ostream& out, std::ostream& err)
{
	auto const g = grid_parse(in);
	search_stats_t stats;
	try {
		auto const solved = solve(g, opts.limits, &stats);
		if (opts.json) {
			grid_print_json(solved, out);
			out << "\n";
		} else {
			out << "OUTPUT\n";
			grid_print(solved, out);
		}
		err << "nodes=" << stats.nodes << "\n";
		return 0;
	} catch (const unsolvable_error& e) {
		out << "UNSOLVABLE\n";
		err << e.what() << ", nodes=" << stats.nodes << "\n";
		return 2;
	}
}

int cmd_count(const options_t& opts, std::istream& in, std::ostream& out)
{
	auto const g = grid_parse(in);
	out << count_solutions(g, opts.limit, opts.limits) << std::endl;
	return 0;
}

int cmd_verify(std::istream& in, std::ostream& out)
{
	auto const g = grid_parse(in);
	return verify(g, out) ? 0 : 2;
}

} // namespace


options_t parse_args(int argc, const char* const* argv)
{
	if (argc < 2) {
		throw std::runtime_error(std::string("No command\n") + usage);
	}
	options_t opts;
	opts.command = argv[1];
	for (int i = 2; i < argc; ++i) {
		std::string const arg = argv[i];
		auto next_value = [&]() -> std::string {
			if (i + 1 >= argc) {
				throw std::runtime_error("Missing value for " + arg);
			}
			return argv[++i];
		};
		if (arg == "-v") {
			opts.verbose = true;
		} else if (arg == "--json") {
			opts.json = true;
		} else if (arg == "--max-nodes") {
			opts.limits.max_nodes = boost::lexical_cast<size_t>(next_value());
		} else if (arg == "--limit") {
			opts.limit = boost::lexical_cast<size_t>(next_value());
		} else if (!arg.empty() && arg[0] == '-') {
			throw std::runtime_error("Unknown option " + arg + "\n" + usage);
		} else {
			opts.positional.push_back(arg);
		}
	}
	return opts;
}


std::string json_escape(const std::string& s)
{
	std::string r;
	r.reserve(s.size());
	for (const char c : s) {
		switch (c) {
			case '"':
				r += "\\\"";
				break;
			case '\\':
				r += "\\\\";
				break;
			case '\n':
				r += "\\n";
				break;
			case '\r':
				r += "\\r";
				break;
			case '\t':
				r += "\\t";
				break;
			default:
				if (static_cast<unsigned char>(c) < 0x20) {
					char buf[8];
					std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
					r += buf;
				} else {
					r += c;
				}
		}
	}
	return r;
}

void print_result_json(const puzzle_result_t& r, std::ostream& os)
{
	os << "{\"seed\":\"" << json_escape(r.seed) << "\",\"puzzle\":";
	grid_print_json(r.puzzle, os);
	os << ",\"solution\":";
	grid_print_json(r.solution, os);
	os << ",\"solutionHash\":\"" << r.solution_hash << "\"}\n";
}


int run_command(const options_t& opts, std::istream& in, std::ostream& out, std::ostream& err)
{
	try {
		if (opts.command == "generate") {
			return cmd_generate(opts, out, err);
		}
		if (opts.command == "solve") {
			return cmd_solve(opts, in, out, err);
		}
		if (opts.command == "count") {
			return cmd_count(opts, in, out);
		}
		if (opts.command == "verify") {
			return cmd_verify(in, out);
		}
		throw std::runtime_error("Unknown command " + opts.command + "\n" + usage);

	} catch (const std::exception& e) {
		err << "Exception: " << e.what() << "\n";
		return 1;
	}
}

int run_cli(int argc, const char* const* argv, std::istream& in, std::ostream& out, std::ostream& err)
{
	try {
		return run_command(parse_args(argc, argv), in, out, err);
	} catch (const std::exception& e) {
		err << "Exception: " << e.what() << "\n";
		return 1;
	}
}
