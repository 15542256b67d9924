#include "grid.h"

#include <boost/algorithm/string.hpp>

#include <bitset>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>

#include <assert.h>


using bitset_t = std::bitset<N>;


size_t target_givens(difficulty_t d)
{
	switch (d) {
		case difficulty_t::EASY:
			return 40;
		case difficulty_t::MEDIUM:
			return 32;
		case difficulty_t::HARD:
			return 26;
		case difficulty_t::EXPERT:
			return 22;
	}
	throw std::runtime_error("Unknown difficulty");
}

const char* difficulty_name(difficulty_t d)
{
	switch (d) {
		case difficulty_t::EASY:
			return "EASY";
		case difficulty_t::MEDIUM:
			return "MEDIUM";
		case difficulty_t::HARD:
			return "HARD";
		case difficulty_t::EXPERT:
			return "EXPERT";
	}
	throw std::runtime_error("Unknown difficulty");
}

difficulty_t difficulty_parse(const std::string& s)
{
	auto const name = boost::algorithm::to_upper_copy(boost::algorithm::trim_copy(s));
	for (auto const d : {difficulty_t::EASY, difficulty_t::MEDIUM, difficulty_t::HARD, difficulty_t::EXPERT}) {
		if (name == difficulty_name(d)) {
			return d;
		}
	}
	throw std::runtime_error("Difficulty parsing error: '" + s + "'");
}


grid_t grid_make_empty()
{
	return grid_t{}; // all cells are nullopt
}

size_t count_givens(const grid_t& g)
{
	size_t count = 0;
	for (const auto& row : g) {
		for (const auto& cell : row) {
			if (cell) {
				++count;
			}
		}
	}
	return count;
}


bool is_valid_placement(const grid_t& g, size_t row, size_t col, num_t num)
{
	assert(row < N && col < N);
	for (size_t i = 0; i < N; ++i) {
		if (g[row][i] == num || g[i][col] == num) {
			return false;
		}
	}
	size_t const sq_row = row / Ns * Ns;
	size_t const sq_col = col / Ns * Ns;
	for (size_t r = sq_row; r < sq_row + Ns; ++r) {
		for (size_t c = sq_col; c < sq_col + Ns; ++c) {
			if (g[r][c] == num) {
				return false;
			}
		}
	}
	return true;
}


namespace {

struct iterator_base_t {
	bool is_valid() const { return mutable_idx_ < N; }
	void next() { ++mutable_idx_; }
protected:
	iterator_base_t(const grid_t& g, size_t idx) : g_(g), fixed_idx_(idx) {}
	const grid_t& g_;
	size_t const fixed_idx_;
	size_t mutable_idx_ = 0;
};

struct iterator_over_row_t : public iterator_base_t {
	iterator_over_row_t(const grid_t& g, size_t row) : iterator_base_t(g, row) {}
	const cell_t& deref() const { return g_.at(fixed_idx_).at(mutable_idx_); }
	void print_info(std::ostream& os) const { os << "row<" << fixed_idx_ << ">"; }
};

struct iterator_over_column_t : public iterator_base_t {
	iterator_over_column_t(const grid_t& g, size_t col) : iterator_base_t(g, col) {}
	const cell_t& deref() const { return g_.at(mutable_idx_).at(fixed_idx_); }
	void print_info(std::ostream& os) const { os << "column<" << fixed_idx_ << ">"; }
};

struct iterator_over_sq_t {
	iterator_over_sq_t(const grid_t& g, size_t row, size_t col)
		: g_(g)
		, fixed_row_(row)
		, fixed_col_(col)
		, r_(row)
		, c_(col)
		{}
	const cell_t& deref() const { return g_.at(r_).at(c_); }
	bool is_valid() const { return (c_ < fixed_col_ + Ns) && (r_ < fixed_row_ + Ns); }
	void next()
	{
		++c_;
		if (c_ >= fixed_col_ + Ns) {
			c_ = fixed_col_;
			++r_;
		}
	}
	void print_info(std::ostream& os) const { os << "square<" << fixed_row_ << "," << fixed_col_ << ">"; }
private:
	const grid_t& g_;
	size_t const fixed_row_;
	size_t const fixed_col_;
	size_t r_;
	size_t c_;
};


bool cell_is_in_range(const cell_t& cell)
{
	return !cell || (cell.value() >= 1 && cell.value() <= N);
}


struct house_summary_t {
	bitset_t nums;
	size_t filled = 0;
	bool duplicate = false;
};

template <typename Iter>
house_summary_t summarize(Iter iter)
{
	house_summary_t s;
	for (; iter.is_valid(); iter.next()) {
		auto const& cell = iter.deref();
		if (!cell) {
			continue;
		}
		++s.filled;
		if (!cell_is_in_range(cell)) {
			s.duplicate = true; // reported the same way
			continue;
		}
		auto const bit = cell.value() - 1;
		if (s.nums.test(bit)) {
			s.duplicate = true;
		}
		s.nums.set(bit);
	}
	return s;
}

// calls f(iter) for all 27 houses
template <typename F>
bool all_houses(const grid_t& g, F&& f)
{
	bool ok = true;
	for (size_t idx = 0; idx < N; ++idx) {
		ok = f(iterator_over_row_t(g, idx)) && ok;
		ok = f(iterator_over_column_t(g, idx)) && ok;
	}
	for (size_t r = 0; r < N; r += Ns) {
		for (size_t c = 0; c < N; c += Ns) {
			ok = f(iterator_over_sq_t(g, r, c)) && ok;
		}
	}
	return ok;
}

} // namespace


bool is_consistent(const grid_t& g)
{
	return all_houses(g, [](auto iter) { return !summarize(iter).duplicate; });
}

bool is_complete(const grid_t& g)
{
	return count_givens(g) == CELLS;
}

bool is_solved(const grid_t& g)
{
	return is_complete(g) && is_consistent(g);
}

bool verify(const grid_t& g, std::ostream& os)
{
	if (!is_consistent(g) || !is_complete(g)) {
		all_houses(g, [&os](auto iter) {
			auto const s = summarize(iter);
			if (s.filled == N && !s.duplicate && s.nums.all()) {
				return true;
			}
			os << "- verify_set:" << s.nums.to_string() << (s.duplicate ? " DUPLICATE" : "") << (s.filled < N ? " UNSOLVED" : "") << " iterator:";
			iter.print_info(os);
			os << "\n";
			return false;
		});
		os << "!!! VERIFY_INCORRECT\n";
		return false;
	}
	os << "VERIFY_CORRECT\n";
	return true;
}


namespace {

cell_t cell_parse(char c)
{
	if (c >= '1' && c <= '9')
		return static_cast<num_t>(c - '0');
	if (c == '*' || c == '.' || c == '0')
		return std::nullopt;
	throw std::runtime_error(std::string("Cell parsing error: '") + c + "'");
}

char cell_print(const cell_t& cell)
{
	if (!cell) {
		return '*';
	}
	assert(cell_is_in_range(cell));
	return static_cast<char>('0' + cell.value());
}

} // namespace


grid_t grid_parse(std::istream& is)
{
	grid_t g;
	auto iter = std::istream_iterator<char>(is);
	auto const end = std::istream_iterator<char>();
	for (size_t row = 0; row < N; ++row) {
		for (size_t col = 0; col < N; ++col) {
			if (iter == end) {
				throw std::runtime_error("Grid parsing error: expected " + std::to_string(CELLS) + " cells, got " + std::to_string(row * N + col));
			}
			g.at(row).at(col) = cell_parse(*iter);
			++iter;
		}
	}
	return g;
}

grid_t grid_parse(const std::string& s)
{
	std::istringstream is(s);
	return grid_parse(is);
}


void grid_print(const grid_t& g, std::ostream& os)
{
	for (size_t row = 0; row < N; ++row) {
		for (size_t col = 0; col < N; ++col) {
			os << cell_print(g.at(row).at(col));
			if (col < N-1) {
				os << ' ';
				if ((col % Ns) == (Ns - 1)) {
					os << ' ';
				}
			}
		}
		os << "\n";
		if ((row % Ns) == (Ns - 1) && row < N-1) {
			os << "\n";
		}
	}
}

std::string grid_flat(const grid_t& g)
{
	std::string s;
	s.reserve(CELLS);
	for (const auto& row : g) {
		for (const auto& cell : row) {
			s.push_back(cell_print(cell));
		}
	}
	return s;
}

void grid_print_json(const grid_t& g, std::ostream& os)
{
	os << "[";
	for (size_t row = 0; row < N; ++row) {
		os << "[";
		for (size_t col = 0; col < N; ++col) {
			auto const& cell = g.at(row).at(col);
			if (cell) {
				os << static_cast<unsigned>(cell.value());
			} else {
				os << "null";
			}
			if (col < N-1) {
				os << ",";
			}
		}
		os << "]";
		if (row < N-1) {
			os << ",";
		}
	}
	os << "]";
}
